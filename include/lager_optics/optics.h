// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file optics.h
/// @brief The optic kinds a Traversal composes with.
///
/// The set of kinds is closed:
/// - Iso:      get / reverse_get, lossless both ways
/// - Lens:     any lager lens (lager::lenses::getset, lager::lenses::attr, ...)
/// - Prism:    get_option / reverse_get, zero-or-one focus that can rebuild the whole
/// - Optional: get_option / set, zero-or-one focus with partial update
///
/// Iso, Prism and Optional store their callables directly; composing them
/// never allocates or goes through std::function.

#pragma once

#include <lager_optics/lager_optics_config.h>
#include <lager_optics/concepts.h>
#include <lager_optics/traversable.h>

#include <lager/lenses.hpp>
#include <lager/lenses/attr.hpp>
#include <zug/compose.hpp>

#include <cstddef>
#include <optional>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>

namespace lager_optics {

// ============================================================
// Iso
// ============================================================

template<typename Get, typename ReverseGet>
class Iso {
public:
    constexpr Iso(Get g, ReverseGet r)
        : get_(std::move(g)), reverse_get_(std::move(r)) {}

    template<typename A>
    [[nodiscard]] auto get(const A& a) const { return get_(a); }

    template<typename B>
    [[nodiscard]] auto reverse_get(const B& b) const { return reverse_get_(b); }

    /// The same view in the opposite direction
    [[nodiscard]] Iso<ReverseGet, Get> reverse() const { return {reverse_get_, get_}; }

private:
    Get get_;
    ReverseGet reverse_get_;
};

template<typename Get, typename ReverseGet>
[[nodiscard]] auto make_iso(Get g, ReverseGet r) {
    return Iso<Get, ReverseGet>(std::move(g), std::move(r));
}

// ============================================================
// Prism
// ============================================================

template<typename GetOption, typename ReverseGet>
class Prism {
public:
    constexpr Prism(GetOption g, ReverseGet r)
        : get_option_(std::move(g)), reverse_get_(std::move(r)) {}

    /// Returns the focus, or an empty optional when `a` does not match
    template<typename A>
    [[nodiscard]] auto get_option(const A& a) const { return get_option_(a); }

    template<typename B>
    [[nodiscard]] auto reverse_get(const B& b) const { return reverse_get_(b); }

private:
    GetOption get_option_;
    ReverseGet reverse_get_;
};

template<typename GetOption, typename ReverseGet>
[[nodiscard]] auto make_prism(GetOption g, ReverseGet r) {
    return Prism<GetOption, ReverseGet>(std::move(g), std::move(r));
}

// ============================================================
// Optional
// ============================================================

template<typename GetOption, typename Setter>
class Optional {
public:
    constexpr Optional(GetOption g, Setter s)
        : get_option_(std::move(g)), setter_(std::move(s)) {}

    template<typename A>
    [[nodiscard]] auto get_option(const A& a) const { return get_option_(a); }

    /// Replaces the focus of `whole`; only meaningful when get_option(whole) matched
    template<typename A, typename B>
    [[nodiscard]] auto set(const A& whole, const B& part) const { return setter_(whole, part); }

private:
    GetOption get_option_;
    Setter setter_;
};

template<typename GetOption, typename Setter>
[[nodiscard]] auto make_optional_optic(GetOption g, Setter s) {
    return Optional<GetOption, Setter>(std::move(g), std::move(s));
}

// ============================================================
// Prism factories
// ============================================================

/// Matches the values satisfying `pred`; re-embedding is the identity
template<typename Pred>
[[nodiscard]] auto predicate_prism(Pred pred) {
    return make_prism(
        [pred = std::move(pred)](const auto& a) -> std::optional<std::decay_t<decltype(a)>> {
            if (pred(a)) {
                return a;
            }
            return std::nullopt;
        },
        [](const auto& a) { return a; });
}

/// std::optional<A> <-> A, matching present values only
[[nodiscard]] inline auto some_prism() {
    return make_prism(
        [](const auto& o) { return o; },
        [](const auto& a) { return std::optional<std::decay_t<decltype(a)>>{a}; });
}

/// std::variant<..., B, ...> <-> B, matching values holding alternative B
template<typename B>
[[nodiscard]] auto alternative_prism() {
    return make_prism(
        [](const auto& v) -> std::optional<B> {
            if (const auto* alt = std::get_if<B>(&v)) {
                return *alt;
            }
            return std::nullopt;
        },
        [](const B& b) { return b; });
}

// ============================================================
// Optional factories
// ============================================================

namespace detail {

// Persistent update for immer sequences, copy-and-assign for std ones
template<typename C, typename T>
C update_at(const C& c, std::size_t i, T&& x) {
    if constexpr (requires { { c.set(i, std::forward<T>(x)) } -> std::convertible_to<C>; }) {
        return c.set(i, std::forward<T>(x));
    } else {
        C result = c;
        result[i] = std::forward<T>(x);
        return result;
    }
}

template<typename C, typename K>
auto lookup(const C& m, const K& key) -> std::optional<typename C::mapped_type> {
    if constexpr (std::is_pointer_v<decltype(m.find(key))>) {
        // immer::map::find returns a pointer to the mapped value
        if (const auto* found = m.find(key)) {
            return *found;
        }
        return std::nullopt;
    } else {
        auto it = m.find(key);
        if (it == m.end()) {
            return std::nullopt;
        }
        return it->second;
    }
}

template<typename C, typename Pred>
std::optional<std::size_t> find_index(const C& seq, const Pred& pred) {
    std::size_t i = 0;
    for (const auto& x : seq) {
        if (pred(x)) {
            return i;
        }
        ++i;
    }
    return std::nullopt;
}

} // namespace detail

/// Element `i` of a sequence; out-of-range sequences don't match
[[nodiscard]] inline auto index_optional(std::size_t i) {
    return make_optional_optic(
        [i](const auto& seq) -> std::optional<std::decay_t<decltype(seq[i])>> {
            if (i < seq.size()) {
                return seq[i];
            }
            return std::nullopt;
        },
        [i](const auto& seq, const auto& x) {
            if (i >= seq.size()) {
                return seq;
            }
            return detail::update_at(seq, i, x);
        });
}

/// Value at `key` of a std::map or immer::map; never inserts
template<typename K>
[[nodiscard]] auto key_optional(K key) {
    return make_optional_optic(
        [key](const auto& m) { return detail::lookup(m, key); },
        [key](const auto& m, const auto& x) {
            if (!detail::lookup(m, key)) {
                return m;
            }
            return detail::assoc(m, key, x);
        });
}

/// First element of a sequence satisfying `pred`
template<typename Pred>
[[nodiscard]] auto find_first_optional(Pred pred) {
    return make_optional_optic(
        [pred](const auto& seq) -> std::optional<typename std::decay_t<decltype(seq)>::value_type> {
            if (auto i = detail::find_index(seq, pred)) {
                return seq[*i];
            }
            return std::nullopt;
        },
        [pred](const auto& seq, const auto& x) {
            if (auto i = detail::find_index(seq, pred)) {
                return detail::update_at(seq, *i, x);
            }
            return seq;
        });
}

// ============================================================
// Lens factories (lager lenses)
// ============================================================

/// A lager lens from a getter and a setter(whole, part) -> whole
template<typename Getter, typename Setter>
[[nodiscard]] auto make_lens(Getter g, Setter s) {
    return lager::lenses::getset(std::move(g), std::move(s));
}

/// Focus on several members at once, as a std::tuple
template<typename... Members>
    requires (sizeof...(Members) > 0 && (std::is_member_object_pointer_v<Members> && ...))
[[nodiscard]] auto fields_lens(Members... members) {
    return lager::lenses::getset(
        [members...](const auto& whole) { return std::make_tuple(whole.*members...); },
        [members...](auto whole, const auto& parts) {
            std::apply([&](const auto&... values) { ((whole.*members = values), ...); }, parts);
            return whole;
        });
}

/// Focus through a chain of nested members: a.*m1.*m2...
template<typename... Members>
    requires (sizeof...(Members) > 0 && (std::is_member_object_pointer_v<Members> && ...))
[[nodiscard]] auto member_path_lens(Members... members) {
    return (zug::identity | ... | lager::lenses::attr(members));
}

} // namespace lager_optics
