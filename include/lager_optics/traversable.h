// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file traversable.h
/// @brief Traversable strategies for common container shapes.
///
/// A strategy knows how to apply an effectful function to every element of a
/// container, sequence the effects left to right, and reassemble a container
/// of the same shape. from_traversable() (traversal.h) turns a strategy into
/// a Traversal without adding any logic of its own.
///
/// Bundled strategies:
/// - SequenceTraversable:  std::vector, immer::vector, immer::flex_vector, immer::array
/// - OptionTraversable:    std::optional
/// - MapValuesTraversable: mapped values of std::map and immer::map (keys are kept)

#pragma once

#include <lager_optics/lager_optics_config.h>
#include <lager_optics/applicative.h>

#include <immer/array.hpp>
#include <immer/flex_vector.hpp>
#include <immer/map.hpp>
#include <immer/vector.hpp>

#include <concepts>
#include <map>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

namespace lager_optics {

namespace detail {

struct identity_fn {
    template<typename T>
    std::decay_t<T> operator()(T&& x) const { return std::forward<T>(x); }
};

// Appends to std containers in place and to immer containers persistently
template<typename C, typename T>
C append(C c, T&& x) {
    if constexpr (std::is_void_v<decltype(c.push_back(std::forward<T>(x)))>) {
        c.push_back(std::forward<T>(x));
        return c;
    } else {
        return std::move(c).push_back(std::forward<T>(x));
    }
}

// Empty container of the same kind, keeping a stateful allocator
template<typename C>
C empty_like(const C& c) {
    if constexpr (requires { C(c.get_allocator()); }) {
        return C(c.get_allocator());
    } else {
        return C{};
    }
}

template<typename C, typename K, typename T>
C assoc(C c, const K& key, T&& x) {
    if constexpr (requires { c.insert_or_assign(key, std::forward<T>(x)); }) {
        c.insert_or_assign(key, std::forward<T>(x));
        return c;
    } else {
        return std::move(c).set(key, std::forward<T>(x));
    }
}

} // namespace detail

// ============================================================
// SequenceTraversable
// ============================================================

struct SequenceTraversable {
    template<typename C>
    using element_type = typename C::value_type;

    template<typename Ap, typename C, typename F>
    static auto traverse(Ap, const C& c, const F& f) {
        auto acc = Ap::pure(detail::empty_like(c));
        for (const auto& x : c) {
            acc = Ap::map2(std::move(acc), f(x), [](C built, auto&& y) {
                return detail::append(std::move(built), std::forward<decltype(y)>(y));
            });
        }
        return acc;
    }
};

// ============================================================
// OptionTraversable - zero or one element
// ============================================================

struct OptionTraversable {
    template<typename C>
    using element_type = typename C::value_type;

    template<typename Ap, typename C, typename F>
    static auto traverse(Ap ap, const C& o, const F& f) {
        if (!o) {
            return Ap::pure(C{});
        }
        return ap_map(ap, f(*o), [](auto&& y) { return C{std::forward<decltype(y)>(y)}; });
    }
};

// ============================================================
// MapValuesTraversable - every mapped value, in the map's iteration order
//
// Values are reassigned on a copy of the source map, which keeps its
// comparator and allocator (std::map) or its structure (immer::map).
// ============================================================

struct MapValuesTraversable {
    template<typename C>
    using element_type = typename C::mapped_type;

    template<typename Ap, typename C, typename F>
    static auto traverse(Ap, const C& m, const F& f) {
        auto acc = Ap::pure(m);
        for (const auto& entry : m) {
            acc = Ap::map2(std::move(acc), f(entry.second), [key = entry.first](C built, auto&& y) {
                return detail::assoc(std::move(built), key, std::forward<decltype(y)>(y));
            });
        }
        return acc;
    }
};

// ============================================================
// Strategy Concept
// ============================================================

template<typename Strategy, typename C>
concept TraversableFor = requires(const C& c, detail::identity_fn f) {
    typename Strategy::template element_type<C>;
    { Strategy::traverse(IdentityApplicative{}, c, f) } -> std::convertible_to<C>;
};

// ============================================================
// Default strategy per container
// ============================================================

template<typename C>
struct DefaultTraversableFor;

template<typename T, typename Alloc>
struct DefaultTraversableFor<std::vector<T, Alloc>> {
    using type = SequenceTraversable;
};

template<typename T, typename MP, auto B, auto BL>
struct DefaultTraversableFor<immer::vector<T, MP, B, BL>> {
    using type = SequenceTraversable;
};

template<typename T, typename MP, auto B, auto BL>
struct DefaultTraversableFor<immer::flex_vector<T, MP, B, BL>> {
    using type = SequenceTraversable;
};

template<typename T, typename MP>
struct DefaultTraversableFor<immer::array<T, MP>> {
    using type = SequenceTraversable;
};

template<typename T>
struct DefaultTraversableFor<std::optional<T>> {
    using type = OptionTraversable;
};

template<typename K, typename T, typename Cmp, typename Alloc>
struct DefaultTraversableFor<std::map<K, T, Cmp, Alloc>> {
    using type = MapValuesTraversable;
};

template<typename K, typename T, typename Hash, typename Eq, typename MP, auto B>
struct DefaultTraversableFor<immer::map<K, T, Hash, Eq, MP, B>> {
    using type = MapValuesTraversable;
};

template<typename C>
using DefaultTraversable = typename DefaultTraversableFor<C>::type;

} // namespace lager_optics
