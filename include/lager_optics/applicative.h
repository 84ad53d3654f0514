// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file applicative.h
/// @brief Applicative capability records and monoids.
///
/// A Traversal is parameterized by the effect it runs in. Instead of a
/// higher-kinded template parameter, the effect is described by a stateless
/// capability record (see the Applicative concept) passed to the primitive:
///
/// @code
/// auto doubled  = t.run(IdentityApplicative{}, [](int n) { return n * 2; }, s);
/// auto checked  = t.run(ValidationApplicative<std::string>{}, check, s);
/// auto branches = t.run(ListApplicative{}, both_signs, s);
/// @endcode
///
/// The library never runs an effect itself; it only sequences the effects
/// produced by the caller, left to right.

#pragma once

#include <lager_optics/lager_optics_config.h>
#include <lager_optics/concepts.h>

#include <immer/flex_vector.hpp>
#include <immer/flex_vector_transient.hpp>

#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace lager_optics {

/// Value carried by pure() when only the effect matters
struct Unit {
    bool operator==(const Unit&) const = default;
};

// ============================================================
// Monoids
// ============================================================

/// Collects values in order (immer::flex_vector concatenation is O(log n))
template<typename T>
struct ListMonoid {
    using value_type = immer::flex_vector<T>;
    static value_type empty() { return {}; }
    static value_type combine(const value_type& a, const value_type& b) { return a + b; }
};

template<typename T>
struct SumMonoid {
    using value_type = T;
    static value_type empty() { return T{}; }
    static value_type combine(const value_type& a, const value_type& b) { return a + b; }
};

struct AnyMonoid {
    using value_type = bool;
    static value_type empty() { return false; }
    static value_type combine(value_type a, value_type b) { return a || b; }
};

struct AllMonoid {
    using value_type = bool;
    static value_type empty() { return true; }
    static value_type combine(value_type a, value_type b) { return a && b; }
};

/// Keeps the leftmost present value
template<typename T>
struct FirstMonoid {
    using value_type = std::optional<T>;
    static value_type empty() { return std::nullopt; }
    static value_type combine(const value_type& a, const value_type& b) { return a ? a : b; }
};

// ============================================================
// IdentityApplicative - no effect, F<T> = T
// ============================================================

struct IdentityApplicative {
    template<typename T>
    using type = T;

    template<typename T>
    static std::decay_t<T> pure(T&& x) { return std::forward<T>(x); }

    template<typename TA, typename Fn>
    static auto map(TA&& a, Fn&& fn) {
        return std::forward<Fn>(fn)(std::forward<TA>(a));
    }

    template<typename TA, typename TB, typename Fn>
    static auto map2(TA&& a, TB&& b, Fn&& fn) {
        return std::forward<Fn>(fn)(std::forward<TA>(a), std::forward<TB>(b));
    }
};

// ============================================================
// ConstApplicative - F<T> = M::value_type, accumulates through a monoid
//
// Rebuilding is skipped entirely: map() discards the function and map2()
// only combines the accumulated values. This is how folds (get_all,
// fold_map) read through a Traversal.
// ============================================================

template<Monoid M>
struct ConstApplicative {
    using monoid_type = M;
    using value_type = typename M::value_type;

    template<typename T>
    using type = value_type;

    template<typename T>
    static value_type pure(T&&) { return M::empty(); }

    template<typename Fn>
    static value_type map(value_type a, Fn&&) { return a; }

    template<typename Fn>
    static value_type map2(const value_type& a, const value_type& b, Fn&&) {
        return M::combine(a, b);
    }
};

// ============================================================
// OptionApplicative - F<T> = std::optional<T>
//
// The result is empty as soon as one target's function returns nullopt.
// Every target is still visited; only the combined result is lost.
// ============================================================

struct OptionApplicative {
    template<typename T>
    using type = std::optional<T>;

    template<typename T>
    static std::optional<std::decay_t<T>> pure(T&& x) { return std::forward<T>(x); }

    template<typename TA, typename Fn>
    static auto map(std::optional<TA> a, Fn&& fn) {
        using R = std::decay_t<std::invoke_result_t<Fn&, TA&&>>;
        if (!a) return std::optional<R>{};
        return std::optional<R>{fn(std::move(*a))};
    }

    template<typename TA, typename TB, typename Fn>
    static auto map2(std::optional<TA> a, std::optional<TB> b, Fn&& fn) {
        using R = std::decay_t<std::invoke_result_t<Fn&, TA&&, TB&&>>;
        if (!a || !b) return std::optional<R>{};
        return std::optional<R>{fn(std::move(*a), std::move(*b))};
    }
};

// ============================================================
// ListApplicative - F<T> = immer::flex_vector<T>, branching outcomes
//
// map2 produces the cartesian product, left outcome major. Running a
// traversal with a function returning n outcomes per target yields every
// combination, ordered as if the targets were nested loops from left to right.
// ============================================================

struct ListApplicative {
    template<typename T>
    using type = immer::flex_vector<T>;

    template<typename T>
    static immer::flex_vector<std::decay_t<T>> pure(T&& x) {
        return immer::flex_vector<std::decay_t<T>>{std::forward<T>(x)};
    }

    template<typename TA, typename Fn>
    static auto map(const immer::flex_vector<TA>& as, Fn&& fn) {
        using R = std::decay_t<std::invoke_result_t<Fn&, const TA&>>;
        auto out = immer::flex_vector<R>{}.transient();
        for (const auto& a : as) {
            out.push_back(fn(a));
        }
        return out.persistent();
    }

    template<typename TA, typename TB, typename Fn>
    static auto map2(const immer::flex_vector<TA>& as, const immer::flex_vector<TB>& bs, Fn&& fn) {
        using R = std::decay_t<std::invoke_result_t<Fn&, const TA&, const TB&>>;
        auto out = immer::flex_vector<R>{}.transient();
        for (const auto& a : as) {
            for (const auto& b : bs) {
                out.push_back(fn(a, b));
            }
        }
        return out.persistent();
    }
};

// ============================================================
// ValidationApplicative - collect errors across all targets
// ============================================================

/// Result of a validating traversal: either a value or every error found
template<typename E, typename T>
struct Validated {
    std::optional<T> value;          // Present when no target failed
    immer::flex_vector<E> errors;    // Errors in visiting order

    explicit operator bool() const noexcept { return value.has_value(); }

    const T& get() const {
        if (!value) {
            throw std::runtime_error("Validation failed with " + std::to_string(errors.size()) +
                                     " error(s)");
        }
        return *value;
    }

    T get_or(T default_val) const {
        return value ? *value : std::move(default_val);
    }

    bool operator==(const Validated&) const = default;
};

template<typename E>
struct ValidationApplicative {
    template<typename T>
    using type = Validated<E, T>;

    template<typename T>
    static Validated<E, std::decay_t<T>> pure(T&& x) {
        return {std::forward<T>(x), {}};
    }

    /// A failed target, for use inside the per-target function
    template<typename T>
    static Validated<E, T> fail(E error) {
        return {std::nullopt, immer::flex_vector<E>{std::move(error)}};
    }

    template<typename TA, typename Fn>
    static auto map(Validated<E, TA> a, Fn&& fn) {
        using R = std::decay_t<std::invoke_result_t<Fn&, TA&&>>;
        if (!a) return Validated<E, R>{std::nullopt, std::move(a.errors)};
        return Validated<E, R>{fn(std::move(*a.value)), {}};
    }

    template<typename TA, typename TB, typename Fn>
    static auto map2(Validated<E, TA> a, Validated<E, TB> b, Fn&& fn) {
        using R = std::decay_t<std::invoke_result_t<Fn&, TA&&, TB&&>>;
        if (a && b) return Validated<E, R>{fn(std::move(*a.value), std::move(*b.value)), {}};
        return Validated<E, R>{std::nullopt, a.errors + b.errors};
    }
};

// ============================================================
// ap_map - functor map for any applicative capability
// ============================================================

/// Uses Ap::map when the capability provides it, otherwise derives it
/// from map2 and pure. The derived continuation owns `fn`, so map2 may
/// store it and call it after ap_map returns.
template<typename Ap, typename Fa, typename Fn>
[[nodiscard]] auto ap_map(Ap, Fa&& fa, Fn&& fn) {
    if constexpr (requires { Ap::map(std::forward<Fa>(fa), fn); }) {
        return Ap::map(std::forward<Fa>(fa), std::forward<Fn>(fn));
    } else {
        return Ap::map2(std::forward<Fa>(fa), Ap::pure(Unit{}),
                        [fn = std::forward<Fn>(fn)](auto&& a, auto&&) {
                            return fn(std::forward<decltype(a)>(a));
                        });
    }
}

} // namespace lager_optics
