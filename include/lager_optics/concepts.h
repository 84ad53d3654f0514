// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file concepts.h
/// @brief C++20 Concepts describing the contracts lager_optics consumes.
///
/// Every capability a Traversal is built from or run with is checked at
/// compile time:
/// - applicative capabilities and monoids (the effect a traversal runs in)
/// - the optic kinds a traversal composes with (Iso, lager lens, Prism, Optional)
///
/// Misuse is rejected before any value-level execution, so none of these
/// contracts is re-checked at runtime.
///
/// @note Requires C++20 or later.

#pragma once

#include <lager_optics/lager_optics_config.h>

#include <lager/lenses.hpp>

#include <concepts>
#include <type_traits>
#include <utility>

namespace lager_optics {

namespace detail {

// Probe used to check map2 without naming a lambda in a requires-expression
struct keep_first {
    template<typename A, typename B>
    A operator()(A a, B&&) const { return a; }
};

} // namespace detail

// ============================================================
// Effect Concepts
// ============================================================

/// Concept for applicative capability records
///
/// An applicative capability is a stateless struct bundling:
/// - `template <class T> using type`: the effectful type F<T>
/// - `static pure(x)`: lift a plain value into F
/// - `static map2(fa, fb, fn)`: combine two effectful values with a binary
///   function, evaluating `fa`'s effect before `fb`'s
///
/// A static `map(fa, fn)` is optional; see ap_map() in applicative.h.
///
/// `map`/`map2` may store `fn` and run it later (a state or reader effect
/// does). Every continuation lager_optics hands them owns copies of what it
/// needs, so the resulting F<S> stays valid after the traversal, the
/// structure and the per-target function are gone. Those continuations are
/// copyable and const-callable, so such effects can store them as is.
template<typename Ap, typename T = int>
concept Applicative = std::is_default_constructible_v<Ap> && requires(const T& x) {
    typename Ap::template type<T>;
    { Ap::pure(x) } -> std::convertible_to<typename Ap::template type<T>>;
    { Ap::map2(Ap::pure(x), Ap::pure(x), detail::keep_first{}) }
        -> std::convertible_to<typename Ap::template type<T>>;
};

/// Concept for monoids used by ConstApplicative and fold_map
template<typename M>
concept Monoid = requires(const typename M::value_type& a) {
    typename M::value_type;
    { M::empty() } -> std::convertible_to<typename M::value_type>;
    { M::combine(a, a) } -> std::convertible_to<typename M::value_type>;
};

// ============================================================
// Optic Concepts
// ============================================================

/// Concept for std::optional-like results of partial getters
template<typename T>
concept OptionLike = requires(const T& o) {
    typename T::value_type;
    { static_cast<bool>(o) } -> std::same_as<bool>;
    *o;
};

/// Iso<A, B>: total forward and reverse conversions
template<typename O, typename A>
concept IsoFor = requires(const O& o, const A& a) {
    o.get(a);
    { o.reverse_get(o.get(a)) } -> std::convertible_to<A>;
};

/// Prism<A, B>: partial get, total reverse construction
template<typename O, typename A>
concept PrismFor = requires(const O& o, const A& a) {
    { o.get_option(a) } -> OptionLike;
    { o.reverse_get(*o.get_option(a)) } -> std::convertible_to<A>;
};

/// Optional<A, B>: partial get, partial set
template<typename O, typename A>
concept OptionalFor = requires(const O& o, const A& a) {
    { o.get_option(a) } -> OptionLike;
    { o.set(a, *o.get_option(a)) } -> std::convertible_to<A>;
};

/// Lens<A, B>: any optic following lager's functor protocol
/// (lager::lenses::getset, lager::lenses::attr, zug::comp compositions)
template<typename L, typename A>
concept LagerLensFor = requires(const L& l, const A& a) {
    lager::view(l, a);
    { lager::set(l, a, lager::view(l, a)) } -> std::convertible_to<A>;
};

// ============================================================
// Callable Concepts
// ============================================================

/// Concept for predicate functions on focused values
template<typename Fn, typename A>
concept PartPredicate = std::invocable<const Fn&, const A&> &&
                        std::convertible_to<std::invoke_result_t<const Fn&, const A&>, bool>;

/// Concept for pure update functions on focused values
template<typename Fn, typename A>
concept PartTransformer = std::invocable<const Fn&, const A&> &&
                          std::convertible_to<std::invoke_result_t<const Fn&, const A&>, A>;

} // namespace lager_optics
