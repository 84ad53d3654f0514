// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file combinators.h
/// @brief Combinators derived from the Traversal primitive and its compositions.
///
/// Curried forms return adaptors, so both spellings work:
/// @code
/// auto bumped = modify([](int n) { return n + 1; })(xs)(data);
/// auto bumped = (xs | modify([](int n) { return n + 1; }))(data);
/// @endcode

#pragma once

#include <lager_optics/lager_optics_config.h>
#include <lager_optics/applicative.h>
#include <lager_optics/concepts.h>
#include <lager_optics/optics.h>
#include <lager_optics/traversal.h>

#include <lager/lenses/attr.hpp>

#include <cstddef>
#include <optional>
#include <type_traits>
#include <utility>

namespace lager_optics {

// ============================================================
// Modification
// ============================================================

/// Apply `f` to every target, leaving the rest of the structure as it is
template<typename F>
[[nodiscard]] auto modify(F f) {
    return make_adaptor([f = std::move(f)]<typename T>(const T& sa)
                            requires PartTransformer<F, typename T::part_type> {
        using S = typename T::whole_type;
        return [sa, f](const S& s) -> S { return sa.run(IdentityApplicative{}, f, s); };
    });
}

/// Replace every target with `a`
template<typename A>
[[nodiscard]] auto set(A a) {
    return modify([a = std::move(a)](const auto&) { return a; });
}

/// lager::over counterpart for traversals
template<TraversalLike T, typename F>
[[nodiscard]] auto over(const T& t, const typename T::whole_type& s, const F& f) -> typename T::whole_type {
    return t.run(IdentityApplicative{}, f, s);
}

/// lager::set counterpart for traversals
template<TraversalLike T, typename A>
[[nodiscard]] auto set(const T& t, const typename T::whole_type& s, const A& a) -> typename T::whole_type {
    return over(t, s, [&a](const auto&) { return a; });
}

/// Effectful modification in a caller-supplied applicative
template<typename Ap, typename F>
[[nodiscard]] auto traverse(Ap ap, F f) {
    return make_adaptor([ap, f = std::move(f)](const auto& sa) { return sa.modify_f(ap, f); });
}

// ============================================================
// Narrowing
// ============================================================

/// Only visit targets satisfying `pred`; the others are invisible to
/// everything composed or run afterwards.
template<typename Pred>
[[nodiscard]] auto filter(Pred pred) {
    return make_adaptor([pred = std::move(pred)]<typename T>(const T& sa)
                            requires PartPredicate<Pred, typename T::part_type> {
        return compose_prism(sa, predicate_prism(pred));
    });
}

/// Only visit std::variant targets holding alternative B, focused as B
template<typename B>
[[nodiscard]] auto filter() {
    return compose_prism(alternative_prism<B>());
}

/// Visit the present values of std::optional targets
[[nodiscard]] inline auto some() {
    return compose_prism(some_prism());
}

template<TraversalLike T>
[[nodiscard]] auto some(const T& soa) {
    return compose_prism(soa, some_prism());
}

// ============================================================
// Property focusing
// ============================================================

/// Focus on one member of every target
template<typename Member>
    requires std::is_member_object_pointer_v<Member>
[[nodiscard]] auto prop(Member member) {
    return compose_lens(lager::lenses::attr(member));
}

/// Focus on several members of every target, as a std::tuple
template<typename... Members>
    requires (sizeof...(Members) > 0 && (std::is_member_object_pointer_v<Members> && ...))
[[nodiscard]] auto props(Members... members) {
    return compose_lens(fields_lens(members...));
}

/// Focus through nested members: prop_path(&A::b, &B::c) reaches a.b.c
template<typename... Members>
    requires (sizeof...(Members) > 0 && (std::is_member_object_pointer_v<Members> && ...))
[[nodiscard]] auto prop_path(Members... members) {
    return compose_lens(member_path_lens(members...));
}

// ============================================================
// Element focusing
// ============================================================

[[nodiscard]] inline auto index(std::size_t i) {
    return compose_optional(index_optional(i));
}

template<typename K>
[[nodiscard]] auto key(K k) {
    return compose_optional(key_optional(std::move(k)));
}

template<typename Pred>
[[nodiscard]] auto find_first(Pred pred) {
    return compose_optional(find_first_optional(std::move(pred)));
}

// ============================================================
// Folds (read through ConstApplicative)
// ============================================================

/// Map every target through `f` and combine the results with monoid M
template<Monoid M, typename F>
[[nodiscard]] auto fold_map(F f) {
    return make_adaptor([f = std::move(f)](const auto& sa) {
        using S = typename std::decay_t<decltype(sa)>::whole_type;
        return [sa, f](const S& s) -> typename M::value_type {
            return sa.run(ConstApplicative<M>{}, f, s);
        };
    });
}

/// Every target, in visiting order
template<TraversalLike T>
[[nodiscard]] auto get_all(const T& t) {
    using A = typename T::part_type;
    return fold_map<ListMonoid<A>>([](const A& a) { return immer::flex_vector<A>{a}; })(t);
}

template<TraversalLike T>
[[nodiscard]] auto length(const T& t) {
    return fold_map<SumMonoid<std::size_t>>([](const auto&) { return std::size_t{1}; })(t);
}

template<TraversalLike T>
[[nodiscard]] auto head_option(const T& t) {
    using A = typename T::part_type;
    return fold_map<FirstMonoid<A>>([](const A& a) { return std::optional<A>{a}; })(t);
}

template<typename Pred>
[[nodiscard]] auto exists(Pred pred) {
    return make_adaptor([pred = std::move(pred)]<typename T>(const T& sa)
                            requires PartPredicate<Pred, typename T::part_type> {
        return fold_map<AnyMonoid>([pred](const auto& a) { return static_cast<bool>(pred(a)); })(sa);
    });
}

template<typename Pred>
[[nodiscard]] auto all(Pred pred) {
    return make_adaptor([pred = std::move(pred)]<typename T>(const T& sa)
                            requires PartPredicate<Pred, typename T::part_type> {
        return fold_map<AllMonoid>([pred](const auto& a) { return static_cast<bool>(pred(a)); })(sa);
    });
}

} // namespace lager_optics
