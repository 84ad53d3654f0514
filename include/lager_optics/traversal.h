// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file traversal.h
/// @brief Traversal: an optic focusing on zero or more values of type A inside an S.
///
/// A Traversal holds exactly one thing: its primitive, a callable that for
/// any applicative capability Ap takes a per-target function A -> F<A> and a
/// structure S, visits every target left to right, and returns F<S>.
///
/// Everything else is derived from that primitive:
/// - constructors:   from_traversable(), each(), id()
/// - compositions:   compose_iso/lens/prism/optional/traversal
/// - combinators:    modify, set, filter, prop, props, some, ... (combinators.h)
///
/// Example:
/// @code
/// struct Point { int x; std::string y; };
/// auto points = each<std::vector<Point>>();
/// auto xs = points | prop(&Point::x);
/// std::vector<Point> zeroed = set(0)(xs)(data);
/// @endcode

#pragma once

#include <lager_optics/lager_optics_config.h>
#include <lager_optics/applicative.h>
#include <lager_optics/concepts.h>
#include <lager_optics/optics.h>
#include <lager_optics/traversable.h>

#include <lager/lenses.hpp>

#include <concepts>
#include <type_traits>
#include <utility>

namespace lager_optics {

// ============================================================
// Traversal
// ============================================================

template<typename S, typename A, typename ModifyF>
class Traversal {
public:
    using whole_type = S;
    using part_type = A;

    explicit Traversal(ModifyF fn) : modify_f_(std::move(fn)) {}

    /// Apply `f` to every target of `s` in the effect described by `ap`
    template<typename Ap, typename F>
        requires Applicative<Ap, A>
    [[nodiscard]] auto run(Ap ap, const F& f, const S& s) const {
        return modify_f_(ap, f, s);
    }

    /// Curried primitive: given `ap` and A -> F<A>, returns S -> F<S>
    template<typename Ap, typename F>
        requires Applicative<Ap, A>
    [[nodiscard]] auto modify_f(Ap ap, F f) const {
        return [modify_f = modify_f_, ap, f = std::move(f)](const S& s) {
            return modify_f(ap, f, s);
        };
    }

private:
    ModifyF modify_f_;
};

template<typename T>
struct is_traversal : std::false_type {};

template<typename S, typename A, typename ModifyF>
struct is_traversal<Traversal<S, A, ModifyF>> : std::true_type {};

template<typename T>
concept TraversalLike = is_traversal<std::decay_t<T>>::value;

/// Wrap a raw primitive `(ap, f, s) -> F<S>` into a Traversal<S, A>
template<typename S, typename A, typename ModifyF>
[[nodiscard]] auto make_traversal(ModifyF fn) {
    return Traversal<S, A, ModifyF>(std::move(fn));
}

// ============================================================
// Constructors
// ============================================================

/// Traversal over every element of `C`, as laid out by `Strategy`
template<typename Strategy, typename C>
    requires TraversableFor<Strategy, C>
[[nodiscard]] auto from_traversable(Strategy = {}) {
    using A = typename Strategy::template element_type<C>;
    return make_traversal<C, A>([](auto ap, const auto& f, const C& s) {
        return Strategy::traverse(ap, s, f);
    });
}

/// Traversal over every element of a std or immer container
template<typename C>
[[nodiscard]] auto each() {
    return from_traversable<DefaultTraversable<C>, C>();
}

/// Single target: the whole structure
template<typename S>
[[nodiscard]] auto id() {
    return make_traversal<S, S>([](auto, const auto& f, const S& s) { return f(s); });
}

// ============================================================
// Adaptors - curried operations usable as `traversal | adaptor`
// ============================================================

template<typename Fn>
struct TraversalAdaptor {
    Fn fn;

    template<TraversalLike T>
        requires std::invocable<const Fn&, const T&>
    [[nodiscard]] auto operator()(const T& t) const { return fn(t); }
};

template<typename Fn>
[[nodiscard]] auto make_adaptor(Fn fn) {
    return TraversalAdaptor<Fn>{std::move(fn)};
}

template<TraversalLike T, typename Fn>
    requires std::invocable<const Fn&, const T&>
[[nodiscard]] auto operator|(const T& t, const TraversalAdaptor<Fn>& adaptor) {
    return adaptor(t);
}

// ============================================================
// Composition algebra
// ============================================================

/// Traversal<S, A> . Iso<A, B> -> Traversal<S, B>
template<typename S, typename A, typename M, typename O>
    requires IsoFor<O, A>
[[nodiscard]] auto compose_iso(const Traversal<S, A, M>& sa, O ab) {
    using B = std::decay_t<decltype(ab.get(std::declval<const A&>()))>;
    return make_traversal<S, B>([sa, ab = std::move(ab)](auto ap, const auto& f, const S& s) {
        return sa.run(ap, [&](const A& a) {
            return ap_map(ap, f(ab.get(a)), [ab](const auto& b) { return A(ab.reverse_get(b)); });
        }, s);
    });
}

/// Traversal<S, A> . Lens<A, B> -> Traversal<S, B>
///
/// The rebuild goes through lager::set on a copy of the target, so the
/// continuation outlives the current call.
template<typename S, typename A, typename M, typename L>
    requires LagerLensFor<L, A>
[[nodiscard]] auto compose_lens(const Traversal<S, A, M>& sa, L ab) {
    using B = std::decay_t<decltype(lager::view(ab, std::declval<const A&>()))>;
    return make_traversal<S, B>([sa, ab = std::move(ab)](auto ap, const auto& f, const S& s) {
        return sa.run(ap, [&](const A& a) {
            return ap_map(ap, f(lager::view(ab, a)), [ab, a](const auto& b) {
                return A(lager::set(ab, a, b));
            });
        }, s);
    });
}

/// Traversal<S, A> . Prism<A, B> -> Traversal<S, B>
///
/// Targets the prism doesn't match are left as they are; the others are
/// still visited.
template<typename S, typename A, typename M, typename O>
    requires PrismFor<O, A>
[[nodiscard]] auto compose_prism(const Traversal<S, A, M>& sa, O ab) {
    using B = typename decltype(ab.get_option(std::declval<const A&>()))::value_type;
    return make_traversal<S, B>([sa, ab = std::move(ab)](auto ap, const auto& f, const S& s) {
        using Ap = decltype(ap);
        return sa.run(ap, [&](const A& a) -> decltype(Ap::pure(a)) {
            auto b = ab.get_option(a);
            if (!b) {
                return Ap::pure(a);
            }
            return ap_map(ap, f(*b), [ab](const auto& nb) { return A(ab.reverse_get(nb)); });
        }, s);
    });
}

/// Traversal<S, A> . Optional<A, B> -> Traversal<S, B>
template<typename S, typename A, typename M, typename O>
    requires OptionalFor<O, A>
[[nodiscard]] auto compose_optional(const Traversal<S, A, M>& sa, O ab) {
    using B = typename decltype(ab.get_option(std::declval<const A&>()))::value_type;
    return make_traversal<S, B>([sa, ab = std::move(ab)](auto ap, const auto& f, const S& s) {
        using Ap = decltype(ap);
        return sa.run(ap, [&](const A& a) -> decltype(Ap::pure(a)) {
            auto b = ab.get_option(a);
            if (!b) {
                return Ap::pure(a);
            }
            return ap_map(ap, f(*b), [ab, a](const auto& nb) { return A(ab.set(a, nb)); });
        }, s);
    });
}

/// Traversal<S, A> . Traversal<A, B> -> Traversal<S, B>, outer-major order
template<typename S, typename A, typename M, typename B, typename N>
[[nodiscard]] auto compose_traversal(const Traversal<S, A, M>& sa, Traversal<A, B, N> ab) {
    return make_traversal<S, B>([sa, ab = std::move(ab)](auto ap, const auto& f, const S& s) {
        return sa.run(ap, [&](const A& a) { return ab.run(ap, f, a); }, s);
    });
}

template<typename O>
[[nodiscard]] auto compose_iso(O ab) {
    return make_adaptor([ab = std::move(ab)](const auto& sa) { return compose_iso(sa, ab); });
}

template<typename L>
[[nodiscard]] auto compose_lens(L ab) {
    return make_adaptor([ab = std::move(ab)](const auto& sa) { return compose_lens(sa, ab); });
}

template<typename O>
[[nodiscard]] auto compose_prism(O ab) {
    return make_adaptor([ab = std::move(ab)](const auto& sa) { return compose_prism(sa, ab); });
}

template<typename O>
[[nodiscard]] auto compose_optional(O ab) {
    return make_adaptor([ab = std::move(ab)](const auto& sa) { return compose_optional(sa, ab); });
}

template<TraversalLike T>
[[nodiscard]] auto compose_traversal(T ab) {
    return make_adaptor([ab = std::move(ab)](const auto& sa) { return compose_traversal(sa, ab); });
}

} // namespace lager_optics
