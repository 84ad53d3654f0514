// test_applicative.cpp - Tests for running traversals in effects
// Module 4: IdentityApplicative, ConstApplicative, OptionApplicative, ListApplicative,
//           ValidationApplicative, user-defined and deferred applicatives, traverse()

#include <catch2/catch_all.hpp>
#include <lager_optics/lager_optics.h>

#include <immer/flex_vector.hpp>

#include <functional>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

using namespace lager_optics;

namespace {

struct Account {
    std::string owner;
    int balance;
    bool operator==(const Account&) const = default;
};

// Minimal applicative without map(): records which values were visited
template<typename T>
struct Logged {
    T value;
    immer::flex_vector<int> visited;
};

struct LoggingApplicative {
    template<typename T>
    using type = Logged<T>;

    template<typename T>
    static Logged<std::decay_t<T>> pure(T&& x) {
        return {std::forward<T>(x), {}};
    }

    template<typename TA, typename TB, typename Fn>
    static auto map2(Logged<TA> a, Logged<TB> b, Fn&& fn) {
        using R = std::decay_t<std::invoke_result_t<Fn&, TA&&, TB&&>>;
        return Logged<R>{fn(std::move(a.value), std::move(b.value)), a.visited + b.visited};
    }
};

static_assert(Applicative<LoggingApplicative>);

// State effect: every target draws the next number from a counter.
// map2 stores its function and only calls it when the result is run.
template<typename T>
using Numbered = std::function<std::pair<T, int>(int)>;

struct NumberingApplicative {
    template<typename T>
    using type = Numbered<T>;

    template<typename T>
    static Numbered<std::decay_t<T>> pure(T&& x) {
        return [x = std::forward<T>(x)](int next) { return std::make_pair(x, next); };
    }

    template<typename TA, typename TB, typename Fn>
    static auto map2(Numbered<TA> fa, Numbered<TB> fb, Fn fn) {
        using R = std::decay_t<std::invoke_result_t<const Fn&, TA, TB>>;
        return Numbered<R>([fa = std::move(fa), fb = std::move(fb), fn = std::move(fn)](int next) {
            auto [a, after_a] = fa(next);
            auto [b, after_b] = fb(after_a);
            return std::make_pair(R(fn(std::move(a), std::move(b))), after_b);
        });
    }
};

static_assert(Applicative<NumberingApplicative>);

struct Ticket {
    std::string label;
    bool open;
    bool operator==(const Ticket&) const = default;
};

Numbered<std::string> take_number(const std::string& label) {
    return [label](int next) { return std::make_pair(label + " #" + std::to_string(next), next + 1); };
}

// The traversals and inputs below are gone by the time the results run

Numbered<std::vector<Ticket>> number_open_tickets(std::vector<Ticket> tickets) {
    auto open_labels = each<std::vector<Ticket>>() |
                       filter([](const Ticket& t) { return t.open; }) |
                       prop(&Ticket::label);
    return open_labels.run(NumberingApplicative{}, take_number, tickets);
}

Numbered<std::vector<std::vector<std::string>>> number_second_entries(std::vector<std::vector<std::string>> rows) {
    auto seconds = each<std::vector<std::vector<std::string>>>() | index(1);
    return seconds.run(NumberingApplicative{}, take_number, rows);
}

Numbered<std::map<std::string, std::string>> number_owners(std::map<std::string, std::string> owners) {
    return each<std::map<std::string, std::string>>().run(NumberingApplicative{}, take_number, owners);
}

using Check = ValidationApplicative<std::string>;

Validated<std::string, int> non_negative(int n) {
    if (n < 0) {
        return Check::fail<int>("negative: " + std::to_string(n));
    }
    return Check::pure(n);
}

} // namespace

// ============================================================
// Validation
// ============================================================

TEST_CASE("validation collects every error in visiting order", "[applicative][validation]") {
    auto ints = each<std::vector<int>>();

    SECTION("all targets valid") {
        auto result = ints.run(Check{}, non_negative, std::vector<int>{1, 2, 3});
        REQUIRE(result);
        REQUIRE(result.get() == std::vector<int>{1, 2, 3});
        REQUIRE(result.errors.empty());
    }

    SECTION("failures are accumulated, not short-circuited") {
        auto result = ints.run(Check{}, non_negative, std::vector<int>{1, -2, 3, -4});
        REQUIRE_FALSE(result);
        REQUIRE(result.errors == immer::flex_vector<std::string>{"negative: -2", "negative: -4"});
    }

    SECTION("get throws when invalid, get_or falls back") {
        auto result = ints.run(Check{}, non_negative, std::vector<int>{-1});
        REQUIRE_THROWS_AS(result.get(), std::runtime_error);
        REQUIRE(result.get_or(std::vector<int>{0}) == std::vector<int>{0});
    }

    SECTION("through a composed traversal") {
        auto balances = each<std::vector<Account>>() | prop(&Account::balance);
        std::vector<Account> accounts{{"ann", 10}, {"ben", -5}, {"cid", -1}};
        auto validate = traverse(Check{}, non_negative)(balances);
        auto result = validate(accounts);
        REQUIRE(result.errors == immer::flex_vector<std::string>{"negative: -5", "negative: -1"});

        auto fixed = set(0)(balances | filter([](int b) { return b < 0; }))(accounts);
        REQUIRE(validate(fixed));
        REQUIRE(validate(fixed).get() == std::vector<Account>{{"ann", 10}, {"ben", 0}, {"cid", 0}});
    }

    SECTION("targets skipped by a prism produce no errors") {
        auto positives = each<std::vector<int>>() | filter([](int n) { return n > 0; });
        auto result = positives.run(Check{}, non_negative, std::vector<int>{-3, 4, -5});
        REQUIRE(result);
        REQUIRE(result.get() == std::vector<int>{-3, 4, -5});
    }
}

// ============================================================
// Option
// ============================================================

TEST_CASE("option applicative fails the whole result on any nullopt", "[applicative][option]") {
    auto ints = each<std::vector<int>>();
    auto half = [](int n) -> std::optional<int> {
        if (n % 2 != 0) return std::nullopt;
        return n / 2;
    };

    REQUIRE(ints.run(OptionApplicative{}, half, std::vector<int>{2, 4, 6}) ==
            std::optional<std::vector<int>>{std::vector<int>{1, 2, 3}});
    REQUIRE(ints.run(OptionApplicative{}, half, std::vector<int>{2, 3, 6}) == std::nullopt);

    SECTION("absent targets of some() are not visited") {
        auto present = some(each<std::vector<std::optional<int>>>());
        std::vector<std::optional<int>> data{4, std::nullopt, 8};
        auto result = present.run(OptionApplicative{}, half, data);
        REQUIRE(result == std::optional<std::vector<std::optional<int>>>{
                              std::vector<std::optional<int>>{2, std::nullopt, 4}});
    }
}

// ============================================================
// List
// ============================================================

TEST_CASE("list applicative yields branches left to right", "[applicative][list]") {
    auto ints = each<std::vector<int>>();
    auto both_signs = [](int n) { return immer::flex_vector<int>{n, -n}; };

    auto outcomes = ints.run(ListApplicative{}, both_signs, std::vector<int>{1, 2});
    REQUIRE(outcomes == immer::flex_vector<std::vector<int>>{
                            std::vector<int>{1, 2},
                            std::vector<int>{1, -2},
                            std::vector<int>{-1, 2},
                            std::vector<int>{-1, -2},
                        });

    SECTION("no targets yields exactly one outcome") {
        REQUIRE(ints.run(ListApplicative{}, both_signs, std::vector<int>{}).size() == 1);
    }

    SECTION("a target with no outcome yields none") {
        auto none_for_zero = [](int n) {
            return n == 0 ? immer::flex_vector<int>{} : immer::flex_vector<int>{n};
        };
        REQUIRE(ints.run(ListApplicative{}, none_for_zero, std::vector<int>{1, 0, 2}).empty());
    }
}

// ============================================================
// Const
// ============================================================

TEST_CASE("const applicative reads without rebuilding", "[applicative][const]") {
    auto names = each<std::vector<Account>>() | prop(&Account::owner);
    std::vector<Account> accounts{{"ann", 1}, {"ben", 2}};

    auto joined = names.run(ConstApplicative<SumMonoid<std::string>>{},
                            [](const std::string& s) { return s + ";"; }, accounts);
    REQUIRE(joined == "ann;ben;");
}

// ============================================================
// User-defined applicative
// ============================================================

TEST_CASE("applicative without map goes through map2", "[applicative][custom]") {
    auto balances = each<std::vector<Account>>() | prop(&Account::balance) |
                    filter([](int b) { return b != 0; });
    std::vector<Account> accounts{{"ann", 3}, {"ben", 0}, {"cid", 7}};

    auto logged = balances.run(LoggingApplicative{}, [](int b) {
        return Logged<int>{b * 2, immer::flex_vector<int>{b}};
    }, accounts);

    REQUIRE(logged.visited == immer::flex_vector<int>{3, 7});
    REQUIRE(logged.value == std::vector<Account>{{"ann", 6}, {"ben", 0}, {"cid", 14}});
}

// ============================================================
// Deferred effects
// ============================================================

TEST_CASE("ap_map keeps its function alive for deferred effects", "[applicative][deferred]") {
    auto labelled = ap_map(NumberingApplicative{}, take_number("job"),
                           [suffix = std::string(64, 'x')](const std::string& v) { return v + suffix; });
    auto [label, next] = labelled(5);
    REQUIRE(label == "job #5" + std::string(64, 'x'));
    REQUIRE(next == 6);
}

TEST_CASE("deferred effects outlive the traversal that built them", "[applicative][deferred]") {
    SECTION("through filter and prop") {
        auto numbered = number_open_tickets({{"login", true}, {"cache", false}, {"deploy", true}});
        auto [tickets, next] = numbered(1);
        REQUIRE(tickets == std::vector<Ticket>{{"login #1", true}, {"cache", false}, {"deploy #2", true}});
        REQUIRE(next == 3);

        // Running again starts over from the given counter
        REQUIRE(numbered(10).first[2].label == "deploy #11");
    }

    SECTION("through index") {
        auto numbered = number_second_entries({{"a", "b"}, {"c"}, {"d", "e", "f"}});
        auto [rows, next] = numbered(1);
        REQUIRE(rows == std::vector<std::vector<std::string>>{{"a", "b #1"}, {"c"}, {"d", "e #2", "f"}});
        REQUIRE(next == 3);
    }

    SECTION("over map values") {
        auto numbered = number_owners({{"api", "ann"}, {"web", "ben"}});
        auto [owners, next] = numbered(1);
        REQUIRE(owners == std::map<std::string, std::string>{{"api", "ann #1"}, {"web", "ben #2"}});
        REQUIRE(next == 3);
    }
}
