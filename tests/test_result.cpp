#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include <catch2/generators/catch_generators_adapters.hpp>
#include <catch2/generators/catch_generators_random.hpp>
#include "core/errors.hpp"
#include "core/result.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using namespace verdict;

TEST_CASE("Result success and failure factories", "[result]") {
    auto ok = Result<int>::success(42);
    CHECK(ok.is_success());
    CHECK_FALSE(ok.is_failure());
    CHECK(static_cast<bool>(ok));
    CHECK(ok.value() == 42);
    CHECK(ok.error() == no_error());

    auto failed = Result<int>::failure(Error::not_found("nope"));
    CHECK(failed.is_failure());
    CHECK_FALSE(static_cast<bool>(failed));
    CHECK(failed.error()->is_error_type<NotFoundError>());
    CHECK(failed.error() != no_error());
}

TEST_CASE("Result converts implicitly from values and errors", "[result]") {
    auto parse = [](const std::string& text) -> Result<int> {
        if (text.empty()) return Error::validation("empty input");
        return std::stoi(text);
    };

    CHECK(parse("17").value() == 17);
    CHECK(parse("").error()->is_error_type<ValidationError>());

    Result<void> done;
    CHECK(done.is_success());
    CHECK(success().is_success());
    CHECK(success(std::string("x")).value() == "x");
}

TEST_CASE("Result rejects inconsistent construction", "[result]") {
    CHECK_THROWS_AS(Result<int>::failure(no_error()), std::invalid_argument);
    CHECK_THROWS_AS(Result<int>::failure(nullptr), std::invalid_argument);
    CHECK_THROWS_AS(Result<void>::failure(no_error()), std::invalid_argument);
    CHECK_THROWS_AS(Result<void>::failure(nullptr), std::invalid_argument);
}

TEST_CASE("A copy of the None sentinel is not a failure", "[result]") {
    auto lookalike = make_error<Error>(NoneCode::instance(), "None");
    CHECK_THROWS_AS(Result<int>::failure(lookalike), std::invalid_argument);
    CHECK_THROWS_AS(Result<void>::failure(lookalike), std::invalid_argument);
}

TEST_CASE("Result invariant holds for generated outcomes", "[result][property]") {
    auto n = GENERATE(take(200, random(-100000, 100000)));

    Result<int> result = (n % 3 == 0)
        ? Result<int>(Error::conflict("conflict " + std::to_string(n)))
        : Result<int>(n);

    CHECK(result.is_success() == (result.error() == no_error()));
    if (result.is_success()) {
        CHECK(result.value() == n);
    } else {
        CHECK(result.error()->description() == "conflict " + std::to_string(n));
    }
}

TEST_CASE("value() on a failed Result yields the default", "[result]") {
    Result<int> failed = Error::not_found("gone");
    CHECK(failed.value() == 0);

    Result<std::string> failed_text = Error::not_found("gone");
    CHECK(failed_text.value().empty());

    Result<std::vector<int>> failed_list = Error::not_found("gone");
    CHECK(failed_list.value().empty());
}

TEST_CASE("value_or_throw() raises on failure", "[result]") {
    Result<int> failed = Error::validation("too small");
    CHECK_THROWS_AS(failed.value_or_throw(), bad_result_access);
    try {
        failed.value_or_throw();
        FAIL("expected bad_result_access");
    } catch (const bad_result_access& ex) {
        CHECK(std::string(ex.what()) == "Result failed: too small");
    }

    CHECK(Result<int>(3).value_or_throw() == 3);
    CHECK_THROWS_AS(Result<void>(Error::conflict("c")).value_or_throw(),
                    bad_result_access);
}

TEST_CASE("map transforms success and preserves failure", "[result][combinators]") {
    auto doubled = Result<int>(5).map([](int x) { return x * 2; });
    CHECK(doubled.value() == 10);

    Result<int> failed = Error::not_found("x");
    bool called = false;
    auto mapped = failed.map([&](int x) {
        called = true;
        return std::to_string(x);
    });
    CHECK_FALSE(called);
    CHECK(mapped.is_failure());
    CHECK(mapped.error() == failed.error());
}

TEST_CASE("map keeps the same error for generated failures", "[result][property]") {
    auto n = GENERATE(take(50, random(1, 1000)));
    Result<int> failed = Error::validation("bad " + std::to_string(n));
    auto mapped = failed.map([](int x) { return x + 1; });
    CHECK(mapped.error().get() == failed.error().get());
}

TEST_CASE("bind short-circuits on failure", "[result][combinators]") {
    int calls = 0;
    auto step = [&](int x) -> Result<int> {
        ++calls;
        return x + 1;
    };

    Result<int> failed = Error::conflict("stop");
    auto chained = failed.bind(step).bind(step).bind(step);
    CHECK(calls == 0);
    CHECK(chained.error() == failed.error());

    auto ok = Result<int>(1).bind(step).bind(step);
    CHECK(calls == 2);
    CHECK(ok.value() == 3);
}

TEST_CASE("bind stops at the first failing step", "[result][combinators]") {
    std::vector<int> seen;
    auto record = [&](int x) -> Result<int> {
        seen.push_back(x);
        if (x >= 2) return Error::business_rule_violation("limit reached");
        return x + 1;
    };

    auto result = Result<int>(0).bind(record).bind(record).bind(record).bind(record);
    CHECK(seen == (std::vector<int>{0, 1, 2}));
    CHECK(result.error()->is_error_type<BusinessRuleViolationError>());
}

TEST_CASE("Map then bind chain", "[result][combinators]") {
    auto to_text = [](int x) -> Result<std::string> {
        if (x > 5) return std::to_string(x);
        return Error::validation("too small");
    };

    auto ok = success(5).map([](int x) { return x * 2; }).bind(to_text);
    REQUIRE(ok.is_success());
    CHECK(ok.value() == "10");

    bool mapped = false;
    bool bound = false;
    Result<int> start = Error::not_found("x");
    auto failed = start
                      .map([&](int x) {
                          mapped = true;
                          return x * 2;
                      })
                      .bind([&](int x) {
                          bound = true;
                          return to_text(x);
                      });
    CHECK_FALSE(mapped);
    CHECK_FALSE(bound);
    CHECK(failed.error() == start.error());
    CHECK(failed.error()->is_error_type<NotFoundError>());
    CHECK(failed.error()->description() == "x");

    auto small = success(2).map([](int x) { return x * 2; }).bind(to_text);
    CHECK(small.error()->is_error_type<ValidationError>());
}

TEST_CASE("match runs exactly one branch", "[result][combinators]") {
    auto describe = [](const Result<int>& r) {
        return r.match([](int x) { return "Success: " + std::to_string(x); },
                       [](const ErrorPtr& e) { return "Error: " + e->description(); });
    };

    CHECK(describe(Result<int>(5)) == "Success: 5");
    CHECK(describe(Result<int>(Error::not_found("Item not found"))) ==
          "Error: Item not found");
}

TEST_CASE("tap runs on success only and leaves the Result unchanged", "[result][combinators]") {
    int seen = 0;
    auto tapped = Result<int>(7).tap([&](int x) { seen = x; });
    CHECK(seen == 7);
    CHECK(tapped.value() == 7);

    seen = 0;
    Result<int> failed = Error::unauthorized("no");
    auto same = failed.tap([&](int x) { seen = x; });
    CHECK(seen == 0);
    CHECK(same.error() == failed.error());
}

TEST_CASE("Result<void> combinators", "[result][combinators]") {
    Result<void> ok;
    CHECK(ok.map([] { return 4; }).value() == 4);
    CHECK(ok.bind([]() -> Result<std::string> { return std::string("a"); }).value() == "a");
    CHECK(ok.to_result(9).value() == 9);

    Result<void> failed = Error::conflict("busy");
    bool called = false;
    auto r = failed.map([&] {
        called = true;
        return 1;
    });
    CHECK_FALSE(called);
    CHECK(r.error() == failed.error());
    CHECK(failed.to_result(std::string("x")).error() == failed.error());
    CHECK(failed.match([] { return 1; }, [](const ErrorPtr&) { return 2; }) == 2);

    int taps = 0;
    ok.tap([&] { ++taps; });
    failed.tap([&] { ++taps; });
    CHECK(taps == 1);
}
