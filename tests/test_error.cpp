#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "core/errors.hpp"
#include "core/result.hpp"

#include <stdexcept>
#include <type_traits>

using namespace verdict;
using Catch::Matchers::ContainsSubstring;

TEST_CASE("Error factories build the matching variant", "[error]") {
    struct Case {
        ErrorPtr error;
        const char* code;
    };
    Case cases[] = {
        {Error::api_error("API connection failed"), "ApiError"},
        {Error::business_rule_violation("Balance cannot be negative"),
         "BusinessRuleViolationError"},
        {Error::configuration("Missing connection string"), "ConfigurationError"},
        {Error::conflict("Resource already exists"), "ConflictError"},
        {Error::not_found("User not found"), "NotFoundError"},
        {Error::unauthorized("Access denied"), "UnauthorizedError"},
        {Error::validation("Email format is invalid"), "ValidationError"},
    };

    for (const auto& c : cases) {
        REQUIRE(c.error);
        CHECK(c.error->code().to_string() == c.code);
        CHECK_FALSE(c.error->description().empty());
    }

    CHECK(cases[0].error->is_error_type<ApiError>());
    CHECK(cases[4].error->is_error_type<NotFoundError>());
    CHECK(cases[4].error->description() == "User not found");
    CHECK(cases[6].error->is_error_type<ValidationError>());
}

TEST_CASE("Error from exception keeps type name and message", "[error]") {
    std::runtime_error ex("Operation failed");
    auto error = Error::from_exception(ex);

    CHECK(error->is_error_type<UnhandledExceptionError>());
    CHECK(error->description() == "runtime_error: Operation failed");
    CHECK(error->code().to_string() == "UnhandledExceptionError");

    std::invalid_argument arg("bad");
    CHECK(Error::from_exception(arg)->description() == "invalid_argument: bad");
}

TEST_CASE("Error rejects blank descriptions at construction", "[error]") {
    CHECK_THROWS_AS(NotFoundError(""), std::invalid_argument);
    CHECK_THROWS_AS(NotFoundError("   \t\n"), std::invalid_argument);
    CHECK_THROWS_AS(Error::validation(" "), std::invalid_argument);
    CHECK_THROWS_WITH(Error(ConflictError::Code::instance(), ""),
                      ContainsSubstring("ConflictError"));
    CHECK_NOTHROW(NotFoundError(" x "));
}

TEST_CASE("is_error_type checks the dynamic type", "[error]") {
    ErrorPtr error = Error::not_found("missing");

    CHECK(error->is_error_type<NotFoundError>());
    CHECK(error->is_error_type<Error>());
    CHECK_FALSE(error->is_error_type<ValidationError>());

    REQUIRE(error->as<NotFoundError>() != nullptr);
    CHECK(error->as<ConflictError>() == nullptr);
}

TEST_CASE("None sentinel is a plain Error with the None code", "[error]") {
    const ErrorPtr& none = no_error();
    REQUIRE(none);
    CHECK(none->code().to_string() == "None");
    CHECK(none->code() == NoneCode::instance());
    CHECK(none.get() == no_error().get());
    CHECK_FALSE(none->is_error_type<NotFoundError>());
}

TEST_CASE("Errors can be copied but not assigned", "[error]") {
    STATIC_REQUIRE(std::is_copy_constructible_v<NotFoundError>);
    STATIC_REQUIRE_FALSE(std::is_copy_assignable_v<Error>);
    STATIC_REQUIRE_FALSE(std::is_copy_assignable_v<NotFoundError>);
}
