#pragma once

#include "core/error.hpp"

#include <string>
#include <string_view>

namespace verdict {

// Built-in variants. Each owns exactly one singleton Code named after the
// variant; the code is only visible through Error::code().

/// Failure of a call to a remote API: transport, HTTP status, payload
/// decoding. Not for application or domain errors.
class ApiError final : public Error {
public:
    class Code final : public SingletonErrorCode<Code> {
    public:
        std::string_view name() const override { return "ApiError"; }

    private:
        friend class SingletonErrorCode<Code>;
        Code() = default;
    };

    explicit ApiError(std::string description)
        : Error(Code::instance(), std::move(description)) {}
};

class BusinessRuleViolationError final : public Error {
public:
    class Code final : public SingletonErrorCode<Code> {
    public:
        std::string_view name() const override {
            return "BusinessRuleViolationError";
        }

    private:
        friend class SingletonErrorCode<Code>;
        Code() = default;
    };

    explicit BusinessRuleViolationError(std::string description)
        : Error(Code::instance(), std::move(description)) {}
};

class ConfigurationError final : public Error {
public:
    class Code final : public SingletonErrorCode<Code> {
    public:
        std::string_view name() const override { return "ConfigurationError"; }

    private:
        friend class SingletonErrorCode<Code>;
        Code() = default;
    };

    explicit ConfigurationError(std::string description)
        : Error(Code::instance(), std::move(description)) {}
};

class ConflictError final : public Error {
public:
    class Code final : public SingletonErrorCode<Code> {
    public:
        std::string_view name() const override { return "ConflictError"; }

    private:
        friend class SingletonErrorCode<Code>;
        Code() = default;
    };

    explicit ConflictError(std::string description)
        : Error(Code::instance(), std::move(description)) {}
};

class NotFoundError final : public Error {
public:
    class Code final : public SingletonErrorCode<Code> {
    public:
        std::string_view name() const override { return "NotFoundError"; }

    private:
        friend class SingletonErrorCode<Code>;
        Code() = default;
    };

    explicit NotFoundError(std::string description)
        : Error(Code::instance(), std::move(description)) {}
};

class UnauthorizedError final : public Error {
public:
    class Code final : public SingletonErrorCode<Code> {
    public:
        std::string_view name() const override { return "UnauthorizedError"; }

    private:
        friend class SingletonErrorCode<Code>;
        Code() = default;
    };

    explicit UnauthorizedError(std::string description)
        : Error(Code::instance(), std::move(description)) {}
};

/// An exception escaped application logic. Should be rare; letting the
/// exception propagate is usually the better choice.
class UnhandledExceptionError final : public Error {
public:
    class Code final : public SingletonErrorCode<Code> {
    public:
        std::string_view name() const override {
            return "UnhandledExceptionError";
        }

    private:
        friend class SingletonErrorCode<Code>;
        Code() = default;
    };

    explicit UnhandledExceptionError(std::string description)
        : Error(Code::instance(), std::move(description)) {}
};

class ValidationError final : public Error {
public:
    class Code final : public SingletonErrorCode<Code> {
    public:
        std::string_view name() const override { return "ValidationError"; }

    private:
        friend class SingletonErrorCode<Code>;
        Code() = default;
    };

    explicit ValidationError(std::string description)
        : Error(Code::instance(), std::move(description)) {}
};

} // namespace verdict
