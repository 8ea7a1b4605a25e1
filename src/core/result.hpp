#pragma once

#include "core/error.hpp"
#include "core/error_code.hpp"
#include "core/types.hpp"

#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace verdict {

/// Code of the "no error" sentinel. Never used by a real failure.
class NoneCode final : public SingletonErrorCode<NoneCode> {
public:
    std::string_view name() const override { return "None"; }

private:
    friend class SingletonErrorCode<NoneCode>;
    NoneCode() = default;
};

/// The sentinel occupying the error slot of every successful Result.
/// Compared by identity.
const ErrorPtr& no_error();

/// Thrown by value_or_throw() on a failed Result.
class bad_result_access : public std::logic_error {
public:
    explicit bad_result_access(const Error& error)
        : std::logic_error("Result failed: " + error.description()) {}
};

template <typename T>
class Result;

namespace detail {

template <typename X>
struct is_result : std::false_type {};
template <typename U>
struct is_result<Result<U>> : std::true_type {};

template <typename X>
inline constexpr bool is_result_v = is_result<std::decay_t<X>>::value;

/// Throws std::invalid_argument unless ok <=> (error is the sentinel).
void check_outcome(bool ok, const ErrorPtr& error);

} // namespace detail

/// Outcome of an operation: either a value of type T or an Error.
///
/// value() on a failed Result returns a default-constructed T instead of
/// throwing. Callers that want the loud behavior use value_or_throw().
template <typename T>
class Result {
    static_assert(!std::is_reference_v<T>, "Result<T&> is not supported");
    static_assert(std::is_default_constructible_v<T>,
                  "Result<T> needs a default T for failed outcomes");

public:
    using value_type = T;

    Result(T value) : Result(true, no_error(), std::move(value)) {}
    Result(ErrorPtr error) : Result(false, std::move(error), T{}) {}

    static Result success(T value) { return Result(std::move(value)); }
    static Result failure(ErrorPtr error) { return Result(std::move(error)); }

    bool is_success() const { return ok_; }
    bool is_failure() const { return !ok_; }
    explicit operator bool() const { return ok_; }

    /// The failure, or no_error() on success.
    const ErrorPtr& error() const { return error_; }

    /// The success value, or a default-constructed T on failure.
    const T& value() const { return value_; }

    const T& value_or_throw() const {
        if (!ok_) throw bad_result_access(*error_);
        return value_;
    }

    /// Transform the value; failures pass through untouched.
    template <typename F>
    auto map(F&& f) const -> Result<std::invoke_result_t<F, const T&>> {
        using U = std::invoke_result_t<F, const T&>;
        static_assert(!detail::is_result_v<U>,
                      "map() callback returned a Result; use bind()");
        if (!ok_) return Result<U>::failure(error_);
        return Result<U>::success(std::invoke(std::forward<F>(f), value_));
    }

    /// Chain an operation that may fail. Never called on failure.
    template <typename F>
    auto bind(F&& f) const -> std::invoke_result_t<F, const T&> {
        using R = std::invoke_result_t<F, const T&>;
        static_assert(detail::is_result_v<R>, "bind() callback must return a Result");
        if (!ok_) return R::failure(error_);
        return std::invoke(std::forward<F>(f), value_);
    }

    /// Exactly one branch runs.
    template <typename S, typename E>
    auto match(S&& on_success, E&& on_failure) const
        -> std::invoke_result_t<S, const T&> {
        if (ok_) return std::invoke(std::forward<S>(on_success), value_);
        return std::invoke(std::forward<E>(on_failure), error_);
    }

    /// Side effect on success; returns the Result unchanged.
    template <typename F>
    Result tap(F&& f) const {
        if (ok_) std::invoke(std::forward<F>(f), value_);
        return *this;
    }

private:
    Result(bool ok, ErrorPtr error, T value)
        : ok_(ok), error_(std::move(error)), value_(std::move(value)) {
        detail::check_outcome(ok_, error_);
    }

    bool ok_;
    ErrorPtr error_;
    T value_;
};

/// Outcome of an operation that produces no value.
template <>
class Result<void> {
public:
    using value_type = void;

    Result() : Result(true, no_error()) {}
    Result(ErrorPtr error) : Result(false, std::move(error)) {}

    static Result success() { return Result(); }
    static Result failure(ErrorPtr error) { return Result(std::move(error)); }

    bool is_success() const { return ok_; }
    bool is_failure() const { return !ok_; }
    explicit operator bool() const { return ok_; }

    const ErrorPtr& error() const { return error_; }

    void value_or_throw() const {
        if (!ok_) throw bad_result_access(*error_);
    }

    template <typename U>
    Result<std::decay_t<U>> to_result(U&& value) const {
        if (!ok_) return Result<std::decay_t<U>>::failure(error_);
        return Result<std::decay_t<U>>::success(std::forward<U>(value));
    }

    template <typename F>
    auto map(F&& f) const -> Result<std::invoke_result_t<F>> {
        using U = std::invoke_result_t<F>;
        static_assert(!detail::is_result_v<U>,
                      "map() callback returned a Result; use bind()");
        if (!ok_) return Result<U>::failure(error_);
        return Result<U>::success(std::invoke(std::forward<F>(f)));
    }

    template <typename F>
    auto bind(F&& f) const -> std::invoke_result_t<F> {
        using R = std::invoke_result_t<F>;
        static_assert(detail::is_result_v<R>, "bind() callback must return a Result");
        if (!ok_) return R::failure(error_);
        return std::invoke(std::forward<F>(f));
    }

    template <typename S, typename E>
    auto match(S&& on_success, E&& on_failure) const -> std::invoke_result_t<S> {
        if (ok_) return std::invoke(std::forward<S>(on_success));
        return std::invoke(std::forward<E>(on_failure), error_);
    }

    template <typename F>
    Result tap(F&& f) const {
        if (ok_) std::invoke(std::forward<F>(f));
        return *this;
    }

private:
    Result(bool ok, ErrorPtr error) : ok_(ok), error_(std::move(error)) {
        detail::check_outcome(ok_, error_);
    }

    bool ok_;
    ErrorPtr error_;
};

template <typename T>
Result<std::decay_t<T>> success(T&& value) {
    return Result<std::decay_t<T>>::success(std::forward<T>(value));
}

inline Result<void> success() { return {}; }

} // namespace verdict
