#pragma once

#include "core/result.hpp"

#include <future>
#include <type_traits>
#include <utility>

// Suspension-aware combinators. Every function returns a deferred future:
// nothing runs until the caller waits on it, and each step waits for the
// one before it, so a chain runs strictly in order on the waiting thread.
// Steps may return plain values or std::futures of them. An exception
// carried by any awaited future (cancellation, timeout, ...) propagates to
// the caller of get().

namespace verdict {

namespace detail {

template <typename X>
struct is_future : std::false_type {};
template <typename U>
struct is_future<std::future<U>> : std::true_type {};

template <typename X>
struct settled {
    using type = X;
};
template <typename U>
struct settled<std::future<U>> {
    using type = U;
};

/// Type produced by a step once its future (if any) has completed.
template <typename X>
using settled_t = typename settled<std::decay_t<X>>::type;

template <typename X>
settled_t<X> settle(X&& step) {
    if constexpr (is_future<std::decay_t<X>>::value) {
        return step.get();
    } else {
        return std::forward<X>(step);
    }
}

template <typename X>
void settle_void(X&& step) {
    if constexpr (is_future<std::decay_t<X>>::value) {
        step.get();
    }
}

template <typename X>
Result<X> ready(std::future<Result<X>>& pending) {
    return pending.get();
}

template <typename X>
Result<X> ready(Result<X>& result) {
    return std::move(result);
}

template <typename X>
struct outcome_of;
template <typename X>
struct outcome_of<Result<X>> {
    using type = X;
};
template <typename X>
struct outcome_of<std::future<Result<X>>> {
    using type = X;
};

template <typename Source>
using outcome_t = typename outcome_of<std::decay_t<Source>>::type;

/// Steps on a Result<void> take no argument.
template <typename F, typename T>
struct step_result {
    using type = std::invoke_result_t<F&, const T&>;
};
template <typename F>
struct step_result<F, void> {
    using type = std::invoke_result_t<F&>;
};

template <typename F, typename T>
using step_t = typename step_result<F, T>::type;

template <typename F, typename T>
decltype(auto) run_step(F& f, const Result<T>& result) {
    if constexpr (std::is_void_v<T>) {
        return std::invoke(f);
    } else {
        return std::invoke(f, result.value());
    }
}

} // namespace detail

/// Source is a Result<T> or a std::future<Result<T>>. For Result<void>
/// every step is nullary.
/// f: T -> U or T -> std::future<U>.
template <typename Source, typename F>
auto map_async(Source source, F f) {
    using T = detail::outcome_t<Source>;
    using U = detail::settled_t<detail::step_t<F, T>>;
    static_assert(!detail::is_result_v<U>,
                  "map_async() callback returned a Result; use bind_async()");
    return std::async(std::launch::deferred,
                      [source = std::move(source), f = std::move(f)]() mutable {
                          Result<T> result = detail::ready(source);
                          if (result.is_failure()) {
                              return Result<U>::failure(result.error());
                          }
                          return Result<U>::success(
                              detail::settle(detail::run_step(f, result)));
                      });
}

/// f: T -> Result<U> or T -> std::future<Result<U>>.
template <typename Source, typename F>
auto bind_async(Source source, F f) {
    using T = detail::outcome_t<Source>;
    using R = detail::settled_t<detail::step_t<F, T>>;
    static_assert(detail::is_result_v<R>,
                  "bind_async() callback must return a Result");
    return std::async(std::launch::deferred,
                      [source = std::move(source), f = std::move(f)]() mutable -> R {
                          Result<T> result = detail::ready(source);
                          if (result.is_failure()) {
                              return R::failure(result.error());
                          }
                          return detail::settle(detail::run_step(f, result));
                      });
}

/// on_success: T -> X (or future), on_failure: ErrorPtr -> X (or future).
template <typename Source, typename S, typename E>
auto match_async(Source source, S on_success, E on_failure) {
    using T = detail::outcome_t<Source>;
    using X = detail::settled_t<detail::step_t<S, T>>;
    return std::async(std::launch::deferred,
                      [source = std::move(source), on_success = std::move(on_success),
                       on_failure = std::move(on_failure)]() mutable -> X {
                          Result<T> result = detail::ready(source);
                          if (result.is_success()) {
                              return detail::settle(
                                  detail::run_step(on_success, result));
                          }
                          return detail::settle(
                              std::invoke(on_failure, result.error()));
                      });
}

/// action: T -> void or T -> std::future<void>. Runs on success only.
template <typename Source, typename F>
auto tap_async(Source source, F action) {
    using T = detail::outcome_t<Source>;
    using Step = detail::step_t<F, T>;
    return std::async(std::launch::deferred,
                      [source = std::move(source), action = std::move(action)]() mutable {
                          Result<T> result = detail::ready(source);
                          if (result.is_success()) {
                              if constexpr (std::is_void_v<Step>) {
                                  detail::run_step(action, result);
                              } else {
                                  detail::settle_void(detail::run_step(action, result));
                              }
                          }
                          return result;
                      });
}

} // namespace verdict
