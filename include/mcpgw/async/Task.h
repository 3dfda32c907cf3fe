//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Task.h
// Purpose: Eager, cancellable coroutine task bridging to std::future for C++20
//==========================================================================================================

#pragma once

#include <concepts>
#include <coroutine>
#include <exception>
#include <future>
#include <optional>
#include <stop_token>
#include <type_traits>
#include <utility>

namespace mcpgw {
namespace async {

//==========================================================================================================
// Task<T>
// Purpose: Coroutine return type exposing its result as a std::future<T> and owning a stop source.
// Notes:
//   - The body runs synchronously up to its first suspension, so an exception thrown before any
//     co_await is already stored in the future when the caller receives it.
//   - A std::stop_token parameter of the coroutine is chained into the task's stop source; the body
//     reads the combined token with `co_await async::thisStopToken()`.
//   - RequestStop() may be called after toFuture() and after the body has finished.
//==========================================================================================================
template <typename T>
class Task;

namespace detail {

struct StopForwarder {
    std::stop_source* target;
    void operator()() const noexcept { target->request_stop(); }
};

template <typename T>
class TaskPromiseBase {
public:
    TaskPromiseBase() = default;

    // Sees the coroutine's arguments (including `*this` for member coroutines) before the body runs
    template <typename... Args>
    explicit TaskPromiseBase(Args&... args) {
        (linkIfToken(args), ...);
    }

    std::suspend_never initial_suspend() noexcept { return {}; }
    std::suspend_never final_suspend() noexcept { return {}; }
    void unhandled_exception() { result.set_exception(std::current_exception()); }

    std::stop_source& stopSource() noexcept { return source; }

protected:
    std::promise<T> result;
    std::stop_source source;

private:
    template <typename A>
    void linkIfToken(A& arg) {
        if constexpr (std::is_same_v<std::remove_cvref_t<A>, std::stop_token>) {
            if (!upstream && arg.stop_possible()) {
                upstream.emplace(arg, StopForwarder{&source});
            }
        }
    }

    std::optional<std::stop_callback<StopForwarder>> upstream;
};

template <typename T>
class TaskPromise : public TaskPromiseBase<T> {
public:
    using TaskPromiseBase<T>::TaskPromiseBase;

    Task<T> get_return_object();

    template <typename U>
    requires std::convertible_to<U, T>
    void return_value(U&& v) { this->result.set_value(std::forward<U>(v)); }
};

template <>
class TaskPromise<void> : public TaskPromiseBase<void> {
public:
    using TaskPromiseBase<void>::TaskPromiseBase;

    Task<void> get_return_object();

    void return_void() { this->result.set_value(); }
};

} // namespace detail

template <typename T>
class Task {
public:
    using value_type = T;
    using promise_type = detail::TaskPromise<T>;

    Task(Task&&) noexcept = default;
    Task& operator=(Task&&) noexcept = default;
    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    std::future<T> toFuture() { return std::move(fut); }

    // Asks the body to stop; returns false when stop was already requested
    bool RequestStop() noexcept { return stop.request_stop(); }

    std::stop_token StopToken() const noexcept { return stop.get_token(); }

private:
    friend promise_type;

    Task(std::future<T>&& f, std::stop_source s) : fut(std::move(f)), stop(std::move(s)) {}

    std::future<T> fut;
    std::stop_source stop;
};

namespace detail {

template <typename T>
Task<T> TaskPromise<T>::get_return_object() {
    return Task<T>(this->result.get_future(), this->source);
}

inline Task<void> TaskPromise<void>::get_return_object() {
    return Task<void>(this->result.get_future(), this->source);
}

} // namespace detail

// Awaiter yielding the running task's stop token without suspending
class StopTokenAwaiter {
public:
    bool await_ready() const noexcept { return false; }

    template <typename P>
    bool await_suspend(std::coroutine_handle<P> h) noexcept {
        token = h.promise().stopSource().get_token();
        return false;
    }

    std::stop_token await_resume() noexcept { return std::move(token); }

private:
    std::stop_token token;
};

inline StopTokenAwaiter thisStopToken() noexcept {
    return {};
}

} // namespace async
} // namespace mcpgw
