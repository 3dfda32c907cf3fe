//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: FutureAwaitable.h
// Purpose: Awaiters enabling co_await on std::future and std::shared_future for C++20 coroutines
//==========================================================================================================

#pragma once

#include <future>
#include <coroutine>
#include <chrono>
#include <thread>
#include <utility>

namespace mcpgw {
namespace async {

// Awaiter for std::future<T>. A not-yet-ready future is waited on by a detached helper thread which
// resumes the coroutine; stored exceptions surface from await_resume via get().

template <typename T>
class FutureAwaitable {
public:
    explicit FutureAwaitable(std::future<T>&& f) : fut(std::move(f)) {}

    bool await_ready() const noexcept {
        using namespace std::chrono_literals;
        return fut.wait_for(0s) == std::future_status::ready;
    }

    void await_suspend(std::coroutine_handle<> h) {
        std::thread waiter([this, h]() mutable {
            fut.wait();
            h.resume();
        });
        waiter.detach();
    }

    T await_resume() { return fut.get(); }

private:
    std::future<T> fut;
};

// void specialization

template <>
class FutureAwaitable<void> {
public:
    explicit FutureAwaitable(std::future<void>&& f) : fut(std::move(f)) {}

    bool await_ready() const noexcept {
        using namespace std::chrono_literals;
        return fut.wait_for(0s) == std::future_status::ready;
    }

    void await_suspend(std::coroutine_handle<> h) {
        std::thread waiter([this, h]() mutable {
            fut.wait();
            h.resume();
        });
        waiter.detach();
    }

    void await_resume() { fut.get(); }

private:
    std::future<void> fut;
};

// Awaiter for std::shared_future<T>; several coroutines may await copies of the same shared state.

template <typename T>
class SharedFutureAwaitable {
public:
    explicit SharedFutureAwaitable(std::shared_future<T> f) : fut(std::move(f)) {}

    bool await_ready() const noexcept {
        using namespace std::chrono_literals;
        return fut.wait_for(0s) == std::future_status::ready;
    }

    void await_suspend(std::coroutine_handle<> h) {
        std::thread waiter([this, h]() mutable {
            fut.wait();
            h.resume();
        });
        waiter.detach();
    }

    decltype(auto) await_resume() { return fut.get(); }

private:
    std::shared_future<T> fut;
};

// Helper factories

template <typename T>
inline FutureAwaitable<T> makeFutureAwaitable(std::future<T>&& fut) {
    return FutureAwaitable<T>(std::move(fut));
}

template <typename T>
inline SharedFutureAwaitable<T> makeFutureAwaitable(std::shared_future<T> fut) {
    return SharedFutureAwaitable<T>(std::move(fut));
}

} // namespace async
} // namespace mcpgw
