//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Task.h
// Purpose: Coroutine Task type bridging to std::future, plus ready-future adapters for synchronous code
//==========================================================================================================

#pragma once

#include <concepts>
#include <coroutine>
#include <exception>
#include <future>
#include <type_traits>
#include <utility>

namespace mcpengine {
namespace async {

// Task<T> - eagerly started coroutine whose outcome is observed through a std::future<T>.
// Usage: Task<T> foo() { co_return value; } -> foo().toFuture()
// The frame destroys itself on completion, so a Task may be dropped while still running.

namespace detail {
template <typename T>
struct TaskPromiseBase {
    std::promise<T> promise;
    std::suspend_never initial_suspend() noexcept { return {}; }
    std::suspend_never final_suspend() noexcept { return {}; }
    void unhandled_exception() { promise.set_exception(std::current_exception()); }
};
} // namespace detail

template <typename T>
class Task {
public:
    using value_type = T;

    struct promise_type : detail::TaskPromiseBase<T> {
        Task get_return_object() noexcept { return Task{ this->promise.get_future() }; }
        template <typename U>
        requires std::convertible_to<U, T>
        void return_value(U&& v) { this->promise.set_value(std::forward<U>(v)); }
    };

    Task(Task&& other) noexcept = default;
    Task& operator=(Task&& other) noexcept = default;
    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    std::future<T> toFuture() { return std::move(fut); }

private:
    explicit Task(std::future<T>&& f) : fut(std::move(f)) {}
    std::future<T> fut;
};

template <>
class Task<void> {
public:
    using value_type = void;

    struct promise_type : detail::TaskPromiseBase<void> {
        Task get_return_object() noexcept { return Task{ this->promise.get_future() }; }
        void return_void() { this->promise.set_value(); }
    };

    Task(Task&& other) noexcept = default;
    Task& operator=(Task&& other) noexcept = default;
    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    std::future<void> toFuture() { return std::move(fut); }

private:
    explicit Task(std::future<void>&& f) : fut(std::move(f)) {}
    std::future<void> fut;
};

//==========================================================================================================
// makeReadyFuture / makeFailedFuture
// Purpose: Adapt a synchronous result (or failure) to the future-returning handler contract.
//==========================================================================================================
template <typename T>
std::future<std::decay_t<T>> makeReadyFuture(T&& value) {
    std::promise<std::decay_t<T>> p;
    p.set_value(std::forward<T>(value));
    return p.get_future();
}

inline std::future<void> makeReadyFuture() {
    std::promise<void> p;
    p.set_value();
    return p.get_future();
}

template <typename T>
std::future<T> makeFailedFuture(std::exception_ptr error) {
    std::promise<T> p;
    p.set_exception(std::move(error));
    return p.get_future();
}

} // namespace async
} // namespace mcpengine
