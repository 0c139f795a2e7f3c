//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: FutureAwaitable.h
// Purpose: Awaiter enabling co_await on std::future for C++20 coroutines
//==========================================================================================================

#pragma once

#include <chrono>
#include <coroutine>
#include <future>
#include <thread>
#include <type_traits>
#include <utility>

namespace mcpengine {
namespace async {

//==========================================================================================================
// FutureAwaitable<T>
// Purpose: co_await adapter for std::future<T>. A ready future resumes inline; otherwise a detached
//          waiter thread blocks on the future and resumes the coroutine on that thread. Failures stored
//          in the future are rethrown from await_resume.
//==========================================================================================================
template <typename T>
class FutureAwaitable {
public:
    explicit FutureAwaitable(std::future<T>&& f) : fut(std::move(f)) {}

    bool await_ready() const noexcept {
        using namespace std::chrono_literals;
        return fut.valid() && fut.wait_for(0s) == std::future_status::ready;
    }

    void await_suspend(std::coroutine_handle<> h) {
        // wait() never throws for a valid future; the stored outcome is observed in await_resume.
        std::thread([this, h]() mutable {
            fut.wait();
            h.resume();
        }).detach();
    }

    T await_resume() {
        if constexpr (std::is_void_v<T>) {
            fut.get();
        } else {
            return fut.get();
        }
    }

private:
    std::future<T> fut;
};

// Helper factory

template <typename T>
inline FutureAwaitable<T> makeFutureAwaitable(std::future<T>&& fut) {
    return FutureAwaitable<T>(std::move(fut));
}

} // namespace async
} // namespace mcpengine
