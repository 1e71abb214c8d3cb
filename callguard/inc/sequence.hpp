// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "arguments.hpp"

#include <coroutine>
#include <cstddef>
#include <exception>
#include <iterator>
#include <optional>
#include <utility>

namespace callguard {

/**
 * @brief Lazy, single-pass sequence of Values produced by a coroutine.
 *
 * The body starts on the first next(). Closing or destroying the sequence
 * destroys the suspended coroutine frame, running the destructors of its
 * locals. Errors thrown by the body are rethrown from next().
 *
 * Usage:
 *   Sequence numbers() {
 *       co_yield 1;
 *       co_yield 2;
 *   }
 *   for (const Value& v : numbers()) { ... }
 */
class Sequence {
public:
    struct promise_type {
        std::optional<Value> current;
        std::exception_ptr error;

        Sequence get_return_object() {
            return Sequence(std::coroutine_handle<promise_type>::from_promise(*this));
        }

        std::suspend_always initial_suspend() noexcept { return {}; }
        std::suspend_always final_suspend() noexcept { return {}; }

        template <typename T>
        std::suspend_always yield_value(T&& value) {
            current = to_value(std::forward<T>(value));
            return {};
        }

        void return_void() noexcept {}
        void unhandled_exception() noexcept { error = std::current_exception(); }
    };

    using handle_type = std::coroutine_handle<promise_type>;

    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Value;
        using difference_type = std::ptrdiff_t;
        using pointer = const Value*;
        using reference = const Value&;

        iterator() = default;
        explicit iterator(Sequence* sequence) : sequence_(sequence) { advance(); }

        reference operator*() const { return *current_; }
        pointer operator->() const { return &*current_; }

        iterator& operator++() {
            advance();
            return *this;
        }
        void operator++(int) { advance(); }

        bool operator==(std::default_sentinel_t) const { return !current_.has_value(); }

    private:
        void advance() { current_ = sequence_->next(); }

        Sequence* sequence_ = nullptr;
        std::optional<Value> current_;
    };

    Sequence() = default;
    explicit Sequence(handle_type handle) : handle_(handle) {}

    Sequence(Sequence&& other) noexcept : handle_(std::exchange(other.handle_, {})) {}

    Sequence& operator=(Sequence&& other) noexcept {
        if (this != &other) {
            close();
            handle_ = std::exchange(other.handle_, {});
        }
        return *this;
    }

    Sequence(const Sequence&) = delete;
    Sequence& operator=(const Sequence&) = delete;

    ~Sequence() { close(); }

    /**
     * @brief Resume the body until it yields, returns or throws.
     *
     * @return The next element, or nullopt once exhausted or closed
     * @throws whatever the body threw (once; later calls return nullopt)
     */
    std::optional<Value> next() {
        if (!handle_ || handle_.done()) {
            return std::nullopt;
        }
        handle_.resume();
        auto& promise = handle_.promise();
        if (promise.error) {
            std::rethrow_exception(std::exchange(promise.error, nullptr));
        }
        if (handle_.done()) {
            return std::nullopt;
        }
        return std::exchange(promise.current, std::nullopt);
    }

    /// Abandon iteration; destroys the suspended body.
    void close() noexcept {
        if (handle_) {
            std::exchange(handle_, {}).destroy();
        }
    }

    [[nodiscard]] bool done() const { return !handle_ || handle_.done(); }

    iterator begin() { return iterator(this); }
    std::default_sentinel_t end() { return {}; }

private:
    handle_type handle_;
};

} // namespace callguard
