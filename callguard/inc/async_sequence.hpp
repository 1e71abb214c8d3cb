// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "arguments.hpp"
#include "obligation.hpp"

#include <functional>
#include <optional>
#include <vector>

#include <boost/asio/awaitable.hpp>

namespace callguard {

/// One asynchronous step of an AsyncSequence: the next element, or nullopt at the end.
using AsyncStep = boost::asio::awaitable<std::optional<Value>>;

class DecoratedAsyncSequence;

/**
 * @brief Lazy, single-pass sequence whose elements are produced asynchronously.
 *
 * Wraps a producer that is awaited once per element. The producer's captured
 * state is the body's state: it is destroyed when the sequence is exhausted,
 * fails, is closed or is destroyed.
 *
 * When returned by a decorated call it carries that call's obligation (one per
 * stacked decoration). The obligation is discharged when next() reports the
 * end, fires before a producer error reaches the consumer, and fires when the
 * sequence is closed or destroyed early. The producer state always goes first.
 *
 * Single consumer: the sequence must not be moved or destroyed while a next()
 * is being awaited.
 *
 * Usage:
 *   AsyncSequence numbers() {
 *       auto count = std::make_shared<int>(0);
 *       return AsyncSequence([count]() -> AsyncStep {
 *           if (*count == 2) {
 *               co_return std::nullopt;
 *           }
 *           co_return Value(++*count);
 *       });
 *   }
 *   while (auto item = co_await sequence.next()) { ... }
 */
class AsyncSequence {
public:
    using Producer = std::function<AsyncStep()>;

    AsyncSequence() = default;
    explicit AsyncSequence(Producer producer) : producer_(std::move(producer)) {}

    AsyncSequence(AsyncSequence&& other) noexcept;
    AsyncSequence& operator=(AsyncSequence&&) = delete;
    AsyncSequence(const AsyncSequence&) = delete;
    AsyncSequence& operator=(const AsyncSequence&) = delete;

    ~AsyncSequence() { close(); }

    /**
     * @brief Await the next element.
     *
     * @return The next element, or nullopt once exhausted or closed
     * @throws whatever the producer threw (once; the sequence is done afterwards)
     */
    AsyncStep next();

    /// Abandon iteration; destroys the producer state, then settles any obligation.
    void close() noexcept;

    [[nodiscard]] bool done() const { return !producer_; }

private:
    friend class DecoratedAsyncSequence;

    void attach(Obligation obligation) { obligations_.push_back(std::move(obligation)); }

    // Declared before the producer: destroyed after it
    std::vector<Obligation> obligations_;
    Producer producer_;
};

} // namespace callguard
