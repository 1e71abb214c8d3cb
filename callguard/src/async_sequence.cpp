// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "async_sequence.hpp"

#include <utility>

namespace callguard {

AsyncSequence::AsyncSequence(AsyncSequence&& other) noexcept
    : obligations_(std::exchange(other.obligations_, {})),
      producer_(std::exchange(other.producer_, nullptr)) {}

// While a step is in flight the obligations and the producer live in this
// frame, so an error or a destroyed frame settles them here: producer first,
// obligations last. They go back to the object only when an element arrives.
AsyncStep AsyncSequence::next() {
    std::vector<Obligation> pending = std::exchange(obligations_, {});
    Producer producer = std::exchange(producer_, nullptr);

    std::optional<Value> item;
    if (producer) {
        item = co_await producer();
    }
    if (!item) {
        producer = nullptr;
        for (Obligation& obligation : pending) {
            obligation.discharge();
        }
        co_return std::nullopt;
    }

    producer_ = std::move(producer);
    obligations_ = std::move(pending);
    co_return item;
}

void AsyncSequence::close() noexcept {
    producer_ = nullptr;
    obligations_.clear();
}

} // namespace callguard
