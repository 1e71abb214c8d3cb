// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "obligation.hpp"

#include "logger.hpp"

#include <exception>

namespace callguard {

Obligation::Obligation(std::shared_ptr<CallbackGuard> guard, std::string callable)
    : guard_(std::move(guard)), callable_(std::move(callable)) {}

Obligation::Obligation(Obligation&& other) noexcept
    : guard_(std::move(other.guard_)), callable_(std::move(other.callable_)) {}

Obligation::~Obligation() {
    if (!guard_) {
        return;
    }
    const char* exit_path = std::uncaught_exceptions() > 0 ? "error" : "abandon";
    try {
        settle(guard_, exit_path);
    } catch (const std::exception& e) {
        CALLGUARD_LOG_ERROR_ENTRY(LogEntry("Fallback callback failed")
                                      .component("obligation")
                                      .operation(exit_path)
                                      .field("callable", callable_)
                                      .field("error", e.what()));
    }
}

void Obligation::discharge() {
    auto guard = std::move(guard_);
    if (guard) {
        settle(guard, "return");
    }
}

void Obligation::settle(const std::shared_ptr<CallbackGuard>& guard, const char* exit_path) const {
    if (guard->released()) {
        CALLGUARD_LOG_TRACE("Callback released, {}() owes no fallback", callable_);
        return;
    }
    const auto owner = guard->owner();
    if (guard->fire_fallback()) {
        CALLGUARD_LOG_DEBUG_ENTRY(LogEntry("Fallback callback fired")
                                      .component("obligation")
                                      .operation(exit_path)
                                      .field("callable", callable_)
                                      .field("fallback_owner", owner));
    }
}

} // namespace callguard
