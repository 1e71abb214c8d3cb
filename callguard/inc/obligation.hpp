// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "callback_guard.hpp"

#include <memory>
#include <string>

namespace callguard {

/**
 * @brief Scope guard owning one decorated call's duty to fire the fallback.
 *
 * Discharged exactly once: by discharge() when the unit of work completes
 * normally, or by the destructor when it is left through an exception, closed
 * early or destroyed while suspended. Either way the guard's fallback fires
 * unless the callback was already invoked or released.
 *
 * Exceptions thrown by the fallback propagate from discharge(). In the
 * destructor they cannot: std::exception is logged and dropped so the original
 * outcome continues, anything else terminates.
 */
class Obligation {
public:
    Obligation(std::shared_ptr<CallbackGuard> guard, std::string callable);

    ~Obligation();

    Obligation(Obligation&& other) noexcept;
    Obligation& operator=(Obligation&&) = delete;
    Obligation(const Obligation&) = delete;
    Obligation& operator=(const Obligation&) = delete;

    /// Normal-completion exit path.
    void discharge();

    [[nodiscard]] bool pending() const { return guard_ != nullptr; }
    [[nodiscard]] const std::shared_ptr<CallbackGuard>& guard() const { return guard_; }

private:
    void settle(const std::shared_ptr<CallbackGuard>& guard, const char* exit_path) const;

    std::shared_ptr<CallbackGuard> guard_;
    std::string callable_;
};

} // namespace callguard
