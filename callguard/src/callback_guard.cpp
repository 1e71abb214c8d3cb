// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "callback_guard.hpp"

#include "errors.hpp"
#include "logger.hpp"

namespace callguard {

namespace {

std::atomic<DoubleInvokePolicy> g_default_policy{DoubleInvokePolicy::Reject};

} // namespace

DoubleInvokePolicy default_double_invoke_policy() {
    return g_default_policy.load();
}

void set_default_double_invoke_policy(DoubleInvokePolicy policy) {
    g_default_policy.store(policy);
}

CallbackGuard::CallbackGuard(Callback callback, Arguments fallback, std::string owner,
                             DoubleInvokePolicy policy)
    : callback_(std::move(callback)), policy_(policy), fallback_(std::move(fallback)),
      owner_(std::move(owner)) {}

Value CallbackGuard::invoke(const Arguments& args) {
    if ((state_.fetch_or(INVOKED) & INVOKED) != 0) {
        if (policy_ == DoubleInvokePolicy::Reject) {
            throw AlreadyInvoked(owner());
        }
        CALLGUARD_LOG_WARN("Ignoring repeated call of callback guarded by '{}'", owner());
        return {};
    }
    return callback_(args);
}

bool CallbackGuard::fire_fallback() {
    // Only a guard that is neither invoked nor released may be claimed
    unsigned expected = 0U;
    if (!state_.compare_exchange_strong(expected, INVOKED)) {
        return false;
    }
    callback_(fallback());
    return true;
}

Callback CallbackGuard::release() {
    state_.fetch_or(RELEASED);
    return callback_;
}

void CallbackGuard::set_fallback(Arguments fallback, std::string owner) {
    std::lock_guard<std::mutex> lock(fallback_mutex_);
    fallback_ = std::move(fallback);
    owner_ = std::move(owner);
}

Arguments CallbackGuard::fallback() const {
    std::lock_guard<std::mutex> lock(fallback_mutex_);
    return fallback_;
}

std::string CallbackGuard::owner() const {
    std::lock_guard<std::mutex> lock(fallback_mutex_);
    return owner_;
}

GuardedProxy::GuardedProxy(std::shared_ptr<CallbackGuard> guard) : guard_(std::move(guard)) {}

std::optional<CallbackValue> as_callback_value(const Value& value) {
    if (const auto* proxy = std::any_cast<GuardedProxy>(&value)) {
        return CallbackValue(*proxy);
    }
    if (const auto* callback = std::any_cast<Callback>(&value); callback && *callback) {
        return CallbackValue(*callback);
    }
    return std::nullopt;
}

Callback release(const Value& value) {
    if (const auto* proxy = std::any_cast<GuardedProxy>(&value)) {
        return release(*proxy);
    }
    throw NotAGuardedCallback(describe(value));
}

Callback release(const GuardedProxy& proxy) {
    CALLGUARD_LOG_DEBUG("Releasing callback guarded by '{}'", proxy.guard()->owner());
    return proxy.guard()->release();
}

} // namespace callguard
