// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "arguments.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>

namespace callguard {

/**
 * @brief What an explicit second call through a GuardedProxy does.
 */
enum class DoubleInvokePolicy {
    Reject, ///< Throw AlreadyInvoked
    Ignore  ///< Do nothing, log a warning, return an empty Value
};

/// Policy used by guards whose decorator does not choose one.
[[nodiscard]] DoubleInvokePolicy default_double_invoke_policy();

void set_default_double_invoke_policy(DoubleInvokePolicy policy);

/**
 * @brief Shared state tracking one logical callback along a delegation chain.
 *
 * Created by the first decorated call that receives the raw callback and
 * shared by every nested decorated call the proxy is forwarded to.
 *
 * `invoked` goes from false to true at most once, claimed by compare-and-set,
 * so the callback fires at most once even if two owners discharge
 * concurrently. A released guard is never fired automatically.
 *
 * Usage:
 *   auto guard = std::make_shared<CallbackGuard>(callback, Arguments::of("fallback"), "f");
 *   GuardedProxy proxy(guard);
 *   proxy(Arguments::of("done"));   // explicit call
 *   guard->fire_fallback();         // no-op, already invoked
 */
class CallbackGuard {
public:
    /**
     * @brief Construct guard for a raw callback.
     *
     * @param callback Callback supplied by the outermost caller
     * @param fallback Arguments used if an owner must fire the callback itself
     * @param owner Name of the decorated callable that created the guard
     * @param policy Behaviour on a second explicit call
     */
    CallbackGuard(Callback callback, Arguments fallback, std::string owner,
                  DoubleInvokePolicy policy = default_double_invoke_policy());

    /**
     * @brief Explicit call with the caller's arguments.
     *
     * @return Result of the callback
     * @throws AlreadyInvoked on a repeat call if the policy is Reject
     */
    Value invoke(const Arguments& args);

    /**
     * @brief Fire the callback with the fallback arguments if still owed.
     *
     * @return true if the callback was called by this invocation
     */
    bool fire_fallback();

    /**
     * @brief Waive every pending obligation and hand out the raw callback.
     *
     * The returned callback does not mark the guard as invoked.
     */
    [[nodiscard]] Callback release();

    /**
     * @brief Re-obligate the guard with the fallback of a nested decorated call.
     */
    void set_fallback(Arguments fallback, std::string owner);

    [[nodiscard]] bool invoked() const { return (state_.load() & INVOKED) != 0; }
    [[nodiscard]] bool released() const { return (state_.load() & RELEASED) != 0; }
    [[nodiscard]] DoubleInvokePolicy policy() const { return policy_; }
    [[nodiscard]] Arguments fallback() const;
    [[nodiscard]] std::string owner() const;

    CallbackGuard(const CallbackGuard&) = delete;
    CallbackGuard& operator=(const CallbackGuard&) = delete;
    CallbackGuard(CallbackGuard&&) = delete;
    CallbackGuard& operator=(CallbackGuard&&) = delete;

private:
    // Both flags live in one word so that release() and an automatic firing
    // cannot interleave between the check and the claim.
    static constexpr unsigned INVOKED = 1U;
    static constexpr unsigned RELEASED = 2U;

    const Callback callback_;
    const DoubleInvokePolicy policy_;
    std::atomic<unsigned> state_{0U};

    mutable std::mutex fallback_mutex_;
    Arguments fallback_;
    std::string owner_;
};

/**
 * @brief Callable substituted for the raw callback in a decorated call.
 *
 * Calling it marks the shared guard as invoked and forwards the caller's
 * arguments to the real callback.
 */
class GuardedProxy {
public:
    explicit GuardedProxy(std::shared_ptr<CallbackGuard> guard);

    Value operator()(const Arguments& args) const { return guard_->invoke(args); }

    /// Call with plain positional values.
    template <typename... Ts>
    Value call(Ts&&... values) const {
        return guard_->invoke(Arguments::of(std::forward<Ts>(values)...));
    }

    [[nodiscard]] const std::shared_ptr<CallbackGuard>& guard() const { return guard_; }

private:
    std::shared_ptr<CallbackGuard> guard_;
};

/// A callback argument: either the raw callback or one already guarded upstream.
using CallbackValue = std::variant<Callback, GuardedProxy>;

/**
 * @brief Classify an argument value.
 *
 * @return The callback or proxy held by the value, or nullopt if it holds
 *         neither (or an empty Callback)
 */
[[nodiscard]] std::optional<CallbackValue> as_callback_value(const Value& value);

/**
 * @brief Detach a guarded callback from automatic enforcement.
 *
 * Marks the proxy's guard released, so no decorated call holding it (at any
 * nesting level) fires the fallback, and returns the raw callback. Whoever
 * holds the result is responsible for calling it.
 *
 * @throws NotAGuardedCallback if the value is not a GuardedProxy
 */
[[nodiscard]] Callback release(const Value& value);

[[nodiscard]] Callback release(const GuardedProxy& proxy);

} // namespace callguard
