// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "callback_guard.hpp"
#include "errors.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

namespace callguard {
namespace {

/**
 * @brief Records every call of the callback it hands out.
 */
class CallRecorder {
public:
    Callback callback() {
        return [this](const Arguments& args) -> Value {
            calls_.push_back(args);
            return std::string("result");
        };
    }

    [[nodiscard]] size_t count() const { return calls_.size(); }

    [[nodiscard]] std::string arg(size_t call, size_t pos = 0) const {
        return std::any_cast<std::string>(calls_.at(call).positional.at(pos));
    }

private:
    std::vector<Arguments> calls_;
};

// =============================================================================
// Explicit invocation
// =============================================================================

TEST(CallbackGuardTest, Constructor_StartsNotInvokedNotReleased) {
    CallRecorder recorder;
    CallbackGuard guard(recorder.callback(), Arguments::of("fallback"), "f");

    EXPECT_FALSE(guard.invoked());
    EXPECT_FALSE(guard.released());
    EXPECT_EQ(guard.owner(), "f");
    EXPECT_EQ(recorder.count(), 0);
}

TEST(CallbackGuardTest, Invoke_UsesCallerArgumentsAndReturnsResult) {
    CallRecorder recorder;
    CallbackGuard guard(recorder.callback(), Arguments::of("fallback"), "f");

    Value result = guard.invoke(Arguments::of("explicit"));

    EXPECT_TRUE(guard.invoked());
    ASSERT_EQ(recorder.count(), 1);
    EXPECT_EQ(recorder.arg(0), "explicit");
    EXPECT_EQ(std::any_cast<std::string>(result), "result");
}

TEST(CallbackGuardTest, Invoke_TwiceRejectedByDefault) {
    CallRecorder recorder;
    CallbackGuard guard(recorder.callback(), {}, "f", DoubleInvokePolicy::Reject);

    guard.invoke(Arguments::of("first"));
    EXPECT_THROW(guard.invoke(Arguments::of("second")), AlreadyInvoked);
    EXPECT_EQ(recorder.count(), 1);
}

TEST(CallbackGuardTest, Invoke_TwiceIgnoredWithIgnorePolicy) {
    CallRecorder recorder;
    CallbackGuard guard(recorder.callback(), {}, "f", DoubleInvokePolicy::Ignore);

    guard.invoke(Arguments::of("first"));
    Value second = guard.invoke(Arguments::of("second"));

    EXPECT_FALSE(second.has_value());
    ASSERT_EQ(recorder.count(), 1);
    EXPECT_EQ(recorder.arg(0), "first");
}

TEST(CallbackGuardTest, AlreadyInvoked_NamesOwner) {
    CallRecorder recorder;
    CallbackGuard guard(recorder.callback(), {}, "outer", DoubleInvokePolicy::Reject);
    guard.invoke({});

    try {
        guard.invoke({});
        FAIL() << "expected AlreadyInvoked";
    } catch (const AlreadyInvoked& e) {
        EXPECT_EQ(e.callable(), "outer");
    }
}

// =============================================================================
// Fallback firing
// =============================================================================

TEST(CallbackGuardTest, FireFallback_UsesFallbackArguments) {
    CallRecorder recorder;
    CallbackGuard guard(recorder.callback(), Arguments::of("fallback").with("code", 7), "f");

    EXPECT_TRUE(guard.fire_fallback());
    EXPECT_TRUE(guard.invoked());
    ASSERT_EQ(recorder.count(), 1);
    EXPECT_EQ(recorder.arg(0), "fallback");
}

TEST(CallbackGuardTest, FireFallback_AtMostOnce) {
    CallRecorder recorder;
    CallbackGuard guard(recorder.callback(), Arguments::of("fallback"), "f");

    EXPECT_TRUE(guard.fire_fallback());
    EXPECT_FALSE(guard.fire_fallback());
    EXPECT_EQ(recorder.count(), 1);
}

TEST(CallbackGuardTest, FireFallback_NotAfterExplicitCall) {
    CallRecorder recorder;
    CallbackGuard guard(recorder.callback(), Arguments::of("fallback"), "f");

    guard.invoke(Arguments::of("explicit"));
    EXPECT_FALSE(guard.fire_fallback());
    ASSERT_EQ(recorder.count(), 1);
    EXPECT_EQ(recorder.arg(0), "explicit");
}

TEST(CallbackGuardTest, SetFallback_LatestWins) {
    CallRecorder recorder;
    CallbackGuard guard(recorder.callback(), Arguments::of("outer"), "outer");

    guard.set_fallback(Arguments::of("inner"), "inner");
    EXPECT_EQ(guard.owner(), "inner");

    guard.fire_fallback();
    ASSERT_EQ(recorder.count(), 1);
    EXPECT_EQ(recorder.arg(0), "inner");
}

// =============================================================================
// Release
// =============================================================================

TEST(CallbackGuardTest, Release_SuppressesFallback) {
    CallRecorder recorder;
    auto guard = std::make_shared<CallbackGuard>(recorder.callback(), Arguments::of("fb"), "f");

    Callback raw = release(GuardedProxy(guard));

    EXPECT_TRUE(guard->released());
    EXPECT_FALSE(guard->fire_fallback());
    EXPECT_EQ(recorder.count(), 0);
    EXPECT_TRUE(static_cast<bool>(raw));
}

TEST(CallbackGuardTest, Release_ReturnedCallbackDoesNotMarkInvoked) {
    CallRecorder recorder;
    auto guard = std::make_shared<CallbackGuard>(recorder.callback(), Arguments::of("fb"), "f");

    Callback raw = release(Value(GuardedProxy(guard)));
    raw(Arguments::of("later"));
    raw(Arguments::of("again"));

    EXPECT_FALSE(guard->invoked());
    ASSERT_EQ(recorder.count(), 2);
    EXPECT_EQ(recorder.arg(0), "later");
}

TEST(CallbackGuardTest, Release_TwiceReturnsSameCallback) {
    CallRecorder recorder;
    auto guard = std::make_shared<CallbackGuard>(recorder.callback(), Arguments{}, "f");
    GuardedProxy proxy(guard);

    Callback first = release(proxy);
    Callback second = release(proxy);
    second(Arguments::of("x"));

    EXPECT_TRUE(static_cast<bool>(first));
    EXPECT_EQ(recorder.count(), 1);
}

TEST(CallbackGuardTest, Release_RawCallbackThrowsNotAGuardedCallback) {
    CallRecorder recorder;
    EXPECT_THROW((void)release(Value(recorder.callback())), NotAGuardedCallback);
    EXPECT_THROW((void)release(Value(std::string("text"))), NotAGuardedCallback);
    EXPECT_THROW((void)release(Value{}), NotAGuardedCallback);
}

// =============================================================================
// Proxy and classification
// =============================================================================

TEST(CallbackGuardTest, Proxy_CallForwardsPositionalValues) {
    CallRecorder recorder;
    auto guard = std::make_shared<CallbackGuard>(recorder.callback(), Arguments{}, "f");
    GuardedProxy proxy(guard);

    proxy.call("a", "b");

    EXPECT_TRUE(guard->invoked());
    ASSERT_EQ(recorder.count(), 1);
    EXPECT_EQ(recorder.arg(0, 0), "a");
    EXPECT_EQ(recorder.arg(0, 1), "b");
}

TEST(CallbackGuardTest, Proxy_CopiesShareOneGuard) {
    CallRecorder recorder;
    auto guard = std::make_shared<CallbackGuard>(recorder.callback(), Arguments{}, "f",
                                                 DoubleInvokePolicy::Ignore);
    GuardedProxy first(guard);
    GuardedProxy second = first;

    first(Arguments::of("one"));
    second(Arguments::of("two"));

    EXPECT_EQ(second.guard(), guard);
    EXPECT_EQ(recorder.count(), 1);
}

TEST(CallbackGuardTest, AsCallbackValue_ClassifiesValues) {
    CallRecorder recorder;
    auto guard = std::make_shared<CallbackGuard>(recorder.callback(), Arguments{}, "f");

    auto raw = as_callback_value(Value(recorder.callback()));
    ASSERT_TRUE(raw.has_value());
    EXPECT_TRUE(std::holds_alternative<Callback>(*raw));

    auto guarded = as_callback_value(Value(GuardedProxy(guard)));
    ASSERT_TRUE(guarded.has_value());
    EXPECT_TRUE(std::holds_alternative<GuardedProxy>(*guarded));

    EXPECT_FALSE(as_callback_value(Value(42)).has_value());
    EXPECT_FALSE(as_callback_value(Value(Callback{})).has_value());
    EXPECT_FALSE(as_callback_value(Value{}).has_value());
}

TEST(CallbackGuardTest, ToValue_StoresProxyAndLambdasDistinctly) {
    CallRecorder recorder;
    auto guard = std::make_shared<CallbackGuard>(recorder.callback(), Arguments{}, "f");

    Arguments args = Arguments::of(GuardedProxy(guard), [](const Arguments&) -> Value { return {}; },
                                   "text");

    EXPECT_NE(std::any_cast<GuardedProxy>(&args.positional[0]), nullptr);
    EXPECT_NE(std::any_cast<Callback>(&args.positional[1]), nullptr);
    EXPECT_EQ(std::any_cast<std::string>(args.positional[2]), "text");
}

TEST(CallbackGuardTest, ToValue_WrapsVoidCallables) {
    int calls = 0;
    Arguments args = Arguments::of([&calls](const Arguments&) { ++calls; });

    const auto* stored = std::any_cast<Callback>(&args.positional[0]);
    ASSERT_NE(stored, nullptr);

    Value result = (*stored)(Arguments{});
    EXPECT_FALSE(result.has_value());
    EXPECT_EQ(calls, 1);
}

TEST(CallbackGuardTest, VoidCallbackGuardedLikeAnyOther) {
    std::vector<std::string> fired;
    auto guard = std::make_shared<CallbackGuard>(
        std::any_cast<Callback>(to_value([&fired](const Arguments& args) {
            fired.push_back(std::any_cast<std::string>(args.positional.at(0)));
        })),
        Arguments::of("fallback"), "f");

    EXPECT_TRUE(guard->fire_fallback());
    EXPECT_EQ(fired, std::vector<std::string>{"fallback"});
}

// =============================================================================
// Thread safety
// =============================================================================

TEST(CallbackGuardTest, ConcurrentFallbacks_FireOnce) {
    std::atomic<int> fired{0};
    auto guard = std::make_shared<CallbackGuard>(
        [&fired](const Arguments&) -> Value {
            ++fired;
            return {};
        },
        Arguments{}, "f");

    constexpr int NUM_THREADS = 8;

    std::vector<std::thread> threads;
    threads.reserve(NUM_THREADS);

    for (int t = 0; t < NUM_THREADS; ++t) {
        threads.emplace_back([&guard]() { guard->fire_fallback(); });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(fired.load(), 1);
    EXPECT_TRUE(guard->invoked());
}

TEST(CallbackGuardTest, ConcurrentExplicitAndFallback_FireOnce) {
    constexpr int ITERATIONS = 200;

    for (int i = 0; i < ITERATIONS; ++i) {
        std::atomic<int> fired{0};
        auto guard = std::make_shared<CallbackGuard>(
            [&fired](const Arguments&) -> Value {
                ++fired;
                return {};
            },
            Arguments{}, "f", DoubleInvokePolicy::Ignore);

        std::thread explicit_call([&guard]() { guard->invoke(Arguments{}); });
        std::thread fallback_call([&guard]() { guard->fire_fallback(); });
        explicit_call.join();
        fallback_call.join();

        EXPECT_EQ(fired.load(), 1);
    }
}

TEST(CallbackGuardTest, ConcurrentReleaseAndFallback_NeverBoth) {
    constexpr int ITERATIONS = 200;

    for (int i = 0; i < ITERATIONS; ++i) {
        std::atomic<int> fired{0};
        auto guard = std::make_shared<CallbackGuard>(
            [&fired](const Arguments&) -> Value {
                ++fired;
                return {};
            },
            Arguments{}, "f");
        std::atomic<bool> fallback_fired{false};

        std::thread releaser([&guard]() { (void)guard->release(); });
        std::thread owner([&guard, &fallback_fired]() { fallback_fired = guard->fire_fallback(); });
        releaser.join();
        owner.join();

        // Either the fallback claimed the guard first, or release won and nothing fired
        EXPECT_TRUE(guard->released());
        EXPECT_EQ(fired.load(), fallback_fired.load() ? 1 : 0);
        EXPECT_EQ(guard->invoked(), fallback_fired.load());
    }
}

TEST(CallbackGuardTest, ExplicitCallAfterReleaseStillCalls) {
    CallRecorder recorder;
    auto guard = std::make_shared<CallbackGuard>(recorder.callback(), Arguments{}, "f");
    GuardedProxy proxy(guard);

    (void)release(proxy);
    proxy.call("explicit");

    EXPECT_TRUE(guard->invoked());
    EXPECT_TRUE(guard->released());
    EXPECT_FALSE(guard->fire_fallback());
    EXPECT_EQ(recorder.count(), 1);
}

} // namespace
} // namespace callguard
