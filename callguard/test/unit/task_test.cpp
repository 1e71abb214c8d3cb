// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "ensure_callback.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <exception>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/system_error.hpp>

namespace callguard {
namespace {

using namespace std::chrono_literals;

class TaskTest : public ::testing::Test {
protected:
    struct Outcome {
        bool completed = false;
        std::exception_ptr error;
        Value result;
        /// Events recorded when the spawning side observed completion
        std::vector<std::string> events_at_completion;
    };

    void SetUp() override { set_default_double_invoke_policy(DoubleInvokePolicy::Reject); }

    Callback callback() {
        return [this](const Arguments& args) -> Value {
            events_.push_back("callback:" + std::any_cast<std::string>(args.positional.at(0)));
            return {};
        };
    }

    Outcome run(Task task) {
        Outcome outcome;
        boost::asio::co_spawn(io_, std::move(task),
                              [this, &outcome](std::exception_ptr error, Value result) {
                                  outcome.completed = true;
                                  outcome.error = error;
                                  outcome.result = std::move(result);
                                  outcome.events_at_completion = events_;
                              });
        io_.run();
        return outcome;
    }

    boost::asio::io_context io_;
    std::vector<std::string> events_;
};

TEST_F(TaskTest, FallbackFiresWhenBodySettles) {
    auto work = decorate("cb", "task")(CallableSignature("work", {param("cb")}),
                                       [this](BoundArguments) -> Task {
                                           events_.push_back("body");
                                           co_return Value(7);
                                       });

    Outcome outcome = run(work.call(callback()));

    ASSERT_TRUE(outcome.completed);
    EXPECT_FALSE(outcome.error);
    EXPECT_EQ(std::any_cast<int>(outcome.result), 7);
    EXPECT_EQ(outcome.events_at_completion, (std::vector<std::string>{"body", "callback:task"}));
}

TEST_F(TaskTest, NothingFiresUntilAwaited) {
    auto work = decorate("cb", "task")(CallableSignature("work", {param("cb")}),
                                       [](BoundArguments) -> Task { co_return Value{}; });

    Task task = work.call(callback());
    EXPECT_TRUE(events_.empty());

    Outcome outcome = run(std::move(task));
    EXPECT_EQ(outcome.events_at_completion, std::vector<std::string>{"callback:task"});
}

TEST_F(TaskTest, FallbackFiresBeforeErrorReachesAwaiter) {
    auto work = decorate("cb", "task")(CallableSignature("work", {param("cb")}),
                                       [](BoundArguments) -> Task {
                                           throw std::runtime_error("task failed");
                                           co_return Value{};
                                       });

    Outcome outcome = run(work.call(callback()));

    ASSERT_TRUE(outcome.completed);
    ASSERT_TRUE(outcome.error);
    EXPECT_THROW(std::rethrow_exception(outcome.error), std::runtime_error);
    EXPECT_EQ(outcome.events_at_completion, std::vector<std::string>{"callback:task"});
}

TEST_F(TaskTest, FallbackFiresWhenWaitIsCancelled) {
    boost::asio::steady_timer blocker(io_, 1h);
    boost::asio::steady_timer canceller(io_, 10ms);
    canceller.async_wait([&blocker](const boost::system::error_code&) { blocker.cancel(); });

    auto work = decorate("cb", "cancelled")(CallableSignature("work", {param("cb")}),
                                            [&blocker](BoundArguments) -> Task {
                                                co_await blocker.async_wait(
                                                    boost::asio::use_awaitable);
                                                co_return Value{};
                                            });

    Outcome outcome = run(work.call(callback()));

    ASSERT_TRUE(outcome.completed);
    ASSERT_TRUE(outcome.error);
    try {
        std::rethrow_exception(outcome.error);
    } catch (const boost::system::system_error& e) {
        EXPECT_EQ(e.code(), boost::asio::error::operation_aborted);
    }
    EXPECT_EQ(outcome.events_at_completion, std::vector<std::string>{"callback:cancelled"});
}

TEST_F(TaskTest, AbandonedTaskFiresFallback) {
    auto work = decorate("cb", "abandoned")(CallableSignature("work", {param("cb")}),
                                            [](BoundArguments) -> Task { co_return Value{}; });
    {
        Task task = work.call(callback());
    }
    EXPECT_EQ(events_, std::vector<std::string>{"callback:abandoned"});
}

TEST_F(TaskTest, ExplicitCallSuppressesFallback) {
    auto work = decorate("cb", "task")(CallableSignature("work", {param("cb")}),
                                       [](BoundArguments bound) -> Task {
                                           bound.at<GuardedProxy>("cb").call("explicit");
                                           co_return Value{};
                                       });

    Outcome outcome = run(work.call(callback()));

    EXPECT_EQ(outcome.events_at_completion, std::vector<std::string>{"callback:explicit"});
}

TEST_F(TaskTest, ReleaseSuppressesFallback) {
    auto work = decorate("cb", "task")(CallableSignature("work", {param("cb")}),
                                       [](BoundArguments bound) -> Task {
                                           [[maybe_unused]] auto raw = release(bound.get("cb"));
                                           co_return Value{};
                                       });

    Outcome outcome = run(work.call(callback()));

    ASSERT_TRUE(outcome.completed);
    EXPECT_TRUE(outcome.events_at_completion.empty());
}

TEST_F(TaskTest, NestedTaskFiresInnerFallbackBeforeOuterResumes) {
    auto task_b = decorate("cb", "task b")(CallableSignature("task_b", {param("cb")}),
                                           [this](BoundArguments) -> Task {
                                               events_.push_back("task_b settled");
                                               co_return Value{};
                                           });
    auto task_a = decorate("callme", "task a")(
        CallableSignature("task_a", {param("callme")}),
        [this, &task_b](BoundArguments bound) -> Task {
            co_await task_b(Arguments::of(bound.get("callme")));
            events_.push_back("task_a resumed");
            co_return Value{};
        });

    Outcome outcome = run(task_a.call(callback()));

    EXPECT_FALSE(outcome.error);
    EXPECT_EQ(outcome.events_at_completion,
              (std::vector<std::string>{"task_b settled", "callback:task b", "task_a resumed"}));
}

TEST_F(TaskTest, BindErrorsRaisedAtCallTime) {
    auto work = decorate("missing")(CallableSignature("work", {param("cb")}),
                                    [](BoundArguments) -> Task { co_return Value{}; });

    EXPECT_THROW((void)work.call(callback()), UnknownArgument);
    EXPECT_TRUE(events_.empty());
}

} // namespace
} // namespace callguard
