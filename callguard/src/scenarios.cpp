// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "scenarios.hpp"

#include "ensure_callback.hpp"
#include "logger.hpp"

#include <any>
#include <exception>
#include <stdexcept>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>

namespace callguard {

namespace {

Callback printer(std::ostream& out) {
    return [&out](const Arguments& args) -> Value {
        out << "callback called from " << std::any_cast<std::string>(args.positional.at(0))
            << "\n";
        return {};
    };
}

void run_direct(std::ostream& out) {
    auto function_b = decorate("cb", "decorator b")(
        CallableSignature("function_b", {param("cb")}),
        [](BoundArguments& bound) { bound.at<GuardedProxy>("cb").call("function_b"); });

    auto function_a = decorate("callme", "decorator a")(
        CallableSignature("function_a", {param("callme")}),
        [&function_b](BoundArguments& bound) { function_b(Arguments::of(bound.get("callme"))); });

    function_a.call(printer(out));
}

void run_fallback(std::ostream& out) {
    auto function_b = decorate("cb", "decorator b")(CallableSignature("function_b", {param("cb")}),
                                                     [](BoundArguments&) {});

    auto function_a = decorate("callme", "decorator a")(
        CallableSignature("function_a", {param("callme")}),
        [&function_b](BoundArguments& bound) { function_b(Arguments::of(bound.get("callme"))); });

    function_a.call(printer(out));
}

void run_release(std::ostream& out) {
    auto function_b = decorate("cb", "decorator b")(
        CallableSignature("function_b", {param("cb")}), [](BoundArguments& bound) {
            [[maybe_unused]] Callback detached = release(bound.get("cb"));
        });

    auto function_a = decorate("callme", "decorator a")(
        CallableSignature("function_a", {param("callme")}),
        [&function_b](BoundArguments& bound) { function_b(Arguments::of(bound.get("callme"))); });

    function_a.call(printer(out));
}

void run_sequence(std::ostream& out) {
    auto generator_b = decorate("cb", "generator b")(
        CallableSignature("generator_b", {param("cb")}), [](BoundArguments) -> Sequence {
            co_yield 1;
            co_yield 2;
        });

    auto function_a = decorate("callme", "decorator a")(
        CallableSignature("function_a", {param("callme")}),
        [&generator_b, &out](BoundArguments& bound) {
            for (const Value& x : generator_b(Arguments::of(bound.get("callme")))) {
                out << std::any_cast<int>(x) << "\n";
            }
        });

    function_a.call(printer(out));
}

void run_task(std::ostream& out) {
    auto task_b = decorate("cb", "task b")(CallableSignature("task_b", {param("cb")}),
                                           [&out](BoundArguments) -> Task {
                                               out << "task_b settled\n";
                                               co_return Value{};
                                           });

    auto task_a = decorate("callme", "task a")(CallableSignature("task_a", {param("callme")}),
                                               [&task_b](BoundArguments bound) -> Task {
                                                   co_return co_await task_b(
                                                       Arguments::of(bound.get("callme")));
                                               });

    boost::asio::io_context io;
    boost::asio::co_spawn(io, task_a.call(printer(out)), [](std::exception_ptr error, Value) {
        if (error) {
            std::rethrow_exception(error);
        }
    });
    io.run();
}

} // namespace

std::vector<std::string> scenario_names() {
    return {"direct", "fallback", "release", "sequence", "task"};
}

void run_scenario(const std::string& name, std::ostream& out) {
    CALLGUARD_LOG_DEBUG("Running scenario '{}'", name);
    if (name == "direct") {
        run_direct(out);
    } else if (name == "fallback") {
        run_fallback(out);
    } else if (name == "release") {
        run_release(out);
    } else if (name == "sequence") {
        run_sequence(out);
    } else if (name == "task") {
        run_task(out);
    } else {
        throw std::invalid_argument("Unknown scenario: " + name);
    }
}

} // namespace callguard
