// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "ensure_callback.hpp"

#include "argument_locator.hpp"
#include "errors.hpp"
#include "logger.hpp"

namespace callguard {

namespace {

// The obligation is moved into a local before the first suspension point so
// that it is destroyed while a body exception unwinds, before the error is
// handed to the consumer. The body is moved into a local declared after it,
// so on early close the body's frame (and its cleanup) goes first and the
// obligation settles last. If the sequence is never started both stay in the
// parameters and the obligation fires when the frame is destroyed.
Sequence drive_sequence(Sequence inner, Obligation obligation) {
    Obligation pending(std::move(obligation));
    Sequence body(std::move(inner));
    while (auto item = body.next()) {
        co_yield std::move(*item);
    }
    pending.discharge();
}

Task drive_task(Task work, Obligation obligation) {
    Obligation pending(std::move(obligation));
    Value result = co_await std::move(work);
    pending.discharge();
    co_return result;
}

} // namespace

DecoratedCall::DecoratedCall(CallableSignature signature, std::string argument,
                             Arguments fallback, std::optional<DoubleInvokePolicy> policy)
    : signature_(std::move(signature)), argument_(std::move(argument)),
      fallback_(std::move(fallback)), policy_(policy) {}

BoundArguments DecoratedCall::bind(Arguments args) const {
    locate_argument(signature_, argument_);
    return signature_.bind(std::move(args));
}

Obligation DecoratedCall::enter(BoundArguments& bound) const {
    auto incoming = as_callback_value(bound.get(argument_));
    if (!incoming.has_value()) {
        throw BindError(signature_.name(), "argument '" + argument_ + "' is not a callback (got " +
                                               describe(bound.get(argument_)) + ")");
    }

    std::shared_ptr<CallbackGuard> guard;
    if (const auto* proxy = std::get_if<GuardedProxy>(&*incoming)) {
        // Innermost pending call owns the next fallback
        guard = proxy->guard();
        guard->set_fallback(fallback_, signature_.name());
        CALLGUARD_LOG_DEBUG("{}() took over callback '{}' from an outer call", signature_.name(),
                            argument_);
    } else {
        guard = std::make_shared<CallbackGuard>(std::get<Callback>(*incoming), fallback_,
                                                signature_.name(),
                                                policy_.value_or(default_double_invoke_policy()));
        CALLGUARD_LOG_DEBUG("{}() guards new callback '{}'", signature_.name(), argument_);
    }

    bound.set(argument_, GuardedProxy(guard));
    return Obligation(std::move(guard), signature_.name());
}

Value DecoratedFunction::operator()(Arguments args) const {
    BoundArguments bound = bind(std::move(args));
    Obligation obligation = enter(bound);
    Value result = body_(bound);
    obligation.discharge();
    return result;
}

Sequence DecoratedSequence::operator()(Arguments args) const {
    BoundArguments bound = bind(std::move(args));
    Obligation obligation = enter(bound);
    return drive_sequence(body_(std::move(bound)), std::move(obligation));
}

Task DecoratedTask::operator()(Arguments args) const {
    BoundArguments bound = bind(std::move(args));
    Obligation obligation = enter(bound);
    return drive_task(body_(std::move(bound)), std::move(obligation));
}

AsyncSequence DecoratedAsyncSequence::operator()(Arguments args) const {
    BoundArguments bound = bind(std::move(args));
    Obligation obligation = enter(bound);
    AsyncSequence sequence = body_(std::move(bound));
    sequence.attach(std::move(obligation));
    return sequence;
}

Decorator::Decorator(std::string argument, Arguments fallback)
    : argument_(std::move(argument)), fallback_(std::move(fallback)) {}

Decorator Decorator::with_policy(DoubleInvokePolicy policy) const {
    Decorator copy(*this);
    copy.policy_ = policy;
    return copy;
}

Decorator decorate(std::string argument, Arguments fallback) {
    return Decorator(std::move(argument), std::move(fallback));
}

} // namespace callguard
