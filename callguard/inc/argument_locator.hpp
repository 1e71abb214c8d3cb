// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "callable_signature.hpp"

#include <cstddef>
#include <string>

namespace callguard {

/**
 * @brief Find the slot holding the callback argument of a callable.
 *
 * Only named parameters qualify; variadic collectors never hold the callback.
 * Decorated calls use it to validate the name before binding, so the index
 * may be ignored.
 *
 * @param signature Declared parameters of the decorated callable
 * @param name Name of the callback parameter
 * @return Index of the parameter in declaration order
 *
 * @throws UnknownArgument naming the callable and the argument if no named
 *         parameter matches
 */
size_t locate_argument(const CallableSignature& signature, const std::string& name);

} // namespace callguard
