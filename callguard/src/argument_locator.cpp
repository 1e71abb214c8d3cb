// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "argument_locator.hpp"

namespace callguard {

size_t locate_argument(const CallableSignature& signature, const std::string& name) {
    auto idx = signature.find(name);
    if (!idx.has_value() || !signature.parameters()[*idx].is_named_slot()) {
        throw UnknownArgument(signature.name(), name);
    }
    return *idx;
}

} // namespace callguard
