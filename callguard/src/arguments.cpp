// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "arguments.hpp"

#include <boost/core/demangle.hpp>

namespace callguard {

std::string describe(const Value& value) {
    if (!value.has_value()) {
        return "an empty value";
    }
    return boost::core::demangle(value.type().name());
}

} // namespace callguard
