// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

// -----------------------------------------------------------------------------
// Environment variable names for runtime configuration overrides.
// -----------------------------------------------------------------------------

namespace callguard::env {

/// Environment variable for overriding log level (trace/debug/info/warning/error)
constexpr const char* LOG_LEVEL = "CALLGUARD_LOG_LEVEL";

/// Environment variable for overriding the double invocation policy (reject/ignore)
constexpr const char* DOUBLE_INVOKE = "CALLGUARD_DOUBLE_INVOKE";

} // namespace callguard::env
