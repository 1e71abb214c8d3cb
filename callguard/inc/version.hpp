// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

// -----------------------------------------------------------------------------
// Library version metadata (compile-time constants)
//
// All values are injected by CMake via compile definitions:
//   - CALLGUARD_NAME
//   - CALLGUARD_VERSION
//   - CALLGUARD_GIT_COMMIT
//
// Fallback defaults are provided for IDE/local development without CMake.
// -----------------------------------------------------------------------------

#ifndef CALLGUARD_NAME
    #define CALLGUARD_NAME "callguard"
#endif

#ifndef CALLGUARD_VERSION
    #define CALLGUARD_VERSION "dev"
#endif

#ifndef CALLGUARD_GIT_COMMIT
    #define CALLGUARD_GIT_COMMIT "unknown"
#endif

namespace callguard {

constexpr const char* NAME = CALLGUARD_NAME;
constexpr const char* VERSION = CALLGUARD_VERSION;
constexpr const char* GIT_COMMIT = CALLGUARD_GIT_COMMIT;

} // namespace callguard
