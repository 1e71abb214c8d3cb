// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <ostream>
#include <string>
#include <vector>

namespace callguard {

/**
 * @brief Names of the usage scenarios run by the demo executable.
 *
 *   direct   - inner decorated function calls the callback itself
 *   fallback - nobody calls it, the inner decorator fires the fallback
 *   release  - inner function releases the callback, nothing fires
 *   sequence - decorated generator consumed to the end, fallback after the last element
 *   task     - decorated asynchronous body, fallback after it settles
 */
[[nodiscard]] std::vector<std::string> scenario_names();

/**
 * @brief Run one scenario, writing what the callback and bodies print to `out`.
 *
 * @throws std::invalid_argument for an unknown scenario name
 */
void run_scenario(const std::string& name, std::ostream& out);

} // namespace callguard
