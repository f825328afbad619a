#pragma once
/**
 * @file logging.hpp
 * @brief Process-wide spdlog setup for the CLI and tests.
 *
 * Library code logs through spdlog's default logger. init() replaces it with
 * a colored stderr logger named "rtlslink" so stdout stays clean for command
 * output and `--json`.
 *
 * Verbosity: 0 = warn, 1 = info, 2+ = debug.
 */

namespace rtlslink {
namespace logging {

void init(int verbosity);

} // namespace logging
} // namespace rtlslink
