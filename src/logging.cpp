// ============================================================================
// logging.cpp - implementation for logging.hpp
// ============================================================================

#include "rtlslink/logging.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace rtlslink {
namespace logging {

void init(int verbosity) {
    auto logger = spdlog::get("rtlslink");
    if (!logger) logger = spdlog::stderr_color_mt("rtlslink");

    spdlog::level::level_enum lvl = spdlog::level::warn;
    if (verbosity == 1) lvl = spdlog::level::info;
    if (verbosity >= 2) lvl = spdlog::level::debug;

    logger->set_level(lvl);
    logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_default_logger(logger);
}

} // namespace logging
} // namespace rtlslink
