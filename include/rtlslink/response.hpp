#pragma once
/**
 * @page rl-response RTLS-Link Reply Handling
 * @file response.hpp
 * @brief Decide whether a device reply is a failure, and pull JSON out of it.
 *
 * @details
 * The firmware has no status code on its WebSocket replies. Success and
 * failure are told apart by looking at the text, in this order:
 *
 *   1. Lowercased reply contains "error:" -> failure. Message is whatever
 *      follows the marker, trimmed.
 *   2. Lowercased reply contains "error", "fail", "invalid" or "not found",
 *      and does not contain "success" -> failure. Message is the whole reply,
 *      trimmed.
 *   3. The first JSON value in the reply is an object with success == false
 *      -> failure, message from "message" or "error" (non-string gives
 *      "Unknown error"), else "Command failed". An object with an "error"
 *      key -> failure with that value.
 *   4. Anything else is success.
 *
 * "First JSON value" means: start at the earliest '{' or '[' and parse from
 * there to the end of the reply. Text before it ("OK\n") is ignored.
 *
 * These rules are heuristics and are pinned by fixtures in
 * tests/test_response.cpp. Change them only together with those fixtures.
 */

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "rtlslink/commands.hpp"
#include "rtlslink/error.hpp"

namespace rtlslink {

/// Failure message if the reply reads as a failure, otherwise nullopt.
std::optional<std::string> classify_response(const std::string& reply);

/// First JSON object/array in reply. InvalidResponse if none or unparsable.
Result<nlohmann::json> extract_json(const std::string& reply, const std::string& ip);

/// A classified reply. raw is the device text as received; json is set for
/// JSON-class commands.
struct CommandResponse {
    std::string                   raw;
    std::optional<nlohmann::json> json;
};

/**
 * @brief Classify then (for JSON-class commands) extract.
 *
 * Failure reply -> Protocol error. JSON-class command whose reply has no
 * JSON -> InvalidResponse. Otherwise the untouched reply plus optional JSON.
 */
Result<CommandResponse> parse_command_response(const std::string& command,
                                               const std::string& reply,
                                               const std::string& ip);

/// `readall` dump -> (group, name, value) triples in reply order.
std::vector<ConfigParam> parse_readall_response(const std::string& reply);

/// Copy with leading/trailing whitespace removed.
std::string trim(const std::string& s);

} // namespace rtlslink
