#pragma once
/**
 * @page rl-error RTLS-Link Error Model
 * @file error.hpp
 * @brief Error kinds, the Error record, and the Result<T> status carrier.
 *
 * @details
 * PURPOSE
 * -------
 * Every operation in the connectivity layer either produces a value or an
 * Error. Nothing throws across a module boundary: third-party exceptions
 * (nlohmann::json parse errors, Boost.System failures) are caught at the edge
 * and turned into an Error with the right kind.
 *
 * ERROR KINDS
 * -----------
 * - Decode:          malformed heartbeat/log/response JSON. Recovered locally.
 * - Transport:       connect/send/receive/HTTP failure.
 * - Timeout:         a connect or response deadline expired. Kept separate so
 *                    callers can tell "unreachable" from "device said no".
 * - Protocol:        the device reported a failure (see response.hpp heuristics).
 * - InvalidResponse: no reply at all, or no JSON where JSON was required.
 * - OtaFailed:       firmware endpoint answered with a non-2xx status.
 * - Validation:      caller-side mistake (missing file, bad argument). Never retried.
 * - Cancelled:       the operation never started because a CancelToken tripped.
 *
 * EXAMPLE
 * -------
 * @code
 *   rtlslink::Result<std::string> r = rtlslink::send_command(ip, "version", timeout);
 *   if (!r) {
 *       std::cerr << "status=error " << r.error().to_string() << "\n";
 *       return 1;
 *   }
 *   std::cout << r.value() << "\n";
 * @endcode
 */

#include <optional>
#include <string>
#include <utility>

namespace rtlslink {

enum class ErrorKind {
    Decode,
    Transport,
    Timeout,
    Protocol,
    InvalidResponse,
    OtaFailed,
    Validation,
    Cancelled
};

/** @brief Stable lowercase name for an ErrorKind ("timeout", "protocol", ...). */
const char* to_string(ErrorKind kind);

/**
 * @struct Error
 * @brief One failure: what kind, which device (may be empty), and the message.
 *
 * The message is the human part only. to_string() decorates it the way the
 * CLI prints it, e.g. "Command failed on 10.0.0.7: invalid group".
 */
struct Error {
    ErrorKind   kind{ErrorKind::Transport};
    std::string ip;
    std::string message;

    std::string to_string() const;
};

/// Shorthand constructors, one per kind.
Error decode_error(std::string message, std::string ip = {});
Error transport_error(std::string ip, std::string message);
Error timeout_error(std::string ip, std::string message);
Error protocol_error(std::string ip, std::string message);
Error invalid_response(std::string ip, std::string message);
Error ota_failed(std::string ip, std::string message);
Error validation_error(std::string message);
Error cancelled_error(std::string ip);

/**
 * @class Result
 * @brief Either a T or an Error. Tested with operator bool.
 *
 * Accessing value() on a failed Result, or error() on a successful one, is a
 * programming error; check first.
 */
template <typename T>
class Result {
public:
    Result(T value) : value_(std::move(value)) {}            // NOLINT: implicit by intent
    Result(Error error) : error_(std::move(error)) {}        // NOLINT

    bool ok() const { return value_.has_value(); }
    explicit operator bool() const { return ok(); }

    T&       value()       { return *value_; }
    const T& value() const { return *value_; }
    const Error& error() const { return error_; }

private:
    std::optional<T> value_;
    Error            error_;
};

/// Status-only form: success or an Error.
template <>
class Result<void> {
public:
    Result() = default;
    Result(Error error) : failed_(true), error_(std::move(error)) {}   // NOLINT

    bool ok() const { return !failed_; }
    explicit operator bool() const { return ok(); }

    const Error& error() const { return error_; }

private:
    bool  failed_{false};
    Error error_;
};

using Status = Result<void>;

} // namespace rtlslink
