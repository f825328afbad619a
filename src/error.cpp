// ============================================================================
// error.cpp - implementation for error.hpp
// ============================================================================

#include "rtlslink/error.hpp"

namespace rtlslink {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Decode:          return "decode";
        case ErrorKind::Transport:       return "transport";
        case ErrorKind::Timeout:         return "timeout";
        case ErrorKind::Protocol:        return "protocol";
        case ErrorKind::InvalidResponse: return "invalid_response";
        case ErrorKind::OtaFailed:       return "ota_failed";
        case ErrorKind::Validation:      return "validation";
        case ErrorKind::Cancelled:       return "cancelled";
    }
    return "unknown";
}

// Mirrors the wording operators already grep for in bulk result tables.
std::string Error::to_string() const {
    switch (kind) {
        case ErrorKind::Protocol:
            return "Command failed on " + ip + ": " + message;
        case ErrorKind::InvalidResponse:
            return "Invalid response from " + ip + ": " + message;
        case ErrorKind::OtaFailed:
            return "OTA update failed on " + ip + ": " + message;
        case ErrorKind::Cancelled:
            return ip.empty() ? message : message + " (" + ip + ")";
        default:
            return message;
    }
}

Error decode_error(std::string message, std::string ip) {
    return Error{ErrorKind::Decode, std::move(ip), std::move(message)};
}

Error transport_error(std::string ip, std::string message) {
    return Error{ErrorKind::Transport, std::move(ip), std::move(message)};
}

Error timeout_error(std::string ip, std::string message) {
    return Error{ErrorKind::Timeout, std::move(ip), std::move(message)};
}

Error protocol_error(std::string ip, std::string message) {
    return Error{ErrorKind::Protocol, std::move(ip), std::move(message)};
}

Error invalid_response(std::string ip, std::string message) {
    return Error{ErrorKind::InvalidResponse, std::move(ip), std::move(message)};
}

Error ota_failed(std::string ip, std::string message) {
    return Error{ErrorKind::OtaFailed, std::move(ip), std::move(message)};
}

Error validation_error(std::string message) {
    return Error{ErrorKind::Validation, {}, std::move(message)};
}

Error cancelled_error(std::string ip) {
    return Error{ErrorKind::Cancelled, std::move(ip), "Operation cancelled"};
}

} // namespace rtlslink
