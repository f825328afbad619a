// ============================================================================
// batch.cpp - BatchSender and outcome names (dispatch() itself is in the header)
// ============================================================================

#include "rtlslink/batch.hpp"
#include "rtlslink/device_connection.hpp"

namespace rtlslink {

const char* to_string(BatchOutcome outcome) {
    switch (outcome) {
        case BatchOutcome::Empty:          return "empty";
        case BatchOutcome::AllSucceeded:   return "all_succeeded";
        case BatchOutcome::PartialFailure: return "partial_failure";
        case BatchOutcome::AllFailed:      return "all_failed";
    }
    return "unknown";
}

BatchResult<std::string> BatchSender::send_to_all(const std::vector<std::string>& ips,
                                                  const std::string& command,
                                                  const CancelToken& cancel) const {
    const auto timeout = timeout_;
    return dispatch(ips, concurrency_,
        [&command, timeout](AsyncContext& ctx, const std::string& ip) {
            return send_command(ctx, ip, command, timeout);
        },
        cancel);
}

} // namespace rtlslink
