#pragma once
/**
 * @file cancel.hpp
 * @brief Shared stop flag for long-running loops (discovery, batch, bulk OTA, logs).
 *
 * Copies share one flag. Loops poll cancelled() between iterations, so work
 * already in flight finishes or times out on its own deadline.
 */

#include <atomic>
#include <memory>

namespace rtlslink {

class CancelToken {
public:
    CancelToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { flag_->store(true); }
    bool cancelled() const { return flag_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace rtlslink
