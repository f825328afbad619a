#pragma once
/**
 * @page rl-batch RTLS-Link Batch Dispatcher
 * @file batch.hpp
 * @brief Run one operation against many devices with bounded concurrency.
 *
 * @details
 * PURPOSE
 * -------
 * Bulk commands and bulk OTA both need "do X to every IP, at most N at a
 * time, and tell me what happened to each". dispatch() is that loop.
 *
 * HOW IT RUNS
 * -----------
 * - A private io_context with `concurrency` worker coroutines (clamped to at
 *   least 1, at most ips.size()). Each worker pulls the next unstarted IP.
 * - Results are appended as they complete, so order is completion order,
 *   not input order.
 * - Failures are independent. One failing IP never stops the others.
 * - Once the CancelToken trips, IPs not yet started are recorded with a
 *   Cancelled error. Every input IP still appears exactly once.
 *
 * The work function has the shape
 *   Result<T> work(AsyncContext& ctx, const std::string& ip)
 * and must suspend through ctx.yield; blocking calls stall every worker.
 *
 * @code
 *   auto res = rtlslink::dispatch(ips, 3,
 *       [&](rtlslink::AsyncContext& ctx, const std::string& ip) {
 *           return rtlslink::send_command(ctx, ip, "version", timeout);
 *       });
 *   if (res.outcome() == rtlslink::BatchOutcome::PartialFailure) ...
 * @endcode
 */

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <type_traits>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/spawn.hpp>

#include "rtlslink/cancel.hpp"
#include "rtlslink/error.hpp"
#include "rtlslink/runtime.hpp"

namespace rtlslink {

enum class BatchOutcome {
    Empty,            ///< no targets
    AllSucceeded,
    PartialFailure,   ///< at least one ok and at least one failed
    AllFailed
};

const char* to_string(BatchOutcome outcome);

template <typename T>
struct BatchItem {
    std::string ip;
    Result<T>   result;
};

template <typename T>
struct BatchResult {
    std::vector<BatchItem<T>> items;   // completion order

    std::size_t total() const { return items.size(); }

    std::size_t succeeded() const {
        return static_cast<std::size_t>(std::count_if(items.begin(), items.end(),
            [](const BatchItem<T>& i) { return i.result.ok(); }));
    }

    std::size_t failed() const { return total() - succeeded(); }

    BatchOutcome outcome() const {
        if (items.empty()) return BatchOutcome::Empty;
        const std::size_t ok = succeeded();
        if (ok == items.size()) return BatchOutcome::AllSucceeded;
        if (ok == 0) return BatchOutcome::AllFailed;
        return BatchOutcome::PartialFailure;
    }
};

namespace detail {
template <typename R> struct result_value;
template <typename T> struct result_value<Result<T>> { using type = T; };
} // namespace detail

template <typename Work>
using work_value_t = typename detail::result_value<
    std::decay_t<decltype(std::declval<Work&>()(std::declval<AsyncContext&>(),
                                                 std::declval<const std::string&>()))>>::type;

template <typename Work>
BatchResult<work_value_t<Work>> dispatch(const std::vector<std::string>& ips,
                                         std::size_t concurrency,
                                         Work work,
                                         const CancelToken& cancel = CancelToken()) {
    using T = work_value_t<Work>;
    BatchResult<T> out;
    if (ips.empty()) return out;

    const std::size_t workers = std::min(std::max<std::size_t>(concurrency, 1), ips.size());
    out.items.reserve(ips.size());

    net::io_context io;
    std::size_t next = 0;                          // shared cursor; single thread

    for (std::size_t w = 0; w < workers; ++w) {
        net::spawn(io, [&](net::yield_context yield) {
            AsyncContext ctx{io, yield};
            while (next < ips.size()) {
                const std::string& ip = ips[next++];
                if (cancel.cancelled()) {
                    out.items.push_back(BatchItem<T>{ip, Result<T>(cancelled_error(ip))});
                    continue;
                }
                Result<T> r = work(ctx, ip);
                out.items.push_back(BatchItem<T>{ip, std::move(r)});
            }
        });
    }
    io.run();
    return out;
}

/**
 * @class BatchSender
 * @brief Same command to many devices, one-shot connection per device.
 */
class BatchSender {
public:
    BatchSender(uint64_t timeout_ms, std::size_t concurrency)
        : timeout_(timeout_ms), concurrency_(std::max<std::size_t>(concurrency, 1)) {}

    BatchResult<std::string> send_to_all(const std::vector<std::string>& ips,
                                         const std::string& command,
                                         const CancelToken& cancel = CancelToken()) const;

    std::size_t concurrency() const { return concurrency_; }

private:
    std::chrono::milliseconds timeout_;
    std::size_t               concurrency_;
};

} // namespace rtlslink
