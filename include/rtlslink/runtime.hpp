#pragma once
/**
 * @page rl-runtime RTLS-Link Async Runtime
 * @file runtime.hpp
 * @brief One io_context, stackful coroutines, and a blocking bridge.
 *
 * @details
 * All network work (WebSocket commands, HTTP uploads, batch fan-out) runs as
 * Boost.Asio stackful coroutines on a single io_context. A coroutine gets an
 * AsyncContext: the io_context to create sockets and timers on, and the
 * yield_context to suspend with.
 *
 * Nothing here is multi-threaded. Many coroutines may be in flight, but only
 * one runs at a time, so shared accumulators need no locks.
 *
 * run_blocking() is the bridge for synchronous callers (CLI, tests): it makes
 * a private io_context, spawns the function, runs to completion and returns
 * its result.
 *
 * @code
 *   auto r = rtlslink::run_blocking([&](rtlslink::AsyncContext& ctx) {
 *       return rtlslink::send_command(ctx, "10.0.0.7", "version", timeout);
 *   });
 * @endcode
 */

#include <chrono>
#include <optional>
#include <utility>

#include <boost/asio/io_context.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/asio/steady_timer.hpp>

namespace rtlslink {

namespace net = boost::asio;

struct AsyncContext {
    net::io_context&    io;
    net::yield_context  yield;
};

/// Suspend the calling coroutine for d. Other coroutines keep running.
inline void async_sleep(AsyncContext& ctx, std::chrono::milliseconds d) {
    net::steady_timer t(ctx.io, d);
    boost::system::error_code ec;
    t.async_wait(ctx.yield[ec]);                  // only error is cancellation
}

/// Run fn(AsyncContext&) as a coroutine on a private io_context and return its result.
template <typename Fn>
auto run_blocking(Fn&& fn) -> decltype(fn(std::declval<AsyncContext&>())) {
    using R = decltype(fn(std::declval<AsyncContext&>()));
    net::io_context io;
    std::optional<R> out;
    net::spawn(io, [&](net::yield_context yield) {
        AsyncContext ctx{io, yield};
        out.emplace(fn(ctx));
    });
    io.run();
    return std::move(*out);
}

} // namespace rtlslink
