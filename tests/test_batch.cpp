#include <doctest/doctest.h>
#include "rtlslink/batch.hpp"

#include <algorithm>

using namespace rtlslink;
using namespace std::chrono_literals;

static std::vector<std::string> five_ips() {
    return {"10.0.0.1", "10.0.0.2", "10.0.0.3", "10.0.0.4", "10.0.0.5"};
}

TEST_CASE("dispatch reports every target and respects the concurrency bound") {
    int in_flight = 0;
    int peak = 0;

    auto work = [&](AsyncContext& ctx, const std::string& ip) -> Result<std::string> {
        ++in_flight;
        peak = std::max(peak, in_flight);
        async_sleep(ctx, 20ms);
        --in_flight;
        if (ip == "10.0.0.3") return protocol_error(ip, "Failed to write parameter");
        return std::string("OK");
    };

    auto res = dispatch(five_ips(), 2, work);
    CHECK(res.total() == 5);
    CHECK(res.succeeded() == 4);
    CHECK(res.failed() == 1);
    CHECK(res.outcome() == BatchOutcome::PartialFailure);
    CHECK(peak == 2);

    auto bad = std::find_if(res.items.begin(), res.items.end(),
                            [](const BatchItem<std::string>& i) { return !i.result.ok(); });
    REQUIRE(bad != res.items.end());
    CHECK(bad->ip == "10.0.0.3");
    CHECK(bad->result.error().message == "Failed to write parameter");
}

TEST_CASE("concurrency larger than the target list is capped") {
    int peak = 0, in_flight = 0;
    auto work = [&](AsyncContext& ctx, const std::string&) -> Result<int> {
        peak = std::max(peak, ++in_flight);
        async_sleep(ctx, 10ms);
        --in_flight;
        return 1;
    };
    auto res = dispatch({"a", "b"}, 16, work);
    CHECK(res.outcome() == BatchOutcome::AllSucceeded);
    CHECK(peak == 2);
}

TEST_CASE("zero concurrency still runs one at a time") {
    auto res = dispatch({"a", "b", "c"}, 0,
                        [](AsyncContext&, const std::string&) -> Status { return {}; });
    CHECK(res.total() == 3);
    CHECK(res.outcome() == BatchOutcome::AllSucceeded);
}

TEST_CASE("empty target list") {
    auto res = dispatch({}, 3, [](AsyncContext&, const std::string&) -> Status { return {}; });
    CHECK(res.total() == 0);
    CHECK(res.outcome() == BatchOutcome::Empty);
    CHECK(std::string(to_string(res.outcome())) == "empty");
}

TEST_CASE("every target failing") {
    auto res = dispatch({"a", "b"}, 2, [](AsyncContext&, const std::string& ip) -> Status {
        return transport_error(ip, "unreachable");
    });
    CHECK(res.outcome() == BatchOutcome::AllFailed);
}

TEST_CASE("cancellation marks the remaining targets as cancelled") {
    CancelToken cancel;
    int ran = 0;
    auto work = [&](AsyncContext& ctx, const std::string&) -> Status {
        ++ran;
        cancel.cancel();                           // first item trips it for the rest
        async_sleep(ctx, 5ms);
        return {};
    };
    auto res = dispatch(five_ips(), 1, work, cancel);
    CHECK(ran == 1);
    CHECK(res.total() == 5);
    CHECK(res.succeeded() == 1);
    for (std::size_t i = 1; i < res.items.size(); ++i) {
        CHECK(res.items[i].result.error().kind == ErrorKind::Cancelled);
        CHECK(res.items[i].result.error().message == "Operation cancelled");
    }
}
