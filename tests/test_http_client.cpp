#include <chrono>
#include <iostream>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "TestSupport.h"
#include "infra/http/HttpClient.h"
#include "logging/Log.h"

using namespace std::chrono_literals;
using infra::http::AsyncHttpClient;
using infra::http::HttpResult;

namespace {

struct Outcome {
    int calls{0};
    HttpResult result{};
};

// Lookups for a reserved name either fail fast or hang; either way the request reports a failure
// no later than the client timeout.
int testUnresolvableHostFailsWithinTimeout() {
    boost::asio::io_context ioc;
    AsyncHttpClient client(ioc, 1);
    Outcome outcome;
    const auto url = infra::http::parse_url("http://livechart-no-such-host.invalid/api/series");
    EXPECT_TRUE(url.has_value(), "test URL parses");

    const auto started = std::chrono::steady_clock::now();
    auto handle = client.get(*url, [&](HttpResult result) {
        ++outcome.calls;
        outcome.result = std::move(result);
        ioc.stop();
    });
    ioc.run_for(5s);
    const auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_TRUE(outcome.calls == 1, "completion runs once, ran " << outcome.calls);
    EXPECT_TRUE(outcome.result.failed(), "an unresolvable host is a failed transfer");
    EXPECT_TRUE(outcome.result.error.find("resolve") != std::string::npos,
                "failure names the resolve stage, got " << outcome.result.error);
    EXPECT_TRUE(elapsed < 3s, "failure arrives within the timeout");
    return 0;
}

// A peer that accepts and never answers trips the read deadline.
int testSilentServerTimesOut() {
    boost::asio::io_context ioc;
    boost::asio::ip::tcp::acceptor acceptor(ioc, {boost::asio::ip::make_address("127.0.0.1"), 0});
    boost::asio::ip::tcp::socket peer(ioc);
    acceptor.async_accept(peer, [](const boost::system::error_code&) {});

    AsyncHttpClient client(ioc, 1);
    Outcome outcome;
    const auto url = infra::http::parse_url("http://127.0.0.1:" + std::to_string(acceptor.local_endpoint().port()) +
                                            "/api/series");
    auto handle = client.get(*url, [&](HttpResult result) {
        ++outcome.calls;
        outcome.result = std::move(result);
        ioc.stop();
    });
    ioc.run_for(5s);

    EXPECT_TRUE(outcome.calls == 1, "completion runs once, ran " << outcome.calls);
    EXPECT_TRUE(outcome.result.failed(), "a silent peer is a failed transfer");
    EXPECT_TRUE(outcome.result.error.find("read") != std::string::npos,
                "failure names the read stage, got " << outcome.result.error);
    return 0;
}

int testCancelSuppressesCompletion() {
    boost::asio::io_context ioc;
    AsyncHttpClient client(ioc, 1);
    int calls = 0;
    const auto url = infra::http::parse_url("http://livechart-no-such-host.invalid/api/series");
    auto handle = client.get(*url, [&](HttpResult) { ++calls; });
    handle->cancel();
    ioc.run_for(1500ms);
    EXPECT_TRUE(calls == 0, "a cancelled request never completes, ran " << calls);
    return 0;
}

}  // namespace

int main() {
    logging::Log::set_log_level(config::LogLevel::Error);

    int failures = 0;
    failures += testUnresolvableHostFailsWithinTimeout();
    failures += testSilentServerTimesOut();
    failures += testCancelSuppressesCompletion();
    if (failures != 0) {
        std::cerr << failures << " HTTP client check(s) failed\n";
        return 1;
    }
    return 0;
}
