#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>

#include "domain/DomainContracts.h"
#include "domain/MarketDataSource.h"

namespace infra::http {

struct Url {
    std::string scheme;
    std::string host;
    std::string port;
    // Path plus optional query, always starting with '/'.
    std::string target;

    bool tls() const { return scheme == "https"; }
    std::string toString() const;
};

// Accepts http:// and https:// URLs with an optional port. Returns std::nullopt for anything else.
std::optional<Url> parse_url(const std::string& text);

// Percent-encodes everything outside the RFC 3986 unreserved set.
std::string url_encode(const std::string& value);

struct HttpResponse {
    unsigned status = 0U;
    std::string body;
};

using HttpResult = domain::Result<HttpResponse>;

// Asynchronous GET over plain TCP or TLS, driven by the caller's io_context. Every request gets
// its own connection and is closed after the response.
class AsyncHttpClient {
public:
    using Completion = std::function<void(HttpResult)>;

    AsyncHttpClient(boost::asio::io_context& ioc, int timeoutSec);
    ~AsyncHttpClient();

    AsyncHttpClient(const AsyncHttpClient&) = delete;
    AsyncHttpClient& operator=(const AsyncHttpClient&) = delete;

    // The completion runs exactly once unless the returned handle is cancelled first. Transport
    // errors and timeouts arrive as a failed HttpResult; any HTTP status is a successful transfer.
    std::unique_ptr<domain::FetchHandle> get(const Url& url, Completion onDone);

    int timeoutSec() const { return timeoutSec_; }

private:
    boost::asio::io_context& ioc_;
    boost::asio::ssl::context sslContext_;
    int timeoutSec_;
};

}  // namespace infra::http
