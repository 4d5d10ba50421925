#include "infra/http/HttpClient.h"

#include <cctype>
#include <chrono>
#include <sstream>
#include <type_traits>
#include <utility>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <openssl/err.h>

#include "logging/Log.h"

namespace infra::http {
namespace {

namespace beast = boost::beast;
namespace bhttp = beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;

constexpr const char* kUserAgent = "livechart/0.1";

std::string describe(const Url& url, const std::string& stage, const std::string& message) {
    std::ostringstream oss;
    oss << "GET " << url.toString() << " failed at " << stage << ": " << message;
    return oss.str();
}

class SessionBase {
public:
    virtual ~SessionBase() = default;
    virtual void cancel() = 0;
};

template <bool Tls>
class Session : public SessionBase, public std::enable_shared_from_this<Session<Tls>> {
public:
    using Stream = std::conditional_t<Tls, beast::ssl_stream<beast::tcp_stream>, beast::tcp_stream>;

    template <bool T = Tls, std::enable_if_t<T, int> = 0>
    Session(net::io_context& ioc, ssl::context& ctx, Url url, int timeoutSec, AsyncHttpClient::Completion onDone)
        : resolver_(ioc),
          resolveTimer_(ioc),
          stream_(ioc, ctx),
          url_(std::move(url)),
          timeout_(timeoutSec),
          onDone_(std::move(onDone)) {}

    template <bool T = Tls, std::enable_if_t<!T, int> = 0>
    Session(net::io_context& ioc, Url url, int timeoutSec, AsyncHttpClient::Completion onDone)
        : resolver_(ioc),
          resolveTimer_(ioc),
          stream_(ioc),
          url_(std::move(url)),
          timeout_(timeoutSec),
          onDone_(std::move(onDone)) {}

    void start() {
        if constexpr (Tls) {
            if (!SSL_set_tlsext_host_name(stream_.native_handle(), url_.host.c_str())) {
                const unsigned long err = ::ERR_get_error();
                const char* reason = err != 0 ? ::ERR_reason_error_string(err) : nullptr;
                std::string message = reason != nullptr ? reason : "cannot set SNI host name";
                net::post(resolver_.get_executor(), [self = this->shared_from_this(), message]() {
                    self->fail_("sni", message);
                });
                return;
            }
            stream_.set_verify_callback(ssl::host_name_verification(url_.host));
        }

        req_ = bhttp::request<bhttp::empty_body>{bhttp::verb::get, url_.target, 11};
        req_.set(bhttp::field::host, url_.host);
        req_.set(bhttp::field::user_agent, kUserAgent);
        req_.set(bhttp::field::accept, "application/json");
        req_.set(bhttp::field::connection, "close");

        LOG_TRACE(logging::LogCategory::NET, "resolving %s:%s", url_.host.c_str(), url_.port.c_str());
        // The resolver has no deadline of its own; a lookup still pending at the timeout fails the request.
        resolveTimer_.expires_after(std::chrono::seconds(timeout_));
        resolveTimer_.async_wait([self = this->shared_from_this()](beast::error_code ec) {
            if (ec == net::error::operation_aborted || self->finished_) {
                return;
            }
            self->resolver_.cancel();
            self->fail_("resolve", "timed out after " + std::to_string(self->timeout_) + "s");
        });
        resolver_.async_resolve(url_.host, url_.port,
                                [self = this->shared_from_this()](beast::error_code ec,
                                                                  net::ip::tcp::resolver::results_type results) {
                                    self->onResolve_(ec, results);
                                });
    }

    void cancel() override {
        if (finished_) {
            return;
        }
        finished_ = true;
        onDone_ = nullptr;
        resolveTimer_.cancel();
        resolver_.cancel();
        beast::error_code ignored;
        beast::get_lowest_layer(stream_).socket().close(ignored);
    }

private:
    void onResolve_(beast::error_code ec, const net::ip::tcp::resolver::results_type& results) {
        if (finished_) {
            return;
        }
        resolveTimer_.cancel();
        if (ec) {
            fail_("resolve", ec.message());
            return;
        }
        auto& lowest = beast::get_lowest_layer(stream_);
        lowest.expires_after(std::chrono::seconds(timeout_));
        lowest.async_connect(results,
                             [self = this->shared_from_this()](beast::error_code ec,
                                                               const net::ip::tcp::endpoint&) {
                                 self->onConnect_(ec);
                             });
    }

    void onConnect_(beast::error_code ec) {
        if (finished_) {
            return;
        }
        if (ec) {
            fail_("connect", ec.message());
            return;
        }
        if constexpr (Tls) {
            beast::get_lowest_layer(stream_).expires_after(std::chrono::seconds(timeout_));
            stream_.async_handshake(ssl::stream_base::client,
                                    [self = this->shared_from_this()](beast::error_code ec) {
                                        if (self->finished_) {
                                            return;
                                        }
                                        if (ec) {
                                            self->fail_("handshake", ec.message());
                                            return;
                                        }
                                        self->write_();
                                    });
        }
        else {
            write_();
        }
    }

    void write_() {
        beast::get_lowest_layer(stream_).expires_after(std::chrono::seconds(timeout_));
        bhttp::async_write(stream_, req_,
                           [self = this->shared_from_this()](beast::error_code ec, std::size_t) {
                               self->onWrite_(ec);
                           });
    }

    void onWrite_(beast::error_code ec) {
        if (finished_) {
            return;
        }
        if (ec) {
            fail_("write", ec.message());
            return;
        }
        beast::get_lowest_layer(stream_).expires_after(std::chrono::seconds(timeout_));
        bhttp::async_read(stream_, buffer_, res_,
                          [self = this->shared_from_this()](beast::error_code ec, std::size_t bytes) {
                              self->onRead_(ec, bytes);
                          });
    }

    void onRead_(beast::error_code ec, std::size_t bytes) {
        if (finished_) {
            return;
        }
        if (ec) {
            fail_("read", ec.message());
            return;
        }
        LOG_DEBUG(logging::LogCategory::NET, "GET %s -> %u (%zu bytes)", url_.toString().c_str(),
                  static_cast<unsigned>(res_.result_int()), bytes);

        HttpResponse response;
        response.status = static_cast<unsigned>(res_.result_int());
        response.body = std::move(res_.body());
        close_();
        finish_(HttpResult::success(std::move(response)));
    }

    void fail_(const char* stage, const std::string& message) {
        const std::string error = describe(url_, stage, message);
        LOG_WARN(logging::LogCategory::NET, "%s", error.c_str());
        close_();
        finish_(HttpResult::failure(error));
    }

    // Connection: close was requested, so the socket is dropped without a TLS close_notify.
    void close_() {
        resolveTimer_.cancel();
        beast::error_code ignored;
        beast::get_lowest_layer(stream_).socket().shutdown(net::ip::tcp::socket::shutdown_both, ignored);
        beast::get_lowest_layer(stream_).socket().close(ignored);
    }

    void finish_(HttpResult result) {
        if (finished_) {
            return;
        }
        finished_ = true;
        auto callback = std::move(onDone_);
        onDone_ = nullptr;
        if (callback) {
            callback(std::move(result));
        }
    }

    net::ip::tcp::resolver resolver_;
    net::steady_timer resolveTimer_;
    Stream stream_;
    Url url_;
    int timeout_;
    AsyncHttpClient::Completion onDone_;
    bhttp::request<bhttp::empty_body> req_;
    bhttp::response<bhttp::string_body> res_;
    beast::flat_buffer buffer_;
    bool finished_{false};
};

class SessionHandle : public domain::FetchHandle {
public:
    explicit SessionHandle(std::weak_ptr<SessionBase> session) : session_(std::move(session)) {}

    void cancel() override {
        if (auto session = session_.lock()) {
            session->cancel();
        }
        session_.reset();
    }

private:
    std::weak_ptr<SessionBase> session_;
};

std::string lowercase(std::string s) {
    for (auto& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

}  // namespace

std::string Url::toString() const {
    const bool defaultPort = (tls() && port == "443") || (!tls() && port == "80");
    return scheme + "://" + host + (defaultPort ? std::string{} : ":" + port) + target;
}

std::optional<Url> parse_url(const std::string& text) {
    const auto schemeEnd = text.find("://");
    if (schemeEnd == std::string::npos) {
        return std::nullopt;
    }
    Url url;
    url.scheme = lowercase(text.substr(0, schemeEnd));
    if (url.scheme != "http" && url.scheme != "https") {
        return std::nullopt;
    }

    const std::string rest = text.substr(schemeEnd + 3);
    const auto pathPos = rest.find_first_of("/?");
    std::string authority = pathPos == std::string::npos ? rest : rest.substr(0, pathPos);
    url.target = pathPos == std::string::npos ? std::string{"/"} : rest.substr(pathPos);
    if (!url.target.empty() && url.target.front() == '?') {
        url.target.insert(url.target.begin(), '/');
    }
    if (authority.find('@') != std::string::npos) {
        return std::nullopt;
    }

    const auto colon = authority.rfind(':');
    if (colon != std::string::npos) {
        url.port = authority.substr(colon + 1);
        authority = authority.substr(0, colon);
        if (url.port.empty() || url.port.size() > 5) {
            return std::nullopt;
        }
        for (char c : url.port) {
            if (std::isdigit(static_cast<unsigned char>(c)) == 0) {
                return std::nullopt;
            }
        }
        const int portNumber = std::stoi(url.port);
        if (portNumber <= 0 || portNumber > 65535) {
            return std::nullopt;
        }
    }
    else {
        url.port = url.tls() ? "443" : "80";
    }
    if (authority.empty()) {
        return std::nullopt;
    }
    url.host = authority;
    return url;
}

std::string url_encode(const std::string& value) {
    static const char* kHex = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size());
    for (unsigned char c : value) {
        if (std::isalnum(c) != 0 || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        }
        else {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
    return out;
}

AsyncHttpClient::AsyncHttpClient(net::io_context& ioc, int timeoutSec)
    : ioc_(ioc), sslContext_(ssl::context::tls_client), timeoutSec_(timeoutSec > 0 ? timeoutSec : 1) {
    sslContext_.set_default_verify_paths();
    sslContext_.set_verify_mode(ssl::verify_peer);
}

AsyncHttpClient::~AsyncHttpClient() = default;

std::unique_ptr<domain::FetchHandle> AsyncHttpClient::get(const Url& url, Completion onDone) {
    std::shared_ptr<SessionBase> session;
    if (url.tls()) {
        auto tlsSession = std::make_shared<Session<true>>(ioc_, sslContext_, url, timeoutSec_, std::move(onDone));
        tlsSession->start();
        session = tlsSession;
    }
    else {
        auto plainSession = std::make_shared<Session<false>>(ioc_, url, timeoutSec_, std::move(onDone));
        plainSession->start();
        session = plainSession;
    }
    return std::make_unique<SessionHandle>(session);
}

}  // namespace infra::http
