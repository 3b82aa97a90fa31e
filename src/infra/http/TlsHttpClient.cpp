#include "infra/http/TlsHttpClient.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <sstream>
#include <string>
#include <utility>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

#include <openssl/err.h>

#include "common/Log.hpp"
#include "core/CancellationToken.hpp"

namespace infra::http {
namespace {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = net::ip::tcp;

constexpr int kMaxRedirects = 5;

HttpError makeError(HttpError::Reason reason,
                    const std::string& host,
                    const std::string& target,
                    const std::string& message) {
    std::ostringstream oss;
    oss << "HTTPS GET request to https://" << host << target << " failed: " << message;
    return HttpError(reason, oss.str());
}

struct ParsedLocation {
    std::string host;
    std::string target;
};

ParsedLocation parseRedirectLocation(const std::string& location, const std::string& currentHost) {
    if (location.empty()) {
        throw std::runtime_error("Redirect response missing Location header");
    }

    ParsedLocation result{};

    if (location.rfind("https://", 0) == 0) {
        const std::string withoutScheme = location.substr(std::string{"https://"}.size());
        const auto slashPos = withoutScheme.find('/');
        std::string hostPart = slashPos == std::string::npos ? withoutScheme : withoutScheme.substr(0, slashPos);
        if (hostPart.empty()) {
            throw std::runtime_error("Redirect URL missing host");
        }
        const auto colonPos = hostPart.find(':');
        if (colonPos != std::string::npos) {
            const std::string portPart = hostPart.substr(colonPos + 1);
            if (portPart != "443") {
                throw std::runtime_error("Redirect to unsupported HTTPS port: " + portPart);
            }
            hostPart = hostPart.substr(0, colonPos);
        }
        result.host = hostPart;
        result.target = slashPos == std::string::npos ? std::string{"/"} : withoutScheme.substr(slashPos);
    } else if (location.rfind("http://", 0) == 0) {
        throw std::runtime_error("Insecure redirect to HTTP is not supported");
    } else {
        result.host = currentHost;
        result.target = location.front() == '/' ? location : "/" + location;
    }

    return result;
}

bool isRedirect(unsigned status) {
    return status == 301U || status == 302U || status == 303U || status == 307U || status == 308U;
}

// One request on its own io_context. Every network step is started
// asynchronously and the context is run on the calling thread until that
// step completes, so a cancel hook can abort the step from another thread.
class Request {
public:
    using Completion = std::function<void(beast::error_code)>;

    Request(std::string host, std::string target, const RequestOptions& options)
        : host_(std::move(host)),
          target_(std::move(target)),
          options_(options),
          sslContext_(ssl::context::tls_client),
          timer_(ioc_) {
        beast::error_code ec;
        sslContext_.set_default_verify_paths(ec);
        if (ec) {
            LOG_WARN("Could not load default CA paths: " << ec.message());
        }
        sslContext_.set_verify_mode(ssl::verify_peer);
        stream_ = std::make_unique<ssl::stream<beast::tcp_stream>>(ioc_, sslContext_);
        stream_->set_verify_callback(ssl::host_name_verification(host_));

        if (options_.cancel != nullptr) {
            registration_ = std::make_unique<core::CancellationToken::Registration>(
                *options_.cancel,
                [this]() {
                    net::post(ioc_, [this]() {
                        resolver_.cancel();
                        timer_.cancel();
                        beast::get_lowest_layer(*stream_).cancel();
                    });
                },
                [this]() { ioc_.stop(); });
        }
    }

    Request(const Request&) = delete;
    Request& operator=(const Request&) = delete;

    http::response<http::string_body> run() {
        if (options_.timeout_sec <= 0) {
            throw fail_(HttpError::Reason::Protocol, "timeout must be positive");
        }

        if (!SSL_set_tlsext_host_name(stream_->native_handle(), host_.c_str())) {
            const unsigned long err = ::ERR_get_error();
            const char* reason = err != 0 ? ::ERR_reason_error_string(err) : nullptr;
            std::ostringstream oss;
            oss << "Failed to set SNI hostname to '" << host_ << "'";
            if (reason != nullptr) {
                oss << ": " << reason;
            }
            throw fail_(HttpError::Reason::Tls, oss.str());
        }

        const auto timeout = std::chrono::seconds(options_.timeout_sec);
        auto& lowestLayer = beast::get_lowest_layer(*stream_);

        tcp::resolver::results_type endpoints;
        bool resolveTimedOut = false;
        auto ec = step_("resolve", [&](Completion done) {
            timer_.expires_after(timeout);
            timer_.async_wait([this, &resolveTimedOut](beast::error_code timerEc) {
                if (!timerEc) {
                    resolveTimedOut = true;
                    resolver_.cancel();
                }
            });
            resolver_.async_resolve(host_, "443",
                                    [this, &endpoints, done](beast::error_code resolveEc,
                                                             tcp::resolver::results_type results) {
                                        timer_.cancel();
                                        endpoints = std::move(results);
                                        done(resolveEc);
                                    });
        });
        if (ec) {
            throw fail_(resolveTimedOut ? HttpError::Reason::Timeout : HttpError::Reason::Resolve,
                        "DNS resolution error: " + ec.message(), ec);
        }

        lowestLayer.expires_after(timeout);
        ec = step_("connect", [&](Completion done) {
            lowestLayer.async_connect(endpoints, [done](beast::error_code connectEc, const tcp::endpoint&) {
                done(connectEc);
            });
        });
        if (ec) {
            throw fail_(HttpError::Reason::Connect, "Connection error: " + ec.message(), ec);
        }

        lowestLayer.expires_after(timeout);
        ec = step_("handshake", [&](Completion done) {
            stream_->async_handshake(ssl::stream_base::client, [done](beast::error_code handshakeEc) {
                done(handshakeEc);
            });
        });
        if (ec) {
            throw fail_(HttpError::Reason::Tls, "TLS handshake error: " + ec.message(), ec);
        }

        http::request<http::empty_body> req{http::verb::get, target_, 11};
        req.set(http::field::host, host_);
        req.set(http::field::user_agent, "kline-fcp/0.1");
        req.set(http::field::accept, options_.accept);
        req.set(http::field::connection, "close");

        lowestLayer.expires_after(timeout);
        ec = step_("write", [&](Completion done) {
            http::async_write(*stream_, req, [done](beast::error_code writeEc, std::size_t) { done(writeEc); });
        });
        if (ec) {
            throw fail_(HttpError::Reason::Io, "Write error: " + ec.message(), ec);
        }

        beast::flat_buffer buffer;
        http::response_parser<http::string_body> parser;
        parser.body_limit(options_.body_limit);
        lowestLayer.expires_after(timeout);
        ec = step_("read", [&](Completion done) {
            http::async_read(*stream_, buffer, parser, [done](beast::error_code readEc, std::size_t) {
                done(readEc);
            });
        });
        if (ec) {
            throw fail_(HttpError::Reason::Io, "Read error: " + ec.message(), ec);
        }

        lowestLayer.expires_after(timeout);
        ec = step_("shutdown", [&](Completion done) {
            stream_->async_shutdown([done](beast::error_code shutdownEc) { done(shutdownEc); });
        });
        if (ec == net::error::eof || ec == ssl::error::stream_truncated) {
            // Servers commonly close without a close_notify.
            ec = {};
        }
        if (ec && ec != beast::error::timeout) {
            LOG_DEBUG("TLS shutdown with " << host_ << " ended with " << ec.message());
        }

        return parser.release();
    }

private:
    template <typename Initiate>
    beast::error_code step_(const char* what, Initiate&& initiate) {
        throwIfCancelled_(what);

        bool done = false;
        beast::error_code result;
        initiate(Completion{[&done, &result](beast::error_code ec) {
            result = ec;
            done = true;
        }});

        ioc_.restart();
        while (!done && ioc_.run_one() > 0) {
        }
        if (!done) {
            throw fail_(HttpError::Reason::Cancelled, std::string{"force released during "} + what);
        }
        if (result == net::error::operation_aborted) {
            throwIfCancelled_(what);
        }
        return result;
    }

    void throwIfCancelled_(const char* what) const {
        if (options_.cancel != nullptr && options_.cancel->cancelled()) {
            throw fail_(HttpError::Reason::Cancelled,
                        std::string{"cancelled before "} + what + ": " + options_.cancel->reason());
        }
    }

    HttpError fail_(HttpError::Reason reason, const std::string& message, beast::error_code ec = {}) const {
        if (ec == beast::error::timeout) {
            reason = HttpError::Reason::Timeout;
        }
        return makeError(reason, host_, target_, message);
    }

    const std::string host_;
    const std::string target_;
    const RequestOptions options_;

    net::io_context ioc_;
    ssl::context sslContext_;
    tcp::resolver resolver_{ioc_};
    net::steady_timer timer_;
    std::unique_ptr<ssl::stream<beast::tcp_stream>> stream_;
    // Declared last: unregistered before the members its hooks touch go away.
    std::unique_ptr<core::CancellationToken::Registration> registration_;
};

}  // namespace

HttpResponse https_get(const std::string& host, const std::string& target, const RequestOptions& options) {
    if (host.empty()) {
        throw HttpError(HttpError::Reason::Protocol, "HTTPS GET requires a non-empty host");
    }

    std::string currentHost = host;
    std::string currentTarget = target.empty() ? std::string{"/"} : target;
    if (currentTarget.front() != '/') {
        currentTarget.insert(currentTarget.begin(), '/');
    }

    for (int redirectCount = 0; redirectCount <= kMaxRedirects; ++redirectCount) {
        auto response = Request{currentHost, currentTarget, options}.run();
        const auto status = static_cast<unsigned>(response.result_int());
        if (isRedirect(status)) {
            try {
                const auto parsed = parseRedirectLocation(std::string(response.base()[http::field::location]),
                                                          currentHost);
                LOG_DEBUG("Redirect " << status << " from " << currentHost << currentTarget << " to "
                                      << parsed.host << parsed.target);
                currentHost = parsed.host;
                currentTarget = parsed.target;
                continue;
            } catch (const std::runtime_error& redirectError) {
                throw makeError(HttpError::Reason::Protocol, currentHost, currentTarget, redirectError.what());
            }
        }

        HttpResponse result{};
        result.status = status;
        result.body = std::move(response.body());
        result.final_host = currentHost;
        result.final_target = currentTarget;
        if (auto it = response.base().find(http::field::retry_after); it != response.base().end()) {
            result.retry_after_header = std::string{it->value()};
        }
        if (auto it = response.base().find("X-MBX-USED-WEIGHT-1M"); it != response.base().end()) {
            result.used_weight_header = std::string{it->value()};
        } else if (auto legacy = response.base().find("X-MBX-USED-WEIGHT"); legacy != response.base().end()) {
            result.used_weight_header = std::string{legacy->value()};
        }
        return result;
    }

    throw makeError(HttpError::Reason::Protocol, currentHost, currentTarget, "Too many redirects");
}

}  // namespace infra::http
