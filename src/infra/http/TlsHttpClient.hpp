#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace core {
class CancellationToken;
}

namespace infra::http {

class HttpError : public std::runtime_error {
public:
    enum class Reason {
        Resolve,
        Connect,
        Tls,
        Timeout,
        Io,
        Cancelled,
        Protocol,
    };

    HttpError(Reason reason, const std::string& message) : std::runtime_error(message), reason_(reason) {}

    Reason reason() const noexcept { return reason_; }

private:
    Reason reason_;
};

struct HttpResponse {
    unsigned status = 0U;
    std::string body;
    std::string retry_after_header;
    std::string used_weight_header;
    std::string final_host;
    std::string final_target;
};

struct RequestOptions {
    int timeout_sec = 20;
    std::string accept = "application/json";
    std::size_t body_limit = 64U * 1024U * 1024U;
    // Cancelling aborts the pending network operation; force release stops
    // the request's io_context outright.
    core::CancellationToken* cancel = nullptr;
};

// Performs an HTTPS GET, following up to five redirects. Any HTTP status is
// returned to the caller; transport failures throw HttpError.
HttpResponse https_get(const std::string& host, const std::string& target, const RequestOptions& options = {});

}  // namespace infra::http
