#include "adapters/binance/HttpTransport.hpp"

namespace adapters::binance {

infra::http::HttpResponse http_get(const HttpGet& http,
                                   const std::string& host,
                                   const std::string& target,
                                   const infra::http::RequestOptions& options) {
    if (http) {
        return http(host, target, options);
    }
    return infra::http::https_get(host, target, options);
}

domain::FetchError classify_http_error(const infra::http::HttpError& error) {
    using Reason = infra::http::HttpError::Reason;
    switch (error.reason()) {
    case Reason::Cancelled:
        return domain::make_error(domain::ErrorKind::Cancelled, error.what());
    case Reason::Timeout:
        return domain::source_error(domain::SourceErrorClass::Timeout, error.what());
    case Reason::Resolve:
    case Reason::Connect:
    case Reason::Tls:
    case Reason::Io:
    case Reason::Protocol:
        return domain::source_error(domain::SourceErrorClass::Network, error.what());
    }
    return domain::source_error(domain::SourceErrorClass::Network, error.what());
}

}  // namespace adapters::binance
