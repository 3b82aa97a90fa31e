#pragma once

#include <functional>
#include <string>

#include "domain/DomainContracts.h"
#include "infra/http/TlsHttpClient.hpp"

namespace adapters::binance {

// Replaceable HTTPS GET; empty means infra::http::https_get.
using HttpGet = std::function<infra::http::HttpResponse(const std::string& host,
                                                        const std::string& target,
                                                        const infra::http::RequestOptions& options)>;

infra::http::HttpResponse http_get(const HttpGet& http,
                                   const std::string& host,
                                   const std::string& target,
                                   const infra::http::RequestOptions& options);

// Transport failure as a source error; cancellation keeps its own kind.
domain::FetchError classify_http_error(const infra::http::HttpError& error);

}  // namespace adapters::binance
