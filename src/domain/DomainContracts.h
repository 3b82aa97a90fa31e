#pragma once

#include <chrono>
#include <optional>
#include <sstream>
#include <string>
#include <utility>

#include "domain/IntervalMath.hpp"
#include "domain/Types.h"

namespace domain {

enum class ErrorKind {
    None,
    Planning,
    CacheIntegrity,
    Source,
    MergeInconsistency,
    DeadlineExceeded,
    Cancelled,
};

enum class SourceErrorClass {
    None,
    RateLimited,
    Network,
    Timeout,
    NotYetAvailable,
    ChecksumMismatch,
    NotFound,
    InvalidRequest,
    Permanent,
};

inline const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
    case ErrorKind::None:
        return "none";
    case ErrorKind::Planning:
        return "planning";
    case ErrorKind::CacheIntegrity:
        return "cache_integrity";
    case ErrorKind::Source:
        return "source";
    case ErrorKind::MergeInconsistency:
        return "merge_inconsistency";
    case ErrorKind::DeadlineExceeded:
        return "deadline_exceeded";
    case ErrorKind::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

inline const char* to_string(SourceErrorClass cls) noexcept {
    switch (cls) {
    case SourceErrorClass::None:
        return "none";
    case SourceErrorClass::RateLimited:
        return "rate_limited";
    case SourceErrorClass::Network:
        return "network";
    case SourceErrorClass::Timeout:
        return "timeout";
    case SourceErrorClass::NotYetAvailable:
        return "not_yet_available";
    case SourceErrorClass::ChecksumMismatch:
        return "checksum_mismatch";
    case SourceErrorClass::NotFound:
        return "not_found";
    case SourceErrorClass::InvalidRequest:
        return "invalid_request";
    case SourceErrorClass::Permanent:
        return "permanent";
    }
    return "unknown";
}

constexpr bool is_transient(SourceErrorClass cls) noexcept {
    switch (cls) {
    case SourceErrorClass::RateLimited:
    case SourceErrorClass::Network:
    case SourceErrorClass::Timeout:
        return true;
    case SourceErrorClass::None:
    case SourceErrorClass::NotYetAvailable:
    case SourceErrorClass::ChecksumMismatch:
    case SourceErrorClass::NotFound:
    case SourceErrorClass::InvalidRequest:
    case SourceErrorClass::Permanent:
        return false;
    }
    return false;
}

struct FetchError {
    ErrorKind kind{ErrorKind::None};
    SourceErrorClass sourceClass{SourceErrorClass::None};
    std::optional<SourceTag> source{};
    TimeRange range{};
    std::string message{};
    std::optional<std::chrono::milliseconds> retryAfter{};

    bool transient() const noexcept { return kind == ErrorKind::Source && is_transient(sourceClass); }

    std::string describe() const {
        std::ostringstream oss;
        oss << to_string(kind);
        if (sourceClass != SourceErrorClass::None) {
            oss << '/' << to_string(sourceClass);
        }
        if (source) {
            oss << " source=" << to_string(*source);
        }
        if (!range.empty()) {
            oss << " range=[" << format_timestamp(range.start) << ", " << format_timestamp(range.end) << ')';
        }
        if (!message.empty()) {
            oss << ": " << message;
        }
        return oss.str();
    }
};

inline FetchError make_error(ErrorKind kind, std::string message) {
    FetchError error{};
    error.kind = kind;
    error.message = std::move(message);
    return error;
}

inline FetchError source_error(SourceErrorClass cls,
                               std::string message,
                               std::optional<std::chrono::milliseconds> retryAfter = std::nullopt) {
    FetchError error{};
    error.kind = ErrorKind::Source;
    error.sourceClass = cls;
    error.message = std::move(message);
    error.retryAfter = retryAfter;
    return error;
}

template <typename T>
struct Result {
    T value{};
    bool ok{true};
    FetchError error{};

    bool failed() const { return !ok; }

    static Result success(T v) {
        Result result{};
        result.value = std::move(v);
        return result;
    }

    static Result failure(FetchError e) {
        Result result{};
        result.ok = false;
        result.error = std::move(e);
        return result;
    }
};

}  // namespace domain
