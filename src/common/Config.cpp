#include "common/Config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <limits>
#include <stdexcept>
#include <string>
#include <system_error>

#include "domain/IntervalMath.hpp"
#include "domain/MarketCapabilities.hpp"
#include "domain/Types.h"

namespace kfcp::common {
namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::string toUpper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return value;
}

std::string trim(std::string value) {
    auto isSpace = [](unsigned char ch) { return std::isspace(ch) != 0; };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), [&](unsigned char ch) {
                   return !isSpace(ch);
               }));
    value.erase(std::find_if(value.rbegin(), value.rend(), [&](unsigned char ch) {
                    return !isSpace(ch);
                }).base(),
                value.end());
    return value;
}

std::uint32_t parseDurationMs(const std::string& value, const std::string& label) {
    try {
        const auto parsed = std::stoul(value);
        if (parsed == 0U || parsed > std::numeric_limits<std::uint32_t>::max()) {
            throw std::out_of_range("duration out of range");
        }
        return static_cast<std::uint32_t>(parsed);
    } catch (const std::exception&) {
        throw std::runtime_error("Valor inválido para " + label + ": " + value);
    }
}

std::uint32_t parseCount(const std::string& value, const std::string& label, std::uint32_t minimum) {
    try {
        std::size_t consumed = 0;
        const auto parsed = std::stoul(value, &consumed);
        if (consumed != value.size() || parsed < minimum || parsed > std::numeric_limits<std::uint32_t>::max()) {
            throw std::out_of_range("count out of range");
        }
        return static_cast<std::uint32_t>(parsed);
    } catch (const std::exception&) {
        throw std::runtime_error("Valor inválido para " + label + ": " + value);
    }
}

bool parseBool(const std::string& value) {
    const auto normalized = toLower(value);
    if (normalized == "true" || normalized == "1" || normalized == "yes" || normalized == "on") {
        return true;
    }
    if (normalized == "false" || normalized == "0" || normalized == "no" || normalized == "off") {
        return false;
    }
    throw std::runtime_error("Valor booleano inválido: " + value);
}

std::string parseInterval(const std::string& value) {
    const auto trimmed = trim(value);
    if (!domain::interval_from_label(trimmed).valid()) {
        throw std::runtime_error("Intervalo no soportado: " + value);
    }
    return trimmed;
}

std::string parseMarket(const std::string& value) {
    const auto normalized = toLower(trim(value));
    if (!domain::market_from_string(normalized)) {
        throw std::runtime_error("Mercado inválido: " + value);
    }
    return normalized;
}

std::string parseSource(const std::string& value) {
    const auto normalized = toLower(trim(value));
    if (normalized == "auto" || normalized == "cache" || normalized == "bulk" || normalized == "live") {
        return normalized;
    }
    throw std::runtime_error("Valor de source inválido: " + value);
}

std::string parseTimestamp(const std::string& value, const std::string& label, bool allowNow) {
    const auto trimmed = trim(value);
    if (allowNow && toLower(trimmed) == "now") {
        return "now";
    }
    if (!domain::parse_utc_timestamp(trimmed)) {
        throw std::runtime_error("Fecha inválida para " + label + ": " + value);
    }
    return trimmed;
}

std::string valueFromArgs(int argc, char** argv, const std::string& key) {
    const std::string withEquals = key + '=';
    for (int i = 1; i < argc; ++i) {
        std::string arg{argv[i]};
        if (arg == key && i + 1 < argc) {
            return argv[i + 1];
        }
        if (arg.rfind(withEquals, 0) == 0) {
            return arg.substr(withEquals.size());
        }
    }
    return {};
}

bool hasFlag(int argc, char** argv, const std::string& key) {
    for (int i = 1; i < argc; ++i) {
        if (key == argv[i]) {
            return true;
        }
    }
    return false;
}

}  // namespace

Config Config::fromArgs(int argc, char** argv) {
    Config config{};

    if (const char* envLogLevel = std::getenv("LOG_LEVEL")) {
        config.logLevel = kfcp::log::levelFromString(toLower(envLogLevel));
    }
    if (const char* envCacheDir = std::getenv("KFCP_CACHE_DIR")) {
        auto pathValue = trim(envCacheDir);
        if (!pathValue.empty()) {
            config.cacheDir = std::move(pathValue);
        }
    }
    if (const char* envMarket = std::getenv("KFCP_MARKET")) {
        config.market = parseMarket(envMarket);
    }
    if (const char* envWorkers = std::getenv("KFCP_WORKERS")) {
        config.workers = parseCount(envWorkers, "KFCP_WORKERS", 1);
    }
    if (const char* envDeadline = std::getenv("KFCP_DEADLINE_MS")) {
        config.deadlineMs = parseDurationMs(envDeadline, "KFCP_DEADLINE_MS");
    }
    if (const char* envGrace = std::getenv("KFCP_GRACE_MS")) {
        config.graceMs = parseDurationMs(envGrace, "KFCP_GRACE_MS");
    }
    if (const char* envRetries = std::getenv("KFCP_RETRIES")) {
        config.retries = parseCount(envRetries, "KFCP_RETRIES", 1);
    }
    if (const char* envFreshness = std::getenv("KFCP_FRESHNESS_HOURS")) {
        config.freshnessHours = parseCount(envFreshness, "KFCP_FRESHNESS_HOURS", 0);
    }
    if (const char* envNoCache = std::getenv("KFCP_NO_CACHE")) {
        config.cacheEnabled = !parseBool(envNoCache);
    }

    if (auto levelArg = valueFromArgs(argc, argv, "--log-level"); !levelArg.empty()) {
        config.logLevel = kfcp::log::levelFromString(toLower(levelArg));
    }
    if (auto symbolArg = valueFromArgs(argc, argv, "--symbol"); !symbolArg.empty()) {
        config.symbol = toUpper(trim(symbolArg));
    }
    if (auto intervalArg = valueFromArgs(argc, argv, "--interval"); !intervalArg.empty()) {
        config.interval = parseInterval(intervalArg);
    }
    if (auto fromArg = valueFromArgs(argc, argv, "--from"); !fromArg.empty()) {
        config.from = parseTimestamp(fromArg, "--from", false);
    }
    if (auto toArg = valueFromArgs(argc, argv, "--to"); !toArg.empty()) {
        config.to = parseTimestamp(toArg, "--to", true);
    }
    if (auto marketArg = valueFromArgs(argc, argv, "--market"); !marketArg.empty()) {
        config.market = parseMarket(marketArg);
    }
    if (auto sourceArg = valueFromArgs(argc, argv, "--source"); !sourceArg.empty()) {
        config.source = parseSource(sourceArg);
    }
    if (auto outArg = valueFromArgs(argc, argv, "--out"); !outArg.empty()) {
        config.outputPath = trim(outArg);
    }
    if (auto cacheArg = valueFromArgs(argc, argv, "--cache-dir"); !cacheArg.empty()) {
        config.cacheDir = trim(cacheArg);
    }
    if (auto maxAgeArg = valueFromArgs(argc, argv, "--cache-max-age-days"); !maxAgeArg.empty()) {
        config.cacheMaxAgeDays = parseCount(maxAgeArg, "--cache-max-age-days", 0);
    }
    if (auto freshnessArg = valueFromArgs(argc, argv, "--freshness-hours"); !freshnessArg.empty()) {
        config.freshnessHours = parseCount(freshnessArg, "--freshness-hours", 0);
    }
    if (auto liveOnlyArg = valueFromArgs(argc, argv, "--live-only-max-bars"); !liveOnlyArg.empty()) {
        config.liveOnlyMaxBars = parseCount(liveOnlyArg, "--live-only-max-bars", 0);
    }
    if (auto workersArg = valueFromArgs(argc, argv, "--workers"); !workersArg.empty()) {
        config.workers = parseCount(workersArg, "--workers", 1);
    }
    if (auto retriesArg = valueFromArgs(argc, argv, "--retries"); !retriesArg.empty()) {
        config.retries = parseCount(retriesArg, "--retries", 1);
    }
    if (auto deadlineArg = valueFromArgs(argc, argv, "--deadline-ms"); !deadlineArg.empty()) {
        config.deadlineMs = parseDurationMs(deadlineArg, "--deadline-ms");
    }
    if (auto graceArg = valueFromArgs(argc, argv, "--grace-ms"); !graceArg.empty()) {
        config.graceMs = parseDurationMs(graceArg, "--grace-ms");
    }
    if (auto timeoutArg = valueFromArgs(argc, argv, "--http-timeout-sec"); !timeoutArg.empty()) {
        config.httpTimeoutSec = parseCount(timeoutArg, "--http-timeout-sec", 1);
    }

    if (hasFlag(argc, argv, "--no-cache")) {
        config.cacheEnabled = false;
    }
    if (hasFlag(argc, argv, "--with-source")) {
        config.withSource = true;
    }

    if (config.symbol.empty()) {
        throw std::runtime_error("La opción --symbol no puede estar vacía");
    }
    if (!domain::capabilities_for(*domain::market_from_string(config.market))
             .supports(domain::interval_from_label(config.interval))) {
        throw std::runtime_error("El intervalo " + config.interval + " no está disponible en el mercado " +
                                 config.market);
    }
    if (config.source == "cache" && !config.cacheEnabled) {
        throw std::runtime_error("--source cache no es compatible con --no-cache");
    }

    if (config.cacheEnabled) {
        const std::filesystem::path cachePath{config.cacheDir};
        std::error_code ec;
        std::filesystem::create_directories(cachePath, ec);
        if (ec) {
            throw std::runtime_error("No se pudo crear el directorio de caché (" + cachePath.string() + "): " +
                                     ec.message());
        }
    }

    return config;
}

}  // namespace kfcp::common
