#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include "adapters/binance/BinanceRestClient.hpp"
#include "adapters/binance/VisionClient.hpp"
#include "app/FailoverOrchestrator.hpp"
#include "app/FcpConfig.hpp"
#include "common/Config.hpp"
#include "common/Log.hpp"
#include "common/Metrics.hpp"
#include "domain/IntervalMath.hpp"

namespace {

constexpr int kExitUsage = 2;

volatile std::sig_atomic_t gSignalStatus = 0;

void handleSignal(int signal) {
    gSignalStatus = signal;
}

void printUsage() {
    std::cout << "Uso: kfcp_fetch --symbol BTCUSDT --interval 1m --from 2024-01-01 [--to now]\n"
                 "  [--market spot|um|cm] [--source auto|cache|bulk|live] [--with-source] [--out archivo.csv]\n"
                 "  [--cache-dir ./cache] [--no-cache] [--cache-max-age-days 30] [--freshness-hours 48]\n"
                 "  [--live-only-max-bars 0] [--workers 8] [--retries 5] [--deadline-ms 300000]\n"
                 "  [--grace-ms 300] [--http-timeout-sec 20] [--log-level debug|info|warn|error]\n";
}

std::optional<domain::SourceTag> sourceFromOption(const std::string& source) {
    if (source == "cache") {
        return domain::SourceTag::Cache;
    }
    if (source == "bulk") {
        return domain::SourceTag::BulkHistorical;
    }
    if (source == "live") {
        return domain::SourceTag::Live;
    }
    return std::nullopt;
}

void writeCsv(std::ostream& out, const app::BarSeries& series, bool withSource) {
    out << "open_time,open,high,low,close,volume" << (withSource ? ",source" : "") << '\n';
    out << std::setprecision(15);
    for (std::size_t i = 0; i < series.bars.size(); ++i) {
        const auto& bar = series.bars[i];
        out << bar.openTime << ',' << bar.open << ',' << bar.high << ',' << bar.low << ',' << bar.close << ','
            << bar.volume;
        if (withSource && i < series.sources.size()) {
            out << ',' << domain::to_string(series.sources[i]);
        }
        out << '\n';
    }
}

}  // namespace

int main(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg{argv[i]};
        if (arg == "--help" || arg == "-h") {
            printUsage();
            return EXIT_SUCCESS;
        }
    }

    kfcp::common::Config config;
    try {
        config = kfcp::common::Config::fromArgs(argc, argv);
    } catch (const std::exception& ex) {
        std::cerr << "Error de configuración: " << ex.what() << '\n';
        printUsage();
        return kExitUsage;
    }
    if (config.from.empty()) {
        std::cerr << "Falta la opción --from\n";
        printUsage();
        return kExitUsage;
    }

    // CSV on stdout must not interleave with INFO lines.
    if (config.outputPath.empty() && config.logLevel < kfcp::log::Level::Warn) {
        kfcp::log::setLevel(kfcp::log::Level::Warn);
    } else {
        kfcp::log::setLevel(config.logLevel);
    }

    try {
        auto fcpConfig = app::FcpConfig::fromConfig(config);
        const auto interval = domain::interval_from_label(config.interval);
        const auto start = domain::parse_utc_timestamp(config.from);
        const auto end = config.to == "now" ? std::optional<domain::TimestampMs>{fcpConfig.currentTime()}
                                            : domain::parse_utc_timestamp(config.to);
        if (!start || !end) {
            std::cerr << "Rango de fechas inválido\n";
            return kExitUsage;
        }

        LOG_INFO("Configuración cargada");
        LOG_INFO("  Símbolo: " << config.symbol << " intervalo: " << config.interval << " mercado: " << config.market);
        LOG_INFO("  Rango: " << domain::format_timestamp(*start) << " -> " << domain::format_timestamp(*end));
        LOG_INFO("  Caché: " << (config.cacheEnabled ? config.cacheDir : std::string{"desactivada"}));
        LOG_INFO("  Workers: " << config.workers << " reintentos: " << config.retries
                               << " deadline: " << config.deadlineMs << " ms gracia: " << config.graceMs << " ms");

        adapters::binance::VisionClient::Options visionOptions{};
        visionOptions.market = fcpConfig.market;
        visionOptions.freshnessDelay = fcpConfig.planner.freshnessDelay;
        visionOptions.timeoutSec = static_cast<int>(config.httpTimeoutSec) * 3;
        auto bulk = std::make_shared<adapters::binance::VisionClient>(std::move(visionOptions));

        adapters::binance::BinanceRestClient::Options restOptions{};
        restOptions.market = fcpConfig.market;
        restOptions.timeoutSec = static_cast<int>(config.httpTimeoutSec);
        auto live = std::make_shared<adapters::binance::BinanceRestClient>(std::move(restOptions));

        app::FailoverOrchestrator orchestrator(std::move(fcpConfig), bulk, live);

        app::GetDataOptions options{};
        options.enforceSource = sourceFromOption(config.source);
        options.includeSources = config.withSource;
        options.cancel = std::make_shared<core::CancellationToken>();

        std::signal(SIGINT, handleSignal);
        std::signal(SIGTERM, handleSignal);
        std::atomic<bool> finished{false};
        std::thread signalWatcher([&finished, cancel = options.cancel]() {
            while (!finished.load()) {
                if (gSignalStatus != 0) {
                    LOG_WARN("Señal " << gSignalStatus << " recibida, cancelando");
                    cancel->cancel("interrupted by signal");
                    return;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
        });

        struct WatcherGuard {
            std::atomic<bool>& finished;
            std::thread& thread;
            ~WatcherGuard() {
                finished.store(true);
                if (thread.joinable()) {
                    thread.join();
                }
            }
        };
        std::optional<domain::Result<app::BarSeries>> outcome;
        {
            WatcherGuard guard{finished, signalWatcher};
            outcome = orchestrator.getData(config.symbol, interval, *start, *end, options);
        }
        auto& result = *outcome;

        kfcp::common::metrics::Registry::instance().logSummary();

        if (result.failed()) {
            LOG_ERR("GetData falló: " << result.error.describe());
            std::cerr << "Error: " << result.error.describe() << '\n';
            return EXIT_FAILURE;
        }

        const auto& series = result.value;
        if (series.hasUnexplainedGap()) {
            LOG_WARN("Serie incompleta: " << series.bars.size() << " de " << series.expectedCount << " velas");
        }

        if (config.outputPath.empty()) {
            writeCsv(std::cout, series, config.withSource);
            std::cout.flush();
            if (!std::cout) {
                std::cerr << "Error escribiendo en stdout\n";
                return EXIT_FAILURE;
            }
        } else {
            std::ofstream out(config.outputPath, std::ios::trunc);
            if (!out) {
                LOG_ERR("No se pudo abrir " << config.outputPath);
                return EXIT_FAILURE;
            }
            writeCsv(out, series, config.withSource);
            out.close();
            if (!out) {
                LOG_ERR("Error escribiendo " << config.outputPath);
                return EXIT_FAILURE;
            }
            LOG_INFO(series.bars.size() << " velas escritas en " << config.outputPath);
        }
        return EXIT_SUCCESS;
    } catch (const std::exception& ex) {
        LOG_ERR("Error fatal: " << ex.what());
        return EXIT_FAILURE;
    }
}
