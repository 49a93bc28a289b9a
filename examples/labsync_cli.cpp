#include "labsync/config/settings.hpp"
#include "labsync/engine/sync_engine.hpp"
#include "labsync/events/components.hpp"
#include "labsync/events/event_bus.hpp"
#include "labsync/remote/http_repository_client.hpp"
#include "labsync/transfer/transfer_strategy.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <spdlog/spdlog.h>

#include <csignal>
#include <iostream>
#include <string>
#include <thread>

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " --config <settings.json> [--verbose]\n";
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    std::string config_path;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            spdlog::set_level(spdlog::level::debug);
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else {
            print_usage(argv[0]);
            return 2;
        }
    }
    if (config_path.empty()) {
        print_usage(argv[0]);
        return 2;
    }

    auto settings = labsync::config::Settings::load_file(config_path);
    if (settings.is_error()) {
        spdlog::error("Cannot load settings: {}", settings.error().describe());
        return 2;
    }
    if (auto valid = settings.value().validate(); valid.is_error()) {
        spdlog::error("Invalid settings: {}", valid.error().describe());
        return 2;
    }

    auto client = labsync::remote::HttpRepositoryClient::create(settings.value());
    if (client.is_error()) {
        spdlog::error("Cannot create repository client: {}", client.error().describe());
        return 2;
    }
    auto transport = labsync::transfer::make_staging_transport(settings.value());

    labsync::events::EventBus event_bus;
    labsync::events::LoggerComponent logger(event_bus);
    labsync::events::MetricsComponent metrics(event_bus);

    labsync::engine::SyncEngine engine(settings.value(), *client.value(), transport.get(), event_bus);

    // Ctrl+C cancels the pass; transfers stop at their next chunk boundary
    boost::asio::io_context signal_io;
    boost::asio::signal_set signals(signal_io, SIGINT, SIGTERM);
    signals.async_wait([&engine](const boost::system::error_code& ec, int signal_number) {
        if (!ec) {
            spdlog::info("Received signal {}, canceling upload pass...", signal_number);
            engine.cancel();
        }
    });
    std::thread signal_thread([&signal_io]() { signal_io.run(); });

    spdlog::info("Uploading from {} to {}", settings.value().data_directory.string(),
                 settings.value().repository_url);
    const auto report = engine.run_pass();

    signals.cancel();
    signal_io.stop();
    signal_thread.join();

    metrics.print_stats();

    if (report.scan_error) {
        spdlog::error("Upload pass aborted: {}", report.scan_error->describe());
        return 1;
    }
    if (report.canceled) {
        spdlog::warn("Upload pass canceled");
        return 130;
    }
    if (report.summary.failed > 0) {
        spdlog::error("{} of {} files failed to upload", report.summary.failed, report.summary.total);
        return 1;
    }
    spdlog::info("All {} files in {} folders are uploaded", report.summary.total, report.folders.size());
    return 0;
}
