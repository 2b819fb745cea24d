#include "rup/core/config.hpp"
#include "rup/core/logging.hpp"
#include "rup/events/components.hpp"
#include "rup/events/event_bus.hpp"
#include "rup/events/events.hpp"
#include "rup/network/http_upload_server.hpp"
#include "rup/storage/key_value_store.hpp"
#include "rup/upload/coordinator.hpp"
#include "rup/upload/progress.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using namespace rup;

namespace {

std::atomic<bool> g_interrupted{false};

void on_signal(int) {
    g_interrupted.store(true);
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options] <path>...\n"
              << "  --host <name>     Upload server host (default from config)\n"
              << "  --port <number>   Upload server port\n"
              << "  --config <file>   JSON configuration file\n"
              << "  --base <folder>   Destination folder on the server\n"
              << "  --store <dir>     Directory holding persisted sessions\n"
              << "  --cancel-all      Cancel every unfinished persisted upload and exit\n"
              << "  --verbose         Debug logging\n";
}

void print_progress(const upload::ProgressReport& report) {
    const auto& total = report.aggregate;
    const auto eta = total.estimated_seconds_remaining
        ? upload::format_duration(*total.estimated_seconds_remaining)
        : std::string("--");
    spdlog::info("{:.1f}% ({}/{} chunks, {}/{} bytes) {:.1f} KiB/s, ETA {}", total.fraction * 100.0,
                 total.uploaded_chunks, total.total_chunks, total.uploaded_bytes, total.total_bytes,
                 total.bytes_per_second / 1024.0, eta);
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_path;
    std::string host;
    std::string base_path;
    std::string store_directory;
    int port = 0;
    bool verbose = false;
    bool cancel_all = false;
    std::vector<fs::path> paths;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--host" && i + 1 < argc) {
            host = argv[++i];
        } else if (arg == "--port" && i + 1 < argc) {
            try {
                port = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Invalid port: " << argv[i] << "\n";
                return EXIT_FAILURE;
            }
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--base" && i + 1 < argc) {
            base_path = argv[++i];
        } else if (arg == "--store" && i + 1 < argc) {
            store_directory = argv[++i];
        } else if (arg == "--cancel-all") {
            cancel_all = true;
        } else if (arg == "--verbose") {
            verbose = true;
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return EXIT_SUCCESS;
        } else {
            paths.emplace_back(arg);
        }
    }

    EngineConfig config;
    if (!config_path.empty()) {
        auto loaded = load_config(config_path);
        if (loaded.is_error()) {
            std::cerr << "Cannot load " << config_path << ": " << loaded.error().describe() << "\n";
            return EXIT_FAILURE;
        }
        config = loaded.value();
    }
    if (!host.empty()) {
        config.server.host = host;
    }
    if (port > 0 && port <= 65535) {
        config.server.port = static_cast<std::uint16_t>(port);
    }
    if (!store_directory.empty()) {
        config.store_directory = store_directory;
    }
    if (verbose) {
        config.logging.level = "debug";
    }
    if (auto valid = validate_config(config); valid.is_error()) {
        std::cerr << "Invalid configuration: " << valid.error().message << "\n";
        return EXIT_FAILURE;
    }
    if (auto logging = configure_logging(config.logging); logging.is_error()) {
        std::cerr << "Cannot configure logging: " << logging.error().message << "\n";
        return EXIT_FAILURE;
    }

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    events::EventBus bus;
    events::LoggerComponent logger(bus);
    events::MetricsComponent metrics(bus);

    storage::FileKeyValueStore backend(config.store_directory);
    network::HttpUploadServer server(config.server);
    upload::UploadCoordinator coordinator(config, backend, server, bus,
                                          std::make_shared<upload::LocalFileSourceResolver>());

    auto restored = coordinator.restore_all();
    if (cancel_all) {
        spdlog::info("Cancelled {} of {} persisted session(s)", coordinator.cancel_all(), restored.size());
        coordinator.shutdown();
        return EXIT_SUCCESS;
    }
    if (!restored.empty()) {
        spdlog::info("Resuming {} persisted session(s) from {}", restored.size(), config.store_directory);
    }

    if (!paths.empty()) {
        auto scanned = coordinator.scan(upload::Selection::from_paths(paths), [](const upload::FolderScanProgress& p) {
            spdlog::debug("Scanning {} ({} files, {} bytes)", p.current_path, p.files_scanned, p.bytes_scanned);
        });
        for (const auto& skipped : scanned.skipped) {
            spdlog::warn("Skipped unreadable entry {}", skipped);
        }
        auto report = coordinator.submit_batch(scanned, base_path);
        for (const auto& [path, error] : report.failures) {
            spdlog::error("{}: {}", path, error.describe());
        }
    } else if (restored.empty()) {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    while (!g_interrupted.load() && !coordinator.wait_until_idle(std::chrono::seconds(1))) {
        print_progress(coordinator.progress());
    }

    if (g_interrupted.load()) {
        spdlog::warn("Interrupted; unfinished uploads resume on the next run");
    }
    coordinator.shutdown();
    print_progress(coordinator.progress());

    int failed = 0;
    for (const auto& session : coordinator.sessions()) {
        if (session.status == upload::UploadStatus::Error) {
            spdlog::error("{} failed: {}", session.relative_path, session.last_error);
            ++failed;
        }
    }
    metrics.print_stats();
    coordinator.clear_completed();
    return failed == 0 && !g_interrupted.load() ? EXIT_SUCCESS : EXIT_FAILURE;
}
