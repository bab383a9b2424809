/**
 * @file main.cpp
 * @brief mipd: media ingest daemon
 *
 * Modes:
 *   run      watcher + control API (default)
 *   watch    watcher only
 *   serve    control API only
 *   init-db  create the SQLite schema and exit
 *
 * Usage:
 *   mipd [run|watch|serve|init-db] [-c|--config path/to/config.yaml]
 *
 * Try:
 *   curl http://localhost:8080/api/records/pending
 *   curl -X POST http://localhost:8080/api/records/1/approve -d '{"delete_source": false}'
 */

#include "mip/api/control_api.hpp"
#include "mip/core/config.hpp"
#include "mip/core/logging.hpp"
#include "mip/ingest/renamer.hpp"
#include "mip/ingest/stability_validator.hpp"
#include "mip/ingest/transfer.hpp"
#include "mip/ingest/version_resolver.hpp"
#include "mip/network/http_router.hpp"
#include "mip/network/http_server_asio.hpp"
#include "mip/store/memory_store.hpp"
#include "mip/store/sqlite_store.hpp"
#include "mip/watch/dispatcher.hpp"
#include "mip/watch/event_source.hpp"
#include "mip/workflow/orchestrator.hpp"

#include <boost/asio.hpp>
#include <spdlog/spdlog.h>

#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace asio = boost::asio;
namespace fs = std::filesystem;

namespace {

enum class Mode { Run, Watch, Serve, InitDb };

struct Options {
    Mode mode = Mode::Run;
    std::optional<fs::path> config_path;
};

void print_usage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [run|watch|serve|init-db] [-c|--config FILE]\n"
              << "\n"
              << "  run      watch the download folder and serve the control API (default)\n"
              << "  watch    watch the download folder only\n"
              << "  serve    serve the control API only\n"
              << "  init-db  create the record database schema and exit\n";
}

// Returns nullopt after printing usage or an error; exit_code tells which
std::optional<Options> parse_args(int argc, char** argv, int& exit_code) {
    Options options;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            exit_code = 0;
            return std::nullopt;
        }
        if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << arg << " requires a path\n";
                exit_code = 2;
                return std::nullopt;
            }
            options.config_path = fs::path(argv[++i]);
        } else if (arg == "run") {
            options.mode = Mode::Run;
        } else if (arg == "watch") {
            options.mode = Mode::Watch;
        } else if (arg == "serve") {
            options.mode = Mode::Serve;
        } else if (arg == "init-db") {
            options.mode = Mode::InitDb;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage(argv[0]);
            exit_code = 2;
            return std::nullopt;
        }
    }
    return options;
}

std::unique_ptr<mip::store::RecordStore> open_store(const mip::StoreConfig& config) {
    if (config.backend == mip::StoreBackend::Memory) {
        spdlog::warn("Using in-memory record store; records are lost on exit");
        return std::make_unique<mip::store::MemoryRecordStore>();
    }
    std::error_code ec;
    const fs::path parent = fs::path(config.path).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
    }
    return std::make_unique<mip::store::SqliteRecordStore>(config.path);
}

} // namespace

int main(int argc, char** argv) {
    int exit_code = 0;
    auto options = parse_args(argc, argv, exit_code);
    if (!options) {
        return exit_code;
    }

    if (!options->config_path) {
        options->config_path = mip::ConfigLoader::find_default();
    }
    if (!options->config_path) {
        std::cerr << "No configuration file given and none found in the default locations\n";
        return 1;
    }

    auto loaded = mip::ConfigLoader::load_file(*options->config_path);
    if (loaded.is_error()) {
        std::cerr << "Configuration error: " << loaded.error().message << "\n";
        return 1;
    }
    const mip::Config config = loaded.value();

    if (auto logging = mip::init_logging(config.logging); logging.is_error()) {
        std::cerr << "Logging setup failed: " << logging.error().message << "\n";
        return 1;
    }
    spdlog::info("mipd starting with config {}", options->config_path->string());

    std::unique_ptr<mip::store::RecordStore> store;
    try {
        store = open_store(config.store);
    } catch (const std::runtime_error& e) {
        spdlog::critical("Failed to open record store: {}", e.what());
        mip::shutdown_logging();
        return 1;
    }

    if (options->mode == Mode::InitDb) {
        spdlog::info("Record store ready at {}", config.store.path);
        mip::shutdown_logging();
        return 0;
    }

    if (config.store.backend == mip::StoreBackend::Memory && options->mode != Mode::Run) {
        spdlog::warn("The memory store is not shared between processes; use 'run' or the sqlite backend");
    }

    mip::ingest::StabilityValidator validator(config.watcher);
    mip::ingest::ExternalRenamer renamer(config.renamer);
    mip::ingest::TransferEngine transfer(mip::ingest::TransferOptions::from_config(config.destination));
    mip::ingest::VersionResolver resolver(config.versioning);
    mip::workflow::Orchestrator orchestrator(*store, renamer, transfer, resolver,
                                             config.destination.target_directory());

    asio::io_context io_context;
    asio::signal_set signals(io_context, SIGINT, SIGTERM);

    const bool watching = options->mode == Mode::Run || options->mode == Mode::Watch;
    const bool serving = options->mode == Mode::Run || options->mode == Mode::Serve;

    mip::watch::WatchDispatcher dispatcher(validator, *store, config.watcher.workers);
    mip::watch::InotifyEventSource source(config.watcher.download_folder, config.watcher.watch_recursive);
    if (watching) {
        dispatcher.start();
        if (auto attached = dispatcher.attach(source); attached.is_error()) {
            spdlog::critical("Failed to watch {}: {}", config.watcher.download_folder,
                             attached.error().message);
            dispatcher.stop();
            mip::shutdown_logging();
            return 1;
        }
        if (config.watcher.scan_on_start) {
            const auto queued = dispatcher.scan_existing(config.watcher.download_folder,
                                                         config.watcher.watch_recursive);
            spdlog::info("Initial scan queued {} files", queued);
        }
    }

    mip::network::HttpRouter router;
    mip::api::ControlApi api(orchestrator, config.api.approval_workers);
    std::unique_ptr<mip::network::HttpServerAsio> server;
    if (serving) {
        api.register_routes(router);
        try {
            server = std::make_unique<mip::network::HttpServerAsio>(io_context, config.api.host, config.api.port);
        } catch (const std::exception& e) {
            spdlog::critical("Failed to start control API on {}:{}: {}", config.api.host, config.api.port, e.what());
            source.stop();
            dispatcher.stop();
            mip::shutdown_logging();
            return 1;
        }
        server->set_handler([&router](const mip::network::HttpRequest& request, mip::network::Responder respond) {
            router.dispatch(request, std::move(respond));
        });
        spdlog::info("Control API listening on {}:{}", config.api.host, server->get_port());
    }

    signals.async_wait([&](const boost::system::error_code& ec, int signal_number) {
        if (ec) {
            return;
        }
        spdlog::info("Received signal {}, shutting down", signal_number);
        if (server) {
            server->stop();
        }
        io_context.stop();
    });

    const std::size_t io_threads = serving ? config.api.threads : 1;
    std::vector<std::thread> pool;
    for (std::size_t i = 1; i < io_threads; ++i) {
        pool.emplace_back([&io_context]() { io_context.run(); });
    }
    io_context.run();
    for (auto& thread : pool) {
        thread.join();
    }

    if (watching) {
        source.stop();
        dispatcher.stop();
    }
    spdlog::info("mipd stopped");
    mip::shutdown_logging();
    return 0;
}
