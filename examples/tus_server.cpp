#include "rus/events/components.hpp"
#include "rus/events/event_bus.hpp"
#include "rus/events/events.hpp"
#include "rus/network/http_server_asio.hpp"
#include "rus/server/config.hpp"
#include "rus/server/tus_handler.hpp"
#include "rus/upload/registry.hpp"
#include "rus/upload/service.hpp"
#include "rus/upload/storage.hpp"
#include "rus/upload/sweeper.hpp"

#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

namespace asio = boost::asio;
namespace fs = std::filesystem;

using rus::server::ServerConfig;

namespace {

void setup_logging(const ServerConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (config.log_file) {
        // 10 MiB per file, 5 files kept
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.log_file->string(), 10 * 1024 * 1024, 5));
    }

    auto logger = std::make_shared<spdlog::logger>("rus", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::from_str(config.log_level));
    spdlog::flush_on(spdlog::level::warn);
}

/**
 * @brief Re-arm the expiry sweep every sweep_interval
 */
void schedule_sweep(asio::steady_timer& timer,
                    const ServerConfig& config,
                    rus::upload::UploadRegistry& registry,
                    rus::upload::StorageBackend& storage,
                    rus::events::EventBus& bus) {
    timer.expires_after(config.sweep_interval);
    timer.async_wait([&timer, &config, &registry, &storage, &bus](const boost::system::error_code& ec) {
        if (ec) {
            return;
        }
        rus::upload::sweep_expired(registry, storage, registry.now(), &bus);
        schedule_sweep(timer, config, registry, storage, bus);
    });
}

} // namespace

int main(int argc, char* argv[]) {
    auto parsed = rus::server::parse_command_line(argc, argv);
    if (parsed.is_error()) {
        std::cerr << parsed.error().message << std::endl;
        rus::server::print_usage(argv[0]);
        return EXIT_FAILURE;
    }
    if (parsed.value().show_help) {
        rus::server::print_usage(argv[0]);
        return EXIT_SUCCESS;
    }

    const ServerConfig config = parsed.value().config;
    if (auto valid = config.validate(); valid.is_error()) {
        std::cerr << "Invalid configuration: " << valid.error().message << std::endl;
        return EXIT_FAILURE;
    }

    try {
        setup_logging(config);
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "Log setup failed: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    try {
        rus::events::EventBus event_bus;
        rus::events::LoggerComponent logger(event_bus);
        rus::events::MetricsComponent metrics(event_bus);

        auto storage = rus::upload::make_storage_backend(config.storage_backend, config.data_dir);
        if (storage.is_error()) {
            spdlog::critical("Storage setup failed: {}", storage.error().message);
            return EXIT_FAILURE;
        }

        rus::upload::UploadRegistry::Options registry_options;
        registry_options.expiry = config.upload_expiry;
        if (config.persist_registry && config.storage_backend == "file") {
            registry_options.persist_dir = config.data_dir;
        }
        rus::upload::UploadRegistry registry(registry_options);

        rus::upload::ServiceOptions service_options;
        service_options.max_size = config.max_size;
        service_options.storage_retry_attempts = config.storage_retry_attempts;
        service_options.storage_retry_backoff = config.storage_retry_backoff;
        rus::upload::UploadService service(registry, storage.value(), event_bus, service_options);

        rus::server::HandlerOptions handler_options;
        handler_options.base_path = config.base_path;
        handler_options.max_size = config.max_size;
        rus::server::TusHandler tus(service, handler_options);

        for (const auto& route : tus.router().list_routes()) {
            spdlog::debug("  {}", route);
        }

        asio::io_context io_context;

        rus::network::ParserLimits limits;
        limits.max_body_bytes = config.max_request_body;
        rus::network::HttpServerAsio server(io_context, config.address, config.port, limits);
        server.set_handler([&tus](const rus::network::HttpRequest& request) {
            return tus.handle(request);
        });
        server.set_default_headers({{"Tus-Resumable", rus::server::kTusVersion}});

        asio::steady_timer sweep_timer(io_context);
        schedule_sweep(sweep_timer, config, registry, *storage.value(), event_bus);

        asio::signal_set signals(io_context, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int signal_number) {
            if (ec) {
                return;
            }
            event_bus.emit(rus::events::ServerShuttingDownEvent(
                signal_number == SIGINT ? "SIGINT" : "SIGTERM"));
            server.stop();
            sweep_timer.cancel();
            io_context.stop();
        });

        event_bus.emit(rus::events::ServerStartedEvent(server.get_port(), storage.value()->name()));

        std::size_t thread_count = config.worker_threads;
        if (thread_count == 0) {
            thread_count = std::max(1u, std::thread::hardware_concurrency());
        }
        spdlog::info("Running with {} worker thread(s)", thread_count);

        std::vector<std::thread> workers;
        for (std::size_t i = 1; i < thread_count; ++i) {
            workers.emplace_back([&io_context] { io_context.run(); });
        }
        io_context.run();

        for (auto& worker : workers) {
            worker.join();
        }

        metrics.print_stats();
    } catch (const boost::system::system_error& e) {
        spdlog::critical("Server error: {}", e.what());
        return EXIT_FAILURE;
    } catch (const fs::filesystem_error& e) {
        spdlog::critical("Filesystem error: {}", e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
