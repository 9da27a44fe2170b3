#include "guestdrop/core/clock.hpp"
#include "guestdrop/core/filesystem.hpp"
#include "guestdrop/events/components.hpp"
#include "guestdrop/events/event_bus.hpp"
#include "guestdrop/events/events.hpp"
#include "guestdrop/network/http_router.hpp"
#include "guestdrop/network/http_server_asio.hpp"
#include "guestdrop/server/config.hpp"
#include "guestdrop/server/upload_api.hpp"
#include "guestdrop/upload/reaper.hpp"
#include "guestdrop/upload/service.hpp"
#include "guestdrop/upload/session_registry.hpp"

#include <boost/asio/signal_set.hpp>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <thread>
#include <vector>

namespace {

constexpr std::size_t kLogFileBytes = 10 * 1024 * 1024;
constexpr std::size_t kLogFileCount = 3;

void configure_logging(const guestdrop::server::ServerConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (config.log_file) {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.log_file->string(), kLogFileBytes, kLogFileCount));
    }

    auto logger = std::make_shared<spdlog::logger>("guestdrop", sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::from_str(config.log_level));
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_default_logger(logger);
}

int run(const guestdrop::server::ServerConfig& config) {
    namespace asio = boost::asio;
    using namespace guestdrop;

    LocalFileSystem filesystem;
    SystemClock clock;

    for (const auto& dir : {config.upload_root, config.effective_scratch_root()}) {
        auto created = filesystem.create_directories(dir);
        if (created.is_error()) {
            spdlog::critical("Cannot prepare {}: {}", dir.string(), created.error().message);
            return EXIT_FAILURE;
        }
    }

    events::EventBus bus;
    events::LoggerComponent logger(bus);
    events::MetricsComponent metrics(bus);

    upload::SessionRegistry registry(clock);
    upload::UploadService service(config.upload_options(), filesystem, registry, bus, clock);
    upload::StaleSessionReaper reaper(service, std::chrono::duration_cast<std::chrono::milliseconds>(config.reaper_interval));

    network::HttpRouter router;
    server::register_upload_routes(router, service);

    asio::io_context io_context;
    network::HttpServerAsio http(io_context, config.bind_address, config.port,
                                 static_cast<size_t>(config.effective_max_request_bytes()));
    http.set_handler([&router](const network::HttpRequest& request) {
        return router.handle_request(request);
    });

    asio::signal_set signals(io_context, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int signal_number) {
        if (ec) {
            return;
        }
        bus.emit(events::ServerShuttingDownEvent{signal_number == SIGINT ? "SIGINT" : "SIGTERM"});
        http.stop();
        io_context.stop();
    });

    http.start();
    reaper.start();
    bus.emit(events::ServerStartedEvent{config.bind_address, http.get_port(), config.upload_root.string()});

    const std::size_t thread_count = config.effective_worker_threads();
    spdlog::info("Serving with {} worker thread(s)", thread_count);

    std::vector<std::thread> workers;
    workers.reserve(thread_count > 0 ? thread_count - 1 : 0);
    for (std::size_t i = 1; i < thread_count; ++i) {
        workers.emplace_back([&io_context] { io_context.run(); });
    }
    io_context.run();
    for (auto& worker : workers) {
        worker.join();
    }

    reaper.stop();
    metrics.print_stats();
    return EXIT_SUCCESS;
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace guestdrop::server;

    auto cli = parse_command_line(argc, argv);
    if (cli.is_error()) {
        std::cerr << cli.error() << "\n" << usage(argv[0]);
        return EXIT_FAILURE;
    }
    if (cli.value().show_help) {
        std::cout << usage(argv[0]);
        return EXIT_SUCCESS;
    }

    ServerConfig config;
    if (cli.value().config_path) {
        auto loaded = load_config_file(*cli.value().config_path);
        if (loaded.is_error()) {
            std::cerr << loaded.error() << "\n";
            return EXIT_FAILURE;
        }
        config = std::move(loaded.value());
    }
    apply_overrides(config, cli.value());

    auto valid = validate(config);
    if (valid.is_error()) {
        std::cerr << "Invalid configuration: " << valid.error() << "\n";
        return EXIT_FAILURE;
    }

    try {
        configure_logging(config);
        return run(config);
    } catch (const std::exception& ex) {
        std::cerr << "Server failed: " << ex.what() << std::endl;
        spdlog::critical("Fatal error: {}", ex.what());
        return EXIT_FAILURE;
    }
}
