#include "vidup/core/config.hpp"
#include "vidup/core/logging.hpp"
#include "vidup/events/components.hpp"
#include "vidup/events/event_bus.hpp"
#include "vidup/events/events.hpp"
#include "vidup/network/http_router.hpp"
#include "vidup/network/http_server_asio.hpp"
#include "vidup/server/upload_routes.hpp"
#include "vidup/server/upload_service.hpp"

#include <boost/asio/signal_set.hpp>
#include <spdlog/spdlog.h>

#include <csignal>
#include <iostream>
#include <stdexcept>
#include <string>

using vidup::network::HttpContext;
using vidup::network::HttpMethodUtils;
using vidup::network::HttpResponse;
using vidup::network::HttpRouter;
using vidup::network::HttpServerAsio;

namespace asio = boost::asio;

namespace {

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "  --config <file>        JSON server configuration\n"
              << "  -p, --port <port>      Listen port (default 8080)\n"
              << "  -d, --data <dir>       Data root for staged and published files\n"
              << "  --max-bytes <n>        Reject uploads larger than n bytes\n"
              << "  --log-level <level>    trace|debug|info|warn|error|off\n"
              << "  -h, --help             Show this help\n";
}

} // namespace

int main(int argc, char* argv[]) {
    vidup::ServerConfig config;

    // First pass: a config file provides the base values, flags override them
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            auto loaded = vidup::load_server_config(argv[++i]);
            if (loaded.is_error()) {
                std::cerr << "Failed to load config: " << loaded.error() << "\n";
                return 1;
            }
            config = loaded.value();
        }
    }

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--config" && i + 1 < argc) {
                ++i;
            } else if ((arg == "-p" || arg == "--port") && i + 1 < argc) {
                config.port = static_cast<uint16_t>(std::stoi(argv[++i]));
            } else if ((arg == "-d" || arg == "--data") && i + 1 < argc) {
                config.data_root = argv[++i];
            } else if (arg == "--max-bytes" && i + 1 < argc) {
                config.max_upload_bytes = std::stoull(argv[++i]);
            } else if (arg == "--log-level" && i + 1 < argc) {
                config.log_level = argv[++i];
            } else if (arg == "-h" || arg == "--help") {
                print_usage(argv[0]);
                return 0;
            } else {
                std::cerr << "Unknown argument: " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Invalid argument value: " << e.what() << "\n";
        return 1;
    }

    auto logging = vidup::configure_logging(config.log_level);
    if (logging.is_error()) {
        std::cerr << logging.error() << "\n";
        return 1;
    }

    vidup::events::EventBus event_bus;
    vidup::events::LoggerComponent logger(event_bus);

    vidup::server::UploadService service(config.data_root, event_bus, config.max_upload_bytes);

    HttpRouter router;
    router.use([](const HttpContext& ctx, HttpResponse&) {
        spdlog::info("{} {}", HttpMethodUtils::to_string(ctx.request.method), ctx.request.url);
        return true;
    });
    vidup::server::register_upload_routes(router, service);

    asio::io_context io_context;
    try {
        HttpServerAsio server(io_context, config.port);
        server.set_handler([&router](const vidup::network::HttpRequest& request) {
            return router.handle_request(request);
        });

        asio::signal_set signals(io_context, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int signal_number) {
            if (ec) {
                return;
            }
            event_bus.emit(vidup::events::ServerShuttingDownEvent{
                "signal " + std::to_string(signal_number)});
            server.stop();
            io_context.stop();
        });

        event_bus.emit(vidup::events::ServerStartedEvent{server.get_port()});
        spdlog::info("Data root: {}", config.data_root.string());
        for (const auto& route : router.list_routes()) {
            spdlog::info("  {}", route);
        }

        io_context.run();
    } catch (const boost::system::system_error& e) {
        spdlog::error("Server error: {}", e.what());
        return 1;
    }

    spdlog::info("Upload server stopped ({} sessions)", service.session_count());
    return 0;
}
