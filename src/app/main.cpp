#include "restcore/core/dispatcher.h"
#include "restcore/core/filter_chain.h"
#include "restcore/core/http_request.h"
#include "restcore/core/response_envelope.h"
#include "restcore/core/route_registry.h"
#include "restcore/infrastructure/config/server_config.h"
#include "restcore/infrastructure/net/http_session.h"
#include "restcore/infrastructure/net/io_context_pool.h"
#include "restcore/infrastructure/net/listener.h"
#include "restcore/logging/logger.h"

#include <boost/asio/signal_set.hpp>

#include <csignal>
#include <exception>
#include <memory>

namespace core = restcore::core;
namespace config = restcore::infrastructure::config;
namespace net = restcore::infrastructure::net;

int main(int argc, char** argv) {
    config::ServerConfig server_config;
    try {
        server_config = argc > 1 ? config::load_config(argv[1]) : config::default_config();
    } catch (const config::ConfigFileError& e) {
        restcore::logging::make_console_logger(spdlog::level::info)->critical("{}", e.what());
        return 1;
    }

    auto logger = restcore::logging::make_console_logger(server_config.log_level);

    auto routes = std::make_shared<core::RouteRegistry>(logger);
    if (auto error = routes->get("/health", [](core::RequestContext&) { return core::text_response(200, "ok"); })) {
        logger->critical("{}", error->message);
        return 1;
    }

    core::FilterChain filters;
    auto access_log = core::make_filter([logger](core::ResponseSink&, core::HttpRequest& request) {
        logger->info("{} {}", request.method(), request.path());
        return true;
    });
    if (auto error = filters.add_post(std::move(access_log))) {
        logger->critical("{}", error->message);
        return 1;
    }

    auto dispatcher = std::make_shared<const core::Dispatcher>(
        std::move(routes), std::move(filters), core::BodyCodecs{}, logger);

    try {
        net::IoContextPool pool(server_config.threads, logger);
        const net::Listener::Tcp::endpoint endpoint(
            boost::asio::ip::make_address(server_config.address), server_config.port);

        auto listener = std::make_shared<net::Listener>(
            pool,
            endpoint,
            [dispatcher, logger](net::Listener::Tcp::socket socket) {
                return std::make_shared<net::HttpSession>(std::move(socket), dispatcher, logger);
            },
            logger);

        boost::asio::io_context signal_context;
        boost::asio::signal_set signals(signal_context, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code&, int signal) {
            logger->info("signal {} received, stopping", signal);
            listener->stop();
        });

        pool.start();
        listener->run();
        logger->info("listening on {}:{} with {} thread(s)", server_config.address, server_config.port, pool.size());

        signal_context.run();
        pool.stop();
    } catch (const std::exception& e) {
        logger->critical("server failed: {}", e.what());
        return 1;
    }

    return 0;
}
