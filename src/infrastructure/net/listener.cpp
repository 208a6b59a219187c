#include "restcore/infrastructure/net/listener.h"

#include "restcore/infrastructure/net/http_session.h"
#include "restcore/infrastructure/net/io_context_pool.h"

#include <exception>
#include <stdexcept>

namespace restcore::infrastructure::net {

Listener::Listener(IoContextPool& pool,
                   const Tcp::endpoint& endpoint,
                   SessionFactory session_factory,
                   logging::LoggerPtr logger)
    : pool_(pool)
    , acceptor_(boost::asio::make_strand(pool.get_io_context()))
    , session_factory_(std::move(session_factory))
    , logger_(logger ? std::move(logger) : logging::null_logger()) {
    boost::system::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
        throw std::runtime_error("Listener: open failed: " + ec.message());
    }

    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec) {
        throw std::runtime_error("Listener: set_option failed: " + ec.message());
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
        throw std::runtime_error("Listener: bind failed: " + ec.message());
    }

    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
        throw std::runtime_error("Listener: listen failed: " + ec.message());
    }
}

void Listener::run() {
    if (stopped_) {
        return;
    }
    boost::asio::dispatch(acceptor_.get_executor(), [self = shared_from_this()] { self->do_accept(); });
}

void Listener::stop() {
    bool expected = false;
    if (!stopped_.compare_exchange_strong(expected, true)) {
        return;
    }

    boost::asio::post(acceptor_.get_executor(), [self = shared_from_this()] {
        boost::system::error_code ec;
        self->acceptor_.cancel(ec);
        self->acceptor_.close(ec);
    });
}

Listener::Tcp::endpoint Listener::local_endpoint() const {
    return acceptor_.local_endpoint();
}

void Listener::do_accept() {
    acceptor_.async_accept(
        boost::asio::make_strand(pool_.get_io_context()),
        [self = shared_from_this()](boost::system::error_code ec, Tcp::socket socket) {
            if (self->stopped_) {
                return;
            }

            if (ec) {
                self->logger_->warn("[Listener] accept failed: {}", ec.message());
            } else {
                try {
                    auto session = self->session_factory_(std::move(socket));
                    session->run();
                } catch (const std::exception& e) {
                    self->logger_->error("[Listener] session setup failed: {}", e.what());
                }
            }

            self->do_accept();
        });
}

} // namespace restcore::infrastructure::net
