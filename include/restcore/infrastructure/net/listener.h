#pragma once

#include "restcore/logging/logger.h"

#include <boost/asio.hpp>

#include <atomic>
#include <functional>
#include <memory>

namespace restcore::infrastructure::net {

class HttpSession;
class IoContextPool;

class Listener : public std::enable_shared_from_this<Listener> {
public:
    using Tcp = boost::asio::ip::tcp;
    using SessionFactory = std::function<std::shared_ptr<HttpSession>(Tcp::socket)>;

    // Throws std::runtime_error when the endpoint cannot be bound.
    Listener(IoContextPool& pool,
             const Tcp::endpoint& endpoint,
             SessionFactory session_factory,
             logging::LoggerPtr logger = logging::null_logger());

    Listener(const Listener&) = delete;
    Listener& operator=(const Listener&) = delete;

    // Starts the accept loop
    void run();

    // Closes the acceptor; open sessions finish on their own
    void stop();

    Tcp::endpoint local_endpoint() const;

private:
    void do_accept();

    IoContextPool& pool_;
    Tcp::acceptor acceptor_;
    SessionFactory session_factory_;
    logging::LoggerPtr logger_;
    std::atomic<bool> stopped_{false};
};

} // namespace restcore::infrastructure::net
