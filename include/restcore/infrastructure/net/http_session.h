#pragma once

#include "restcore/core/dispatcher.h"
#include "restcore/core/http_request.h"
#include "restcore/core/http_response.h"
#include "restcore/logging/logger.h"

#include <boost/asio.hpp>
#include <boost/beast.hpp>

#include <memory>

namespace restcore::infrastructure::net {

// One connection. Reads requests one at a time, hands each to the
// dispatcher and writes back what it produced.
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    using Tcp = boost::asio::ip::tcp;
    using Request = boost::beast::http::request<boost::beast::http::string_body>;
    using Response = boost::beast::http::response<boost::beast::http::string_body>;

    HttpSession(Tcp::socket socket,
                std::shared_ptr<const core::Dispatcher> dispatcher,
                logging::LoggerPtr logger = logging::null_logger());

    // Entry point, called by the listener
    void run();

private:
    void do_read();
    void on_read(boost::beast::error_code ec, std::size_t bytes);

    void handle_request(Request&& req);

    void on_write(bool close, boost::beast::error_code ec, std::size_t bytes);

    void do_close();

    boost::beast::tcp_stream stream_;
    boost::beast::flat_buffer buffer_;
    Request request_;
    Response response_;
    std::shared_ptr<const core::Dispatcher> dispatcher_;
    logging::LoggerPtr logger_;
};

// Splits the target into path and query parameters.
core::HttpRequest to_core_request(HttpSession::Request&& req);

HttpSession::Response to_beast_response(const core::HttpResponse& res, unsigned version, bool keep_alive);

} // namespace restcore::infrastructure::net
