#include "restcore/infrastructure/net/http_session.h"

#include <boost/beast/http.hpp>

#include <exception>
#include <string>
#include <string_view>

namespace restcore::infrastructure::net {

namespace http = boost::beast::http;

namespace {

std::string to_std(boost::beast::string_view value) {
    return std::string(value.data(), value.size());
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

// application/x-www-form-urlencoded: '+' is a space and %XX a byte.
// A malformed escape is kept as is.
std::string decode_query_component(std::string_view in) {
    std::string out;
    out.reserve(in.size());
    for (std::size_t i = 0; i < in.size(); ++i) {
        const char c = in[i];
        if (c == '+') {
            out += ' ';
        } else if (c == '%' && i + 2 < in.size() && hex_value(in[i + 1]) >= 0 && hex_value(in[i + 2]) >= 0) {
            out += static_cast<char>(hex_value(in[i + 1]) * 16 + hex_value(in[i + 2]));
            i += 2;
        } else {
            out += c;
        }
    }
    return out;
}

void parse_query(std::string_view query, core::HttpRequest& request) {
    while (!query.empty()) {
        const auto amp = query.find('&');
        const auto pair = query.substr(0, amp);
        if (!pair.empty()) {
            const auto eq = pair.find('=');
            if (eq == std::string_view::npos) {
                request.set_query_param(decode_query_component(pair), std::string{});
            } else {
                request.set_query_param(decode_query_component(pair.substr(0, eq)),
                                        decode_query_component(pair.substr(eq + 1)));
            }
        }
        if (amp == std::string_view::npos) {
            break;
        }
        query.remove_prefix(amp + 1);
    }
}

} // namespace

core::HttpRequest to_core_request(HttpSession::Request&& req) {
    const auto target = to_std(req.target());
    const auto question = target.find('?');

    core::HttpRequest request(to_std(req.method_string()), target.substr(0, question));
    if (question != std::string::npos) {
        parse_query(std::string_view(target).substr(question + 1), request);
    }

    for (const auto& field : req) {
        request.set_header(to_std(field.name_string()), to_std(field.value()));
    }

    request.set_body(std::move(req.body()));
    return request;
}

HttpSession::Response to_beast_response(const core::HttpResponse& res, unsigned version, bool keep_alive) {
    HttpSession::Response out;
    out.version(version);
    out.keep_alive(keep_alive);
    out.result(static_cast<unsigned>(res.status()));
    out.set(http::field::server, "restcore");

    for (const auto& [name, value] : res.headers()) {
        out.set(name, value);
    }

    out.body() = res.body();
    out.prepare_payload();
    return out;
}

HttpSession::HttpSession(Tcp::socket socket,
                         std::shared_ptr<const core::Dispatcher> dispatcher,
                         logging::LoggerPtr logger)
    : stream_(std::move(socket))
    , dispatcher_(std::move(dispatcher))
    , logger_(logger ? std::move(logger) : logging::null_logger()) {}

void HttpSession::run() {
    boost::asio::dispatch(stream_.get_executor(),
                          boost::beast::bind_front_handler(&HttpSession::do_read, shared_from_this()));
}

void HttpSession::do_read() {
    request_ = {};

    http::async_read(
        stream_,
        buffer_,
        request_,
        boost::beast::bind_front_handler(&HttpSession::on_read, shared_from_this()));
}

void HttpSession::on_read(boost::beast::error_code ec, std::size_t) {
    if (ec == http::error::end_of_stream) {
        return do_close();
    }

    if (ec) {
        logger_->debug("[HttpSession] read error: {}", ec.message());
        return;
    }

    handle_request(std::move(request_));
}

void HttpSession::handle_request(Request&& req) {
    const auto version = req.version();
    const auto keep_alive = req.keep_alive();

    auto request = to_core_request(std::move(req));
    core::HttpResponse response;

    // A throwing handler or a status Beast cannot encode costs this
    // connection only; the io_context keeps serving the others.
    try {
        dispatcher_->handle(request, response);

        // Nothing written: a rejecting filter without output or a body that
        // could not be bound. The client only sees the connection close.
        if (!response.committed()) {
            logger_->debug("[HttpSession] no response for {} {}, closing", request.method(), request.path());
            return do_close();
        }

        response_ = to_beast_response(response, version, keep_alive);
    } catch (const std::exception& e) {
        logger_->error("[HttpSession] {} {} failed: {}", request.method(), request.path(), e.what());
        return do_close();
    }

    const auto close = response_.need_eof();

    http::async_write(
        stream_,
        response_,
        boost::beast::bind_front_handler(&HttpSession::on_write, shared_from_this(), close));
}

void HttpSession::on_write(bool close, boost::beast::error_code ec, std::size_t) {
    if (ec) {
        logger_->debug("[HttpSession] write error: {}", ec.message());
        return;
    }

    if (close) {
        return do_close();
    }

    do_read();
}

void HttpSession::do_close() {
    boost::beast::error_code ec;
    stream_.socket().shutdown(Tcp::socket::shutdown_send, ec);
    if (ec && ec != boost::beast::errc::not_connected) {
        logger_->debug("[HttpSession] shutdown: {}", ec.message());
    }
}

} // namespace restcore::infrastructure::net
