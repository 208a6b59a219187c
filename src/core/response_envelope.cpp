#include "restcore/core/response_envelope.h"

#include "restcore/core/http_request.h"
#include "restcore/core/response_sink.h"

#include <boost/property_tree/xml_parser.hpp>

#include <array>
#include <chrono>
#include <ctime>
#include <exception>
#include <sstream>

namespace restcore::core {

namespace {

void apply_headers(ResponseSink& sink, const CustomHeaders& headers) {
    for (const auto& [name, value] : headers) {
        sink.set_header(name, value);
    }
}

std::string rfc3339_now() {
    const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_buf{};
    gmtime_r(&now, &tm_buf);
    std::array<char, 32> buf{};
    const auto size = std::strftime(buf.data(), buf.size(), "%Y-%m-%dT%H:%M:%SZ", &tm_buf);
    return std::string(buf.data(), size);
}

ErrorBody make_error_body(const HttpRequest& request, std::string message) {
    return ErrorBody{rfc3339_now(), std::move(message), request.method(), request.path()};
}

} // namespace

MarshalledResponse::MarshalledResponse(int status,
                                       std::string content_type,
                                       CustomHeaders headers,
                                       Marshaller marshaller)
    : status_(status)
    , content_type_(std::move(content_type))
    , headers_(std::move(headers))
    , marshaller_(std::move(marshaller)) {}

void MarshalledResponse::write(ResponseSink& sink, spdlog::logger& logger) {
    sink.set_status(status_);
    sink.set_header("Content-Type", content_type_);
    apply_headers(sink, headers_);

    std::string body;
    try {
        body = marshaller_();
    } catch (const std::exception& e) {
        logger.debug("[MarshalledResponse#write] marshal => {}", e.what());
        return;
    }

    try {
        sink.write(body);
    } catch (const std::exception& e) {
        logger.debug("[MarshalledResponse#write] write => {}", e.what());
    }
}

TextResponse::TextResponse(int status, std::string body, CustomHeaders headers)
    : status_(status)
    , body_(std::move(body))
    , headers_(std::move(headers)) {}

void TextResponse::write(ResponseSink& sink, spdlog::logger& logger) {
    sink.set_status(status_);
    sink.set_header("Content-Type", "text/plain");
    apply_headers(sink, headers_);

    try {
        sink.write(body_);
    } catch (const std::exception& e) {
        logger.debug("[TextResponse#write] write => {}", e.what());
    }
}

FileResponse::FileResponse(int status,
                           std::string content_type,
                           std::string content_disposition,
                           long long content_length,
                           std::unique_ptr<std::istream> file)
    : status_(status)
    , content_type_(std::move(content_type))
    , content_disposition_(std::move(content_disposition))
    , content_length_(content_length)
    , file_(std::move(file)) {}

void FileResponse::write(ResponseSink& sink, spdlog::logger& logger) {
    sink.set_status(status_);
    sink.set_header("Content-Type", content_type_);
    if (content_length_ > 0) {
        sink.set_header("Content-Length", std::to_string(content_length_));
    }
    if (!content_disposition_.empty()) {
        sink.set_header("Content-Disposition", content_disposition_);
    }

    if (!file_) {
        logger.debug("[FileResponse#write] copy => no stream");
        return;
    }

    std::array<char, 8192> chunk{};
    try {
        while (file_->read(chunk.data(), chunk.size()) || file_->gcount() > 0) {
            sink.write(std::string_view(chunk.data(), static_cast<std::size_t>(file_->gcount())));
        }
    } catch (const std::exception& e) {
        logger.debug("[FileResponse#write] copy => {}", e.what());
        return;
    }

    if (file_->bad()) {
        logger.debug("[FileResponse#write] copy => stream read failed");
    }
}

void NoContentResponse::write(ResponseSink& sink, spdlog::logger&) {
    sink.set_status(204);
}

void to_ptree(Tree& tree, const ErrorBody& body) {
    tree.put("Date", body.date);
    tree.put("Message", body.message);
    tree.put("Method", body.method);
    tree.put("Path", body.path);
}

void from_ptree(const Tree& tree, ErrorBody& body) {
    body.date = tree.get<std::string>("Date");
    body.message = tree.get<std::string>("Message");
    body.method = tree.get<std::string>("Method");
    body.path = tree.get<std::string>("Path");
}

void to_json(Json& json, const ErrorBody& body) {
    json = Json{{"Date", body.date}, {"Message", body.message}, {"Method", body.method}, {"Path", body.path}};
}

std::string marshal_json(const Json& json) {
    return json.dump();
}

std::string marshal_xml(const Tree& tree, const std::string& root) {
    namespace xml = boost::property_tree::xml_parser;

    std::ostringstream out;
    Tree document;
    document.add_child(root, tree);
    // write_xml() would prepend an <?xml ...?> declaration.
    xml::write_xml_element(out, std::string(), document, -1, xml::xml_writer_settings<std::string>());
    if (!out) {
        throw xml::xml_parser_error("write error", std::string(), 0);
    }
    return out.str();
}

ResponsePtr json_error_response(int status, const HttpRequest& request, std::string message) {
    return json_response(status, make_error_body(request, std::move(message)));
}

ResponsePtr xml_error_response(int status, const HttpRequest& request, std::string message) {
    return xml_response(status, make_error_body(request, std::move(message)), {}, "ErrorResponse");
}

ResponsePtr text_response(int status, std::string body, CustomHeaders headers) {
    return std::make_unique<TextResponse>(status, std::move(body), std::move(headers));
}

ResponsePtr file_response(int status,
                          std::string content_type,
                          std::string content_disposition,
                          long long content_length,
                          std::unique_ptr<std::istream> file) {
    return std::make_unique<FileResponse>(
        status, std::move(content_type), std::move(content_disposition), content_length, std::move(file));
}

ResponsePtr no_content_response() {
    return std::make_unique<NoContentResponse>();
}

} // namespace restcore::core
