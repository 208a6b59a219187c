#pragma once

#include "restcore/core/serialization.h"

#include <spdlog/logger.h>

#include <functional>
#include <istream>
#include <map>
#include <memory>
#include <string>

namespace restcore::core {

class HttpRequest;
class ResponseSink;

using CustomHeaders = std::map<std::string, std::string>;

// A complete response waiting to be written. Written exactly once.
//
// Every variant sets the status, then the content type, then the custom
// headers, then emits the body. Failures while producing the body are
// logged and dropped: status and headers are on the sink by then.
class ResponseEnvelope {
public:
    virtual ~ResponseEnvelope() = default;

    virtual void write(ResponseSink& sink, spdlog::logger& logger) = 0;
};

using ResponsePtr = std::unique_ptr<ResponseEnvelope>;

// JSON and XML responses. The marshaller renders the body when the
// envelope is written; a throw from it is a marshalling failure.
class MarshalledResponse : public ResponseEnvelope {
public:
    using Marshaller = std::function<std::string()>;

    MarshalledResponse(int status, std::string content_type, CustomHeaders headers, Marshaller marshaller);

    void write(ResponseSink& sink, spdlog::logger& logger) override;

private:
    int status_;
    std::string content_type_;
    CustomHeaders headers_;
    Marshaller marshaller_;
};

class TextResponse : public ResponseEnvelope {
public:
    TextResponse(int status, std::string body, CustomHeaders headers);

    void write(ResponseSink& sink, spdlog::logger& logger) override;

private:
    int status_;
    std::string body_;
    CustomHeaders headers_;
};

class FileResponse : public ResponseEnvelope {
public:
    FileResponse(int status,
                 std::string content_type,
                 std::string content_disposition,
                 long long content_length,
                 std::unique_ptr<std::istream> file);

    void write(ResponseSink& sink, spdlog::logger& logger) override;

private:
    int status_;
    std::string content_type_;
    std::string content_disposition_;
    long long content_length_;
    std::unique_ptr<std::istream> file_;
};

class NoContentResponse : public ResponseEnvelope {
public:
    void write(ResponseSink& sink, spdlog::logger& logger) override;
};

// Body of json_error_response() / xml_error_response().
struct ErrorBody {
    std::string date; // RFC 3339, UTC
    std::string message;
    std::string method;
    std::string path;
};

void to_ptree(Tree& tree, const ErrorBody& body);
void from_ptree(const Tree& tree, ErrorBody& body);
void to_json(Json& json, const ErrorBody& body);

// Compact JSON text. Throws on strings that are not valid UTF-8.
std::string marshal_json(const Json& json);

// The tree as the single element <root>, without an XML declaration.
std::string marshal_xml(const Tree& tree, const std::string& root);

// --- factories ---

template <typename T>
ResponsePtr json_response(int status, T body, CustomHeaders headers = {}) {
    return std::make_unique<MarshalledResponse>(
        status, "application/json", std::move(headers), [body = std::move(body)] {
            const Json json = body;
            return marshal_json(json);
        });
}

template <typename T>
ResponsePtr xml_response(int status, T body, CustomHeaders headers = {}, std::string root = "response") {
    return std::make_unique<MarshalledResponse>(
        status, "application/xml", std::move(headers), [body = std::move(body), root = std::move(root)] {
            Tree tree;
            to_ptree(tree, body);
            return marshal_xml(tree, root);
        });
}

ResponsePtr json_error_response(int status, const HttpRequest& request, std::string message);
ResponsePtr xml_error_response(int status, const HttpRequest& request, std::string message);

ResponsePtr text_response(int status, std::string body, CustomHeaders headers = {});

// content_length <= 0 leaves Content-Length unset.
ResponsePtr file_response(int status,
                          std::string content_type,
                          std::string content_disposition,
                          long long content_length,
                          std::unique_ptr<std::istream> file);

ResponsePtr no_content_response();

} // namespace restcore::core
