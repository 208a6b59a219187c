#include "restcore/core/http_request.h"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace restcore::core {

namespace {

std::string lower(std::string_view name) {
    std::string out(name);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

} // namespace

HttpRequest::HttpRequest()
    : body_(std::make_unique<std::istringstream>()) {}

HttpRequest::HttpRequest(std::string method, std::string path)
    : method_(std::move(method))
    , path_(std::move(path))
    , body_(std::make_unique<std::istringstream>()) {}

const std::string& HttpRequest::method() const noexcept {
    return method_;
}

const std::string& HttpRequest::path() const noexcept {
    return path_;
}

void HttpRequest::set_method(std::string method) {
    method_ = std::move(method);
}

void HttpRequest::set_path(std::string path) {
    path_ = std::move(path);
}

const HttpRequest::Headers& HttpRequest::headers() const noexcept {
    return headers_;
}

bool HttpRequest::has_header(std::string_view name) const {
    return headers_.find(lower(name)) != headers_.end();
}

std::string HttpRequest::header(std::string_view name) const {
    auto it = headers_.find(lower(name));
    return it != headers_.end() ? it->second : std::string{};
}

void HttpRequest::set_header(std::string_view name, std::string value) {
    headers_[lower(name)] = std::move(value);
}

const HttpRequest::QueryParams& HttpRequest::query_params() const noexcept {
    return query_params_;
}

std::string HttpRequest::query_param(std::string_view key) const {
    auto it = query_params_.find(std::string(key));
    return it != query_params_.end() ? it->second : std::string{};
}

void HttpRequest::set_query_param(std::string key, std::string value) {
    query_params_[std::move(key)] = std::move(value);
}

std::istream& HttpRequest::body() noexcept {
    return *body_;
}

void HttpRequest::set_body(std::string body) {
    body_ = std::make_unique<std::istringstream>(std::move(body));
}

void HttpRequest::set_body_stream(std::unique_ptr<std::istream> stream) {
    if (stream) {
        body_ = std::move(stream);
    } else {
        body_ = std::make_unique<std::istringstream>();
    }
}

} // namespace restcore::core
