#include "restcore/core/http_response.h"

namespace restcore::core {

HttpResponse::HttpResponse()
    : status_(200) {}

int HttpResponse::status() const noexcept {
    return status_;
}

void HttpResponse::set_status(int status) {
    committed_ = true;
    status_ = status;
}

const HttpResponse::Headers& HttpResponse::headers() const noexcept {
    return headers_;
}

std::string HttpResponse::header(const std::string& name) const {
    auto it = headers_.find(name);
    return it != headers_.end() ? it->second : std::string{};
}

void HttpResponse::set_header(std::string name, std::string value) {
    committed_ = true;
    headers_[std::move(name)] = std::move(value);
}

const std::string& HttpResponse::body() const noexcept {
    return body_;
}

void HttpResponse::set_body(std::string body) {
    committed_ = true;
    body_ = std::move(body);
}

void HttpResponse::write(std::string_view data) {
    committed_ = true;
    body_.append(data.data(), data.size());
}

bool HttpResponse::committed() const noexcept {
    return committed_;
}

} // namespace restcore::core
