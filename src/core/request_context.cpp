#include "restcore/core/request_context.h"

namespace restcore::core {

RequestContext::RequestContext(ResponseSink& response, HttpRequest& request, PathVariables path_variables)
    : response_(response)
    , request_(request)
    , path_variables_(std::move(path_variables)) {}

ResponseSink& RequestContext::response() noexcept {
    return response_;
}

HttpRequest& RequestContext::request() noexcept {
    return request_;
}

const HttpRequest& RequestContext::request() const noexcept {
    return request_;
}

const RequestContext::PathVariables& RequestContext::path_variables() const noexcept {
    return path_variables_;
}

bool RequestContext::has_path_variable(std::string_view name) const {
    return path_variables_.find(std::string(name)) != path_variables_.end();
}

std::string RequestContext::path_variable(std::string_view name) const {
    auto it = path_variables_.find(std::string(name));
    return it != path_variables_.end() ? it->second : std::string{};
}

} // namespace restcore::core
