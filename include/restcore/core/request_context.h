#pragma once

#include <string>
#include <string_view>
#include <unordered_map>

namespace restcore::core {

class HttpRequest;
class ResponseSink;

// Everything a handler sees about the request it serves.
// Lives on the stack of the dispatching call.
class RequestContext {
public:
    using PathVariables = std::unordered_map<std::string, std::string>;

    RequestContext(ResponseSink& response, HttpRequest& request, PathVariables path_variables);

    ResponseSink& response() noexcept;
    HttpRequest& request() noexcept;
    const HttpRequest& request() const noexcept;

    // --- path variables ---
    const PathVariables& path_variables() const noexcept;
    bool has_path_variable(std::string_view name) const;
    std::string path_variable(std::string_view name) const;

private:
    ResponseSink& response_;
    HttpRequest& request_;
    PathVariables path_variables_;
};

} // namespace restcore::core
