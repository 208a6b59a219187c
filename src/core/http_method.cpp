#include "restcore/core/http_method.h"

namespace restcore::core {

std::string_view to_string(HttpMethod method) noexcept {
    switch (method) {
    case HttpMethod::Get:
        return "GET";
    case HttpMethod::Post:
        return "POST";
    case HttpMethod::Put:
        return "PUT";
    case HttpMethod::Patch:
        return "PATCH";
    case HttpMethod::Delete:
        return "DELETE";
    }
    return "UNKNOWN";
}

std::optional<HttpMethod> parse_method(std::string_view name) noexcept {
    if (name == "GET") {
        return HttpMethod::Get;
    }
    if (name == "POST") {
        return HttpMethod::Post;
    }
    if (name == "PUT") {
        return HttpMethod::Put;
    }
    if (name == "PATCH") {
        return HttpMethod::Patch;
    }
    if (name == "DELETE") {
        return HttpMethod::Delete;
    }
    return std::nullopt;
}

bool is_bodyable(HttpMethod method) noexcept {
    switch (method) {
    case HttpMethod::Post:
    case HttpMethod::Put:
    case HttpMethod::Patch:
    case HttpMethod::Delete:
        return true;
    case HttpMethod::Get:
        return false;
    }
    return false;
}

} // namespace restcore::core
