#pragma once

#include <optional>
#include <string_view>

namespace restcore::core {

enum class HttpMethod {
    Get,
    Post,
    Put,
    Patch,
    Delete
};

std::string_view to_string(HttpMethod method) noexcept;

// Unknown or unsupported names (HEAD, OPTIONS, ...) yield nullopt.
std::optional<HttpMethod> parse_method(std::string_view name) noexcept;

// POST, PUT, PATCH and DELETE carry a request payload.
bool is_bodyable(HttpMethod method) noexcept;

} // namespace restcore::core
