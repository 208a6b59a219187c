#include "restcore/core/request_binder.h"

#include "restcore/core/errors.h"
#include "restcore/core/http_request.h"

#include <array>
#include <exception>
#include <sstream>
#include <string>
#include <vector>

namespace restcore::core {

namespace {

std::vector<std::string_view> split(std::string_view path, char separator) {
    std::vector<std::string_view> parts;
    std::size_t start = 0;
    while (true) {
        const auto end = path.find(separator, start);
        if (end == std::string_view::npos) {
            parts.push_back(path.substr(start));
            return parts;
        }
        parts.push_back(path.substr(start, end - start));
        start = end + 1;
    }
}

std::string read_all(std::istream& in) {
    std::string payload;
    std::array<char, 4096> chunk{};
    while (in.read(chunk.data(), chunk.size()) || in.gcount() > 0) {
        payload.append(chunk.data(), static_cast<std::size_t>(in.gcount()));
    }
    if (in.bad()) {
        throw BindError("failed to read request body");
    }
    return payload;
}

} // namespace

RequestContext::PathVariables extract_path_variables(const RoutePattern& pattern, std::string_view path) {
    RequestContext::PathVariables values;
    if (pattern.variables().empty()) {
        return values;
    }

    // parts[0] is the empty string before the leading slash.
    const auto parts = split(path, '/');
    for (const auto& variable : pattern.variables()) {
        const auto index = variable.position + 1;
        if (index < parts.size()) {
            values[variable.name] = std::string(parts[index]);
        }
    }
    return values;
}

Tree read_body_tree(HttpRequest& request, const BodyCodecs& codecs) {
    const auto payload = read_all(request.body());

    std::istringstream in(payload);
    try {
        return codecs.find(request.header("Content-Type"))(in);
    } catch (const std::exception& e) {
        throw BindError(std::string("failed to decode request body: ") + e.what());
    }
}

std::any bind_body(HttpRequest& request, const BodyCodecs& codecs, const BodyHandler& handler) {
    const auto tree = read_body_tree(request, codecs);
    try {
        return handler.decode(tree);
    } catch (const std::exception& e) {
        throw BindError("failed to build '" + handler.body_type() + "' from request body: " + e.what());
    }
}

} // namespace restcore::core
