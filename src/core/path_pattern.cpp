#include "restcore/core/path_pattern.h"

namespace restcore::core {

namespace {

constexpr const char* kVariableValuePattern = "[a-zA-Z0-9_-]+";

const boost::regex& template_grammar() {
    static const boost::regex grammar(
        R"(^(/((\{[a-z0-9]+(-?[a-z0-9]+)*\})|([a-z0-9]+(-?[a-z0-9]+)*)))+$)");
    return grammar;
}

bool is_variable_segment(std::string_view segment) {
    return segment.size() >= 2 && segment.front() == '{' && segment.back() == '}';
}

// Splits "/a/b" into {"a", "b"}. Only called on validated templates.
std::vector<std::string_view> segments_of(std::string_view path) {
    std::vector<std::string_view> out;
    std::size_t start = 1;
    while (start <= path.size()) {
        auto end = path.find('/', start);
        if (end == std::string_view::npos) {
            end = path.size();
        }
        out.push_back(path.substr(start, end - start));
        start = end + 1;
    }
    return out;
}

} // namespace

bool is_valid_path(std::string_view path_template) {
    if (path_template == "/") {
        return true;
    }
    return boost::regex_match(path_template.begin(), path_template.end(), template_grammar());
}

std::optional<RoutePattern> RoutePattern::compile(std::string_view path_template) {
    if (!is_valid_path(path_template)) {
        return std::nullopt;
    }

    if (path_template == "/") {
        return RoutePattern(std::string(path_template), boost::regex("/"), {});
    }

    std::vector<PathVariable> variables;
    std::string expression;

    const auto segments = segments_of(path_template);
    for (std::size_t i = 0; i < segments.size(); ++i) {
        const auto segment = segments[i];
        expression += '/';
        if (is_variable_segment(segment)) {
            variables.push_back(PathVariable{i, std::string(segment.substr(1, segment.size() - 2))});
            expression += kVariableValuePattern;
        } else {
            // Literals are restricted to [a-z0-9-], nothing to escape.
            expression.append(segment.data(), segment.size());
        }
    }

    return RoutePattern(std::string(path_template), boost::regex(expression), std::move(variables));
}

RoutePattern::RoutePattern(std::string path_template,
                           boost::regex matcher,
                           std::vector<PathVariable> variables)
    : template_(std::move(path_template))
    , matcher_(std::move(matcher))
    , variables_(std::move(variables)) {}

const std::string& RoutePattern::path_template() const noexcept {
    return template_;
}

const std::vector<PathVariable>& RoutePattern::variables() const noexcept {
    return variables_;
}

bool RoutePattern::matches(std::string_view path) const {
    return boost::regex_match(path.begin(), path.end(), matcher_);
}

} // namespace restcore::core
