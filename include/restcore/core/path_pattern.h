#pragma once

#include <boost/regex.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace restcore::core {

struct PathVariable {
    // Zero-based index of the segment, leading slash excluded.
    // Ex: in /{v0}/{v1}/path2/{v3} the positions are 0, 1 and 3.
    std::size_t position;
    std::string name;

    bool operator==(const PathVariable& other) const {
        return position == other.position && name == other.name;
    }
};

// Valid templates:
//   /
//   /path1
//   /path1/pa-th-2/3
//   /path1/{pa-th-2}/3
bool is_valid_path(std::string_view path_template);

// A compiled route template. Immutable; matches() may be called
// concurrently without synchronization.
class RoutePattern {
public:
    // nullopt when the template is not valid.
    static std::optional<RoutePattern> compile(std::string_view path_template);

    const std::string& path_template() const noexcept;
    const std::vector<PathVariable>& variables() const noexcept;

    // Whole-string match against a concrete request path.
    bool matches(std::string_view path) const;

private:
    RoutePattern(std::string path_template,
                 boost::regex matcher,
                 std::vector<PathVariable> variables);

    std::string template_;
    boost::regex matcher_;
    std::vector<PathVariable> variables_;
};

} // namespace restcore::core
