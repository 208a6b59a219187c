#include "restcore/infrastructure/config/server_config.h"

#include "restcore/logging/logger.h"

#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include <fstream>
#include <limits>
#include <thread>

namespace restcore::infrastructure::config {

namespace pt = boost::property_tree;

namespace {

// get(path, default) would silently fall back on garbage.
long read_number(const pt::ptree& tree, const char* key, long fallback) {
    if (!tree.get_child_optional(key)) {
        return fallback;
    }
    try {
        return tree.get<long>(key);
    } catch (const pt::ptree_bad_data&) {
        throw ConfigFileError(std::string("config: ") + key + " is not a number: '" +
                              tree.get<std::string>(key) + "'");
    }
}

} // namespace

ServerConfig default_config() {
    ServerConfig config;
    const auto hardware = std::thread::hardware_concurrency();
    config.threads = hardware > 0 ? hardware : 1;
    return config;
}

ServerConfig parse_config(std::istream& in) {
    pt::ptree tree;
    try {
        pt::read_ini(in, tree);
    } catch (const pt::ini_parser_error& e) {
        throw ConfigFileError("config: " + e.message() + " (line " + std::to_string(e.line()) + ")");
    }

    auto config = default_config();
    config.address = tree.get<std::string>("server.address", config.address);

    const auto port = read_number(tree, "server.port", config.port);
    if (port <= 0 || port > std::numeric_limits<std::uint16_t>::max()) {
        throw ConfigFileError("config: server.port out of range: " + std::to_string(port));
    }
    config.port = static_cast<std::uint16_t>(port);

    const auto threads = read_number(tree, "server.threads", static_cast<long>(config.threads));
    if (threads <= 0) {
        throw ConfigFileError("config: server.threads must be > 0");
    }
    config.threads = static_cast<std::size_t>(threads);

    if (const auto level_name = tree.get_optional<std::string>("log.level")) {
        const auto level = logging::parse_level(*level_name);
        if (!level) {
            throw ConfigFileError("config: unknown log.level '" + *level_name + "'");
        }
        config.log_level = *level;
    }

    return config;
}

ServerConfig load_config(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigFileError("config: cannot open '" + path + "'");
    }
    return parse_config(in);
}

} // namespace restcore::infrastructure::config
