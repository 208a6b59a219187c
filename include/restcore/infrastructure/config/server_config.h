#pragma once

#include <spdlog/common.h>

#include <cstddef>
#include <cstdint>
#include <istream>
#include <stdexcept>
#include <string>

namespace restcore::infrastructure::config {

class ConfigFileError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct ServerConfig {
    std::string address = "0.0.0.0";
    std::uint16_t port = 8080;
    std::size_t threads = 1;
    spdlog::level::level_enum log_level = spdlog::level::info;
};

// Defaults, with threads set to the hardware concurrency (at least 1).
ServerConfig default_config();

// INI file:
//   [server]
//   address = 127.0.0.1
//   port = 8080
//   threads = 4
//   [log]
//   level = debug
// Missing keys keep their defaults. Throws ConfigFileError.
ServerConfig load_config(const std::string& path);
ServerConfig parse_config(std::istream& in);

} // namespace restcore::infrastructure::config
