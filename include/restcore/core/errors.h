#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <type_traits>

namespace restcore::core {

// Startup-time misconfiguration. Never produced while serving.
enum class ConfigErrc {
    invalid_path = 1,
    invalid_handler,
    null_handler,
    null_filter
};

const std::error_category& config_category() noexcept;

std::error_code make_error_code(ConfigErrc code) noexcept;

struct ConfigurationError {
    ConfigErrc code;
    std::string message;

    std::error_code error_code() const noexcept { return make_error_code(code); }
};

// Empty on success.
using RegistrationResult = std::optional<ConfigurationError>;

// Body read, parse or mapping failure while binding a request.
class BindError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace restcore::core

namespace std {

template <>
struct is_error_code_enum<restcore::core::ConfigErrc> : true_type {};

} // namespace std
