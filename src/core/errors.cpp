#include "restcore/core/errors.h"

namespace restcore::core {

namespace {

class ConfigCategory : public std::error_category {
public:
    const char* name() const noexcept override {
        return "restcore.config";
    }

    std::string message(int value) const override {
        switch (static_cast<ConfigErrc>(value)) {
        case ConfigErrc::invalid_path:
            return "invalid path template";
        case ConfigErrc::invalid_handler:
            return "handler does not match the HTTP method";
        case ConfigErrc::null_handler:
            return "handler must not be empty";
        case ConfigErrc::null_filter:
            return "filter must not be null";
        }
        return "unknown configuration error";
    }
};

} // namespace

const std::error_category& config_category() noexcept {
    static const ConfigCategory category;
    return category;
}

std::error_code make_error_code(ConfigErrc code) noexcept {
    return {static_cast<int>(code), config_category()};
}

} // namespace restcore::core
