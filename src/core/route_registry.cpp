#include "restcore/core/route_registry.h"

#include <string>

namespace restcore::core {

HandlerEntry::HandlerEntry(HttpMethod method, RoutePattern pattern, Handler handler)
    : method_(method)
    , pattern_(std::move(pattern))
    , handler_(std::move(handler)) {}

HttpMethod HandlerEntry::method() const noexcept {
    return method_;
}

const RoutePattern& HandlerEntry::pattern() const noexcept {
    return pattern_;
}

const Handler& HandlerEntry::handler() const noexcept {
    return handler_;
}

bool HandlerEntry::requires_body() const noexcept {
    return handler_.has_body();
}

RouteRegistry::RouteRegistry(logging::LoggerPtr logger)
    : logger_(logger ? std::move(logger) : logging::null_logger()) {}

RegistrationResult RouteRegistry::add(HttpMethod method, std::string_view path_template, Handler handler) {
    logger_->debug("[RouteRegistry#add] Method: '{}' | Path: '{}'", to_string(method), path_template);

    auto pattern = RoutePattern::compile(path_template);
    if (!pattern) {
        return ConfigurationError{ConfigErrc::invalid_path,
                                  "[RouteRegistry#add] Path '" + std::string(path_template) +
                                      "' is not a valid route template"};
    }

    if (auto error = validate_handler(method, handler)) {
        error->message += " (path '" + std::string(path_template) + "')";
        return error;
    }

    routes_[method].emplace_back(method, std::move(*pattern), std::move(handler));
    return std::nullopt;
}

const HandlerEntry* RouteRegistry::lookup(HttpMethod method, std::string_view path) const {
    const auto method_it = routes_.find(method);
    if (method_it == routes_.end()) {
        return nullptr;
    }

    for (const auto& entry : method_it->second) {
        if (entry.pattern().matches(path)) {
            return &entry;
        }
    }
    return nullptr;
}

std::size_t RouteRegistry::size() const noexcept {
    std::size_t total = 0;
    for (const auto& [method, entries] : routes_) {
        total += entries.size();
    }
    return total;
}

std::size_t RouteRegistry::size(HttpMethod method) const noexcept {
    const auto it = routes_.find(method);
    return it != routes_.end() ? it->second.size() : 0;
}

} // namespace restcore::core
