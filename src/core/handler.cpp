#include "restcore/core/handler.h"

namespace restcore::core {

BodyHandler::BodyHandler(std::string body_type, Decode decode, Invoke invoke)
    : body_type_(std::move(body_type))
    , decode_(std::move(decode))
    , invoke_(std::move(invoke)) {}

const std::string& BodyHandler::body_type() const noexcept {
    return body_type_;
}

std::any BodyHandler::decode(const Tree& tree) const {
    return decode_(tree);
}

ResponsePtr BodyHandler::invoke(RequestContext& context, std::any& body) const {
    return invoke_(context, body);
}

BodyHandler::operator bool() const noexcept {
    return static_cast<bool>(decode_) && static_cast<bool>(invoke_);
}

Handler::Handler(ContextHandler handler)
    : impl_(std::move(handler)) {}

Handler::Handler(BodyHandler handler)
    : impl_(std::move(handler)) {}

bool Handler::has_body() const noexcept {
    return std::holds_alternative<BodyHandler>(impl_);
}

bool Handler::empty() const noexcept {
    if (const auto* handler = std::get_if<ContextHandler>(&impl_)) {
        return !*handler;
    }
    return !std::get<BodyHandler>(impl_);
}

ResponsePtr Handler::invoke(RequestContext& context) const {
    return std::get<ContextHandler>(impl_)(context);
}

const BodyHandler& Handler::body_handler() const {
    return std::get<BodyHandler>(impl_);
}

RegistrationResult validate_handler(HttpMethod method, const Handler& handler) {
    const auto name = std::string(to_string(method));

    if (handler.empty()) {
        return ConfigurationError{ConfigErrc::null_handler,
                                  "[validate_handler] handler for '" + name + "' must not be empty"};
    }

    if (is_bodyable(method) && !handler.has_body()) {
        return ConfigurationError{ConfigErrc::invalid_handler,
                                  "[validate_handler] handler for '" + name +
                                      "' HTTP method must have 2 parameters (context and request body)"};
    }

    if (!is_bodyable(method) && handler.has_body()) {
        return ConfigurationError{ConfigErrc::invalid_handler,
                                  "[validate_handler] handler for '" + name +
                                      "' HTTP method must have 1 parameter (context only)"};
    }

    return std::nullopt;
}

} // namespace restcore::core
