#pragma once

#include "restcore/core/errors.h"
#include "restcore/core/http_method.h"
#include "restcore/core/request_context.h"
#include "restcore/core/response_envelope.h"
#include "restcore/core/serialization.h"

#include <any>
#include <functional>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <utility>
#include <variant>

namespace restcore::core {

using ContextHandler = std::function<ResponsePtr(RequestContext&)>;

// Type-erased "context + body" handler. The body type is fixed when the
// handler is wrapped; decode() builds a fresh instance from a tree.
class BodyHandler {
public:
    using Decode = std::function<std::any(const Tree&)>;
    using Invoke = std::function<ResponsePtr(RequestContext&, std::any&)>;

    BodyHandler() = default;
    BodyHandler(std::string body_type, Decode decode, Invoke invoke);

    const std::string& body_type() const noexcept;

    std::any decode(const Tree& tree) const;
    ResponsePtr invoke(RequestContext& context, std::any& body) const;

    explicit operator bool() const noexcept;

private:
    std::string body_type_;
    Decode decode_;
    Invoke invoke_;
};

// A route handler: either ResponsePtr(RequestContext&) or
// ResponsePtr(RequestContext&, Body&).
class Handler {
public:
    template <typename F>
    static Handler context_only(F&& fn) {
        static_assert(std::is_invocable_v<F&, RequestContext&>,
                      "handler must accept a RequestContext& as its only parameter");
        static_assert(std::is_same_v<std::invoke_result_t<F&, RequestContext&>, ResponsePtr>,
                      "handler must return restcore::core::ResponsePtr");
        return Handler(ContextHandler(std::forward<F>(fn)));
    }

    template <typename Body, typename F>
    static Handler with_body(F&& fn) {
        static_assert(std::is_class_v<Body> && !std::is_const_v<Body>,
                      "request body must be a concrete, non-const class type");
        static_assert(std::is_default_constructible_v<Body> && std::is_copy_constructible_v<Body>,
                      "request body must be default and copy constructible");
        static_assert(std::is_invocable_v<F&, RequestContext&, Body&>,
                      "handler must accept (RequestContext&, Body&)");
        static_assert(std::is_same_v<std::invoke_result_t<F&, RequestContext&, Body&>, ResponsePtr>,
                      "handler must return restcore::core::ResponsePtr");

        std::function<ResponsePtr(RequestContext&, Body&)> typed(std::forward<F>(fn));
        if (!typed) {
            return Handler(BodyHandler());
        }

        return Handler(BodyHandler(
            typeid(Body).name(),
            [](const Tree& tree) {
                Body body{};
                from_ptree(tree, body);
                return std::any(std::move(body));
            },
            [typed = std::move(typed)](RequestContext& context, std::any& body) {
                return typed(context, std::any_cast<Body&>(body));
            }));
    }

    bool has_body() const noexcept;
    bool empty() const noexcept;

    // Only valid when !has_body().
    ResponsePtr invoke(RequestContext& context) const;

    // Only valid when has_body().
    const BodyHandler& body_handler() const;

private:
    explicit Handler(ContextHandler handler);
    explicit Handler(BodyHandler handler);

    std::variant<ContextHandler, BodyHandler> impl_;
};

// Checks the handler against the method it is registered for: bodyable
// methods take a body handler, the others a context-only one.
RegistrationResult validate_handler(HttpMethod method, const Handler& handler);

} // namespace restcore::core
