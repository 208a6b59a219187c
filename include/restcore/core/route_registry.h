#pragma once

#include "restcore/core/errors.h"
#include "restcore/core/handler.h"
#include "restcore/core/http_method.h"
#include "restcore/core/path_pattern.h"
#include "restcore/logging/logger.h"

#include <cstddef>
#include <map>
#include <string_view>
#include <utility>
#include <vector>

namespace restcore::core {

class HandlerEntry {
public:
    HandlerEntry(HttpMethod method, RoutePattern pattern, Handler handler);

    HttpMethod method() const noexcept;
    const RoutePattern& pattern() const noexcept;
    const Handler& handler() const noexcept;

    // True for bodyable methods; enforced at registration.
    bool requires_body() const noexcept;

private:
    HttpMethod method_;
    RoutePattern pattern_;
    Handler handler_;
};

// Routes per method, in registration order. Filled once before serving,
// then only read (lookup() is safe from concurrent requests).
//
// Lookup is first match wins: a broader template registered earlier
// shadows any narrower one registered after it. There is no conflict
// detection.
class RouteRegistry {
public:
    explicit RouteRegistry(logging::LoggerPtr logger = logging::null_logger());

    RegistrationResult add(HttpMethod method, std::string_view path_template, Handler handler);

    template <typename F>
    RegistrationResult get(std::string_view path_template, F&& fn) {
        return add(HttpMethod::Get, path_template, Handler::context_only(std::forward<F>(fn)));
    }

    template <typename Body, typename F>
    RegistrationResult post(std::string_view path_template, F&& fn) {
        return add(HttpMethod::Post, path_template, Handler::with_body<Body>(std::forward<F>(fn)));
    }

    template <typename Body, typename F>
    RegistrationResult put(std::string_view path_template, F&& fn) {
        return add(HttpMethod::Put, path_template, Handler::with_body<Body>(std::forward<F>(fn)));
    }

    template <typename Body, typename F>
    RegistrationResult patch(std::string_view path_template, F&& fn) {
        return add(HttpMethod::Patch, path_template, Handler::with_body<Body>(std::forward<F>(fn)));
    }

    template <typename Body, typename F>
    RegistrationResult del(std::string_view path_template, F&& fn) {
        return add(HttpMethod::Delete, path_template, Handler::with_body<Body>(std::forward<F>(fn)));
    }

    // nullptr when no route of this method matches the path.
    const HandlerEntry* lookup(HttpMethod method, std::string_view path) const;

    std::size_t size() const noexcept;
    std::size_t size(HttpMethod method) const noexcept;

private:
    logging::LoggerPtr logger_;
    std::map<HttpMethod, std::vector<HandlerEntry>> routes_;
};

} // namespace restcore::core
