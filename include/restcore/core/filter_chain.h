#pragma once

#include "restcore/core/errors.h"
#include "restcore/core/http_request.h"
#include "restcore/core/response_sink.h"

#include <cstddef>
#include <memory>
#include <type_traits>
#include <utility>
#include <vector>

namespace restcore::core {

class Filter {
public:
    virtual ~Filter() = default;

    // return false → stop the chain. Whatever was written to the
    // response before returning stays written.
    virtual bool apply(ResponseSink& response, HttpRequest& request) = 0;
};

using FilterPtr = std::shared_ptr<Filter>;

template <typename F>
class FunctionFilter : public Filter {
public:
    explicit FunctionFilter(F fn)
        : fn_(std::move(fn)) {}

    bool apply(ResponseSink& response, HttpRequest& request) override {
        return fn_(response, request);
    }

private:
    F fn_;
};

template <typename F>
FilterPtr make_filter(F&& fn) {
    using Fn = std::decay_t<F>;
    static_assert(std::is_invocable_r_v<bool, Fn&, ResponseSink&, HttpRequest&>,
                  "filter must be callable as bool(ResponseSink&, HttpRequest&)");
    return std::make_shared<FunctionFilter<Fn>>(std::forward<F>(fn));
}

// Pre filters run before the handler, post filters after the response is
// written. Set up before serving; run_pre()/run_post() only read it.
class FilterChain {
public:
    RegistrationResult add_pre(FilterPtr filter);
    RegistrationResult add_post(FilterPtr filter);

    // false if a filter stopped the chain.
    bool run_pre(ResponseSink& response, HttpRequest& request) const;
    bool run_post(ResponseSink& response, HttpRequest& request) const;

    std::size_t pre_size() const noexcept;
    std::size_t post_size() const noexcept;

private:
    static bool execute(const std::vector<FilterPtr>& chain, ResponseSink& response, HttpRequest& request);

    std::vector<FilterPtr> pre_;
    std::vector<FilterPtr> post_;
};

} // namespace restcore::core
