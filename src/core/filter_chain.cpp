#include "restcore/core/filter_chain.h"

namespace restcore::core {

RegistrationResult FilterChain::add_pre(FilterPtr filter) {
    if (!filter) {
        return ConfigurationError{ConfigErrc::null_filter, "[FilterChain#add_pre] filter must not be null"};
    }
    pre_.push_back(std::move(filter));
    return std::nullopt;
}

RegistrationResult FilterChain::add_post(FilterPtr filter) {
    if (!filter) {
        return ConfigurationError{ConfigErrc::null_filter, "[FilterChain#add_post] filter must not be null"};
    }
    post_.push_back(std::move(filter));
    return std::nullopt;
}

bool FilterChain::run_pre(ResponseSink& response, HttpRequest& request) const {
    return execute(pre_, response, request);
}

bool FilterChain::run_post(ResponseSink& response, HttpRequest& request) const {
    return execute(post_, response, request);
}

std::size_t FilterChain::pre_size() const noexcept {
    return pre_.size();
}

std::size_t FilterChain::post_size() const noexcept {
    return post_.size();
}

bool FilterChain::execute(const std::vector<FilterPtr>& chain, ResponseSink& response, HttpRequest& request) {
    for (const auto& filter : chain) {
        if (!filter->apply(response, request)) {
            return false;
        }
    }
    return true;
}

} // namespace restcore::core
