#pragma once

#include "restcore/core/body_codecs.h"
#include "restcore/core/filter_chain.h"
#include "restcore/core/route_registry.h"
#include "restcore/logging/logger.h"

#include <memory>

namespace restcore::core {

class HttpRequest;
class ResponseSink;

// Single entry point of the core, called by the host once per request:
//
//   lookup → pre filters → bind → handler → write envelope → post filters
//
// A lookup miss writes 404. A rejecting pre filter, a bind failure or a
// handler without envelope end the request without any further write by
// the dispatcher; the bind failure leaves the request unanswered.
//
// handle() is const and may run concurrently; routes, filters and codecs
// must not change once the dispatcher is built.
class Dispatcher {
public:
    explicit Dispatcher(std::shared_ptr<const RouteRegistry> routes,
                        FilterChain filters = {},
                        BodyCodecs codecs = {},
                        logging::LoggerPtr logger = logging::null_logger());

    void handle(HttpRequest& request, ResponseSink& response) const;

    const RouteRegistry& routes() const noexcept;

private:
    std::shared_ptr<const RouteRegistry> routes_;
    FilterChain filters_;
    BodyCodecs codecs_;
    logging::LoggerPtr logger_;
};

} // namespace restcore::core
