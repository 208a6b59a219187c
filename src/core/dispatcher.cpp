#include "restcore/core/dispatcher.h"

#include "restcore/core/http_request.h"
#include "restcore/core/request_binder.h"
#include "restcore/core/request_context.h"
#include "restcore/core/response_sink.h"

#include <stdexcept>
#include <string>

namespace restcore::core {

Dispatcher::Dispatcher(std::shared_ptr<const RouteRegistry> routes,
                       FilterChain filters,
                       BodyCodecs codecs,
                       logging::LoggerPtr logger)
    : routes_(std::move(routes))
    , filters_(std::move(filters))
    , codecs_(std::move(codecs))
    , logger_(logger ? std::move(logger) : logging::null_logger()) {
    if (!routes_) {
        throw std::invalid_argument("Dispatcher: routes must not be null");
    }
}

const RouteRegistry& Dispatcher::routes() const noexcept {
    return *routes_;
}

void Dispatcher::handle(HttpRequest& request, ResponseSink& response) const {
    const std::string path = request.path();

    const HandlerEntry* entry = nullptr;
    if (const auto method = parse_method(request.method())) {
        entry = routes_->lookup(*method, path);
    }
    if (entry == nullptr) {
        logger_->debug("[Dispatcher#handle] Route does NOT exist => Method: '{}' | Path: '{}'",
                       request.method(), path);
        response.set_status(404);
        return;
    }

    logger_->debug("[Dispatcher#handle] => Method: '{}' | Path: '{}'", request.method(), path);

    if (!filters_.run_pre(response, request)) {
        return;
    }

    RequestContext context(response, request, extract_path_variables(entry->pattern(), path));
    const auto& handler = entry->handler();

    ResponsePtr envelope;
    if (!handler.has_body()) {
        envelope = handler.invoke(context);
    } else {
        std::any body;
        try {
            body = bind_body(request, codecs_, handler.body_handler());
        } catch (const BindError& e) {
            // Nothing is written: the host decides what the client sees.
            logger_->debug("[Dispatcher#handle][bind_body] {}", e.what());
            return;
        }
        envelope = handler.body_handler().invoke(context, body);
    }

    if (envelope) {
        envelope->write(response, *logger_);
    } else {
        logger_->warn("[Dispatcher#handle] handler for '{}' returned no response", entry->pattern().path_template());
    }

    filters_.run_post(response, request);
}

} // namespace restcore::core
