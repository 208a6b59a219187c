#pragma once

#include "restcore/core/body_codecs.h"
#include "restcore/core/handler.h"
#include "restcore/core/path_pattern.h"
#include "restcore/core/request_context.h"
#include "restcore/core/serialization.h"

#include <any>
#include <string_view>

namespace restcore::core {

class HttpRequest;

// Values of the pattern's variables in a path the pattern matched.
RequestContext::PathVariables extract_path_variables(const RoutePattern& pattern, std::string_view path);

// Reads the whole payload and parses it with the decoder registered for
// the request's Content-Type. Throws BindError.
Tree read_body_tree(HttpRequest& request, const BodyCodecs& codecs);

// read_body_tree() followed by the handler's body construction.
// Throws BindError.
std::any bind_body(HttpRequest& request, const BodyCodecs& codecs, const BodyHandler& handler);

} // namespace restcore::core
