#pragma once

#include <string>
#include <string_view>

namespace restcore::core {

// Where a response is written to. Implemented by the host server.
class ResponseSink {
public:
    virtual ~ResponseSink() = default;

    virtual void set_status(int status) = 0;
    virtual void set_header(std::string name, std::string value) = 0;

    // Appends to the body. Throws on transport failure.
    virtual void write(std::string_view data) = 0;
};

} // namespace restcore::core
