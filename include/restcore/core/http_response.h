#pragma once

#include "restcore/core/response_sink.h"

#include <string>
#include <unordered_map>

namespace restcore::core {

// Buffered sink; the host serializes it once dispatch returns.
class HttpResponse : public ResponseSink {
public:
    using Headers = std::unordered_map<std::string, std::string>;

    HttpResponse();

    // --- status ---
    int status() const noexcept;
    void set_status(int status) override;

    // --- headers ---
    const Headers& headers() const noexcept;
    std::string header(const std::string& name) const;
    void set_header(std::string name, std::string value) override;

    // --- body ---
    const std::string& body() const noexcept;
    void set_body(std::string body);
    void write(std::string_view data) override;

    // True once anything was set or written.
    bool committed() const noexcept;

private:
    bool committed_ = false;
    int status_;
    Headers headers_;
    std::string body_;
};

} // namespace restcore::core
