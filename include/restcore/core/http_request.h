#pragma once

#include <istream>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>

namespace restcore::core {

class HttpRequest {
public:
    // Header names are stored lower-cased; lookups are case-insensitive.
    using Headers = std::unordered_map<std::string, std::string>;
    using QueryParams = std::unordered_map<std::string, std::string>;

    HttpRequest();
    HttpRequest(std::string method, std::string path);

    // --- method / path ---
    const std::string& method() const noexcept;
    const std::string& path() const noexcept;

    void set_method(std::string method);
    void set_path(std::string path);

    // --- headers ---
    const Headers& headers() const noexcept;
    bool has_header(std::string_view name) const;
    std::string header(std::string_view name) const;

    void set_header(std::string_view name, std::string value);

    // --- query params ---
    const QueryParams& query_params() const noexcept;
    std::string query_param(std::string_view key) const;
    void set_query_param(std::string key, std::string value);

    // --- body ---
    // The payload is consumed at most once, by the request binder.
    std::istream& body() noexcept;
    void set_body(std::string body);
    void set_body_stream(std::unique_ptr<std::istream> stream);

private:
    std::string method_;
    std::string path_;
    Headers headers_;
    QueryParams query_params_;
    std::unique_ptr<std::istream> body_;
};

} // namespace restcore::core
