#pragma once

#include <map>
#include <optional>
#include <string>

/**
 * Just enough HTTP/1.1 to route probes and upgrades on the channel port.
 */
struct HttpRequest {
    std::string method;
    std::string target;   // as sent, e.g. "/ping?token=ab12"
    std::string path;     // target without the query
    std::map<std::string, std::string> query;
    std::map<std::string, std::string> headers;  // keys lower-cased

    /// Header value or empty string.
    [[nodiscard]] std::string header(const std::string& name) const;

    /// Query parameter value or empty string.
    [[nodiscard]] std::string param(const std::string& name) const;

    /// Parse a request head (everything up to and including the blank line).
    static std::optional<HttpRequest> parse(const std::string& head);
};

struct HttpResponse {
    int status = 0;
    std::map<std::string, std::string> headers;  // keys lower-cased
    std::string body;

    [[nodiscard]] std::string header(const std::string& name) const;

    /// Parse a full response; the body is whatever follows the head.
    static std::optional<HttpResponse> parse(const std::string& raw);
};

const char* status_reason(int status);

/// Serialize a complete response with Content-Length and Connection: close.
std::string make_response(int status, const std::string& body);

std::string to_lower(std::string s);
