#include "network/http_message.h"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace {

std::string trim(const std::string& s) {
    auto begin = std::find_if(s.begin(), s.end(), [](unsigned char c) { return !std::isspace(c); });
    auto end = std::find_if(s.rbegin(), s.rend(), [](unsigned char c) { return !std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string url_decode(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    for (std::size_t i = 0; i < in.size(); ++i) {
        if (in[i] == '+') {
            out += ' ';
        } else if (in[i] == '%' && i + 2 < in.size() &&
                   hex_value(in[i + 1]) >= 0 && hex_value(in[i + 2]) >= 0) {
            out += static_cast<char>(hex_value(in[i + 1]) * 16 + hex_value(in[i + 2]));
            i += 2;
        } else {
            out += in[i];
        }
    }
    return out;
}

// Reads "Name: value" lines until the blank line. Returns false on a malformed line.
bool parse_headers(std::istringstream& in, std::map<std::string, std::string>& headers) {
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) return true;

        auto colon = line.find(':');
        if (colon == std::string::npos || colon == 0) return false;
        headers[to_lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
    }
    return true;
}

std::string lookup(const std::map<std::string, std::string>& m, const std::string& key) {
    auto it = m.find(key);
    return it == m.end() ? std::string() : it->second;
}

} // namespace

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string HttpRequest::header(const std::string& name) const {
    return lookup(headers, to_lower(name));
}

std::string HttpRequest::param(const std::string& name) const {
    return lookup(query, name);
}

std::optional<HttpRequest> HttpRequest::parse(const std::string& head) {
    std::istringstream in(head);
    std::string line;
    if (!std::getline(in, line)) return std::nullopt;
    if (!line.empty() && line.back() == '\r') line.pop_back();

    HttpRequest req;
    std::istringstream request_line(line);
    std::string version;
    if (!(request_line >> req.method >> req.target >> version)) return std::nullopt;
    if (version.rfind("HTTP/", 0) != 0 || req.target.empty() || req.target.front() != '/') {
        return std::nullopt;
    }

    auto qpos = req.target.find('?');
    req.path = url_decode(req.target.substr(0, qpos));
    if (qpos != std::string::npos) {
        std::istringstream qs(req.target.substr(qpos + 1));
        std::string pair;
        while (std::getline(qs, pair, '&')) {
            if (pair.empty()) continue;
            auto eq = pair.find('=');
            if (eq == std::string::npos) {
                req.query[url_decode(pair)] = "";
            } else {
                req.query[url_decode(pair.substr(0, eq))] = url_decode(pair.substr(eq + 1));
            }
        }
    }

    if (!parse_headers(in, req.headers)) return std::nullopt;
    return req;
}

std::string HttpResponse::header(const std::string& name) const {
    return lookup(headers, to_lower(name));
}

std::optional<HttpResponse> HttpResponse::parse(const std::string& raw) {
    auto head_end = raw.find("\r\n\r\n");
    if (head_end == std::string::npos) return std::nullopt;

    std::istringstream in(raw.substr(0, head_end + 4));
    std::string line;
    if (!std::getline(in, line)) return std::nullopt;
    if (!line.empty() && line.back() == '\r') line.pop_back();

    HttpResponse res;
    std::istringstream status_line(line);
    std::string version;
    if (!(status_line >> version >> res.status) || version.rfind("HTTP/", 0) != 0) {
        return std::nullopt;
    }
    if (!parse_headers(in, res.headers)) return std::nullopt;

    res.body = raw.substr(head_end + 4);
    return res;
}

const char* status_reason(int status) {
    switch (status) {
        case 101: return "Switching Protocols";
        case 200: return "OK";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 409: return "Conflict";
        default:  return "Internal Server Error";
    }
}

std::string make_response(int status, const std::string& body) {
    std::ostringstream out;
    out << "HTTP/1.1 " << status << ' ' << status_reason(status) << "\r\n"
        << "Content-Type: text/plain\r\n"
        << "Content-Length: " << body.size() << "\r\n"
        << "Connection: close\r\n\r\n"
        << body;
    return out.str();
}
