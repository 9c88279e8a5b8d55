#include "network/ping_manager.h"

#include <algorithm>
#include <cctype>

#include "crypto/crypto_manager.h"
#include "network/socket_type.h"

std::string PingManager::build_ping() const {
    return CryptoManager::random_hex(kTokenBytes);
}

std::string PingManager::build_ping_request(const std::string& token,
                                            const std::string& host, uint16_t port) const {
    return std::string("GET ") + kPingPath + "?token=" + token + " HTTP/1.1\r\n" +
           "Host: " + host + ":" + std::to_string(port) + "\r\n" +
           "Connection: close\r\n\r\n";
}

bool PingManager::is_ping(const HttpRequest& request) const {
    return request.method == "GET" &&
           request.path == kPingPath &&
           is_token(request.param("token"));
}

std::string PingManager::pong_body(const std::string& token) const {
    return "pong:" + token;
}

bool PingManager::is_pong(const std::optional<HttpResponse>& response, const std::string& token) const {
    if (!response || response->status != 200 || !is_token(token)) {
        return false;
    }
    return response->body == pong_body(token);
}

bool PingManager::is_token(const std::string& value) {
    return value.size() == kTokenBytes * 2 &&
           std::all_of(value.begin(), value.end(), [](unsigned char c) {
               return std::isdigit(c) || (c >= 'a' && c <= 'f');
           });
}
