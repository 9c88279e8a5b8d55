#include "config/app_config.h"

#include <fstream>
#include <limits>

using json = nlohmann::json;

namespace {

const json& require_object(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_object()) {
        throw ConfigError(std::string("config: \"") + key + "\" must be an object");
    }
    return *it;
}

} // namespace

ChannelConfig channel_config_from_json(const json& j) {
    ChannelConfig config;
    try {
        const auto port = j.value("port", static_cast<int>(config.port));
        if (port <= 0 || port > std::numeric_limits<uint16_t>::max()) {
            throw ConfigError("config: channel.port out of range: " + std::to_string(port));
        }
        config.port = static_cast<uint16_t>(port);

        const auto reconnect = j.value("reconnect_interval_ms",
                                       static_cast<long long>(config.reconnect_interval.count()));
        const auto probe = j.value("probe_timeout_ms",
                                   static_cast<long long>(config.probe_timeout.count()));
        if (reconnect <= 0 || probe <= 0) {
            throw ConfigError("config: channel intervals must be positive");
        }
        config.reconnect_interval = std::chrono::milliseconds(reconnect);
        config.probe_timeout = std::chrono::milliseconds(probe);

        if (j.contains("key") || j.contains("nonce")) {
            config.key = ChannelKey::from_strings(j.at("key").get<std::string>(),
                                                  j.at("nonce").get<std::string>());
        }
    } catch (const json::exception& e) {
        throw ConfigError(std::string("config: invalid channel section: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw ConfigError(std::string("config: ") + e.what());
    }
    return config;
}

AppConfig app_config_from_json(const json& j) {
    AppConfig config;
    try {
        config.log_level = j.value("log_level", config.log_level);
        config.device = require_object(j, "device").get<DeviceInfo>();
        config.peer_id = j.at("peer_id").get<std::string>();

        const auto& group = require_object(j, "group");
        config.group.group_formed = group.value("formed", true);
        config.group.is_group_owner = group.at("is_owner").get<bool>();
        config.group.owner_address = group.at("owner_address").get<std::string>();

        if (j.contains("channel")) {
            config.channel = channel_config_from_json(require_object(j, "channel"));
        }
    } catch (const json::exception& e) {
        throw ConfigError(std::string("config: ") + e.what());
    }

    if (config.device.id.empty() || config.peer_id.empty()) {
        throw ConfigError("config: device.id and peer_id must not be empty");
    }
    return config;
}

AppConfig load_config(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Cannot open config file: " + path);
    }

    json j;
    try {
        j = json::parse(file);
    } catch (const json::parse_error& e) {
        throw ConfigError("config: " + path + ": " + e.what());
    }
    return app_config_from_json(j);
}
