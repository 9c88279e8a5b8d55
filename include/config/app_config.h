#pragma once

#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "channel/channel_data.h"
#include "group/group_info_provider.h"
#include "protocol/message.h"

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Contents of config.json for the nearlink executable.
 */
struct AppConfig {
    std::string log_level = "info";
    DeviceInfo device;
    std::string peer_id;
    ConnectionInfo group;
    ChannelConfig channel;
};

/// Reads the "channel" object; absent fields keep their defaults.
ChannelConfig channel_config_from_json(const nlohmann::json& j);

AppConfig app_config_from_json(const nlohmann::json& j);

/// Throws ConfigError if the file is missing or invalid.
AppConfig load_config(const std::string& path);
