#pragma once

#include <optional>
#include <string>

#include "protocol/message.h"

/// Snapshot of the local group as reported by the platform.
struct ConnectionInfo {
    bool group_formed = false;
    bool is_group_owner = false;
    std::string owner_address;
};

/**
 * Platform collaborator that forms the group and knows this device.
 */
class GroupInfoProvider {
public:
    virtual ~GroupInfoProvider() = default;

    /// nullopt while the platform has nothing to report.
    virtual std::optional<ConnectionInfo> connection_info() = 0;

    virtual std::optional<DeviceInfo> current_device() = 0;
};
