#pragma once

#include <optional>

#include "group/group_info_provider.h"

/**
 * GroupInfoProvider backed by fixed values, for hosts where the group is
 * formed outside this process (configuration file, tests).
 */
class StaticGroupInfo : public GroupInfoProvider {
public:
    StaticGroupInfo() = default;
    StaticGroupInfo(std::optional<ConnectionInfo> info, std::optional<DeviceInfo> device);

    std::optional<ConnectionInfo> connection_info() override;
    std::optional<DeviceInfo> current_device() override;

    void set_connection_info(std::optional<ConnectionInfo> info);
    void set_current_device(std::optional<DeviceInfo> device);

    /// Number of connection_info() calls so far.
    [[nodiscard]] int queries() const { return queries_; }

private:
    std::optional<ConnectionInfo> info_;
    std::optional<DeviceInfo> device_;
    int queries_ = 0;
};
