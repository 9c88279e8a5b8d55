#include "group/static_group_info.h"

#include <utility>

StaticGroupInfo::StaticGroupInfo(std::optional<ConnectionInfo> info, std::optional<DeviceInfo> device)
    : info_(std::move(info)), device_(std::move(device)) {}

std::optional<ConnectionInfo> StaticGroupInfo::connection_info() {
    ++queries_;
    return info_;
}

std::optional<DeviceInfo> StaticGroupInfo::current_device() {
    return device_;
}

void StaticGroupInfo::set_connection_info(std::optional<ConnectionInfo> info) {
    info_ = std::move(info);
}

void StaticGroupInfo::set_current_device(std::optional<DeviceInfo> device) {
    device_ = std::move(device);
}
