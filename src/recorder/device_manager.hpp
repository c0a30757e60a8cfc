#pragma once

#include "platform/audio_backend.hpp"

#include <cstddef>
#include <expected>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

// Exclusive handle to one input device. Move-only: a device is owned by at
// most one capture stream.
class Device {
public:
    explicit Device(DeviceInfo info) : info_(std::move(info)) {}

    Device(Device&&) = default;
    Device& operator=(Device&&) = default;
    Device(const Device&) = delete;
    Device& operator=(const Device&) = delete;

    const DeviceInfo& info() const { return info_; }
    StreamFormat default_format() const { return {info_.channels, info_.sample_rate}; }

private:
    DeviceInfo info_;
};

class DeviceManager {
public:
    // Fails if the backend cannot enumerate or reports no input devices.
    static std::expected<DeviceManager, std::string> create(AudioBackend& backend);

    void list(std::ostream& out) const;
    size_t count() const { return devices_.size(); }

    std::expected<std::string, std::string> name(size_t index) const;
    std::expected<StreamFormat, std::string> format(size_t index) const;

    // Removes the device from the manager; later indices shift down by one.
    std::optional<Device> take(size_t index);

private:
    explicit DeviceManager(std::vector<Device> devices) : devices_(std::move(devices)) {}

    std::vector<Device> devices_;
};
