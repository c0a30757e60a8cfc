#include "device_manager.hpp"

#include <format>
#include <print>

std::expected<DeviceManager, std::string> DeviceManager::create(AudioBackend& backend) {
    auto infos = backend.enumerate();
    if (!infos) {
        return std::unexpected(std::format("enumeration failed: {}", infos.error()));
    }
    if (infos->empty()) {
        return std::unexpected("no input devices found");
    }

    std::vector<Device> devices;
    devices.reserve(infos->size());
    for (auto& info : *infos) {
        devices.emplace_back(std::move(info));
    }
    return DeviceManager(std::move(devices));
}

void DeviceManager::list(std::ostream& out) const {
    std::println(out, "Available input devices:");
    for (size_t i = 0; i < devices_.size(); ++i) {
        const auto& info = devices_[i].info();
        std::println(out, "  {}: {} ({} ch, {} Hz){}", i,
                     info.description.empty() ? info.name : info.description,
                     info.channels, info.sample_rate,
                     info.monitor ? " [system audio]" : "");
    }
}

std::expected<std::string, std::string> DeviceManager::name(size_t index) const {
    if (index >= devices_.size()) {
        return std::unexpected(std::format("device index {} out of range", index));
    }
    const auto& info = devices_[index].info();
    return info.description.empty() ? info.name : info.description;
}

std::expected<StreamFormat, std::string> DeviceManager::format(size_t index) const {
    if (index >= devices_.size()) {
        return std::unexpected(std::format("device index {} out of range", index));
    }
    return devices_[index].default_format();
}

std::optional<Device> DeviceManager::take(size_t index) {
    if (index >= devices_.size()) return std::nullopt;
    auto it = devices_.begin() + static_cast<std::ptrdiff_t>(index);
    Device d = std::move(*it);
    devices_.erase(it);
    return d;
}
