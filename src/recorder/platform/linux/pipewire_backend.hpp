#pragma once

#include "platform/audio_backend.hpp"

#include <cstdint>

// Device discovery through the PipeWire registry. Audio/Source nodes are
// offered as microphones, Audio/Sink nodes as system-audio monitors.
class PipeWireBackend : public AudioBackend {
public:
    explicit PipeWireBackend(uint32_t default_sample_rate = 48000);
    ~PipeWireBackend() override;

    PipeWireBackend(const PipeWireBackend&) = delete;
    PipeWireBackend& operator=(const PipeWireBackend&) = delete;

    std::expected<std::vector<DeviceInfo>, std::string> enumerate() override;

    std::expected<std::unique_ptr<InputStream>, std::string>
        open_input(const DeviceInfo& device, StreamFormat format,
                   DataCallback on_data, ErrorCallback on_error) override;

private:
    uint32_t default_sample_rate_;
};
