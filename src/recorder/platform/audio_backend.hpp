#pragma once

#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <vector>

struct DeviceInfo {
    uint32_t id = 0;
    std::string name;
    std::string description;
    uint16_t channels = 1;
    uint32_t sample_rate = 48000;
    bool monitor = false; // loopback of an output device
};

struct StreamFormat {
    uint16_t channels = 1;
    uint32_t sample_rate = 48000;
};

// A running hardware stream. stop() returns only once no further data
// callback can run.
class InputStream {
public:
    virtual ~InputStream() = default;
    virtual bool start() = 0;
    virtual void stop() = 0;
    virtual bool is_capturing() const = 0;
};

class AudioBackend {
public:
    // Interleaved float samples in [-1, 1], called on the audio thread.
    using DataCallback = std::function<void(std::span<const float>)>;
    using ErrorCallback = std::function<void(const std::string&)>;

    virtual ~AudioBackend() = default;

    virtual std::expected<std::vector<DeviceInfo>, std::string> enumerate() = 0;

    virtual std::expected<std::unique_ptr<InputStream>, std::string>
        open_input(const DeviceInfo& device, StreamFormat format,
                   DataCallback on_data, ErrorCallback on_error) = 0;
};
