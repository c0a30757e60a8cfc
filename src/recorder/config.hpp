#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>

struct Config {
    // Directory where recordings are saved. Required.
    std::string output_directory;

    struct Audio {
        // Rate requested from devices that do not advertise one.
        uint32_t sample_rate = 48000;
        // Per-source queue depth between the capture callback and the mixer.
        uint32_t queue_seconds = 30;
        static constexpr uint32_t max_queue_seconds = 600;

        size_t queue_capacity(uint16_t channels, uint32_t rate) const {
            return static_cast<size_t>(queue_seconds > 0 ? queue_seconds : 1) * rate * channels;
        }
    } audio;

    // Full path for a recording file inside output_directory.
    std::string recording_path(const std::string& filename) const;

    // Loads and validates the file, creating output_directory if needed.
    static std::expected<Config, std::string> load(const std::string& path);
    static std::expected<Config, std::string> load_default();
};
