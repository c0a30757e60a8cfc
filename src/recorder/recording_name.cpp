#include "recording_name.hpp"

#include <format>

std::string recording_filename(std::chrono::system_clock::time_point start) {
    auto minute = std::chrono::floor<std::chrono::minutes>(start);
    return std::format("{:%m-%d-%Y-%H-%M}-recording.wav", minute);
}
