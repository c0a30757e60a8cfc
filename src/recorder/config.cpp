#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <format>
#include <fstream>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using json = nlohmann::json;

std::string Config::recording_path(const std::string& filename) const {
    return (fs::path(output_directory) / filename).string();
}

std::expected<Config, std::string> Config::load(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        return std::unexpected(std::format(
            "config file not found at {}; create it with an \"output_directory\" field", path));
    }

    Config cfg;
    try {
        auto j = json::parse(f);

        if (j.contains("output_directory")) {
            cfg.output_directory = j["output_directory"].get<std::string>();
        }

        if (j.contains("audio")) {
            auto& a = j["audio"];
            if (a.contains("sample_rate")) cfg.audio.sample_rate = a["sample_rate"].get<uint32_t>();
            if (a.contains("queue_seconds")) cfg.audio.queue_seconds = a["queue_seconds"].get<uint32_t>();
        }
    } catch (const json::exception& e) {
        return std::unexpected(std::format("parse error in {}: {}", path, e.what()));
    }

    if (cfg.output_directory.empty()) {
        return std::unexpected(std::format("{} has no \"output_directory\"", path));
    }
    if (cfg.audio.sample_rate == 0) {
        return std::unexpected("audio.sample_rate must be positive");
    }
    if (cfg.audio.queue_seconds > Audio::max_queue_seconds) {
        return std::unexpected(std::format("audio.queue_seconds must be at most {}, got {}",
                                           Audio::max_queue_seconds, cfg.audio.queue_seconds));
    }

    std::error_code ec;
    fs::path out(cfg.output_directory);
    if (!fs::exists(out, ec)) {
        fs::create_directories(out, ec);
        if (ec) {
            return std::unexpected(std::format("cannot create output directory '{}': {}",
                                               cfg.output_directory, ec.message()));
        }
    }
    if (!fs::is_directory(out, ec)) {
        return std::unexpected(std::format(
            "output directory '{}' exists but is not a directory", cfg.output_directory));
    }

    return cfg;
}

std::expected<Config, std::string> Config::load_default() {
    auto dir = platform::config_dir();
    if (!dir.empty()) {
        auto user_path = fs::path(dir) / "config.json";
        std::error_code ec;
        if (fs::exists(user_path, ec)) {
            return load(user_path.string());
        }
    }
    return load(platform::system_config_file());
}
