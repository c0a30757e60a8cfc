#include "config.hpp"
#include "device_manager.hpp"
#include "device_prompt.hpp"
#include "platform/linux/pipewire_backend.hpp"
#include "platform/linux/signal_interrupt.hpp"
#include "recorder.hpp"
#include "wav.hpp"

#include <charconv>
#include <iostream>
#include <optional>
#include <print>
#include <string>

static void usage(const char* prog) {
    std::println("Usage: {} [options]", prog);
    std::println("Options:");
    std::println("  -c, --config PATH   Config file path");
    std::println("  -v, --verbose       Enable verbose logging");
    std::println("  -l, --list          List input devices and exit");
    std::println("      --mic N         Microphone device index");
    std::println("      --system N      System audio device index (-1 for none)");
    std::println("  -h, --help          Show this help");
}

static std::optional<long> parse_index(const std::string& s) {
    long v = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
    return v;
}

int main(int argc, char* argv[]) {
    bool verbose = false;
    bool list_only = false;
    std::string config_path;
    std::optional<long> mic_arg;
    std::optional<long> system_arg;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--list" || arg == "-l") {
            list_only = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 < argc) config_path = argv[++i];
        } else if ((arg == "--mic" || arg == "--system") && i + 1 < argc) {
            auto v = parse_index(argv[++i]);
            if (!v) {
                std::println(stderr, "Invalid index for {}: {}", arg, argv[i]);
                return 1;
            }
            (arg == "--mic" ? mic_arg : system_arg) = *v;
        } else if (arg == "--help" || arg == "-h") {
            usage(argv[0]);
            return 0;
        } else {
            std::println(stderr, "Unknown option: {}", arg);
            usage(argv[0]);
            return 1;
        }
    }

    auto config = config_path.empty() ? Config::load_default() : Config::load(config_path);
    if (!config) {
        std::println(stderr, "config: {}", config.error());
        return 1;
    }
    if (verbose) {
        std::println(stderr, "[meeting-recorder] Saving recordings to {}", config->output_directory);
    }

    PipeWireBackend backend(config->audio.sample_rate);

    auto devices = DeviceManager::create(backend);
    if (!devices) {
        std::println(stderr, "devices: {}", devices.error());
        return 1;
    }

    devices->list(std::cout);
    if (list_only) return 0;

    size_t count = devices->count();

    size_t mic_index = 0;
    if (mic_arg) {
        if (*mic_arg < 0 || static_cast<size_t>(*mic_arg) >= count) {
            std::println(stderr, "devices: microphone index {} out of range (0-{})", *mic_arg, count - 1);
            return 1;
        }
        mic_index = static_cast<size_t>(*mic_arg);
    } else {
        std::println("\nSelect microphone device:");
        auto idx = read_index(std::cin, std::cout, count);
        if (!idx) {
            std::println(stderr, "devices: {}", idx.error());
            return 1;
        }
        mic_index = *idx;
    }

    std::optional<size_t> system_index;
    if (system_arg) {
        if (*system_arg >= 0) {
            if (static_cast<size_t>(*system_arg) >= count) {
                std::println(stderr, "devices: system audio index {} out of range (0-{})",
                             *system_arg, count - 1);
                return 1;
            }
            system_index = static_cast<size_t>(*system_arg);
        }
    } else {
        std::println("\nSelect system audio device (-1 to skip):");
        auto idx = read_index_optional(std::cin, std::cout, count);
        if (!idx) {
            std::println(stderr, "devices: {}", idx.error());
            return 1;
        }
        system_index = *idx;
    }

    if (system_index && *system_index == mic_index) {
        std::println(stderr, "devices: microphone and system audio must be different devices");
        return 1;
    }

    auto describe = [&](const char* role, size_t index) {
        auto n = devices->name(index);
        auto f = devices->format(index);
        if (n && f) std::println("{}: {} ({} ch, {} Hz)", role, *n, f->channels, f->sample_rate);
    };
    std::println("");
    describe("Microphone", mic_index);
    if (system_index) describe("System audio", *system_index);

    // take() shifts later indices down, so the higher index goes first.
    std::optional<Device> mic;
    std::optional<Device> system;
    if (system_index && *system_index > mic_index) {
        system = devices->take(*system_index);
        mic = devices->take(mic_index);
    } else {
        mic = devices->take(mic_index);
        if (system_index) system = devices->take(*system_index);
    }
    if (!mic || (system_index && !system)) {
        std::println(stderr, "devices: selected device is no longer available");
        return 1;
    }

    // Blocked from here on; capture threads are created after this point and inherit the mask.
    SignalInterrupt interrupt;
    if (!interrupt.valid()) {
        std::println(stderr, "Ctrl+C will not stop the recording cleanly");
    }

    Recorder recorder(backend, std::move(*mic), std::move(system), verbose);
    recorder.set_interrupt_source(&interrupt);

    auto result = recorder.record(*config);
    if (!result) {
        std::println(stderr, "Recording failed ({}): {}", to_string(result.error().kind),
                     result.error().message);
        return 1;
    }

    std::println("\n=== Recording Complete ===");
    std::println("Saved to: {}", result->path);
    std::println("File size: {} bytes ({:.2f} KB)", result->bytes,
                 static_cast<double>(result->bytes) / 1024.0);

    if (auto info = wav::inspect(result->path)) {
        double seconds = info->spec.sample_rate
            ? static_cast<double>(info->frames()) / info->spec.sample_rate : 0.0;
        std::println("Duration: {:.1f}s ({} frames)", seconds, info->frames());
    } else {
        std::println(stderr, "wav: {}: {}", result->path, info.error());
    }

    return 0;
}
