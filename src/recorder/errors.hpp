#pragma once

#include <string>
#include <string_view>

struct RecorderError {
    enum class Kind {
        Device,       // no device, bad index, unsupported stream format
        Config,       // unusable configuration
        SinkOpen,     // output file could not be created
        SinkWrite,    // write failed mid-recording
        SinkFinalize, // header back-patch or close failed
        Coordination, // mixer thread ended abnormally
    };

    Kind kind;
    std::string message;
};

inline std::string_view to_string(RecorderError::Kind kind) {
    switch (kind) {
        case RecorderError::Kind::Device: return "device";
        case RecorderError::Kind::Config: return "config";
        case RecorderError::Kind::SinkOpen: return "sink open";
        case RecorderError::Kind::SinkWrite: return "sink write";
        case RecorderError::Kind::SinkFinalize: return "sink finalize";
        case RecorderError::Kind::Coordination: return "internal coordination failure";
    }
    return "unknown";
}
