#pragma once

#include <string>

namespace platform {

// Per-user configuration directory, empty if it cannot be determined.
std::string config_dir();

// System-wide configuration file used when no per-user file exists.
std::string system_config_file();

} // namespace platform
