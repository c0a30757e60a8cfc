#pragma once

#include <chrono>
#include <string>

// "{MM}-{DD}-{YYYY}-{HH}-{mm}-recording.wav" for the given instant, in UTC.
std::string recording_filename(std::chrono::system_clock::time_point start);
