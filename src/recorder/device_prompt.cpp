#include "device_prompt.hpp"

#include <charconv>
#include <print>

namespace {

std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return {};
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::optional<size_t> parse_index(const std::string& s) {
    size_t v = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc{} || ptr != s.data() + s.size() || s.empty()) return std::nullopt;
    return v;
}

// Returns nullopt on "-1" when allow_skip is set.
std::expected<std::optional<size_t>, std::string>
prompt(std::istream& in, std::ostream& out, size_t max, bool allow_skip) {
    if (max == 0) {
        return std::unexpected("no devices to choose from");
    }

    for (;;) {
        std::print(out, "Enter index: ");
        out.flush();

        std::string line;
        if (!std::getline(in, line)) {
            return std::unexpected("input closed before a device was selected");
        }

        auto text = trim(line);
        if (allow_skip && text == "-1") {
            return std::optional<size_t>{};
        }

        auto idx = parse_index(text);
        if (!idx) {
            std::println(out, "Invalid input. Please enter a number{}.",
                         allow_skip ? " or -1 to skip" : "");
        } else if (*idx >= max) {
            std::println(out, "Index out of range. Please enter a number between 0 and {}{}",
                         max - 1, allow_skip ? " (or -1 to skip)" : "");
        } else {
            return idx;
        }
    }
}

} // namespace

std::expected<size_t, std::string> read_index(std::istream& in, std::ostream& out, size_t max) {
    auto r = prompt(in, out, max, false);
    if (!r) return std::unexpected(r.error());
    return **r;
}

std::expected<std::optional<size_t>, std::string>
read_index_optional(std::istream& in, std::ostream& out, size_t max) {
    return prompt(in, out, max, true);
}
