#pragma once

#include <cstddef>
#include <expected>
#include <istream>
#include <optional>
#include <ostream>
#include <string>

// Prompts until a valid index in [0, max) is entered.
std::expected<size_t, std::string> read_index(std::istream& in, std::ostream& out, size_t max);

// As read_index, but "-1" skips and yields nullopt.
std::expected<std::optional<size_t>, std::string>
    read_index_optional(std::istream& in, std::ostream& out, size_t max);
