#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace phonemask {

// A positioned occurrence of a phone number in decoded text
struct PhoneMatch {
    size_t offset{};    // Byte offset into the UTF-8 buffer
    size_t length{};
    std::string text;

    auto operator==(const PhoneMatch& other) const -> bool = default;
};

// A candidate split into its 3-3-4 groups
struct PhoneParts {
    std::string area_code;
    std::string exchange;
    std::string line;

    auto operator==(const PhoneParts& other) const -> bool = default;
};

// Fully resolved run configuration
struct Config {
    std::string input_file;
    std::optional<std::string> output_file;   // Overwrite input_file when empty
    std::string mask_char = "X";
    bool replace = false;
    bool keep_area_code = false;
    std::string log_level = "INFO";
    std::optional<std::uint32_t> seed;        // Random seed for replace mode
};

} // namespace phonemask
