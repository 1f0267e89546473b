#pragma once

#include "phonemask/interfaces.hpp"
#include <regex>
#include <string>

namespace phonemask {

// North American 3-3-4 layout: "555-123-4567", "555.123.4567", "555 123 4567", "5551234567".
// A match must not touch another digit on either side.
class NanpPhonePattern : public IPhonePattern {
public:
    auto name() const -> std::string override;
    auto find_all(std::string_view text) const -> std::vector<PhoneMatch> override;
    auto parse(std::string_view candidate) const -> std::optional<PhoneParts> override;

private:
    // std::regex has no lookbehind, so digit boundaries are checked in find_all.
    // Separators: '-', '.', or one whitespace character, including the UTF-8
    // encodings of NEL, NBSP, U+1680, U+2000-U+200A, U+2028/9, NNBSP, U+205F and U+3000.
    static inline const std::regex candidate_pattern_{
        R"(\d{3}(?:[-.\s\x1C-\x1F]|\xC2[\x85\xA0]|\xE1\x9A\x80|\xE2\x80[\x80\x81\x82\x83\x84\x85\x86\x87\x88\x89\x8A\xA8\xA9\xAF]|\xE2\x81\x9F|\xE3\x80\x80)?\d{3}(?:[-.\s\x1C-\x1F]|\xC2[\x85\xA0]|\xE1\x9A\x80|\xE2\x80[\x80\x81\x82\x83\x84\x85\x86\x87\x88\x89\x8A\xA8\xA9\xAF]|\xE2\x81\x9F|\xE3\x80\x80)?\d{4})"};
    static inline const std::regex parts_pattern_{
        R"((\d{3})(?:[-.\s\x1C-\x1F]|\xC2[\x85\xA0]|\xE1\x9A\x80|\xE2\x80[\x80\x81\x82\x83\x84\x85\x86\x87\x88\x89\x8A\xA8\xA9\xAF]|\xE2\x81\x9F|\xE3\x80\x80)?(\d{3})(?:[-.\s\x1C-\x1F]|\xC2[\x85\xA0]|\xE1\x9A\x80|\xE2\x80[\x80\x81\x82\x83\x84\x85\x86\x87\x88\x89\x8A\xA8\xA9\xAF]|\xE2\x81\x9F|\xE3\x80\x80)?(\d{4}))"};
};

auto is_ascii_digit(char c) -> bool;

} // namespace phonemask
