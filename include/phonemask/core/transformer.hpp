#pragma once

#include "phonemask/interfaces.hpp"
#include <string>
#include <string_view>

namespace phonemask {

enum class TransformMode {
    MASK,     // Digits replaced by the mask character
    REPLACE   // Whole number replaced by a synthetic one
};

struct TransformOptions {
    TransformMode mode = TransformMode::MASK;
    std::string mask_char = "X";
    bool keep_area_code = false;
};

// Replace every ASCII digit with mask_char, keep separators as they are
auto mask_phone_number(std::string_view phone_number, std::string_view mask_char) -> std::string;

// Computes the substitute text for one candidate
class Transformer {
public:
    Transformer(TransformOptions options, const IPhonePattern& pattern,
                IPhoneNumberGenerator& generator);

    auto transform(std::string_view candidate) -> std::string;

    // Synthetic number, optionally reusing the candidate's area code.
    // Never throws: returns the candidate unchanged on failure.
    auto replace_phone_number(std::string_view candidate, bool keep_area_code) -> std::string;

private:
    TransformOptions options_;
    const IPhonePattern& pattern_;
    IPhoneNumberGenerator& generator_;
};

} // namespace phonemask
