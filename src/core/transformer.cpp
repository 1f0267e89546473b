#include "phonemask/core/transformer.hpp"
#include "phonemask/core/phone_pattern.hpp"
#include <plog/Log.h>
#include <optional>
#include <utility>

namespace phonemask {

auto mask_phone_number(std::string_view phone_number, std::string_view mask_char) -> std::string {
    std::string masked;
    masked.reserve(phone_number.size());
    for (char c : phone_number) {
        if (is_ascii_digit(c)) {
            masked.append(mask_char);
        } else {
            masked += c;
        }
    }
    return masked;
}

Transformer::Transformer(TransformOptions options, const IPhonePattern& pattern,
                         IPhoneNumberGenerator& generator)
    : options_(std::move(options)), pattern_(pattern), generator_(generator) {}

auto Transformer::transform(std::string_view candidate) -> std::string {
    switch (options_.mode) {
    case TransformMode::MASK:
        return mask_phone_number(candidate, options_.mask_char);
    case TransformMode::REPLACE:
        return replace_phone_number(candidate, options_.keep_area_code);
    }
    return std::string(candidate);
}

auto Transformer::replace_phone_number(std::string_view candidate, bool keep_area_code)
    -> std::string {
    try {
        std::optional<PhoneParts> original_parts;
        if (keep_area_code) {
            original_parts = pattern_.parse(candidate);
        }
        if (!original_parts) {
            return generator_.generate();
        }

        auto synthetic = generator_.generate();
        auto synthetic_parts = pattern_.parse(synthetic);
        if (!synthetic_parts) {
            PLOG_WARNING << "Failed to parse generated phone number " << synthetic
                         << ", using full random number.";
            return synthetic;
        }

        return original_parts->area_code + "-" + synthetic_parts->exchange + "-"
               + synthetic_parts->line;
    } catch (const std::exception& e) {
        PLOG_ERROR << "Error replacing phone number: " << e.what();
        return std::string(candidate);
    }
}

} // namespace phonemask
