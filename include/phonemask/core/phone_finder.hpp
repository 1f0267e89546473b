#pragma once

#include "phonemask/interfaces.hpp"
#include <functional>
#include <map>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace phonemask {

// Replacement text keyed by candidate value
using Replacements = std::map<std::string, std::string, std::less<>>;

// Positioned, non-overlapping matches in text order
auto find_phone_matches(std::string_view text, const IPhonePattern& pattern)
    -> std::vector<PhoneMatch>;

// Distinct candidate values, sorted
auto find_phone_numbers(std::string_view text, const IPhonePattern& pattern)
    -> std::set<std::string>;

auto distinct_candidates(std::span<const PhoneMatch> matches) -> std::set<std::string>;

// Single pass over the original text. Only the matched ranges are rewritten, so a
// replacement can never be re-matched or bleed into neighbouring digits.
auto redact_matches(std::string_view text, std::span<const PhoneMatch> matches,
                    const Replacements& replacements) -> std::string;

} // namespace phonemask
