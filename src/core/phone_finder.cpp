#include "phonemask/core/phone_finder.hpp"

namespace phonemask {

auto find_phone_matches(std::string_view text, const IPhonePattern& pattern)
    -> std::vector<PhoneMatch> {
    return pattern.find_all(text);
}

auto find_phone_numbers(std::string_view text, const IPhonePattern& pattern)
    -> std::set<std::string> {
    auto matches = find_phone_matches(text, pattern);
    return distinct_candidates(matches);
}

auto distinct_candidates(std::span<const PhoneMatch> matches) -> std::set<std::string> {
    std::set<std::string> candidates;
    for (const auto& match : matches) {
        candidates.insert(match.text);
    }
    return candidates;
}

auto redact_matches(std::string_view text, std::span<const PhoneMatch> matches,
                    const Replacements& replacements) -> std::string {
    std::string output;
    output.reserve(text.size());

    size_t cursor = 0;
    for (const auto& match : matches) {
        if (match.offset < cursor || match.offset + match.length > text.size()) {
            continue; // Overlapping or stale match
        }

        output.append(text.substr(cursor, match.offset - cursor));

        auto it = replacements.find(match.text);
        if (it != replacements.end()) {
            output.append(it->second);
        } else {
            output.append(text.substr(match.offset, match.length));
        }
        cursor = match.offset + match.length;
    }
    output.append(text.substr(cursor));

    return output;
}

} // namespace phonemask
