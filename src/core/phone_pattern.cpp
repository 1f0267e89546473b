#include "phonemask/core/phone_pattern.hpp"

namespace phonemask {

auto is_ascii_digit(char c) -> bool {
    return c >= '0' && c <= '9';
}

auto NanpPhonePattern::name() const -> std::string {
    return "nanp-3-3-4";
}

auto NanpPhonePattern::find_all(std::string_view text) const -> std::vector<PhoneMatch> {
    using Iterator = std::string_view::const_iterator;

    std::vector<PhoneMatch> matches;
    const Iterator begin = text.begin();
    const Iterator end = text.end();
    Iterator search_from = begin;
    std::match_results<Iterator> match;

    while (search_from != end && std::regex_search(search_from, end, match, candidate_pattern_)) {
        Iterator match_begin = match[0].first;
        Iterator match_end = match[0].second;

        bool digit_before = match_begin != begin && is_ascii_digit(*(match_begin - 1));
        bool digit_after = match_end != end && is_ascii_digit(*match_end);
        if (digit_before || digit_after) {
            // Part of a longer digit run; retry one character later
            search_from = match_begin + 1;
            continue;
        }

        matches.push_back(PhoneMatch{.offset = static_cast<size_t>(match_begin - begin),
                                     .length = static_cast<size_t>(match_end - match_begin),
                                     .text = match.str()});
        search_from = match_end;
    }

    return matches;
}

auto NanpPhonePattern::parse(std::string_view candidate) const -> std::optional<PhoneParts> {
    std::match_results<std::string_view::const_iterator> match;
    if (!std::regex_search(candidate.begin(), candidate.end(), match, parts_pattern_,
                           std::regex_constants::match_continuous)) {
        return std::nullopt;
    }

    return PhoneParts{.area_code = match[1].str(), .exchange = match[2].str(), .line = match[3].str()};
}

} // namespace phonemask
