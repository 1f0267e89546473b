#include "phonemask/core/phone_generator.hpp"

namespace phonemask {

FakePhoneNumberGenerator::FakePhoneNumberGenerator(std::uint32_t seed) : engine_(seed) {}

auto FakePhoneNumberGenerator::formats() -> const std::vector<std::string>& {
    static const std::vector<std::string> formats{
        // Standard 10-digit
        "N##N######",
        "N##-N##-####",
        // Local
        "(N##)N##-####",
        // Non-standard
        "N##.N##.####",
        // Extensions
        "N##-N##-####x###",
        "N##-N##-####x####",
        "N##-N##-####x#####",
        "(N##)N##-####x###",
        "(N##)N##-####x####",
        "(N##)N##-####x#####",
        "N##.N##.####x###",
        "N##.N##.####x####",
        "N##.N##.####x#####",
        // Country code prefixed
        "+1-N##-N##-####",
        "001-N##-N##-####",
        "+1-N##-N##-####x###",
        "001-N##-N##-####x###",
    };
    return formats;
}

auto FakePhoneNumberGenerator::generate() -> std::string {
    const auto& all = formats();
    std::uniform_int_distribution<size_t> pick(0, all.size() - 1);
    return render(all[pick(engine_)]);
}

auto FakePhoneNumberGenerator::render(std::string_view format) -> std::string {
    std::uniform_int_distribution<int> any_digit(0, 9);
    std::uniform_int_distribution<int> lead_digit(2, 9);

    std::string number;
    number.reserve(format.size());
    for (char c : format) {
        switch (c) {
        case '#':
            number += static_cast<char>('0' + any_digit(engine_));
            break;
        case 'N':
            number += static_cast<char>('0' + lead_digit(engine_));
            break;
        default:
            number += c;
            break;
        }
    }
    return number;
}

auto random_seed() -> std::uint32_t {
    std::random_device device;
    return device();
}

} // namespace phonemask
