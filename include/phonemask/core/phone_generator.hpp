#pragma once

#include "phonemask/interfaces.hpp"
#include <cstdint>
#include <random>
#include <string>
#include <string_view>
#include <vector>

namespace phonemask {

// US-style fake phone numbers. Format placeholders:
//   '#'  any digit
//   'N'  digit 2-9 (area code and exchange lead digits)
class FakePhoneNumberGenerator : public IPhoneNumberGenerator {
public:
    explicit FakePhoneNumberGenerator(std::uint32_t seed);

    auto generate() -> std::string override;

    // Fill a single format template
    auto render(std::string_view format) -> std::string;

    static auto formats() -> const std::vector<std::string>&;

private:
    std::mt19937 engine_;
};

// Per-run seed when the user does not supply one
auto random_seed() -> std::uint32_t;

} // namespace phonemask
