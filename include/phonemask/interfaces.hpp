#pragma once

#include "phonemask/types.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace phonemask {

// Abstract interfaces for dependency injection
class IFileSystem {
public:
    virtual ~IFileSystem() = default;
    virtual auto file_exists(const std::string& path) -> bool = 0;
    virtual auto read_bytes(const std::string& path) -> std::string = 0;
    virtual auto write_bytes(const std::string& path, const std::string& bytes) -> void = 0;
};

// Detection and parsing rules for one phone number layout
class IPhonePattern {
public:
    virtual ~IPhonePattern() = default;
    virtual auto name() const -> std::string = 0;
    virtual auto find_all(std::string_view text) const -> std::vector<PhoneMatch> = 0;
    virtual auto parse(std::string_view candidate) const -> std::optional<PhoneParts> = 0;
};

// Source of synthetic phone numbers
class IPhoneNumberGenerator {
public:
    virtual ~IPhoneNumberGenerator() = default;
    virtual auto generate() -> std::string = 0;
};

} // namespace phonemask
