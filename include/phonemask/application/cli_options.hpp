#pragma once

#include "phonemask/types.hpp"
#include <optional>
#include <span>
#include <string>

namespace phonemask {

inline constexpr int kExitSuccess = 0;
inline constexpr int kExitFailure = 1;
inline constexpr int kExitUsage = 2;

enum class ParseStatus {
    OK,
    HELP,    // -h / --help given
    ERROR    // Usage error, see error_message
};

struct ParseResult {
    Config config;
    ParseStatus status = ParseStatus::OK;
    std::string error_message;
};

// args excludes the program name
auto parse_args(std::span<const std::string> args) -> ParseResult;
auto parse_args(int argc, char* argv[]) -> ParseResult;

auto usage_text() -> std::string;
auto help_text() -> std::string;

// Semantic checks that are fatal errors rather than usage errors
auto validate_config(const Config& config) -> std::optional<std::string>;

// One-line dump for debug logging
auto describe_config(const Config& config) -> std::string;

} // namespace phonemask
