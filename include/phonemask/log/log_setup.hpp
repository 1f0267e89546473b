#pragma once

#include <plog/Record.h>
#include <plog/Severity.h>
#include <plog/Util.h>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace phonemask::logging {

// "2026-01-31 13:45:07,123 - WARNING - message"
struct LineFormatter {
    static plog::util::nstring header();
    static plog::util::nstring format(const plog::Record& record);
};

// Accepted --log_level values, most verbose first
auto level_names() -> const std::vector<std::string>&;

auto severity_from_level_name(std::string_view name) -> std::optional<plog::Severity>;
auto level_name_for(plog::Severity severity) -> std::string;

// Console logging to stderr. Calling again only changes the level.
auto init_logging(plog::Severity severity) -> void;

} // namespace phonemask::logging
