#include "phonemask/log/log_setup.hpp"
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Init.h>
#include <plog/Log.h>
#include <iomanip>

namespace phonemask::logging {

plog::util::nstring LineFormatter::header() {
    return plog::util::nstring();
}

plog::util::nstring LineFormatter::format(const plog::Record& record) {
    tm t;
    plog::util::localtime_s(&t, &record.getTime().time);

    plog::util::nostringstream ss;
    ss << t.tm_year + 1900 << PLOG_NSTR("-") << std::setfill(PLOG_NSTR('0')) << std::setw(2)
       << t.tm_mon + 1 << PLOG_NSTR("-") << std::setw(2) << t.tm_mday << PLOG_NSTR(" ")
       << std::setw(2) << t.tm_hour << PLOG_NSTR(":") << std::setw(2) << t.tm_min
       << PLOG_NSTR(":") << std::setw(2) << t.tm_sec << PLOG_NSTR(",") << std::setw(3)
       << static_cast<int>(record.getTime().millitm);
    ss << PLOG_NSTR(" - ") << level_name_for(record.getSeverity()).c_str() << PLOG_NSTR(" - ");
    ss << record.getMessage() << PLOG_NSTR("\n");

    return ss.str();
}

auto level_names() -> const std::vector<std::string>& {
    static const std::vector<std::string> names{"DEBUG", "INFO", "WARNING", "ERROR", "CRITICAL"};
    return names;
}

auto severity_from_level_name(std::string_view name) -> std::optional<plog::Severity> {
    if (name == "DEBUG") {
        return plog::debug;
    }
    if (name == "INFO") {
        return plog::info;
    }
    if (name == "WARNING") {
        return plog::warning;
    }
    if (name == "ERROR") {
        return plog::error;
    }
    if (name == "CRITICAL") {
        return plog::fatal;
    }
    return std::nullopt;
}

auto level_name_for(plog::Severity severity) -> std::string {
    switch (severity) {
    case plog::fatal:
        return "CRITICAL";
    case plog::error:
        return "ERROR";
    case plog::warning:
        return "WARNING";
    case plog::info:
        return "INFO";
    case plog::debug:
    case plog::verbose:
        return "DEBUG";
    default:
        return "NOTSET";
    }
}

auto init_logging(plog::Severity severity) -> void {
    static plog::ConsoleAppender<LineFormatter> console_appender(plog::streamStdErr);

    if (auto* logger = plog::get()) {
        logger->setMaxSeverity(severity);
        return;
    }
    plog::init(severity, &console_appender);
}

} // namespace phonemask::logging
