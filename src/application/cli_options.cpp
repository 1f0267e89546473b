#include "phonemask/application/cli_options.hpp"
#include "phonemask/io/text_encoding.hpp"
#include "phonemask/log/log_setup.hpp"
#include <algorithm>
#include <charconv>
#include <cstdint>
#include <sstream>
#include <string_view>
#include <utility>
#include <vector>

namespace phonemask {

namespace {

enum class OptionKind { OUTPUT_FILE, MASK_CHAR, REPLACE, KEEP_AREA_CODE, LOG_LEVEL, SEED, HELP };

struct OptionSpec {
    char short_name;          // '\0' when the option has no short form
    std::string_view long_name;
    OptionKind kind;
    bool takes_value;
};

constexpr OptionSpec kOptions[] = {
    {'o', "--output_file", OptionKind::OUTPUT_FILE, true},
    {'m', "--mask_char", OptionKind::MASK_CHAR, true},
    {'r', "--replace", OptionKind::REPLACE, false},
    {'k', "--keep_area_code", OptionKind::KEEP_AREA_CODE, false},
    {'\0', "--log_level", OptionKind::LOG_LEVEL, true},
    {'\0', "--seed", OptionKind::SEED, true},
    {'h', "--help", OptionKind::HELP, false},
};

// Exact name first, otherwise every option the name abbreviates
auto find_long(std::string_view name) -> std::vector<const OptionSpec*> {
    std::vector<const OptionSpec*> found;
    for (const auto& spec : kOptions) {
        if (spec.long_name == name) {
            return {&spec};
        }
        if (spec.long_name.starts_with(name)) {
            found.push_back(&spec);
        }
    }
    return found;
}

auto find_short(char name) -> const OptionSpec* {
    auto it = std::find_if(std::begin(kOptions), std::end(kOptions),
                           [name](const OptionSpec& spec) { return spec.short_name == name; });
    return it == std::end(kOptions) ? nullptr : &*it;
}

auto option_label(const OptionSpec& spec) -> std::string {
    if (spec.short_name != '\0') {
        return "-" + std::string(1, spec.short_name) + "/" + std::string(spec.long_name);
    }
    return std::string(spec.long_name);
}

auto join_level_names() -> std::string {
    std::string joined;
    for (const auto& name : logging::level_names()) {
        if (!joined.empty()) {
            joined += ",";
        }
        joined += name;
    }
    return joined;
}

// Returns an error message, empty on success
auto apply_option(const OptionSpec& spec, const std::string& value, ParseResult& result)
    -> std::string {
    auto& config = result.config;

    switch (spec.kind) {
    case OptionKind::OUTPUT_FILE:
        config.output_file = value;
        break;
    case OptionKind::MASK_CHAR:
        config.mask_char = value;
        break;
    case OptionKind::REPLACE:
        config.replace = true;
        break;
    case OptionKind::KEEP_AREA_CODE:
        config.keep_area_code = true;
        break;
    case OptionKind::LOG_LEVEL:
        if (!logging::severity_from_level_name(value)) {
            return "argument --log_level: invalid choice: '" + value + "' (choose from "
                   + join_level_names() + ")";
        }
        config.log_level = value;
        break;
    case OptionKind::SEED: {
        std::uint32_t seed = 0;
        auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), seed);
        if (ec != std::errc() || ptr != value.data() + value.size() || value.empty()) {
            return "argument --seed: invalid unsigned 32-bit value: '" + value + "'";
        }
        config.seed = seed;
        break;
    }
    case OptionKind::HELP:
        result.status = ParseStatus::HELP;
        break;
    }
    return "";
}

auto fail(ParseResult result, std::string message) -> ParseResult {
    result.status = ParseStatus::ERROR;
    result.error_message = std::move(message);
    return result;
}

} // namespace

auto parse_args(std::span<const std::string> args) -> ParseResult {
    ParseResult result;
    std::vector<std::string> positionals;
    bool options_ended = false;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (options_ended || arg.size() < 2 || arg[0] != '-') {
            positionals.push_back(arg);
            continue;
        }

        if (arg == "--") {
            options_ended = true;
            continue;
        }

        if (arg.starts_with("--")) {
            // --name or --name=value
            auto eq = arg.find('=');
            std::string name = arg.substr(0, eq);
            auto found = find_long(name);
            if (found.empty()) {
                return fail(std::move(result), "unrecognized arguments: " + arg);
            }
            if (found.size() > 1) {
                std::string message = "ambiguous option: " + name + " could match ";
                for (size_t k = 0; k < found.size(); ++k) {
                    message += (k == 0 ? "" : ", ") + std::string(found[k]->long_name);
                }
                return fail(std::move(result), message);
            }
            const OptionSpec* spec = found.front();

            std::string value;
            if (spec->takes_value) {
                if (eq != std::string::npos) {
                    value = arg.substr(eq + 1);
                } else if (i + 1 < args.size()) {
                    value = args[++i];
                } else {
                    return fail(std::move(result),
                                "argument " + option_label(*spec) + ": expected one argument");
                }
            } else if (eq != std::string::npos) {
                return fail(std::move(result), "argument " + option_label(*spec)
                                                   + ": ignored explicit argument '"
                                                   + arg.substr(eq + 1) + "'");
            }

            if (auto error = apply_option(*spec, value, result); !error.empty()) {
                return fail(std::move(result), error);
            }
            if (result.status == ParseStatus::HELP) {
                return result;
            }
            continue;
        }

        // Short options: flags may be clustered (-rk), a value may be attached (-m*)
        for (size_t pos = 1; pos < arg.size(); ++pos) {
            const OptionSpec* spec = find_short(arg[pos]);
            if (spec == nullptr) {
                return fail(std::move(result), "unrecognized arguments: " + arg);
            }

            std::string value;
            if (spec->takes_value) {
                if (pos + 1 < arg.size()) {
                    value = arg.substr(pos + 1);
                } else if (i + 1 < args.size()) {
                    value = args[++i];
                } else {
                    return fail(std::move(result),
                                "argument " + option_label(*spec) + ": expected one argument");
                }
                pos = arg.size();
            }

            if (auto error = apply_option(*spec, value, result); !error.empty()) {
                return fail(std::move(result), error);
            }
            if (result.status == ParseStatus::HELP) {
                return result;
            }
        }
    }

    if (positionals.empty()) {
        return fail(std::move(result), "the following arguments are required: input_file");
    }
    if (positionals.size() > 1) {
        return fail(std::move(result), "unrecognized arguments: " + positionals[1]);
    }

    result.config.input_file = positionals.front();
    return result;
}

auto parse_args(int argc, char* argv[]) -> ParseResult {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return parse_args(args);
}

auto usage_text() -> std::string {
    return "usage: phonemask [-h] [-o OUTPUT_FILE] [-m MASK_CHAR] [-r] [-k]\n"
           "                 [--log_level {" + join_level_names() + "}] [--seed SEED]\n"
           "                 input_file\n";
}

auto help_text() -> std::string {
    std::ostringstream oss;
    oss << usage_text();
    oss << "\nMasks or replaces phone numbers in text and data files.\n";
    oss << "\npositional arguments:\n";
    oss << "  input_file                      Path to the input file to process.\n";
    oss << "\noptions:\n";
    oss << "  -h, --help                      Show this help message and exit\n";
    oss << "  -o, --output_file OUTPUT_FILE   Path to the output file. If not specified,\n";
    oss << "                                  overwrites the input file.\n";
    oss << "  -m, --mask_char MASK_CHAR       Character to use for masking phone numbers.\n";
    oss << "                                  Defaults to 'X'.\n";
    oss << "  -r, --replace                   Replace phone numbers with fake phone numbers.\n";
    oss << "  -k, --keep_area_code            Keep the original area code when replacing\n";
    oss << "                                  phone numbers.\n";
    oss << "  --log_level LEVEL               One of " << join_level_names()
        << ". Defaults to INFO.\n";
    oss << "  --seed SEED                     Seed for fake number generation (replace mode).\n";
    return oss.str();
}

auto validate_config(const Config& config) -> std::optional<std::string> {
    auto length = utf8_length(config.mask_char);
    if (!length || *length != 1) {
        return "Mask character must be a single character.";
    }
    return std::nullopt;
}

auto describe_config(const Config& config) -> std::string {
    std::ostringstream oss;
    oss << "input_file='" << config.input_file << "', output_file="
        << (config.output_file ? "'" + *config.output_file + "'" : std::string("None"))
        << ", mask_char='" << config.mask_char << "', replace=" << std::boolalpha
        << config.replace << ", keep_area_code=" << config.keep_area_code
        << ", log_level='" << config.log_level << "', seed="
        << (config.seed ? std::to_string(*config.seed) : std::string("None"));
    return oss.str();
}

} // namespace phonemask
