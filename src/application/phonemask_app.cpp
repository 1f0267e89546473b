#include "phonemask/application/phonemask_app.hpp"
#include "phonemask/application/cli_options.hpp"
#include <plog/Log.h>
#include <sstream>
#include <utility>

namespace phonemask {

namespace {

auto format_candidates(const std::set<std::string>& candidates) -> std::string {
    std::ostringstream oss;
    oss << "[";
    bool first = true;
    for (const auto& candidate : candidates) {
        if (!first) {
            oss << ", ";
        }
        oss << "'" << candidate << "'";
        first = false;
    }
    oss << "]";
    return oss.str();
}

} // namespace

auto transform_options_from(const Config& config) -> TransformOptions {
    return TransformOptions{.mode = config.replace ? TransformMode::REPLACE : TransformMode::MASK,
                            .mask_char = config.mask_char,
                            .keep_area_code = config.keep_area_code};
}

PhoneMaskApp::PhoneMaskApp(std::unique_ptr<IFileSystem> filesystem,
                           std::unique_ptr<IPhonePattern> pattern,
                           std::unique_ptr<IPhoneNumberGenerator> generator)
    : filesystem_(std::move(filesystem)), pattern_(std::move(pattern)),
      generator_(std::move(generator)) {}

auto PhoneMaskApp::run(const Config& config) -> int {
    if (auto error = validate_config(config)) {
        PLOG_ERROR << *error;
        return kExitFailure;
    }

    try {
        return process_file(config);
    } catch (const std::exception& e) {
        PLOG_FATAL << "An unexpected error occurred: " << e.what();
        return kExitFailure;
    }
}

auto PhoneMaskApp::process_file(const Config& config) -> int {
    const auto& input_file = config.input_file;
    PLOG_DEBUG << "Using pattern " << pattern_->name();

    if (!filesystem_->file_exists(input_file)) {
        PLOG_ERROR << "Input file not found: " << input_file;
        return kExitFailure;
    }

    std::string bytes;
    try {
        bytes = filesystem_->read_bytes(input_file);
    } catch (const std::exception& e) {
        PLOG_ERROR << "Error reading input file: " << e.what();
        return kExitFailure;
    }

    auto encoding = resolve_encoding(bytes);

    std::string content;
    try {
        content = decode_text(bytes, encoding);
    } catch (const std::exception& e) {
        PLOG_ERROR << "Error reading input file: " << e.what();
        return kExitFailure;
    }

    content = transform_text(content, config);

    const std::string output_file = config.output_file.value_or(input_file);
    try {
        filesystem_->write_bytes(output_file, encode_text(content, encoding));
    } catch (const std::exception& e) {
        PLOG_ERROR << "Error writing output file: " << e.what();
        return kExitFailure;
    }

    PLOG_INFO << "Processed file saved to: " << output_file;
    return kExitSuccess;
}

auto PhoneMaskApp::transform_text(const std::string& text, const Config& config) -> std::string {
    auto matches = find_phone_matches(text, *pattern_);
    auto candidates = distinct_candidates(matches);
    PLOG_DEBUG << "Found phone numbers: " << format_candidates(candidates);

    if (candidates.empty()) {
        return text;
    }

    auto replacements = build_replacements(candidates, config);
    return redact_matches(text, matches, replacements);
}

auto PhoneMaskApp::resolve_encoding(const std::string& bytes) -> TextEncoding {
    auto detected = detect_encoding(bytes);
    if (!detected) {
        PLOG_ERROR << "Failed to detect file encoding, falling back to " << encoding_name(kDefaultEncoding);
        return kDefaultEncoding;
    }

    PLOG_DEBUG << "Detected encoding: " << encoding_name(*detected);
    return *detected;
}

auto PhoneMaskApp::build_replacements(const std::set<std::string>& candidates,
                                      const Config& config) -> Replacements {
    Transformer transformer(transform_options_from(config), *pattern_, *generator_);
    Replacements replacements;

    // std::set order keeps generator draws reproducible for a given seed
    for (const auto& candidate : candidates) {
        auto substitute = transformer.transform(candidate);
        if (config.replace) {
            PLOG_INFO << "Replacing '" << candidate << "' with '" << substitute << "'";
        } else {
            PLOG_INFO << "Masking '" << candidate << "' with '" << substitute << "'";
        }
        replacements.emplace(candidate, std::move(substitute));
    }

    return replacements;
}

} // namespace phonemask
