#pragma once

#include "phonemask/core/phone_finder.hpp"
#include "phonemask/core/transformer.hpp"
#include "phonemask/interfaces.hpp"
#include "phonemask/io/text_encoding.hpp"
#include "phonemask/types.hpp"
#include <memory>
#include <set>
#include <string>

namespace phonemask {

class PhoneMaskApp {
private:
    std::unique_ptr<IFileSystem> filesystem_;
    std::unique_ptr<IPhonePattern> pattern_;
    std::unique_ptr<IPhoneNumberGenerator> generator_;

public:
    PhoneMaskApp(std::unique_ptr<IFileSystem> filesystem,
                 std::unique_ptr<IPhonePattern> pattern,
                 std::unique_ptr<IPhoneNumberGenerator> generator);

    // Validates the config, processes the file and maps failures to exit codes
    auto run(const Config& config) -> int;

    // Read -> transform -> write. Returns an exit code.
    auto process_file(const Config& config) -> int;

    // Text-only part of process_file
    auto transform_text(const std::string& text, const Config& config) -> std::string;

private:
    auto resolve_encoding(const std::string& bytes) -> TextEncoding;
    auto build_replacements(const std::set<std::string>& candidates, const Config& config)
        -> Replacements;
};

auto transform_options_from(const Config& config) -> TransformOptions;

} // namespace phonemask
