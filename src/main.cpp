#include "phonemask/application/cli_options.hpp"
#include "phonemask/application/phonemask_app.hpp"
#include "phonemask/core/phone_generator.hpp"
#include "phonemask/core/phone_pattern.hpp"
#include "phonemask/io/file_system.hpp"
#include "phonemask/log/log_setup.hpp"

#include <plog/Log.h>

#include <cstdint>
#include <exception>
#include <iostream>
#include <memory>
#include <utility>

int main(int argc, char* argv[]) {
    using namespace phonemask;

    auto parsed = parse_args(argc, argv);
    switch (parsed.status) {
    case ParseStatus::HELP:
        std::cout << help_text();
        return kExitSuccess;
    case ParseStatus::ERROR:
        std::cerr << usage_text() << "phonemask: error: " << parsed.error_message << "\n";
        return kExitUsage;
    case ParseStatus::OK:
        break;
    }

    const Config& config = parsed.config;
    logging::init_logging(logging::severity_from_level_name(config.log_level).value_or(plog::info));
    PLOG_DEBUG << "Arguments: " << describe_config(config);

    std::unique_ptr<IPhoneNumberGenerator> generator;
    try {
        std::uint32_t seed = config.seed ? *config.seed : random_seed();
        if (config.replace) {
            PLOG_DEBUG << "Fake number seed: " << seed;
        }
        generator = std::make_unique<FakePhoneNumberGenerator>(seed);
    } catch (const std::exception& e) {
        PLOG_FATAL << "An unexpected error occurred: " << e.what();
        return kExitFailure;
    }

    PhoneMaskApp app(std::make_unique<FileSystem>(), std::make_unique<NanpPhonePattern>(),
                     std::move(generator));
    return app.run(config);
}
