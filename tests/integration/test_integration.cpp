#include "phonemask/application/cli_options.hpp"
#include "phonemask/application/phonemask_app.hpp"
#include "phonemask/core/phone_generator.hpp"
#include "phonemask/core/phone_pattern.hpp"
#include "phonemask/io/file_system.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <cstdint>
#include <iterator>
#include <regex>

namespace phonemask {

class IntegrationTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        temp_dir_ = std::filesystem::temp_directory_path()
                    / (std::string("phonemask_it_") + info->name());
        std::filesystem::remove_all(temp_dir_);
        std::filesystem::create_directories(temp_dir_);
    }

    void TearDown() override
    {
        std::filesystem::remove_all(temp_dir_);
    }

    auto path_of(const std::string& name) const -> std::string
    {
        return (temp_dir_ / name).string();
    }

    auto write_file(const std::string& path, const std::string& bytes) -> void
    {
        std::ofstream file(path, std::ios::binary);
        file.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    }

    auto read_file(const std::string& path) -> std::string
    {
        std::ifstream file(path, std::ios::binary);
        return {std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
    }

    auto run_app(const Config& config, std::uint32_t seed = 42) -> int
    {
        PhoneMaskApp app(std::make_unique<FileSystem>(), std::make_unique<NanpPhonePattern>(),
                         std::make_unique<FakePhoneNumberGenerator>(seed));
        return app.run(config);
    }

    std::filesystem::path temp_dir_;
};

TEST_F(IntegrationTest, MasksFileInPlace)
{
    auto input = path_of("contacts.txt");
    write_file(input, "Alice: 555-123-4567\nBob: 555.987.6543\nOrder id 01234567890123\n");

    EXPECT_EQ(run_app({.input_file = input}), kExitSuccess);
    EXPECT_EQ(read_file(input), "Alice: XXX-XXX-XXXX\nBob: XXX.XXX.XXXX\nOrder id 01234567890123\n");
}

TEST_F(IntegrationTest, WritesSeparateOutputAndLeavesInputAlone)
{
    auto input = path_of("contacts.txt");
    auto output = path_of("masked.txt");
    write_file(input, "Phone: 800-555-0199.");

    EXPECT_EQ(run_app({.input_file = input, .output_file = output, .mask_char = "*"}), kExitSuccess);
    EXPECT_EQ(read_file(output), "Phone: ***-***-****.");
    EXPECT_EQ(read_file(input), "Phone: 800-555-0199.");
}

TEST_F(IntegrationTest, MaskingTwiceChangesNothing)
{
    auto input = path_of("contacts.txt");
    write_file(input, "call 555 123 4567 or 5551234567\r\n");

    ASSERT_EQ(run_app({.input_file = input}), kExitSuccess);
    auto once = read_file(input);
    ASSERT_EQ(run_app({.input_file = input}), kExitSuccess);

    EXPECT_EQ(read_file(input), once);
    EXPECT_EQ(once, "call XXX XXX XXXX or XXXXXXXXXX\r\n");
}

TEST_F(IntegrationTest, KeepsLatin1Encoding)
{
    auto input = path_of("latin1.txt");
    write_file(input, "T\xE9l: 555-123-4567 caf\xE9\n");

    EXPECT_EQ(run_app({.input_file = input}), kExitSuccess);
    EXPECT_EQ(read_file(input), "T\xE9l: XXX-XXX-XXXX caf\xE9\n");
}

TEST_F(IntegrationTest, ReplaceWithSeedIsReproducible)
{
    auto input = path_of("contacts.txt");
    auto first = path_of("first.txt");
    auto second = path_of("second.txt");
    write_file(input, "Office: 555-123-4567\nHome: 555-123-4567\n");

    Config config{.input_file = input, .output_file = first, .replace = true, .keep_area_code = true};
    ASSERT_EQ(run_app(config, 7), kExitSuccess);
    config.output_file = second;
    ASSERT_EQ(run_app(config, 7), kExitSuccess);

    auto replaced = read_file(first);
    EXPECT_EQ(replaced, read_file(second));
    EXPECT_NE(replaced, read_file(input));

    // Both occurrences receive the same synthetic number
    std::smatch match;
    ASSERT_TRUE(std::regex_match(replaced, match, std::regex{R"(Office: (.+)\nHome: (.+)\n)"}));
    EXPECT_EQ(match[1].str(), match[2].str());
}

TEST_F(IntegrationTest, MissingInputFails)
{
    EXPECT_EQ(run_app({.input_file = path_of("absent.txt")}), kExitFailure);
    EXPECT_FALSE(std::filesystem::exists(path_of("absent.txt")));
}

TEST_F(IntegrationTest, UnwritableOutputFails)
{
    auto input = path_of("contacts.txt");
    write_file(input, "555-123-4567");

    EXPECT_EQ(run_app({.input_file = input, .output_file = path_of("missing/dir/out.txt")}),
              kExitFailure);
    EXPECT_EQ(read_file(input), "555-123-4567");
}

} // namespace phonemask
