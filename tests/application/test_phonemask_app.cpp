#include "phonemask/application/cli_options.hpp"
#include "phonemask/application/phonemask_app.hpp"
#include "phonemask/core/phone_pattern.hpp"
#include "phonemask/io/file_system.hpp"
#include "phonemask/io/text_encoding.hpp"
#include "phonemask/log/log_setup.hpp"
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <plog/Appenders/IAppender.h>
#include <plog/Log.h>
#include <stdexcept>
#include <string>
#include <vector>

namespace phonemask {

using ::testing::_;
using ::testing::Return;
using ::testing::Throw;

class MockFileSystem : public IFileSystem {
public:
    MOCK_METHOD(bool, file_exists, (const std::string& path), (override));
    MOCK_METHOD(std::string, read_bytes, (const std::string& path), (override));
    MOCK_METHOD(void, write_bytes, (const std::string& path, const std::string& bytes), (override));
};

class MockGenerator : public IPhoneNumberGenerator {
public:
    MOCK_METHOD(std::string, generate, (), (override));
};

// Keeps the messages written through the default logger
class RecordingAppender : public plog::IAppender {
public:
    void write(const plog::Record& record) override { messages.emplace_back(record.getMessage()); }

    std::vector<std::string> messages;
};

auto recording_appender() -> RecordingAppender& {
    static RecordingAppender appender;
    static bool attached = false;
    if (!attached) {
        logging::init_logging(plog::none);
        plog::get()->addAppender(&appender);
        attached = true;
    }
    return appender;
}

class PhoneMaskAppTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        mock_filesystem_ = std::make_unique<MockFileSystem>();
        mock_generator_ = std::make_unique<MockGenerator>();

        // Capture raw pointers before moving to app
        filesystem_ptr_ = mock_filesystem_.get();
        generator_ptr_ = mock_generator_.get();
    }

    auto make_app() -> PhoneMaskApp
    {
        return PhoneMaskApp(std::move(mock_filesystem_), std::make_unique<NanpPhonePattern>(),
                            std::move(mock_generator_));
    }

    auto expect_input(const std::string& path, const std::string& bytes) -> void
    {
        EXPECT_CALL(*filesystem_ptr_, file_exists(path)).WillOnce(Return(true));
        EXPECT_CALL(*filesystem_ptr_, read_bytes(path)).WillOnce(Return(bytes));
    }

    std::unique_ptr<MockFileSystem> mock_filesystem_;
    std::unique_ptr<MockGenerator> mock_generator_;

    MockFileSystem* filesystem_ptr_;
    MockGenerator* generator_ptr_;

    Config config_{.input_file = "contacts.txt"};
};

TEST_F(PhoneMaskAppTest, MasksInPlaceByDefault)
{
    expect_input("contacts.txt", "Call 555-123-4567 or 555.123.4567 again\n");
    EXPECT_CALL(*filesystem_ptr_,
                write_bytes("contacts.txt", "Call XXX-XXX-XXXX or XXX.XXX.XXXX again\n"));
    EXPECT_CALL(*generator_ptr_, generate()).Times(0);

    auto app = make_app();
    EXPECT_EQ(app.run(config_), kExitSuccess);
}

TEST_F(PhoneMaskAppTest, WritesToOutputFileWhenGiven)
{
    config_.output_file = "masked.txt";
    config_.mask_char = "*";

    expect_input("contacts.txt", "Phone: 800-555-0199.");
    EXPECT_CALL(*filesystem_ptr_, write_bytes("masked.txt", "Phone: ***-***-****."));

    auto app = make_app();
    EXPECT_EQ(app.run(config_), kExitSuccess);
}

TEST_F(PhoneMaskAppTest, MissingInputFileIsFatal)
{
    EXPECT_CALL(*filesystem_ptr_, file_exists("contacts.txt")).WillOnce(Return(false));
    EXPECT_CALL(*filesystem_ptr_, read_bytes(_)).Times(0);
    EXPECT_CALL(*filesystem_ptr_, write_bytes(_, _)).Times(0);

    auto app = make_app();
    EXPECT_EQ(app.run(config_), kExitFailure);
}

TEST_F(PhoneMaskAppTest, InvalidMaskCharIsFatalBeforeAnyIo)
{
    config_.mask_char = "XX";
    EXPECT_CALL(*filesystem_ptr_, file_exists(_)).Times(0);

    auto app = make_app();
    EXPECT_EQ(app.run(config_), kExitFailure);
}

TEST_F(PhoneMaskAppTest, ReadFailureIsFatal)
{
    EXPECT_CALL(*filesystem_ptr_, file_exists("contacts.txt")).WillOnce(Return(true));
    EXPECT_CALL(*filesystem_ptr_, read_bytes("contacts.txt"))
        .WillOnce(Throw(FileSystemError("Cannot open file: contacts.txt")));
    EXPECT_CALL(*filesystem_ptr_, write_bytes(_, _)).Times(0);

    auto app = make_app();
    EXPECT_EQ(app.run(config_), kExitFailure);
}

TEST_F(PhoneMaskAppTest, DecodeFailureIsFatal)
{
    // UTF-16 byte order mark followed by an odd trailing byte
    expect_input("contacts.txt", std::string("\xFF\xFE" "5", 3));
    EXPECT_CALL(*filesystem_ptr_, write_bytes(_, _)).Times(0);

    auto app = make_app();
    EXPECT_EQ(app.run(config_), kExitFailure);
}

TEST_F(PhoneMaskAppTest, WriteFailureIsFatal)
{
    expect_input("contacts.txt", "555-123-4567");
    EXPECT_CALL(*filesystem_ptr_, write_bytes("contacts.txt", _))
        .WillOnce(Throw(FileSystemError("Cannot write to file: contacts.txt.tmp")));

    auto app = make_app();
    EXPECT_EQ(app.run(config_), kExitFailure);
}

TEST_F(PhoneMaskAppTest, EncodeFailureIsFatal)
{
    // ASCII input cannot hold a non-ASCII mask character
    config_.mask_char = "\xE2\x80\xA2";
    expect_input("contacts.txt", "555-123-4567");
    EXPECT_CALL(*filesystem_ptr_, write_bytes(_, _)).Times(0);

    auto app = make_app();
    EXPECT_EQ(app.run(config_), kExitFailure);
}

TEST_F(PhoneMaskAppTest, UndetectableEncodingFallsBackToUtf8)
{
    expect_input("contacts.txt", "");
    EXPECT_CALL(*filesystem_ptr_, write_bytes("contacts.txt", ""));

    auto app = make_app();
    EXPECT_EQ(app.run(config_), kExitSuccess);
}

TEST_F(PhoneMaskAppTest, PreservesSourceEncoding)
{
    auto input = encode_text("Tel: 555-123-4567\n", TextEncoding::UTF16LE_BOM);
    auto expected = encode_text("Tel: XXX-XXX-XXXX\n", TextEncoding::UTF16LE_BOM);

    expect_input("contacts.txt", input);
    EXPECT_CALL(*filesystem_ptr_, write_bytes("contacts.txt", expected));

    auto app = make_app();
    EXPECT_EQ(app.run(config_), kExitSuccess);
}

TEST_F(PhoneMaskAppTest, ReplaceModeDrawsOncePerDistinctCandidate)
{
    config_.replace = true;

    // Candidates are transformed in sorted order: '-' sorts before '.'
    expect_input("contacts.txt", "555-123-4567, 555.123.4567, 555-123-4567");
    EXPECT_CALL(*generator_ptr_, generate())
        .WillOnce(Return("800-555-0000"))
        .WillOnce(Return("(800)555-1111"));
    EXPECT_CALL(*filesystem_ptr_,
                write_bytes("contacts.txt", "800-555-0000, (800)555-1111, 800-555-0000"));

    auto app = make_app();
    EXPECT_EQ(app.run(config_), kExitSuccess);
}

TEST_F(PhoneMaskAppTest, ReplaceModeKeepsAreaCode)
{
    config_.replace = true;
    config_.keep_area_code = true;

    expect_input("contacts.txt", "Office 555.123.4567");
    EXPECT_CALL(*generator_ptr_, generate()).WillOnce(Return("212-867-5309"));
    EXPECT_CALL(*filesystem_ptr_, write_bytes("contacts.txt", "Office 555-867-5309"));

    auto app = make_app();
    EXPECT_EQ(app.run(config_), kExitSuccess);
}

TEST_F(PhoneMaskAppTest, FailedReplacementKeepsOriginalAndContinues)
{
    config_.replace = true;

    expect_input("contacts.txt", "212-555-0100 and 555-123-4567");
    EXPECT_CALL(*generator_ptr_, generate())
        .WillOnce(Throw(std::runtime_error("generator broke")))
        .WillOnce(Return("800-555-0000"));
    EXPECT_CALL(*filesystem_ptr_, write_bytes("contacts.txt", "212-555-0100 and 800-555-0000"));

    auto app = make_app();
    EXPECT_EQ(app.run(config_), kExitSuccess);
}

TEST_F(PhoneMaskAppTest, TransformTextIsIdempotentInMaskMode)
{
    auto app = make_app();
    std::string text = "a 555-123-4567 b 5551234567 c 01234567890123";

    auto once = app.transform_text(text, config_);
    auto twice = app.transform_text(once, config_);

    EXPECT_EQ(once, "a XXX-XXX-XXXX b XXXXXXXXXX c 01234567890123");
    EXPECT_EQ(twice, once);
}

TEST(TransformOptionsTest, MapsConfigFields)
{
    Config config{.input_file = "in.txt", .mask_char = "#", .replace = true, .keep_area_code = true};

    auto options = transform_options_from(config);

    EXPECT_EQ(options.mode, TransformMode::REPLACE);
    EXPECT_EQ(options.mask_char, "#");
    EXPECT_TRUE(options.keep_area_code);
}

TEST_F(PhoneMaskAppTest, LogsPatternNameAtDebugLevel)
{
    auto& appender = recording_appender();
    appender.messages.clear();
    plog::get()->setMaxSeverity(plog::debug);

    expect_input("contacts.txt", "no numbers here\n");
    EXPECT_CALL(*filesystem_ptr_, write_bytes("contacts.txt", "no numbers here\n"));

    auto app = make_app();
    auto status = app.run(config_);
    plog::get()->setMaxSeverity(plog::none);

    EXPECT_EQ(status, kExitSuccess);
    EXPECT_THAT(appender.messages, ::testing::Contains("Using pattern nanp-3-3-4"));
}

} // namespace phonemask
