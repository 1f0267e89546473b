#include "phonemask/io/text_encoding.hpp"
#include <algorithm>
#include <array>
#include <cerrno>
#include <iconv.h>

namespace phonemask {

namespace {

constexpr std::string_view kBomUtf8{"\xEF\xBB\xBF", 3};
constexpr std::string_view kBomUtf16LE{"\xFF\xFE", 2};
constexpr std::string_view kBomUtf16BE{"\xFE\xFF", 2};
constexpr std::string_view kBomUtf32LE{"\xFF\xFE\x00\x00", 4};
constexpr std::string_view kBomUtf32BE{"\x00\x00\xFE\xFF", 4};

constexpr size_t kSampleSize = 4096;

// RAII wrapper around an iconv conversion descriptor
class IconvConverter {
public:
    IconvConverter(const char* to_charset, const char* from_charset)
        : handle_(iconv_open(to_charset, from_charset)), from_(from_charset), to_(to_charset) {
        if (handle_ == reinterpret_cast<iconv_t>(-1)) {
            throw EncodingError("Unsupported conversion from " + from_ + " to " + to_);
        }
    }

    ~IconvConverter() { iconv_close(handle_); }

    IconvConverter(const IconvConverter&) = delete;
    auto operator=(const IconvConverter&) -> IconvConverter& = delete;

    auto convert(std::string_view input) -> std::string {
        std::string output;
        output.reserve(input.size() * 2);
        std::array<char, 4096> buffer{};

        char* in_ptr = const_cast<char*>(input.data());
        size_t in_left = input.size();

        while (in_left > 0) {
            char* out_ptr = buffer.data();
            size_t out_left = buffer.size();
            size_t rc = iconv(handle_, &in_ptr, &in_left, &out_ptr, &out_left);
            output.append(buffer.data(), buffer.size() - out_left);

            if (rc == static_cast<size_t>(-1)) {
                if (errno == E2BIG) {
                    continue;
                }
                size_t position = input.size() - in_left;
                if (errno == EINVAL) {
                    throw EncodingError("Incomplete " + from_ + " sequence at end of input");
                }
                throw EncodingError("Cannot convert " + from_ + " to " + to_ + " at byte "
                                    + std::to_string(position));
            }
        }

        // Flush any shift state
        char* out_ptr = buffer.data();
        size_t out_left = buffer.size();
        iconv(handle_, nullptr, nullptr, &out_ptr, &out_left);
        output.append(buffer.data(), buffer.size() - out_left);

        return output;
    }

private:
    iconv_t handle_;
    std::string from_;
    std::string to_;
};

auto looks_like_utf16(std::string_view sample, bool little_endian) -> bool {
    size_t pairs = sample.size() / 2;
    if (pairs == 0) {
        return false;
    }

    size_t hits = 0;
    for (size_t i = 0; i + 1 < sample.size(); i += 2) {
        char low = little_endian ? sample[i] : sample[i + 1];
        char high = little_endian ? sample[i + 1] : sample[i];
        if (high == '\0' && low != '\0') {
            ++hits;
        }
    }

    return hits * 10 >= pairs * 9;
}

auto is_ascii(std::string_view text) -> bool {
    return std::all_of(text.begin(), text.end(),
                       [](char c) { return static_cast<unsigned char>(c) < 0x80; });
}

} // namespace

auto encoding_name(TextEncoding encoding) -> std::string {
    switch (encoding) {
    case TextEncoding::ASCII:
        return "ascii";
    case TextEncoding::UTF8:
        return "utf-8";
    case TextEncoding::UTF8_BOM:
        return "UTF-8-SIG";
    case TextEncoding::UTF16LE:
    case TextEncoding::UTF16LE_BOM:
        return "UTF-16LE";
    case TextEncoding::UTF16BE:
    case TextEncoding::UTF16BE_BOM:
        return "UTF-16BE";
    case TextEncoding::UTF32LE_BOM:
        return "UTF-32LE";
    case TextEncoding::UTF32BE_BOM:
        return "UTF-32BE";
    case TextEncoding::LATIN1:
        return "ISO-8859-1";
    }
    return "unknown";
}

auto iconv_charset(TextEncoding encoding) -> const char* {
    switch (encoding) {
    case TextEncoding::ASCII:
        return "ASCII";
    case TextEncoding::UTF8:
    case TextEncoding::UTF8_BOM:
        return "UTF-8";
    case TextEncoding::UTF16LE:
    case TextEncoding::UTF16LE_BOM:
        return "UTF-16LE";
    case TextEncoding::UTF16BE:
    case TextEncoding::UTF16BE_BOM:
        return "UTF-16BE";
    case TextEncoding::UTF32LE_BOM:
        return "UTF-32LE";
    case TextEncoding::UTF32BE_BOM:
        return "UTF-32BE";
    case TextEncoding::LATIN1:
        return "ISO-8859-1";
    }
    return "UTF-8";
}

auto byte_order_mark(TextEncoding encoding) -> std::string_view {
    switch (encoding) {
    case TextEncoding::UTF8_BOM:
        return kBomUtf8;
    case TextEncoding::UTF16LE_BOM:
        return kBomUtf16LE;
    case TextEncoding::UTF16BE_BOM:
        return kBomUtf16BE;
    case TextEncoding::UTF32LE_BOM:
        return kBomUtf32LE;
    case TextEncoding::UTF32BE_BOM:
        return kBomUtf32BE;
    default:
        return {};
    }
}

auto detect_encoding(std::string_view bytes) -> std::optional<TextEncoding> {
    if (bytes.empty()) {
        return std::nullopt;
    }

    // UTF-32LE shares its first two bytes with UTF-16LE, so test it first
    if (bytes.starts_with(kBomUtf32LE)) {
        return TextEncoding::UTF32LE_BOM;
    }
    if (bytes.starts_with(kBomUtf32BE)) {
        return TextEncoding::UTF32BE_BOM;
    }
    if (bytes.starts_with(kBomUtf8)) {
        return TextEncoding::UTF8_BOM;
    }
    if (bytes.starts_with(kBomUtf16LE)) {
        return TextEncoding::UTF16LE_BOM;
    }
    if (bytes.starts_with(kBomUtf16BE)) {
        return TextEncoding::UTF16BE_BOM;
    }

    auto sample = bytes.substr(0, kSampleSize);
    if (looks_like_utf16(sample, true)) {
        return TextEncoding::UTF16LE;
    }
    if (looks_like_utf16(sample, false)) {
        return TextEncoding::UTF16BE;
    }

    if (bytes.find('\0') != std::string_view::npos) {
        return std::nullopt;
    }
    if (is_ascii(bytes)) {
        return TextEncoding::ASCII;
    }
    if (is_valid_utf8(bytes)) {
        return TextEncoding::UTF8;
    }
    return TextEncoding::LATIN1;
}

auto decode_text(std::string_view bytes, TextEncoding encoding) -> std::string {
    auto bom = byte_order_mark(encoding);
    if (!bom.empty() && bytes.starts_with(bom)) {
        bytes.remove_prefix(bom.size());
    }

    switch (encoding) {
    case TextEncoding::ASCII:
        if (!is_ascii(bytes)) {
            throw EncodingError("Input contains bytes outside the ascii range");
        }
        return std::string(bytes);
    case TextEncoding::UTF8:
    case TextEncoding::UTF8_BOM:
        if (!is_valid_utf8(bytes)) {
            throw EncodingError("Input is not valid utf-8");
        }
        return std::string(bytes);
    default:
        break;
    }

    IconvConverter converter("UTF-8", iconv_charset(encoding));
    return converter.convert(bytes);
}

auto encode_text(std::string_view text, TextEncoding encoding) -> std::string {
    std::string bytes(byte_order_mark(encoding));

    switch (encoding) {
    case TextEncoding::ASCII:
        if (!is_ascii(text)) {
            throw EncodingError("Output contains characters outside the ascii range");
        }
        bytes.append(text);
        return bytes;
    case TextEncoding::UTF8:
    case TextEncoding::UTF8_BOM:
        bytes.append(text);
        return bytes;
    default:
        break;
    }

    IconvConverter converter(iconv_charset(encoding), "UTF-8");
    bytes.append(converter.convert(text));
    return bytes;
}

auto is_valid_utf8(std::string_view text) -> bool {
    size_t i = 0;
    while (i < text.size()) {
        auto lead = static_cast<unsigned char>(text[i]);
        size_t extra = 0;
        unsigned int code_point = 0;

        if (lead < 0x80) {
            ++i;
            continue;
        } else if ((lead & 0xE0) == 0xC0) {
            extra = 1;
            code_point = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            extra = 2;
            code_point = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            extra = 3;
            code_point = lead & 0x07;
        } else {
            return false;
        }

        if (i + extra >= text.size()) {
            return false; // Truncated sequence
        }

        for (size_t k = 1; k <= extra; ++k) {
            auto next = static_cast<unsigned char>(text[i + k]);
            if ((next & 0xC0) != 0x80) {
                return false;
            }
            code_point = (code_point << 6) | (next & 0x3F);
        }

        // Overlong forms, surrogates and values past U+10FFFF
        if ((extra == 1 && code_point < 0x80) || (extra == 2 && code_point < 0x800)
            || (extra == 3 && code_point < 0x10000) || code_point > 0x10FFFF
            || (code_point >= 0xD800 && code_point <= 0xDFFF)) {
            return false;
        }

        i += extra + 1;
    }
    return true;
}

auto utf8_length(std::string_view text) -> std::optional<size_t> {
    if (!is_valid_utf8(text)) {
        return std::nullopt;
    }
    return static_cast<size_t>(std::count_if(text.begin(), text.end(), [](char c) {
        return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
    }));
}

} // namespace phonemask
