#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace phonemask {

class EncodingError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class TextEncoding {
    ASCII,
    UTF8,
    UTF8_BOM,
    UTF16LE,       // BOM-less, detected from NUL byte layout
    UTF16BE,
    UTF16LE_BOM,
    UTF16BE_BOM,
    UTF32LE_BOM,
    UTF32BE_BOM,
    LATIN1         // Catch-all for 8-bit text that is not UTF-8
};

// Used when detection yields nothing
inline constexpr TextEncoding kDefaultEncoding = TextEncoding::UTF8;

// Human readable name, e.g. "utf-8", "UTF-16LE", "ISO-8859-1"
auto encoding_name(TextEncoding encoding) -> std::string;

// Charset name understood by iconv(3)
auto iconv_charset(TextEncoding encoding) -> const char*;

// Byte order mark written in front of the content, empty when the encoding has none
auto byte_order_mark(TextEncoding encoding) -> std::string_view;

// Best guess from raw file bytes; nullopt for empty or binary-looking input
auto detect_encoding(std::string_view bytes) -> std::optional<TextEncoding>;

// Bytes -> UTF-8 text (BOM stripped). Throws EncodingError.
auto decode_text(std::string_view bytes, TextEncoding encoding) -> std::string;

// UTF-8 text -> bytes (BOM restored). Throws EncodingError.
auto encode_text(std::string_view text, TextEncoding encoding) -> std::string;

auto is_valid_utf8(std::string_view text) -> bool;

// Number of code points, nullopt when text is not valid UTF-8
auto utf8_length(std::string_view text) -> std::optional<size_t>;

} // namespace phonemask
