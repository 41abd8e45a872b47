// Copyright (c) 2023, The jsonvfy Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.

#include "jsonvfy/lexer.h"
#include "jsonvfy/source.h"
#include "unicode.h"
#include "utils.h"
#include <spdlog/fmt/fmt.h>

namespace jsonvfy
{

namespace
{

// JSON whitespace is exactly space, horizontal tab, line feed, and carriage return.
constexpr uint8_t kIsSpaceTable[] = {
    0, 0, 0, 0, 0, 0, 0, 0, 0, 1, 1, 0, 0, 1, 0, 0,
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
    1, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0};

constexpr uint8_t kIsNumericTable[] = {
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
    1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 0, 0, 0, 0, 0, 0,
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0};

constexpr uint8_t kIsHexTable[] = {
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
    1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 0, 0, 0, 0, 0, 0,
    0, 11, 12, 13, 14, 15, 16, 0, 0, 0, 0, 0, 0, 0, 0, 0,
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
    0, 11, 12, 13, 14, 15, 16, 0, 0, 0, 0, 0, 0, 0, 0, 0,
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0};

// These macros also accept -1 (end of input), which maps to entry 0xFF.
#define ISSPACE(c) (kIsSpaceTable[static_cast<uint8_t>(c)])
#define ISNUMERIC(c) (kIsNumericTable[static_cast<uint8_t>(c)])
#define ISHEX(c) (kIsHexTable[static_cast<uint8_t>(c)])
#define HEXVAL(c) (kIsHexTable[static_cast<uint8_t>(c)] - 1)

// Characters that may not directly follow a keyword.
auto is_identifier_char(int c) -> bool
{
    return ISNUMERIC(c) ||
           (c >= 'a' && c <= 'z') ||
           (c >= 'A' && c <= 'Z') ||
           c == '_';
}

auto describe_byte(int c) -> std::string
{
    if (c >= 0x20 && c < 0x7F) {
        return fmt::format("'{}'", static_cast<char>(c));
    } else if (c >= 0x80) {
        return "non-ASCII character";
    }
    return fmt::format("byte 0x{:02X}", c);
}

} // namespace

auto token_type_name(TokenType type) -> const char *
{
    static constexpr const char *kNames[kTokenCount] = {
        "STRING",
        "NUMBER",
        "TRUE",
        "FALSE",
        "NULL",
        "OBJECT_OPEN",
        "OBJECT_CLOSE",
        "ARRAY_OPEN",
        "ARRAY_CLOSE",
        "COLON",
        "COMMA",
        "END_OF_INPUT",
    };
    JSONVFY_EXPECT_LT(type, kTokenCount);
    return kNames[type];
}

Lexer::Lexer(Source &source, const Options &options)
    : m_source(&source),
      m_buffer(options.read_buffer_size ? options.read_buffer_size
                                        : JSONVFY_DEFAULT_READ_BUFFER_SIZE,
               '\0'),
      m_allow_nan_infinity(options.allow_nan_infinity)
{
}

auto Lexer::fill() -> void
{
    JSONVFY_EXPECT_TRUE(m_chunk.is_empty());
    if (m_at_eof) {
        return;
    }
    m_status = m_source->read(m_buffer.size(), m_buffer.data(), &m_chunk);
    if (!m_status.is_ok() || m_chunk.is_empty()) {
        // Either the source is exhausted, or it failed. In both cases, no more bytes
        // will be read. A failure is reported the next time the lexer looks for a byte.
        m_chunk.clear();
        m_at_eof = true;
    }
}

auto Lexer::peek() -> int
{
    if (m_chunk.is_empty()) {
        fill();
        if (m_chunk.is_empty()) {
            return -1;
        }
    }
    return static_cast<uint8_t>(m_chunk[0]);
}

auto Lexer::get() -> int
{
    const auto c = peek();
    if (c >= 0) {
        m_chunk.advance();
        ++m_pos.offset;
        if (c == '\n') {
            m_pos.column = 1;
            ++m_pos.line;
        } else if (!utf8_is_continuation(static_cast<uint8_t>(c))) {
            ++m_pos.column;
        }
    }
    return c;
}

auto Lexer::make_error(ErrorKind kind, const Position &pos, std::string message) -> Result
{
    m_done = true;
    return {kind, pos, std::move(message)};
}

// Report an error caused by the next unread byte. If the next byte is not what the
// caller expected because the source failed, or because it starts an ill-formed
// UTF-8 sequence, then that problem is reported instead.
auto Lexer::reject(ErrorKind kind, const Position &pos, const std::string &message) -> Result
{
    // `pos` may refer to m_pos, which moves if an encoded character is scanned below.
    const auto at = pos;
    const auto c = peek();
    if (c < 0 && !m_status.is_ok()) {
        return make_error(ErrorKind::kIoError, m_pos, m_status.message());
    } else if (c >= 0x80) {
        auto r = scan_utf8(nullptr);
        if (!r) {
            return r;
        }
    }
    return make_error(kind, at, message);
}

auto Lexer::unterminated() -> Result
{
    return reject(ErrorKind::kUnterminatedString, m_pos, "unterminated string");
}

auto Lexer::next_token(Token &token) -> Result
{
    JSONVFY_EXPECT_FALSE(m_done);
    if (m_done) {
        return {ErrorKind::kUnexpectedEndOfInput, m_pos, "no more tokens"};
    }
    while (ISSPACE(peek())) {
        get();
    }
    token.position = m_pos;
    token.text.clear();

    const auto c = peek();
    switch (c) {
        case -1:
            if (!m_status.is_ok()) {
                return make_error(ErrorKind::kIoError, m_pos, m_status.message());
            }
            m_done = true;
            token.type = kTokenEndOfInput;
            return {};
        case '"':
            return scan_string(token);
        case '-':
        case '0':
        case '1':
        case '2':
        case '3':
        case '4':
        case '5':
        case '6':
        case '7':
        case '8':
        case '9':
            return scan_number(token);
        case 't':
            return scan_literal("true", kTokenTrue, token);
        case 'f':
            return scan_literal("false", kTokenFalse, token);
        case 'n':
            return scan_literal("null", kTokenNull, token);
        case '.':
        case '+':
            return reject(ErrorKind::kInvalidNumberFormat, m_pos,
                          fmt::format("a number cannot start with '{}'", static_cast<char>(c)));
        case '{':
            token.type = kTokenObjectOpen;
            break;
        case '}':
            token.type = kTokenObjectClose;
            break;
        case '[':
            token.type = kTokenArrayOpen;
            break;
        case ']':
            token.type = kTokenArrayClose;
            break;
        case ':':
            token.type = kTokenColon;
            break;
        case ',':
            token.type = kTokenComma;
            break;
        case 'N':
        case 'I':
            if (m_allow_nan_infinity) {
                return scan_literal(c == 'N' ? "NaN" : "Infinity", kTokenNumber, token);
            }
            [[fallthrough]];
        default:
            return reject(ErrorKind::kUnexpectedToken, m_pos,
                          fmt::format("unexpected {}", describe_byte(c)));
    }
    // Structural characters are always a single byte.
    get();
    return {};
}

auto Lexer::scan_string(Token &token) -> Result
{
    JSONVFY_EXPECT_EQ(peek(), '"');
    get();

    // Reuse the scratch buffer. The decoded text is written starting at offset 0.
    m_scratch.clear();
    for (;;) {
        const auto pos = m_pos;
        const auto c = peek();
        if (c < 0) {
            return unterminated();
        } else if (c == '"') {
            get();
            token.type = kTokenString;
            token.text = Slice(m_scratch);
            return {};
        } else if (c == '\\') {
            get();
            auto r = scan_escape(pos);
            if (!r) {
                return r;
            }
        } else if (c < 0x20) {
            return make_error(ErrorKind::kInvalidControlCharacter, pos,
                              fmt::format("unescaped control character 0x{:02X} in string", c));
        } else if (c < 0x80) {
            m_scratch.push_back(static_cast<char>(c));
            get();
        } else {
            auto r = scan_utf8(&m_scratch);
            if (!r) {
                return r;
            }
        }
    }
}

auto Lexer::scan_escape(const Position &backslash) -> Result
{
    const auto c = peek();
    char decoded;
    switch (c) {
        case '"':
        case '\\':
        case '/':
            decoded = static_cast<char>(c);
            break;
        case 'b':
            decoded = '\b';
            break;
        case 'f':
            decoded = '\f';
            break;
        case 'n':
            decoded = '\n';
            break;
        case 'r':
            decoded = '\r';
            break;
        case 't':
            decoded = '\t';
            break;
        case 'u': {
            get();
            uint32_t codepoint;
            auto r = scan_hex4(backslash, codepoint);
            if (!r) {
                return r;
            }
            if (is_low_surrogate(codepoint)) {
                return make_error(ErrorKind::kInvalidUnicodeEscape, backslash,
                                  fmt::format("unpaired low surrogate \\u{:04X}", codepoint));
            } else if (is_high_surrogate(codepoint)) {
                // Codepoint is part of a surrogate pair. Expect a high surrogate (U+D800-U+DBFF)
                // followed by a low surrogate (U+DC00-U+DFFF).
                const auto missing_low = fmt::format(
                    "high surrogate \\u{:04X} is not followed by a low surrogate", codepoint);
                const auto second = m_pos;
                for (const auto expected : {'\\', 'u'}) {
                    const auto c2 = peek();
                    if (c2 < 0) {
                        return unterminated();
                    } else if (c2 != expected) {
                        return reject(ErrorKind::kInvalidUnicodeEscape, backslash, missing_low);
                    }
                    get();
                }
                uint32_t low;
                r = scan_hex4(second, low);
                if (!r) {
                    return r;
                }
                if (!is_low_surrogate(low)) {
                    return make_error(ErrorKind::kInvalidUnicodeEscape, backslash, missing_low);
                }
                codepoint = combine_surrogates(codepoint, low);
            }
            char buffer[4];
            m_scratch.append(buffer, encode_utf8(codepoint, buffer));
            return {};
        }
        default:
            if (c < 0) {
                return unterminated();
            }
            return reject(ErrorKind::kInvalidEscape, backslash,
                          fmt::format("invalid escape sequence: backslash followed by {}",
                                      describe_byte(c)));
    }
    get();
    m_scratch.push_back(decoded);
    return {};
}

auto Lexer::scan_hex4(const Position &backslash, uint32_t &out) -> Result
{
    out = 0;
    for (int i = 0; i < 4; ++i) {
        const auto c = peek();
        if (c < 0) {
            return unterminated();
        } else if (!ISHEX(c)) {
            return reject(ErrorKind::kInvalidUnicodeEscape, backslash,
                          "expected 4 hex digits after \\u");
        }
        out = out << 4 | static_cast<uint32_t>(HEXVAL(c));
        get();
    }
    return {};
}

auto Lexer::scan_digits() -> void
{
    while (ISNUMERIC(peek())) {
        m_scratch.push_back(static_cast<char>(get()));
    }
}

auto Lexer::scan_number(Token &token) -> Result
{
    // According to RFC 8259, the ABNF for a number looks like:
    //     [ minus ] int [ frac ] [ exp ]
    // where "int" is either a single '0', or a nonzero digit followed by any number of
    // digits, and both "frac" and "exp" require at least 1 digit.
    m_scratch.clear();
    if (peek() == '-') {
        m_scratch.push_back(static_cast<char>(get()));
        if (m_allow_nan_infinity && peek() == 'I') {
            auto r = scan_literal("Infinity", kTokenNumber, token);
            if (r) {
                token.text = "-Infinity";
            }
            return r;
        }
    }

    auto c = peek();
    if (c == '0') {
        m_scratch.push_back(static_cast<char>(get()));
    } else if (ISNUMERIC(c)) {
        scan_digits();
    } else {
        return reject(ErrorKind::kInvalidNumberFormat, m_pos, "expected a digit after '-'");
    }

    if (peek() == '.') {
        m_scratch.push_back(static_cast<char>(get()));
        if (!ISNUMERIC(peek())) {
            return reject(ErrorKind::kInvalidNumberFormat, m_pos,
                          "expected a digit after the decimal point");
        }
        scan_digits();
    }

    c = peek();
    if (c == 'e' || c == 'E') {
        m_scratch.push_back(static_cast<char>(get()));
        c = peek();
        if (c == '+' || c == '-') {
            m_scratch.push_back(static_cast<char>(get()));
        }
        if (!ISNUMERIC(peek())) {
            return reject(ErrorKind::kInvalidNumberFormat, m_pos,
                          "expected a digit in the exponent");
        }
        scan_digits();
    }

    // Every run of digits above was scanned to its end, so a digit here must follow
    // a leading '0'. The other characters cannot continue a complete number.
    c = peek();
    if (ISNUMERIC(c)) {
        return make_error(ErrorKind::kInvalidNumberFormat, m_pos,
                          "leading zeros are not allowed");
    } else if (c == '.' || c == 'e' || c == 'E' || c == '+' || c == '-') {
        return make_error(ErrorKind::kInvalidNumberFormat, m_pos,
                          fmt::format("unexpected '{}' in number", static_cast<char>(c)));
    }
    token.type = kTokenNumber;
    token.text = Slice(m_scratch);
    return {};
}

auto Lexer::scan_literal(const char *word, TokenType type, Token &token) -> Result
{
    // Errors are reported at the first byte of the token, which is the '-' in "-Infinity".
    const auto message = fmt::format("invalid literal (expected \"{}\")", word);
    for (const auto *p = word; *p != '\0'; ++p) {
        if (peek() != static_cast<uint8_t>(*p)) {
            return reject(ErrorKind::kUnexpectedToken, token.position, message);
        }
        get();
    }
    if (is_identifier_char(peek())) {
        return reject(ErrorKind::kUnexpectedToken, token.position, message);
    }
    token.type = type;
    token.text = word;
    return {};
}

auto Lexer::scan_utf8(std::string *out) -> Result
{
    const auto pos = m_pos;
    const auto lead = static_cast<uint8_t>(peek());
    JSONVFY_EXPECT_GE(lead, 0x80);
    const auto length = utf8_sequence_length(lead);
    if (length == 0) {
        return make_error(ErrorKind::kInvalidUtf8, pos,
                          fmt::format("invalid UTF-8 start byte 0x{:02X}", lead));
    }
    if (out) {
        out->push_back(static_cast<char>(lead));
    }
    get();

    for (size_t i = 1; i < length; ++i) {
        const auto next_pos = m_pos;
        const auto c = peek();
        if (c < 0) {
            if (!m_status.is_ok()) {
                return make_error(ErrorKind::kIoError, m_pos, m_status.message());
            }
            return make_error(ErrorKind::kInvalidUtf8, next_pos, "truncated UTF-8 sequence");
        }
        const auto byte = static_cast<uint8_t>(c);
        const auto ok = i == 1 ? utf8_is_valid_second(lead, byte)
                               : utf8_is_continuation(byte);
        if (!ok) {
            return make_error(ErrorKind::kInvalidUtf8, next_pos,
                              fmt::format("invalid UTF-8 continuation byte 0x{:02X}", byte));
        }
        if (out) {
            out->push_back(static_cast<char>(byte));
        }
        get();
    }
    return {};
}

} // namespace jsonvfy
