// Copyright (c) 2023, The jsonvfy Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.

#ifndef JSONVFY_LEXER_H
#define JSONVFY_LEXER_H

#include "options.h"
#include "result.h"
#include "slice.h"
#include "status.h"
#include <cstdint>
#include <string>

namespace jsonvfy
{

class Source;

// Value tokens come first so that they can be used to index a table of events.
enum TokenType {
    kTokenString,
    kTokenNumber,
    kTokenTrue,
    kTokenFalse,
    kTokenNull,
    kTokenObjectOpen,
    kTokenObjectClose,
    kTokenArrayOpen,
    kTokenArrayClose,
    kTokenColon,
    kTokenComma,
    kTokenEndOfInput,
    kTokenCount
};

// Return an uppercase name for `type`, e.g. "OBJECT_OPEN"
auto token_type_name(TokenType type) -> const char *;

struct Token {
    TokenType type = kTokenEndOfInput;

    // Position of the first byte of the token.
    Position position;

    // Decoded contents of a string token (without the quotes), or the raw lexeme of a
    // number token. Refers to memory owned by the lexer, and is invalidated by the
    // next call to Lexer::next_token().
    Slice text;
};

// Converts a stream of bytes into JSON tokens, one token per call
// Whitespace is skipped, strings are unescaped and checked, and numbers are checked
// against the RFC 8259 grammar. The lexer is forward-only: once it has returned an
// error or a kTokenEndOfInput token, it must not be called again.
class Lexer final
{
public:
    explicit Lexer(Source &source, const Options &options);

    // Scan the next token into `token`
    // Returns an error result if the token is malformed, if the input contains invalid
    // UTF-8, or if the source could not be read.
    auto next_token(Token &token) -> Result;

    // Return the position of the next unread byte
    [[nodiscard]] auto position() const -> const Position &
    {
        return m_pos;
    }

    Lexer(Lexer &) = delete;
    void operator=(Lexer &) = delete;

private:
    [[nodiscard]] auto peek() -> int;
    auto get() -> int;
    auto fill() -> void;

    auto scan_string(Token &token) -> Result;
    auto scan_escape(const Position &backslash) -> Result;
    auto scan_hex4(const Position &backslash, uint32_t &out) -> Result;
    auto scan_number(Token &token) -> Result;
    auto scan_digits() -> void;
    auto scan_literal(const char *word, TokenType type, Token &token) -> Result;
    auto scan_utf8(std::string *out) -> Result;
    auto unterminated() -> Result;

    auto reject(ErrorKind kind, const Position &pos, const std::string &message) -> Result;
    auto make_error(ErrorKind kind, const Position &pos, std::string message) -> Result;

    Source *const m_source;
    std::string m_buffer;
    std::string m_scratch;
    Slice m_chunk;
    Position m_pos;
    Status m_status;
    bool m_at_eof = false;
    bool m_done = false;
    const bool m_allow_nan_infinity;
};

} // namespace jsonvfy

#endif // JSONVFY_LEXER_H
