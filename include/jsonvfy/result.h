// Copyright (c) 2023, The jsonvfy Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.

#ifndef JSONVFY_RESULT_H
#define JSONVFY_RESULT_H

#include <cstddef>
#include <string>

namespace jsonvfy
{

class Status;

// Location of a byte in the input
// Lines and columns are 1-based. Columns count Unicode scalar values, not bytes.
struct Position {
    size_t offset = 0;
    size_t line = 1;
    size_t column = 1;
};

inline auto operator==(const Position &lhs, const Position &rhs) -> bool
{
    return lhs.offset == rhs.offset &&
           lhs.line == rhs.line &&
           lhs.column == rhs.column;
}

inline auto operator!=(const Position &lhs, const Position &rhs) -> bool
{
    return !(lhs == rhs);
}

enum class ErrorKind {
    kNone,
    kInvalidUtf8,
    kUnterminatedString,
    kInvalidEscape,
    kInvalidControlCharacter,
    kInvalidUnicodeEscape,
    kInvalidNumberFormat,
    kUnexpectedToken,
    kDuplicateKey,
    kTrailingComma,
    kTrailingContent,
    kMaxDepthExceeded,
    kUnexpectedEndOfInput,
    kIoError,
    kAborted,
};

// Outcome of lexing a token or validating a document
struct [[nodiscard]] Result {
    ErrorKind kind = ErrorKind::kNone;

    // Location of the first offending byte. Not meaningful for kIoError.
    Position position;

    std::string message;

    // Return true if no error was encountered
    explicit operator bool() const
    {
        return kind == ErrorKind::kNone;
    }

    // Render the result as "<line>:<column>: <message>"
    [[nodiscard]] auto to_string() const -> std::string;
};

// Return a stable, lowercase identifier for `kind`, e.g. "trailing_comma"
auto error_kind_name(ErrorKind kind) -> const char *;

auto to_status(const Result &result) -> Status;

} // namespace jsonvfy

#endif // JSONVFY_RESULT_H
