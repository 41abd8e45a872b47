// Copyright (c) 2023, The jsonvfy Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.

#ifndef JSONVFY_VALIDATOR_H
#define JSONVFY_VALIDATOR_H

#include "options.h"
#include "result.h"
#include "slice.h"

namespace jsonvfy
{

class Source;

// Receives the structure of a document as it is validated
// Each callback returns true to continue, or false to stop validation. A stopped run
// produces a result with ErrorKind::kAborted. Events are only delivered for tokens that
// have been accepted by the grammar, so a handler may observe a prefix of an invalid
// document before the run fails.
class Handler
{
public:
    explicit Handler();
    virtual ~Handler();

    [[nodiscard]] virtual auto accept_key(const Slice &value) -> bool = 0;
    [[nodiscard]] virtual auto accept_string(const Slice &value) -> bool = 0;

    // `lexeme` is the number exactly as it appeared in the input, e.g. "-1.5e+10".
    [[nodiscard]] virtual auto accept_number(const Slice &lexeme) -> bool = 0;

    [[nodiscard]] virtual auto accept_boolean(bool value) -> bool = 0;
    [[nodiscard]] virtual auto accept_null() -> bool = 0;
    [[nodiscard]] virtual auto begin_object() -> bool = 0;
    [[nodiscard]] virtual auto end_object() -> bool = 0;
    [[nodiscard]] virtual auto begin_array() -> bool = 0;
    [[nodiscard]] virtual auto end_array() -> bool = 0;
};

// Check that the bytes produced by `source` form exactly one JSON value, optionally
// surrounded by whitespace
// Validation stops at the first error. Nothing is shared between runs: each call
// owns its lexer, nesting stack, and logger.
auto validate(Source &source, const Options &options, Handler *handler = nullptr) -> Result;

// Check that `input` is a single JSON value
auto validate(const Slice &input, const Options &options, Handler *handler = nullptr) -> Result;

} // namespace jsonvfy

#endif // JSONVFY_VALIDATOR_H
