// Copyright (c) 2023, The jsonvfy Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.

#include "jsonvfy/result.h"
#include "jsonvfy/slice.h"
#include "jsonvfy/status.h"
#include "utils.h"
#include <spdlog/fmt/fmt.h>

namespace jsonvfy
{

auto Result::to_string() const -> std::string
{
    if (kind == ErrorKind::kNone) {
        return "valid";
    } else if (kind == ErrorKind::kIoError) {
        return message;
    }
    return fmt::format("{}:{}: {}", position.line, position.column, message);
}

auto error_kind_name(ErrorKind kind) -> const char *
{
    static constexpr const char *kNames[] = {
        "none",
        "invalid_utf8",
        "unterminated_string",
        "invalid_escape",
        "invalid_control_character",
        "invalid_unicode_escape",
        "invalid_number_format",
        "unexpected_token",
        "duplicate_key",
        "trailing_comma",
        "trailing_content",
        "max_depth_exceeded",
        "unexpected_end_of_input",
        "io_error",
        "aborted",
    };
    const auto index = static_cast<size_t>(kind);
    JSONVFY_EXPECT_LT(index, ARRAY_SIZE(kNames));
    return kNames[index];
}

auto to_status(const Result &result) -> Status
{
    switch (result.kind) {
        case ErrorKind::kNone:
            return Status::ok();
        case ErrorKind::kIoError:
            return Status::io_error(result.message);
        case ErrorKind::kAborted:
            return Status::aborted(result.message);
        default:
            return Status::corruption(result.to_string());
    }
}

} // namespace jsonvfy
