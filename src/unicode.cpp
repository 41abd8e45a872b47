// Copyright (c) 2023, The jsonvfy Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.

#include "unicode.h"
#include "utils.h"

namespace jsonvfy
{

auto utf8_sequence_length(uint8_t lead) -> size_t
{
    if (lead < 0x80) {
        return 1;
    } else if (lead < 0xC2) {
        // Continuation byte, or an overlong 2-byte lead (C0, C1).
        return 0;
    } else if (lead < 0xE0) {
        return 2;
    } else if (lead < 0xF0) {
        return 3;
    } else if (lead < 0xF5) {
        return 4;
    }
    return 0;
}

auto utf8_is_valid_second(uint8_t lead, uint8_t byte) -> bool
{
    switch (lead) {
        case 0xE0:
            return 0xA0 <= byte && byte <= 0xBF;
        case 0xED:
            return 0x80 <= byte && byte <= 0x9F;
        case 0xF0:
            return 0x90 <= byte && byte <= 0xBF;
        case 0xF4:
            return 0x80 <= byte && byte <= 0x8F;
        default:
            return utf8_is_continuation(byte);
    }
}

auto encode_utf8(uint32_t codepoint, char *out) -> size_t
{
    // Modified from @Tencent/rapidjson.
    if (codepoint <= 0x7F) {
        out[0] = static_cast<char>(codepoint);
        return 1;
    } else if (codepoint <= 0x7FF) {
        out[0] = static_cast<char>(0xC0 | ((codepoint >> 6) & 0xFF));
        out[1] = static_cast<char>(0x80 | ((codepoint & 0x3F)));
        return 2;
    } else if (codepoint <= 0xFFFF) {
        out[0] = static_cast<char>(0xE0 | ((codepoint >> 12) & 0xFF));
        out[1] = static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out[2] = static_cast<char>(0x80 | (codepoint & 0x3F));
        return 3;
    }
    JSONVFY_EXPECT_LE(codepoint, kMaxCodepoint);
    out[0] = static_cast<char>(0xF0 | ((codepoint >> 18) & 0xFF));
    out[1] = static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
    out[2] = static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
    out[3] = static_cast<char>(0x80 | (codepoint & 0x3F));
    return 4;
}

} // namespace jsonvfy
