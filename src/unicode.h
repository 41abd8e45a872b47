// Copyright (c) 2023, The jsonvfy Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.

#ifndef JSONVFY_UNICODE_H
#define JSONVFY_UNICODE_H

#include <cstddef>
#include <cstdint>

namespace jsonvfy
{

static constexpr uint32_t kMaxCodepoint = 0x10FFFF;

// Return the total length of the UTF-8 sequence that starts with `lead`, or 0 if
// `lead` cannot start a well-formed sequence (C0, C1, F5-FF, or a continuation byte)
auto utf8_sequence_length(uint8_t lead) -> size_t;

// Return true if `byte` may follow `lead` as the second byte of a sequence
// The range of the second byte is narrower than 80-BF after E0, ED, F0 and F4: this
// is what excludes overlong encodings, encoded surrogates and codepoints above
// U+10FFFF (RFC 3629, section 4).
auto utf8_is_valid_second(uint8_t lead, uint8_t byte) -> bool;

inline auto utf8_is_continuation(uint8_t byte) -> bool
{
    return (byte & 0xC0) == 0x80;
}

inline auto is_high_surrogate(uint32_t codepoint) -> bool
{
    return 0xD800 <= codepoint && codepoint <= 0xDBFF;
}

inline auto is_low_surrogate(uint32_t codepoint) -> bool
{
    return 0xDC00 <= codepoint && codepoint <= 0xDFFF;
}

inline auto combine_surrogates(uint32_t high, uint32_t low) -> uint32_t
{
    return (((high - 0xD800) << 10) | (low - 0xDC00)) + 0x10000;
}

// Write the UTF-8 encoding of `codepoint` to `out`, which must have room for 4 bytes
// Returns the number of bytes written.
auto encode_utf8(uint32_t codepoint, char *out) -> size_t;

} // namespace jsonvfy

#endif // JSONVFY_UNICODE_H
