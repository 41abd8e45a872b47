// Copyright (c) 2023, The jsonvfy Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.

#include "jsonvfy/status.h"
#include "jsonvfy/slice.h"
#include "utils.h"
#include <cstdint>
#include <utility>

namespace jsonvfy
{

namespace
{

// Statuses without a message pack their code and subcode into the state pointer
// value. The least-significant bit is set to distinguish them from heap states,
// which are always at least 2-byte aligned.
//
// Heap status layout:
//      Offset | Size | Field
//     --------|------|----------
//      0      | 1    | Code
//      1      | 1    | SubCode
//      2      | N    | Message
//      2 + N  | 1    | '\0'
constexpr size_t kHeapHeaderSize = 2;

auto make_inline_state(Status::Code code, Status::SubCode subc) -> char *
{
    JSONVFY_EXPECT_GT(code, Status::kOK);
    JSONVFY_EXPECT_LT(code, Status::kMaxCode);
    JSONVFY_EXPECT_LT(subc, Status::kMaxSubCode);

    uintptr_t state = 1;
    state |= static_cast<uintptr_t>(code) << 1;
    state |= static_cast<uintptr_t>(subc) << 8;
    return reinterpret_cast<char *>(state);
}

auto is_inline(const char *state) -> bool
{
    return reinterpret_cast<uintptr_t>(state) & 1;
}

auto is_heap(const char *state) -> bool
{
    return state && !is_inline(state);
}

auto make_heap_state(Status::Code code, Status::SubCode subc, const Slice &msg) -> char *
{
    auto *state = new char[kHeapHeaderSize + msg.size() + 1];
    state[0] = code;
    state[1] = subc;
    if (!msg.is_empty()) {
        std::memcpy(state + kHeapHeaderSize, msg.data(), msg.size());
    }
    state[kHeapHeaderSize + msg.size()] = '\0';
    return state;
}

auto copy_state(const char *state) -> char *
{
    if (!is_heap(state)) {
        return const_cast<char *>(state);
    }
    const Slice msg(state + kHeapHeaderSize);
    return make_heap_state(static_cast<Status::Code>(state[0]),
                           static_cast<Status::SubCode>(state[1]), msg);
}

auto free_state(char *state) -> void
{
    if (is_heap(state)) {
        delete[] state;
    }
}

} // namespace

Status::Status(Code code, SubCode subc)
    : m_state(make_inline_state(code, subc))
{
}

Status::Status(Code code, const Slice &msg)
    : m_state(make_heap_state(code, kNone, msg))
{
}

Status::~Status()
{
    free_state(m_state);
}

Status::Status(const Status &rhs)
    : m_state(copy_state(rhs.m_state))
{
}

auto Status::operator=(const Status &rhs) -> Status &
{
    if (&rhs != this) {
        auto *state = copy_state(rhs.m_state);
        free_state(m_state);
        m_state = state;
    }
    return *this;
}

Status::Status(Status &&rhs) noexcept
    : m_state(std::exchange(rhs.m_state, nullptr))
{
}

auto Status::operator=(Status &&rhs) noexcept -> Status &
{
    std::swap(m_state, rhs.m_state);
    return *this;
}

auto Status::invalid_argument(const Slice &msg) -> Status
{
    return Status(kInvalidArgument, msg);
}

auto Status::io_error(const Slice &msg) -> Status
{
    return Status(kIOError, msg);
}

auto Status::corruption(const Slice &msg) -> Status
{
    return Status(kCorruption, msg);
}

auto Status::not_found(const Slice &msg) -> Status
{
    return Status(kNotFound, msg);
}

auto Status::aborted(const Slice &msg) -> Status
{
    return Status(kAborted, msg);
}

auto Status::code() const -> Code
{
    if (is_ok()) {
        return kOK;
    } else if (is_inline(m_state)) {
        return static_cast<Code>((reinterpret_cast<uintptr_t>(m_state) & 0xFE) >> 1);
    }
    return static_cast<Code>(m_state[0]);
}

auto Status::subcode() const -> SubCode
{
    if (is_ok()) {
        return kNone;
    } else if (is_inline(m_state)) {
        return static_cast<SubCode>((reinterpret_cast<uintptr_t>(m_state) & 0xFF00) >> 8);
    }
    return static_cast<SubCode>(m_state[1]);
}

auto Status::message() const -> const char *
{
    if (is_heap(m_state)) {
        return m_state + kHeapHeaderSize;
    }
    static constexpr const char *kCodeMessages[kMaxCode] = {
        "OK",
        "invalid argument",
        "I/O error",
        "corruption",
        "not found",
        "aborted",
    };
    if (subcode() == kNoMemory) {
        return "out of memory";
    }
    return kCodeMessages[code()];
}

} // namespace jsonvfy
