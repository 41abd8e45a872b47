// Copyright (c) 2023, The jsonvfy Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.

#ifndef JSONVFY_STATUS_H
#define JSONVFY_STATUS_H

namespace jsonvfy
{

class Slice;

// Outcome of an operation that touches the environment (opening a file, reading
// from a byte source, checking options)
// Grammar errors are not reported through Status: see Result in validator.h.
class [[nodiscard]] Status final
{
public:
    enum Code : char {
        kOK,
        kInvalidArgument,
        kIOError,
        kCorruption,
        kNotFound,
        kAborted,
        kMaxCode
    };

    enum SubCode : char {
        kNone,
        kNoMemory,
        kMaxSubCode
    };

    // Construct an OK status
    explicit Status()
        : m_state(nullptr)
    {
    }

    ~Status();

    static auto ok() -> Status
    {
        return Status();
    }

    static auto invalid_argument(SubCode subc = kNone) -> Status
    {
        return Status(kInvalidArgument, subc);
    }

    static auto io_error(SubCode subc = kNone) -> Status
    {
        return Status(kIOError, subc);
    }

    static auto corruption(SubCode subc = kNone) -> Status
    {
        return Status(kCorruption, subc);
    }

    static auto not_found(SubCode subc = kNone) -> Status
    {
        return Status(kNotFound, subc);
    }

    static auto aborted(SubCode subc = kNone) -> Status
    {
        return Status(kAborted, subc);
    }

    static auto no_memory() -> Status
    {
        return aborted(kNoMemory);
    }

    static auto invalid_argument(const Slice &msg) -> Status;
    static auto io_error(const Slice &msg) -> Status;
    static auto corruption(const Slice &msg) -> Status;
    static auto not_found(const Slice &msg) -> Status;
    static auto aborted(const Slice &msg) -> Status;

    // Return true if the status is OK, false otherwise
    [[nodiscard]] auto is_ok() const -> bool
    {
        return m_state == nullptr;
    }

    [[nodiscard]] auto is_invalid_argument() const -> bool
    {
        return code() == kInvalidArgument;
    }

    [[nodiscard]] auto is_io_error() const -> bool
    {
        return code() == kIOError;
    }

    [[nodiscard]] auto is_corruption() const -> bool
    {
        return code() == kCorruption;
    }

    [[nodiscard]] auto is_not_found() const -> bool
    {
        return code() == kNotFound;
    }

    [[nodiscard]] auto is_aborted() const -> bool
    {
        return code() == kAborted;
    }

    [[nodiscard]] auto is_no_memory() const -> bool
    {
        return is_aborted() && subcode() == kNoMemory;
    }

    [[nodiscard]] auto code() const -> Code;
    [[nodiscard]] auto subcode() const -> SubCode;

    // Return a message describing this status
    // If no message was provided when the status was created, a description of the
    // code and subcode is returned instead. The pointer is owned by the status.
    [[nodiscard]] auto message() const -> const char *;

    auto operator==(const Status &rhs) const -> bool
    {
        return code() == rhs.code();
    }
    auto operator!=(const Status &rhs) const -> bool
    {
        return !(*this == rhs);
    }

    Status(const Status &rhs);
    auto operator=(const Status &rhs) -> Status &;
    Status(Status &&rhs) noexcept;
    auto operator=(Status &&rhs) noexcept -> Status &;

private:
    explicit Status(Code code, SubCode subc);
    explicit Status(Code code, const Slice &msg);

    char *m_state;
};

} // namespace jsonvfy

#endif // JSONVFY_STATUS_H
