// Copyright (c) 2023, The jsonvfy Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.

#include "jsonvfy/source.h"
#include "utils.h"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace jsonvfy
{

namespace
{

[[nodiscard]] auto posix_error(int error) -> Status
{
    JSONVFY_EXPECT_NE(error, 0);
    switch (error) {
        case ENOENT:
            return Status::not_found(std::strerror(error));
        default:
            return Status::io_error(std::strerror(error));
    }
}

constexpr size_t kInterruptTimeout = 100;

[[nodiscard]] auto posix_open(const char *filename) -> int
{
    for (size_t t = 0; t < kInterruptTimeout; ++t) {
        const auto fd = ::open(filename, O_RDONLY | O_CLOEXEC);
        if (fd < 0 && errno == EINTR) {
            continue;
        }
        return fd;
    }
    return -1;
}

auto posix_close(int fd) -> int
{
    // Retrying close() after EINTR is unsafe on Linux: the descriptor has already
    // been released.
    return ::close(fd);
}

// Read whatever is available, up to `size` bytes
// Pipes and terminals may return fewer bytes than requested before the end of the
// input is reached. A short read is not an error.
[[nodiscard]] auto posix_read(int file, size_t size, char *scratch, Slice *out) -> int
{
    for (;;) {
        const auto n = ::read(file, scratch, size);
        if (n >= 0) {
            *out = Slice(scratch, static_cast<size_t>(n));
            return 0;
        } else if (errno != EINTR) {
            return -1;
        }
    }
}

class PosixSource : public Source
{
public:
    explicit PosixSource(int fd, bool owns_fd)
        : m_file(fd),
          m_owns_fd(owns_fd)
    {
    }

    ~PosixSource() override
    {
        if (m_owns_fd) {
            // Nothing useful can be done if this fails: the file was only read from.
            (void)posix_close(m_file);
        }
    }

    auto read(size_t size, char *scratch, Slice *out) -> Status override
    {
        if (posix_read(m_file, size, scratch, out)) {
            return posix_error(errno);
        }
        return Status::ok();
    }

private:
    const int m_file;
    const bool m_owns_fd;
};

class BufferSource : public Source
{
public:
    explicit BufferSource(const Slice &buffer)
        : m_rest(buffer)
    {
    }

    ~BufferSource() override = default;

    auto read(size_t size, char *, Slice *out) -> Status override
    {
        // The buffer is already in memory, so hand out pieces of it directly.
        const auto n = size < m_rest.size() ? size : m_rest.size();
        *out = m_rest.range(0, n);
        m_rest.advance(n);
        return Status::ok();
    }

private:
    Slice m_rest;
};

} // namespace

Source::Source() = default;

Source::~Source() = default;

auto new_file_source(const char *filename, Source *&out) -> Status
{
    out = nullptr;
    const auto fd = posix_open(filename);
    if (fd < 0) {
        return posix_error(errno);
    }
    out = new PosixSource(fd, true);
    return Status::ok();
}

auto new_fd_source(int fd, Source *&out) -> Status
{
    out = nullptr;
    if (fd < 0) {
        return Status::invalid_argument("file descriptor is negative");
    }
    out = new PosixSource(fd, false);
    return Status::ok();
}

auto new_buffer_source(const Slice &buffer, Source *&out) -> Status
{
    out = new BufferSource(buffer);
    return Status::ok();
}

} // namespace jsonvfy
