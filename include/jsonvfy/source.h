// Copyright (c) 2023, The jsonvfy Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.

#ifndef JSONVFY_SOURCE_H
#define JSONVFY_SOURCE_H

#include "slice.h"
#include "status.h"

namespace jsonvfy
{

// Sequential supplier of the bytes being validated
// A source is read from front to back exactly once. It never seeks, and the lexer
// never asks for bytes it has already been given.
class Source
{
public:
    explicit Source();
    virtual ~Source();

    Source(Source &) = delete;
    void operator=(Source &) = delete;

    // Read at most `size` bytes into `scratch`, which must point to at least `size`
    // bytes of available memory.
    //
    // On success, sets "*out" to point to the data that was read. An empty slice
    // means that the end of the input has been reached. A read error is reported
    // with a non-OK status, after which the source should not be used again.
    virtual auto read(size_t size, char *scratch, Slice *out) -> Status = 0;
};

// Open the file named `filename` for reading
// On success, stores a heap-allocated source in `out`, which must be deleted by
// the caller when it is no longer needed. Returns a "not found" status if the file
// does not exist.
auto new_file_source(const char *filename, Source *&out) -> Status;

// Create a source that reads from an open file descriptor, e.g. STDIN_FILENO
// The descriptor is not closed when the source is destroyed.
auto new_fd_source(int fd, Source *&out) -> Status;

// Create a source that reads from an in-memory buffer
// The buffer must outlive the source.
auto new_buffer_source(const Slice &buffer, Source *&out) -> Status;

} // namespace jsonvfy

#endif // JSONVFY_SOURCE_H
