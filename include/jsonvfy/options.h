// Copyright (c) 2023, The jsonvfy Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.

#ifndef JSONVFY_OPTIONS_H
#define JSONVFY_OPTIONS_H

#include <cstddef>

#ifndef JSONVFY_DEFAULT_MAX_DEPTH
#define JSONVFY_DEFAULT_MAX_DEPTH 128U
#endif // JSONVFY_DEFAULT_MAX_DEPTH

#ifndef JSONVFY_DEFAULT_READ_BUFFER_SIZE
#define JSONVFY_DEFAULT_READ_BUFFER_SIZE 4'096U
#endif // JSONVFY_DEFAULT_READ_BUFFER_SIZE

namespace jsonvfy
{

// jsonvfy/status.h
class Status;

enum LogLevel {
    kLogTrace,
    kLogDebug,
    kLogInfo,
    kLogWarn,
    kLogError,
    kLogOff,
};

enum LogTarget {
    kLogStderr,
    kLogStdout,
    kLogStderrColor,
    kLogStdoutColor,
    kLogFile,
};

// Options to control the behavior of a single validation run (passed to validate()
// and to the Lexer constructor)
// Nothing here is process-wide: independent runs with different options may execute
// concurrently.
struct Options final {
    // Maximum number of nested arrays and objects. A document nested exactly this deep
    // is accepted, one level deeper is rejected with ErrorKind::kMaxDepthExceeded.
    size_t max_nesting_depth = JSONVFY_DEFAULT_MAX_DEPTH;

    // If true, reject an object that contains the same key more than once. Keys are
    // compared after escape sequences are decoded.
    bool reject_duplicate_keys = false;

    // If true, accept the non-standard literals "NaN", "Infinity" and "-Infinity"
    // as numbers.
    bool allow_nan_infinity = false;

    // Number of bytes requested from the byte source at a time.
    size_t read_buffer_size = JSONVFY_DEFAULT_READ_BUFFER_SIZE;

    // Info log configuration. Logging is disabled by default.
    LogLevel log_level = kLogOff;
    LogTarget log_target = kLogStderr;

    // File to append log messages to, if log_target is kLogFile.
    const char *log_filename = "";
};

// Return an OK status if `options` can be used for a validation run, an
// invalid argument status otherwise
auto check_options(const Options &options) -> Status;

} // namespace jsonvfy

#endif // JSONVFY_OPTIONS_H
