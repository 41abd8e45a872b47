// Copyright (c) 2023, The jsonvfy Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.

#include "jsonvfy/options.h"
#include "jsonvfy/slice.h"
#include "jsonvfy/status.h"

namespace jsonvfy
{

auto check_options(const Options &options) -> Status
{
    if (options.read_buffer_size == 0) {
        return Status::invalid_argument("read buffer size must be positive");
    }
    if (options.log_level < kLogTrace || options.log_level > kLogOff) {
        return Status::invalid_argument("unrecognized log level");
    }
    if (options.log_target < kLogStderr || options.log_target > kLogFile) {
        return Status::invalid_argument("unrecognized log target");
    }
    if (options.log_level != kLogOff && options.log_target == kLogFile &&
        (options.log_filename == nullptr || *options.log_filename == '\0')) {
        return Status::invalid_argument("log file name is missing");
    }
    return Status::ok();
}

} // namespace jsonvfy
