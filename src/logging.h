// Copyright (c) 2023, The jsonvfy Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.

#ifndef JSONVFY_LOGGING_H
#define JSONVFY_LOGGING_H

#include "jsonvfy/options.h"
#include "jsonvfy/status.h"
#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace jsonvfy
{

using Log = spdlog::logger;
using LogPtr = std::shared_ptr<spdlog::logger>;
using LogSink = spdlog::sink_ptr;

// Create a sink described by the log_* fields of `options`
// If logging is disabled, the sink discards everything. Sinks are thread-safe, so a
// single sink may be shared between concurrent validation runs.
auto create_sink(const Options &options, LogSink &out) -> Status;

// Create a logger that writes to `sink`
// The logger is not added to spdlog's global registry.
auto create_logger(LogSink sink, const std::string &name) -> LogPtr;

} // namespace jsonvfy

#endif // JSONVFY_LOGGING_H
