// Copyright (c) 2023, The jsonvfy Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.

#include "logging.h"
#include "jsonvfy/slice.h"
#include "utils.h"
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>

namespace jsonvfy
{

auto create_sink(const Options &options, LogSink &out) -> Status
{
    spdlog::level::level_enum level;
    switch (options.log_level) {
        case kLogTrace:
            level = spdlog::level::trace;
            break;
        case kLogDebug:
            level = spdlog::level::debug;
            break;
        case kLogInfo:
            level = spdlog::level::info;
            break;
        case kLogWarn:
            level = spdlog::level::warn;
            break;
        case kLogError:
            level = spdlog::level::err;
            break;
        default:
            out = std::make_shared<spdlog::sinks::null_sink_mt>();
            out->set_level(spdlog::level::off);
            return Status::ok();
    }

    switch (options.log_target) {
        case kLogStdout:
            out = std::make_shared<spdlog::sinks::stdout_sink_mt>();
            break;
        case kLogStderr:
            out = std::make_shared<spdlog::sinks::stderr_sink_mt>();
            break;
        case kLogStdoutColor:
            out = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            break;
        case kLogStderrColor:
            out = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            break;
        default:
            JSONVFY_EXPECT_EQ(options.log_target, kLogFile);
            if (options.log_filename == nullptr || *options.log_filename == '\0') {
                return Status::invalid_argument("log file name is missing");
            }
            try {
                out = std::make_shared<spdlog::sinks::basic_file_sink_mt>(options.log_filename);
            } catch (const spdlog::spdlog_ex &ex) {
                out.reset();
                return Status::io_error(ex.what());
            }
    }
    out->set_level(level);
    return Status::ok();
}

auto create_logger(LogSink sink, const std::string &name) -> LogPtr
{
    JSONVFY_EXPECT_TRUE(sink);
    JSONVFY_EXPECT_FALSE(name.empty());
    const auto level = sink->level();
    auto log = std::make_shared<Log>(name, std::move(sink));
    // Messages below the sink level are dropped before they are formatted.
    log->set_level(level);
    return log;
}

} // namespace jsonvfy
