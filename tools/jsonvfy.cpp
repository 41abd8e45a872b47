// Copyright (c) 2023, The jsonvfy Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.

#include "jsonvfy/lexer.h"
#include "jsonvfy/source.h"
#include "jsonvfy/validator.h"
#include "logging.h"
#include <cerrno>
#include <cstdlib>
#include <memory>
#include <spdlog/fmt/fmt.h>
#include <unistd.h>

namespace
{

using namespace jsonvfy;

enum ExitCode {
    kExitValid = 0,
    kExitInvalid = 1,
    kExitUsage = 2,
    kExitIoError = 3,
};

struct Arguments {
    Options options;
    const char *filename = "-";
    bool tokenize = false;
    bool quiet = false;
    bool machine = false;
    bool verbose = false;
    bool help = false;
};

auto show_usage(std::FILE *fp) -> void
{
    fmt::print(fp,
               "usage: jsonvfy [options] [FILE]\n"
               "Check that FILE (or standard input, if FILE is missing or \"-\") is valid JSON.\n"
               "\n"
               "options:\n"
               "  -t, --tokenize        print the tokens of the input instead of validating it\n"
               "  -d, --duplicate-keys  reject objects that contain the same key more than once\n"
               "  -n, --nan-infinity    accept NaN, Infinity, and -Infinity as numbers\n"
               "  -m, --max-depth N     maximum nesting depth of arrays and objects (default {})\n"
               "  -f, --format FORMAT   output format: \"human\" (default) or \"machine\"\n"
               "  -q, --quiet           print nothing if the input is valid\n"
               "  -v, --verbose         write debug messages to standard error\n"
               "  -h, --help            show this message and exit\n"
               "\n"
               "exit status: 0 if valid, 1 if invalid, 2 on a usage error, 3 on an I/O error\n",
               JSONVFY_DEFAULT_MAX_DEPTH);
}

auto parse_depth(const char *text, size_t &out) -> Status
{
    char *end;
    errno = 0;
    const auto value = std::strtoull(text, &end, 10);
    if (*text < '0' || *text > '9' || *end != '\0' || errno == ERANGE) {
        return Status::invalid_argument(fmt::format("invalid nesting depth '{}'", text));
    }
    out = static_cast<size_t>(value);
    return Status::ok();
}

auto parse_format(const char *text, bool &machine) -> Status
{
    const Slice format(text);
    if (format == "human") {
        machine = false;
    } else if (format == "machine") {
        machine = true;
    } else {
        return Status::invalid_argument(fmt::format("unrecognized format '{}'", text));
    }
    return Status::ok();
}

auto parse_arguments(int argc, char *argv[], Arguments &args) -> Status
{
    auto have_file = false;
    auto end_of_options = false;
    for (int i = 1; i < argc; ++i) {
        Slice arg(argv[i]);
        // Options that take a value accept it as the next argument, or after an '='.
        const auto take_value = [&](const Slice &name, const char *&out) {
            if (arg == name) {
                if (i + 1 >= argc) {
                    return Status::invalid_argument(
                        fmt::format("option '{}' requires a value", argv[i]));
                }
                out = argv[++i];
            } else {
                // arg is still null-terminated.
                out = arg.advance(name.size() + 1).data();
            }
            return Status::ok();
        };

        const char *value;
        auto s = Status::ok();
        if (end_of_options || arg == "-" || !arg.starts_with("-")) {
            if (have_file) {
                return Status::invalid_argument("more than one input file was given");
            }
            args.filename = argv[i];
            have_file = true;
        } else if (arg == "--") {
            end_of_options = true;
        } else if (arg == "-t" || arg == "--tokenize") {
            args.tokenize = true;
        } else if (arg == "-d" || arg == "--duplicate-keys") {
            args.options.reject_duplicate_keys = true;
        } else if (arg == "-n" || arg == "--nan-infinity") {
            args.options.allow_nan_infinity = true;
        } else if (arg == "-q" || arg == "--quiet") {
            args.quiet = true;
        } else if (arg == "-v" || arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "-h" || arg == "--help") {
            args.help = true;
        } else if (arg == "-m" || arg == "--max-depth" || arg.starts_with("--max-depth=")) {
            s = take_value(arg == "-m" ? "-m" : "--max-depth", value);
            if (s.is_ok()) {
                s = parse_depth(value, args.options.max_nesting_depth);
            }
        } else if (arg == "-f" || arg == "--format" || arg.starts_with("--format=")) {
            s = take_value(arg == "-f" ? "-f" : "--format", value);
            if (s.is_ok()) {
                s = parse_format(value, args.machine);
            }
        } else {
            s = Status::invalid_argument(fmt::format("unrecognized option '{}'", argv[i]));
        }
        if (!s.is_ok()) {
            return s;
        }
    }
    if (args.verbose) {
        args.options.log_level = kLogDebug;
        args.options.log_target = kLogStderrColor;
    }
    return check_options(args.options);
}

// Make a string or number token printable on a single line
auto escape_text(const Slice &text) -> std::string
{
    std::string out;
    for (size_t i = 0; i < text.size(); ++i) {
        const auto c = static_cast<unsigned char>(text[i]);
        if (c == '"' || c == '\\') {
            out.push_back('\\');
            out.push_back(static_cast<char>(c));
        } else if (c < 0x20 || c == 0x7F) {
            out.append(fmt::format("\\u{:04X}", c));
        } else {
            out.push_back(static_cast<char>(c));
        }
    }
    return out;
}

class Program
{
public:
    explicit Program(const Arguments &args, LogPtr log)
        : m_args(&args),
          m_log(std::move(log)),
          m_name(Slice(args.filename) == "-" ? "<stdin>" : args.filename)
    {
    }

    auto run() -> int
    {
        Source *source;
        auto s = Slice(m_args->filename) == "-"
                     ? new_fd_source(STDIN_FILENO, source)
                     : new_file_source(m_args->filename, source);
        if (!s.is_ok()) {
            m_log->error("cannot open {}: {}", m_name, s.message());
            return kExitIoError;
        }
        std::unique_ptr<Source> owner(source);
        m_log->debug("reading from {}", m_name);
        return m_args->tokenize ? tokenize(*source)
                                : report(validate(*source, m_args->options));
    }

private:
    auto tokenize(Source &source) -> int
    {
        Lexer lexer(source, m_args->options);
        Token token;
        for (;;) {
            auto r = lexer.next_token(token);
            if (!r) {
                return report(r);
            }
            const auto &pos = token.position;
            const auto *name = token_type_name(token.type);
            if (token.type == kTokenString) {
                fmt::print("{}:{} {} \"{}\"\n", pos.line, pos.column, name, escape_text(token.text));
            } else if (token.type == kTokenNumber) {
                fmt::print("{}:{} {} {}\n", pos.line, pos.column, name, token.text.to_string());
            } else {
                fmt::print("{}:{} {}\n", pos.line, pos.column, name);
            }
            if (token.type == kTokenEndOfInput) {
                return kExitValid;
            }
        }
    }

    auto report(const Result &r) -> int
    {
        if (r.kind == ErrorKind::kIoError) {
            m_log->error("cannot read {}: {}", m_name, r.message);
            return kExitIoError;
        }
        if (m_args->machine) {
            if (r) {
                fmt::print("valid\n");
            } else {
                fmt::print("invalid {} {} {} {}\n", error_kind_name(r.kind),
                           r.position.offset, r.position.line, r.position.column);
            }
        } else if (!r) {
            fmt::print(stderr, "{}:{}\n", m_name, r.to_string());
        } else if (!m_args->quiet && !m_args->tokenize) {
            fmt::print("{}: valid\n", m_name);
        }
        return r ? kExitValid : kExitInvalid;
    }

    const Arguments *m_args;
    LogPtr m_log;
    const char *m_name;
};

} // namespace

auto main(int argc, char *argv[]) -> int
{
    using namespace jsonvfy;

    Arguments args;
    const auto s = parse_arguments(argc, argv, args);
    if (!s.is_ok()) {
        fmt::print(stderr, "jsonvfy: {}\n", s.message());
        show_usage(stderr);
        return kExitUsage;
    }
    if (args.help) {
        show_usage(stdout);
        return kExitValid;
    }

    // Problems with the input itself are always reported. Debug messages only with -v.
    Options log_options;
    log_options.log_level = args.verbose ? kLogDebug : kLogError;
    log_options.log_target = kLogStderrColor;
    LogSink sink;
    if (!create_sink(log_options, sink).is_ok()) {
        return kExitIoError;
    }
    auto log = create_logger(sink, "jsonvfy");
    log->set_pattern("%n: %^%l%$: %v");

    return Program(args, std::move(log)).run();
}
