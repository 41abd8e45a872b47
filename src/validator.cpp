// Copyright (c) 2023, The jsonvfy Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.

#include "jsonvfy/validator.h"
#include "jsonvfy/lexer.h"
#include "jsonvfy/source.h"
#include "logging.h"
#include "utils.h"
#include <memory>
#include <spdlog/fmt/fmt.h>
#include <string>
#include <unordered_set>
#include <vector>

namespace jsonvfy
{

namespace
{

auto describe_token(const Token &token) -> std::string
{
    switch (token.type) {
        case kTokenString:
            return "string";
        case kTokenNumber:
            return "number";
        case kTokenTrue:
            return "'true'";
        case kTokenFalse:
            return "'false'";
        case kTokenNull:
            return "'null'";
        case kTokenObjectOpen:
            return "'{'";
        case kTokenObjectClose:
            return "'}'";
        case kTokenArrayOpen:
            return "'['";
        case kTokenArrayClose:
            return "']'";
        case kTokenColon:
            return "':'";
        case kTokenComma:
            return "','";
        default:
            return "end of input";
    }
}

class Validator
{
public:
    // This validator is a simple state machine with states defined by this enumerator. Nested
    // structure types are tracked using an explicit stack of frames. The general idea is from
    // @Tencent/rapidjson.
    enum State {
        kStateAccept,
        kStateStop,
        kStateError,
        kStateBegin,
        kAB, // Array begin
        kA1, // Array element
        kAx, // Array element separator
        kAE, // Array end
        kOB, // Object begin
        kO1, // Object key
        kOx, // Object key separator
        kO2, // Object value
        kOy, // Object value separator
        kOE, // Object end
        kStateEnd, // Root value has been read
        kStateCount
    };

    explicit Validator(Source &source, const Options &options, Handler *handler, LogPtr log)
        : m_log(std::move(log)),
          m_lex(source, options),
          m_handler(handler),
          m_max_depth(options.max_nesting_depth),
          m_reject_duplicates(options.reject_duplicate_keys)
    {
        m_log->debug("validating (max_nesting_depth={}, reject_duplicate_keys={}, "
                     "allow_nan_infinity={}, read_buffer_size={})",
                     options.max_nesting_depth, options.reject_duplicate_keys,
                     options.allow_nan_infinity, options.read_buffer_size);
    }

    auto run() -> Result
    {
        Token token;
        State src = kStateBegin;
        for (;;) {
            auto r = m_lex.next_token(token);
            if (!r) {
                if (src == kStateEnd && r.kind == ErrorKind::kUnexpectedToken) {
                    // Garbage after the root value, e.g. "[] x".
                    r.kind = ErrorKind::kTrailingContent;
                    r.message = "unexpected trailing content: " + r.message;
                }
                return finish(std::move(r));
            }
            const auto dst = predict(src, token.type);
            src = transit(src, token, dst);
            if (src == kStateAccept) {
                m_log->debug("accepted {} bytes", m_lex.position().offset);
                return {};
            } else if (src == kStateError || src == kStateStop) {
                return finish(std::move(m_result));
            }
        }
    }

private:
    struct Frame {
        bool is_object = false;

        // Decoded keys seen so far in this object. Only used if duplicate keys are rejected.
        std::unordered_set<std::string> keys;
    };

    auto finish(Result result) -> Result
    {
        m_log->debug("rejected ({}) at {}:{} (offset {}): {}",
                     error_kind_name(result.kind),
                     result.position.line,
                     result.position.column,
                     result.position.offset,
                     result.message);
        return result;
    }

    auto fail(ErrorKind kind, const Position &pos, std::string message) -> State
    {
        m_result = {kind, pos, std::move(message)};
        return kStateError;
    }

    // Predict the next state based on the current state and a token read by the lexer
    [[nodiscard]] static auto predict(State src, TokenType token) -> State
    {
        // kStateBegin is the source: no transition leads back into it. Rows marked "sink" have
        // no way out, except that kStateEnd accepts the end of input. "push" states enter a
        // nested object or array, and "pop" states leave one. Pop states are sinks here, since
        // the state that follows depends on the kind of container on top of the stack. It is
        // the responsibility of transit() to move to either kA1 or kO2 (or kStateEnd, if the
        // stack became empty), treating the closed container as a value in its parent.
        static constexpr State kTransitions[kStateCount][kTokenCount] = {
#define acc kStateAccept
#define end kStateEnd
#define ex_ kStateError
            // Token = "s"  123  tru  fal  nul   {    }    [    ]    :    ,   eoi
            /* acc */ {ex_, ex_, ex_, ex_, ex_, ex_, ex_, ex_, ex_, ex_, ex_, ex_}, // sink
            /* stp */ {ex_, ex_, ex_, ex_, ex_, ex_, ex_, ex_, ex_, ex_, ex_, ex_}, // sink
            /* ex_ */ {ex_, ex_, ex_, ex_, ex_, ex_, ex_, ex_, ex_, ex_, ex_, ex_}, // sink
            /* beg */ {end, end, end, end, end, kOB, ex_, kAB, ex_, ex_, ex_, ex_}, // source
            /* kAB */ {kA1, kA1, kA1, kA1, kA1, kOB, ex_, kAB, kAE, ex_, ex_, ex_}, // push
            /* kA1 */ {ex_, ex_, ex_, ex_, ex_, ex_, ex_, ex_, kAE, ex_, kAx, ex_},
            /* kAx */ {kA1, kA1, kA1, kA1, kA1, kOB, ex_, kAB, ex_, ex_, ex_, ex_},
            /* kAE */ {ex_, ex_, ex_, ex_, ex_, ex_, ex_, ex_, ex_, ex_, ex_, ex_}, // pop
            /* kOB */ {kO1, ex_, ex_, ex_, ex_, ex_, kOE, ex_, ex_, ex_, ex_, ex_}, // push
            /* kO1 */ {ex_, ex_, ex_, ex_, ex_, ex_, ex_, ex_, ex_, kOx, ex_, ex_},
            /* kOx */ {kO2, kO2, kO2, kO2, kO2, kOB, ex_, kAB, ex_, ex_, ex_, ex_},
            /* kO2 */ {ex_, ex_, ex_, ex_, ex_, ex_, kOE, ex_, ex_, ex_, kOy, ex_},
            /* kOy */ {kO1, ex_, ex_, ex_, ex_, ex_, ex_, ex_, ex_, ex_, ex_, ex_},
            /* kOE */ {ex_, ex_, ex_, ex_, ex_, ex_, ex_, ex_, ex_, ex_, ex_, ex_}, // pop
            /* end */ {ex_, ex_, ex_, ex_, ex_, ex_, ex_, ex_, ex_, ex_, ex_, acc},
#undef acc
#undef end
#undef ex_
        };
        return kTransitions[src][token];
    }

    // Explain why `token` cannot follow state `src`
    auto diagnose(State src, const Token &token) -> State
    {
        static constexpr const char *kExpected[kStateCount] = {
            "",
            "",
            "",
            "a value",
            "a value or ']'",
            "',' or ']'",
            "a value",
            "",
            "a string key or '}'",
            "':'",
            "a value",
            "',' or '}'",
            "a string key",
            "",
            "end of input",
        };
        const auto *expected = kExpected[src];
        const auto found = describe_token(token);
        if (token.type == kTokenEndOfInput) {
            return fail(ErrorKind::kUnexpectedEndOfInput, token.position,
                        fmt::format("unexpected end of input: expected {}", expected));
        } else if (src == kStateEnd && (token.type == kTokenObjectClose ||
                                        token.type == kTokenArrayClose)) {
            // A closer with nothing left to close is an unbalanced bracket, not a second value.
            return fail(ErrorKind::kUnexpectedToken, token.position,
                        fmt::format("unmatched {}", found));
        } else if (src == kStateEnd) {
            return fail(ErrorKind::kTrailingContent, token.position,
                        fmt::format("unexpected trailing content: found {} after the document", found));
        } else if ((src == kAx && token.type == kTokenArrayClose) ||
                   (src == kOy && token.type == kTokenObjectClose)) {
            return fail(ErrorKind::kTrailingComma, token.position,
                        fmt::format("trailing comma before {}", found));
        }
        return fail(ErrorKind::kUnexpectedToken, token.position,
                    fmt::format("expected {} but found {}", expected, found));
    }

    // Transition into the next state
    [[nodiscard]] auto transit(State src, const Token &token, State dst) -> State
    {
        switch (dst) {
            case kStateEnd:
            case kA1:
            case kO2:
                // Read a root value, an array element, or an object member value.
                break;
            case kO1:
                // Special case for reading an object key.
                if (m_reject_duplicates &&
                    !m_stack.back().keys.insert(token.text.to_string()).second) {
                    return fail(ErrorKind::kDuplicateKey, token.position,
                                fmt::format("duplicate key \"{}\"", token.text.to_string()));
                }
                break;
            case kAx:
            case kOx:
            case kOy:
                // Separators return immediately without dispatching an event.
                return dst;
            case kAB:
            case kOB:
                // Opened a new array or object. Check the depth before pushing, so that the
                // stack never grows past the limit.
                if (m_stack.size() >= m_max_depth) {
                    return fail(ErrorKind::kMaxDepthExceeded, token.position,
                                fmt::format("exceeded maximum nesting depth of {}", m_max_depth));
                }
                m_stack.emplace_back();
                m_stack.back().is_object = dst == kOB;
                m_log->trace("push {} (depth {})", dst == kOB ? "object" : "array", m_stack.size());
                break;
            case kAE:
            case kOE:
                // Closed an array or object. We can only get to this state if we have pushed
                // onto the stack at least once.
                JSONVFY_EXPECT_FALSE(m_stack.empty());
                m_stack.pop_back();
                m_log->trace("pop {} (depth {})", dst == kOE ? "object" : "array", m_stack.size());
                if (m_stack.empty()) {
                    dst = kStateEnd; // Must be finished
                } else {
                    dst = m_stack.back().is_object ? kO2 : kA1; // After value
                }
                break;
            case kStateError:
                return diagnose(src, token);
            default: // kStateAccept
                return dst;
        }
        if (m_handler && !dispatch(token, dst == kO1)) {
            m_result = {ErrorKind::kAborted, token.position, "stopped by handler"};
            return kStateStop;
        }
        return dst;
    }

    [[nodiscard]] auto dispatch(const Token &token, bool is_key) -> bool
    {
        if (is_key) {
            return m_handler->accept_key(token.text);
        }
        switch (token.type) {
            case kTokenString:
                return m_handler->accept_string(token.text);
            case kTokenNumber:
                return m_handler->accept_number(token.text);
            case kTokenTrue:
                return m_handler->accept_boolean(true);
            case kTokenFalse:
                return m_handler->accept_boolean(false);
            case kTokenNull:
                return m_handler->accept_null();
            case kTokenObjectOpen:
                return m_handler->begin_object();
            case kTokenObjectClose:
                return m_handler->end_object();
            case kTokenArrayOpen:
                return m_handler->begin_array();
            default:
                JSONVFY_EXPECT_EQ(token.type, kTokenArrayClose);
                return m_handler->end_array();
        }
    }

    Result m_result;
    std::vector<Frame> m_stack;
    LogPtr m_log;
    Lexer m_lex;
    Handler *const m_handler;
    const size_t m_max_depth;
    const bool m_reject_duplicates;
};

} // namespace

Handler::Handler() = default;

Handler::~Handler() = default;

auto validate(Source &source, const Options &options, Handler *handler) -> Result
{
    // A zero read size falls back to the default, but anything else check_options()
    // rejects is reported before any input is read.
    auto checked = options;
    if (checked.read_buffer_size == 0) {
        checked.read_buffer_size = JSONVFY_DEFAULT_READ_BUFFER_SIZE;
    }
    auto s = check_options(checked);
    if (!s.is_ok()) {
        return {ErrorKind::kIoError, Position(), s.message()};
    }
    LogSink sink;
    s = create_sink(options, sink);
    if (!s.is_ok()) {
        return {ErrorKind::kIoError, Position(), s.message()};
    }
    return Validator(source, options, handler, create_logger(sink, "validator"))
        .run();
}

auto validate(const Slice &input, const Options &options, Handler *handler) -> Result
{
    Source *source;
    auto s = new_buffer_source(input, source);
    if (!s.is_ok()) {
        return {ErrorKind::kIoError, Position(), s.message()};
    }
    std::unique_ptr<Source> owner(source);
    return validate(*source, options, handler);
}

} // namespace jsonvfy
