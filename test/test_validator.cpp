// Copyright (c) 2023, The jsonvfy Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.

#include "jsonvfy/status.h"
#include "test.h"
#include <cstdint>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace jsonvfy::test
{

static auto number_str(const std::string &lexeme) -> std::string
{
    return "<number=" + lexeme + '>';
}

class TestHandler : public Handler
{
public:
    std::vector<std::string> records;
    std::string current;
    uint32_t open_objects = 0;
    uint32_t closed_objects = 0;
    uint32_t open_arrays = 0;
    uint32_t closed_arrays = 0;

    // Return false from the callback after this many events have been accepted.
    size_t max_events = SIZE_MAX;
    size_t num_events = 0;

    explicit TestHandler() = default;
    ~TestHandler() override = default;

    [[nodiscard]] auto accept_key(const Slice &value) -> bool override
    {
        current = value.to_string() + ':';
        return keep_going();
    }

    [[nodiscard]] auto accept_string(const Slice &value) -> bool override
    {
        records.push_back(current + value.to_string());
        current.clear();
        return keep_going();
    }

    [[nodiscard]] auto accept_number(const Slice &lexeme) -> bool override
    {
        records.push_back(current + number_str(lexeme.to_string()));
        current.clear();
        return keep_going();
    }

    [[nodiscard]] auto accept_boolean(bool value) -> bool override
    {
        records.push_back(current + (value ? "<true>" : "<false>"));
        current.clear();
        return keep_going();
    }

    [[nodiscard]] auto accept_null() -> bool override
    {
        records.push_back(current + "<null>");
        current.clear();
        return keep_going();
    }

    [[nodiscard]] auto begin_object() -> bool override
    {
        ++open_objects;
        records.push_back(current + "<object>");
        current.clear();
        return keep_going();
    }

    [[nodiscard]] auto end_object() -> bool override
    {
        records.emplace_back("</object>");
        ++closed_objects;
        return keep_going();
    }

    [[nodiscard]] auto begin_array() -> bool override
    {
        ++open_arrays;
        records.push_back(current + "<array>");
        current.clear();
        return keep_going();
    }

    [[nodiscard]] auto end_array() -> bool override
    {
        records.emplace_back("</array>");
        ++closed_arrays;
        return keep_going();
    }

private:
    auto keep_going() -> bool
    {
        return ++num_events <= max_events;
    }
};

class ValidatorTests : public testing::Test
{
public:
    Options m_options;
    TestHandler m_handler;

    ~ValidatorTests() override = default;

    auto reset_test_state()
    {
        m_handler.records.clear();
        m_handler.current.clear();
        m_handler.open_objects = 0;
        m_handler.closed_objects = 0;
        m_handler.open_arrays = 0;
        m_handler.closed_arrays = 0;
        m_handler.num_events = 0;
    }

    auto run_example_test(const std::vector<std::string> &target, size_t num_objects, size_t num_arrays, const Slice &input)
    {
        reset_test_state();
        const auto r = validate(input, m_options, &m_handler);
        ASSERT_TRUE(r) << r.to_string();
        ASSERT_EQ(m_handler.records, target);
        ASSERT_EQ(m_handler.open_objects, num_objects);
        ASSERT_EQ(m_handler.closed_objects, num_objects);
        ASSERT_EQ(m_handler.open_arrays, num_arrays);
        ASSERT_EQ(m_handler.closed_arrays, num_arrays);
    }

    auto assert_ok(const Slice &input, const std::vector<std::string> &target)
    {
        reset_test_state();
        const auto r = validate(input, m_options, &m_handler);
        ASSERT_TRUE(r) << input.to_string() << ": " << r.to_string();
        ASSERT_EQ(m_handler.open_objects, m_handler.closed_objects);
        ASSERT_EQ(m_handler.open_arrays, m_handler.closed_arrays);
        ASSERT_EQ(m_handler.records, target);
    }

    auto assert_valid(const Slice &input)
    {
        const auto r = validate(input, m_options);
        ASSERT_TRUE(r) << input.to_string() << ": " << r.to_string();
    }

    auto assert_error(const Slice &input, ErrorKind kind, size_t offset)
    {
        const auto r = validate(input, m_options);
        ASSERT_EQ(r.kind, kind) << input.to_string() << ": " << r.to_string();
        ASSERT_EQ(r.position.offset, offset) << input.to_string() << ": " << r.to_string();
        ASSERT_FALSE(r.message.empty());
    }
};

// Just objects and strings
TEST_F(ValidatorTests, Example1)
{
    const std::vector<std::string> target = {
        "<object>", // Toplevel object
        "browsers:<object>",
        "firefox:<object>",
        "name:Firefox",
        "pref_url:about:config",
        "releases:<object>",
        "1:<object>",
        "release_date:2004-11-09",
        "status:retired",
        "engine:Gecko",
        "engine_version:1.7",
        "</object>",
        "</object>",
        "</object>",
        "</object>",
        "</object>"};

    // Example from https://developer.mozilla.org/en-US/docs/Web/JavaScript/Reference/Global_Objects/JSON
    // with whitespace stripped.
    run_example_test(target, 5, 0, R"({"browsers":{"firefox":{"name":"Firefox","pref_url":"about:config","releases":{"1":{"release_date":"2004-11-09","status":"retired","engine":"Gecko","engine_version":"1.7"}}}}})");

    // Original text.
    run_example_test(target, 5, 0, R"({
  "browsers": {
    "firefox": {
      "name": "Firefox",
      "pref_url": "about:config",
      "releases": {
        "1": {
          "release_date": "2004-11-09",
          "status": "retired",
          "engine": "Gecko",
          "engine_version": "1.7"
        }
      }
    }
  }
})");
}

static constexpr const char *kExample2 = R"([
{
        "id": "0001",
        "type": "donut",
        "name": "Cake",
        "ppu": 0.55,
        "batters":
                {
                        "batter":
                                [
                                        { "id": "1001", "type": "Regular" },
                                        { "id": "1002", "type": "Chocolate" },
                                        { "id": "1003", "type": "Blueberry" },
                                        { "id": "1004", "type": "Devil's Food" }
                                ]
                },
        "topping":
                [
                        { "id": "5001", "type": "None" },
                        { "id": "5002", "type": "Glazed" },
                        { "id": "5005", "type": "Sugar" },
                        { "id": "5007", "type": "Powdered Sugar" },
                        { "id": "5006", "type": "Chocolate with Sprinkles" },
                        { "id": "5003", "type": "Chocolate" },
                        { "id": "5004", "type": "Maple" }
                ]
}
])";

static const std::vector<std::string> s_example_target_2 = {
    "<array>",
    "<object>",
    "id:0001",
    "type:donut",
    "name:Cake",
    "ppu:" + number_str("0.55"),
    "batters:<object>",
    "batter:<array>",
    "<object>",
    "id:1001",
    "type:Regular",
    "</object>",
    "<object>",
    "id:1002",
    "type:Chocolate",
    "</object>",
    "<object>",
    "id:1003",
    "type:Blueberry",
    "</object>",
    "<object>",
    "id:1004",
    "type:Devil's Food",
    "</object>",
    "</array>",
    "</object>",
    "topping:<array>",
    "<object>",
    "id:5001",
    "type:None",
    "</object>",
    "<object>",
    "id:5002",
    "type:Glazed",
    "</object>",
    "<object>",
    "id:5005",
    "type:Sugar",
    "</object>",
    "<object>",
    "id:5007",
    "type:Powdered Sugar",
    "</object>",
    "<object>",
    "id:5006",
    "type:Chocolate with Sprinkles",
    "</object>",
    "<object>",
    "id:5003",
    "type:Chocolate",
    "</object>",
    "<object>",
    "id:5004",
    "type:Maple",
    "</object>",
    "</array>",
    "</object>",
    "</array>"};

TEST_F(ValidatorTests, Example2)
{
    // Example 5 from https://opensource.adobe.com/Spry/samples/data_region/JSONDataSetSample.html,
    // shortened.
    run_example_test(s_example_target_2, 13, 3, kExample2);
}

TEST_F(ValidatorTests, ValidInput)
{
    // Single value
    assert_ok("1", {number_str("1")});
    assert_ok(R"("")", {""});
    assert_ok("true", {"<true>"});
    assert_ok("false", {"<false>"});
    assert_ok("null", {"<null>"});
    assert_ok("-12.5e+3", {number_str("-12.5e+3")});
    assert_ok(" \n\t 42 \r\n ", {number_str("42")});

    // Compound value
    assert_ok(R"({})", {"<object>", "</object>"});
    assert_ok(R"({"":""})", {"<object>", ":", "</object>"});
    assert_ok(R"({"k":"v"})", {"<object>", "k:v", "</object>"});
    assert_ok(R"([])", {"<array>", "</array>"});
    assert_ok(R"([""])", {"<array>", "", "</array>"});
    assert_ok(R"(["v"])", {"<array>", "v", "</array>"});
}

TEST_F(ValidatorTests, MixedDocument)
{
    assert_ok(R"({"a":1,"b":[true,false,null]})",
              {"<object>", "a:" + number_str("1"), "b:<array>", "<true>", "<false>",
               "<null>", "</array>", "</object>"});
}

TEST_F(ValidatorTests, NestedContainers)
{
    assert_ok("[[[]]]", {"<array>", "<array>", "<array>", "</array>", "</array>", "</array>"});
    assert_ok(R"({"a":{"b":{}}})", {"<object>", "a:<object>", "b:<object>", "</object>", "</object>", "</object>"});
    assert_ok(R"([{"a":[1,{}]},[]])",
              {"<array>", "<object>", "a:<array>", number_str("1"), "<object>", "</object>",
               "</array>", "</object>", "<array>", "</array>", "</array>"});
}

TEST_F(ValidatorTests, ValidatesWithoutAHandler)
{
    assert_valid(kExample2);
    assert_valid(R"({"a":1,"b":[true,false,null]})");
}

TEST_F(ValidatorTests, NumberBoundaries)
{
    assert_valid("0");
    assert_valid("-0");
    assert_valid("1e10");
    assert_valid("-1.5e-10");
    assert_error("01", ErrorKind::kInvalidNumberFormat, 1);
    assert_error("1.", ErrorKind::kInvalidNumberFormat, 2);
    assert_error("1e", ErrorKind::kInvalidNumberFormat, 2);
    assert_error("[1,01]", ErrorKind::kInvalidNumberFormat, 4);
}

TEST_F(ValidatorTests, StringBoundaries)
{
    assert_ok(R"("\u0041")", {"A"});
    assert_ok(R"("\uD800\uDC00")", {"\xF0\x90\x80\x80"});
    assert_error(R"("\uD800")", ErrorKind::kInvalidUnicodeEscape, 1);
    assert_error(R"({"a":"\uD800"})", ErrorKind::kInvalidUnicodeEscape, 6);
}

TEST_F(ValidatorTests, TrailingCommasAreNotAllowed)
{
    // Reported at the closing bracket.
    assert_error(R"({"a":1,})", ErrorKind::kTrailingComma, 7);
    assert_error("[1,2,]", ErrorKind::kTrailingComma, 5);
    assert_error(R"(["v",])", ErrorKind::kTrailingComma, 5);
    assert_error(R"({"k1":"v1","k2":2,})", ErrorKind::kTrailingComma, 18);

    // A comma that follows nothing is just unexpected.
    assert_error("[,]", ErrorKind::kUnexpectedToken, 1);
    assert_error("{,}", ErrorKind::kUnexpectedToken, 1);
    assert_error("[1,,2]", ErrorKind::kUnexpectedToken, 3);

    // Comma after the root value.
    assert_error("42,", ErrorKind::kTrailingContent, 2);
    assert_error("[],", ErrorKind::kTrailingContent, 2);
}

TEST_F(ValidatorTests, OnlyAllowsSingleValue)
{
    assert_error(R"({"a":1}{"b":2})", ErrorKind::kTrailingContent, 7);
    assert_error("1 2", ErrorKind::kTrailingContent, 2);
    assert_error(R"("a" "b")", ErrorKind::kTrailingContent, 4);
    assert_error("null null", ErrorKind::kTrailingContent, 5);
    assert_error("[] {}", ErrorKind::kTrailingContent, 3);
    assert_error("{}:", ErrorKind::kTrailingContent, 2);

    // Bytes that do not start any token.
    assert_error("[] x", ErrorKind::kTrailingContent, 3);
    assert_error("true\n#", ErrorKind::kTrailingContent, 5);
}

TEST_F(ValidatorTests, UnexpectedTokens)
{
    const auto r = validate(R"({"a":})", m_options);
    ASSERT_EQ(r.kind, ErrorKind::kUnexpectedToken);
    ASSERT_EQ(r.position, (Position{5, 1, 6}));
    ASSERT_EQ(r.message, "expected a value but found '}'");

    assert_error(R"({"a" 1})", ErrorKind::kUnexpectedToken, 5);
    assert_error("{1:2}", ErrorKind::kUnexpectedToken, 1);
    assert_error(R"({"a":1 "b":2})", ErrorKind::kUnexpectedToken, 7);
    assert_error(R"({"a":1,2})", ErrorKind::kUnexpectedToken, 7);
    assert_error(R"({"a"::1})", ErrorKind::kUnexpectedToken, 5);
    assert_error("[1 2]", ErrorKind::kUnexpectedToken, 3);
    assert_error("[1:2]", ErrorKind::kUnexpectedToken, 2);
    assert_error(":", ErrorKind::kUnexpectedToken, 0);
    assert_error(",", ErrorKind::kUnexpectedToken, 0);
    assert_error("a", ErrorKind::kUnexpectedToken, 0);
}

TEST_F(ValidatorTests, UnbalancedBrackets)
{
    assert_error("[", ErrorKind::kUnexpectedEndOfInput, 1);
    assert_error("{", ErrorKind::kUnexpectedEndOfInput, 1);
    assert_error("[[1]", ErrorKind::kUnexpectedEndOfInput, 4);
    assert_error(R"({"a":[1})", ErrorKind::kUnexpectedToken, 7);
    assert_error("[{]}", ErrorKind::kUnexpectedToken, 2);
    assert_error("]", ErrorKind::kUnexpectedToken, 0);
    assert_error("}", ErrorKind::kUnexpectedToken, 0);
    assert_error("[1]]", ErrorKind::kUnexpectedToken, 3);
    assert_error("{}}", ErrorKind::kUnexpectedToken, 2);
}

TEST_F(ValidatorTests, UnexpectedEndOfInput)
{
    assert_error("", ErrorKind::kUnexpectedEndOfInput, 0);
    assert_error("   ", ErrorKind::kUnexpectedEndOfInput, 3);
    assert_error(R"({"a")", ErrorKind::kUnexpectedEndOfInput, 4);
    assert_error(R"({"a":)", ErrorKind::kUnexpectedEndOfInput, 5);
    assert_error("[1,", ErrorKind::kUnexpectedEndOfInput, 3);
    assert_error(R"({"a":1,)", ErrorKind::kUnexpectedEndOfInput, 7);
}

TEST_F(ValidatorTests, ReportsLinesAndColumns)
{
    const auto r = validate("[\n1,\n]", m_options);
    ASSERT_EQ(r.kind, ErrorKind::kTrailingComma);
    ASSERT_EQ(r.position, (Position{5, 3, 1}));
    ASSERT_EQ(r.to_string(), "3:1: trailing comma before ']'");
}

TEST_F(ValidatorTests, LexicalErrorsArePassedThrough)
{
    assert_error(R"(["abc)", ErrorKind::kUnterminatedString, 5);
    assert_error(R"(["\q"])", ErrorKind::kInvalidEscape, 2);
    assert_error("[\"\x01\"]", ErrorKind::kInvalidControlCharacter, 2);
    assert_error("[\"\xFF\"]", ErrorKind::kInvalidUtf8, 2);
    assert_error("[tru]", ErrorKind::kUnexpectedToken, 1);
    assert_error("[-]", ErrorKind::kInvalidNumberFormat, 2);
}

TEST_F(ValidatorTests, NanAndInfinity)
{
    assert_error("[NaN]", ErrorKind::kUnexpectedToken, 1);
    assert_error("[-Infinity]", ErrorKind::kInvalidNumberFormat, 2);

    m_options.allow_nan_infinity = true;
    assert_ok("[NaN,Infinity,-Infinity]",
              {"<array>", number_str("NaN"), number_str("Infinity"),
               number_str("-Infinity"), "</array>"});
}

TEST_F(ValidatorTests, DuplicateKeysAreAllowedByDefault)
{
    assert_ok(R"({"a":1,"a":2})", {"<object>", "a:" + number_str("1"), "a:" + number_str("2"), "</object>"});
}

TEST_F(ValidatorTests, RejectsDuplicateKeys)
{
    m_options.reject_duplicate_keys = true;

    const auto r = validate(R"({"a":1,"a":2})", m_options);
    ASSERT_EQ(r.kind, ErrorKind::kDuplicateKey);
    ASSERT_EQ(r.position.offset, 7U);
    ASSERT_EQ(r.message, "duplicate key \"a\"");

    // Keys are compared after escapes are decoded.
    assert_error(R"({"a":1,"\u0061":2})", ErrorKind::kDuplicateKey, 7);
    assert_error(R"({"a":{"b":1,"b":2}})", ErrorKind::kDuplicateKey, 12);
    assert_error(R"({"a":1,"b":2,"a":3})", ErrorKind::kDuplicateKey, 13);
}

TEST_F(ValidatorTests, DuplicateKeysAreScopedToOneObject)
{
    m_options.reject_duplicate_keys = true;
    assert_valid(R"({"a":1,"A":2})");
    assert_valid(R"({"a":{"a":1}})");
    assert_valid(R"([{"a":1},{"a":1}])");
    assert_valid(R"({"a":{"b":1},"b":{"a":1}})");
}

TEST_F(ValidatorTests, MaxDepthBoundary)
{
    m_options.max_nesting_depth = 3;
    assert_valid("[[[]]]");
    assert_valid(R"({"a":[{}]})");
    assert_valid("[[1],[2],[[3]]]");
    assert_error("[[[[]]]]", ErrorKind::kMaxDepthExceeded, 3);
    assert_error(R"({"a":{"b":{"c":{}}}})", ErrorKind::kMaxDepthExceeded, 15);
}

TEST_F(ValidatorTests, ZeroMaxDepthOnlyAllowsScalars)
{
    m_options.max_nesting_depth = 0;
    assert_valid("1");
    assert_valid(R"("abc")");
    assert_error("[]", ErrorKind::kMaxDepthExceeded, 0);
    assert_error("{}", ErrorKind::kMaxDepthExceeded, 0);
}

TEST_F(ValidatorTests, DefaultMaxDepth)
{
    const auto nested = [](size_t depth) {
        return std::string(depth, '[') + std::string(depth, ']');
    };
    assert_valid(nested(JSONVFY_DEFAULT_MAX_DEPTH));
    assert_error(nested(JSONVFY_DEFAULT_MAX_DEPTH + 1), ErrorKind::kMaxDepthExceeded,
                 JSONVFY_DEFAULT_MAX_DEPTH);
}

TEST_F(ValidatorTests, HandlesExcessiveNesting)
{
    std::string input;
    for (int i = 0; i < 50'000; ++i) {
        input.append(R"({"a":)");
    }
    // No need to close objects: the validator should exceed the maximum allowed
    // nesting way before it gets that far.
    assert_error(input, ErrorKind::kMaxDepthExceeded, JSONVFY_DEFAULT_MAX_DEPTH * 5);
}

TEST_F(ValidatorTests, HandlerCanStopValidation)
{
    reset_test_state();
    m_handler.max_events = 2;
    const auto r = validate("[1,2,3]", m_options, &m_handler);
    ASSERT_EQ(r.kind, ErrorKind::kAborted);
    ASSERT_EQ(r.position.offset, 3U);
    ASSERT_TRUE(to_status(r).is_aborted());

    const std::vector<std::string> target = {"<array>", number_str("1"), number_str("2")};
    ASSERT_EQ(m_handler.records, target);
}

TEST_F(ValidatorTests, ResultIsDeterministic)
{
    for (const auto *input : {R"({"a":1,"b":[true,false,null]})", "[1,2,]",
                              R"({"a":1}{"b":2})", R"({"a":})", "[\"\xC3\"]", "[[[["}) {
        const auto r1 = validate(input, m_options);
        const auto r2 = validate(input, m_options);
        ASSERT_EQ(r1.kind, r2.kind);
        ASSERT_EQ(r1.position, r2.position);
        ASSERT_EQ(r1.message, r2.message);
    }
}

TEST_F(ValidatorTests, ReadSizeDoesNotAffectResult)
{
    const std::string inputs[] = {
        kExample2,
        R"({"a":1,"b":[true,false,null]})",
        R"({"kéy": "😀", "n": -1.25e-3})",
        R"({"a":1,})",
        "[\"\xE2\x82\xAC\", \"\xE2\x82\"]",
    };
    for (const auto &input : inputs) {
        const auto expected = validate(input, m_options);
        for (size_t chunk_size = 1; chunk_size < 8; ++chunk_size) {
            ChunkedSource source(input, chunk_size);
            const auto r = validate(source, m_options);
            ASSERT_EQ(r.kind, expected.kind) << input;
            ASSERT_EQ(r.position, expected.position) << input;
        }
    }
}

TEST_F(ValidatorTests, ReadErrorIsNotAGrammarError)
{
    FailingSource source("[1, 2");
    const auto r = validate(source, m_options);
    ASSERT_EQ(r.kind, ErrorKind::kIoError);
    ASSERT_EQ(r.message, "injected read failure");
    ASSERT_EQ(r.to_string(), "injected read failure");
    ASSERT_TRUE(to_status(r).is_io_error());
}

TEST_F(ValidatorTests, ConvertsResultToStatus)
{
    ASSERT_OK(to_status(validate("[]", m_options)));

    const auto r = validate("[1,]", m_options);
    const auto s = to_status(r);
    ASSERT_TRUE(s.is_corruption());
    ASSERT_EQ(Slice(s.message()), "1:4: trailing comma before ']'");
}

TEST_F(ValidatorTests, ErrorKindNames)
{
    ASSERT_EQ(Slice(error_kind_name(ErrorKind::kNone)), "none");
    ASSERT_EQ(Slice(error_kind_name(ErrorKind::kInvalidUtf8)), "invalid_utf8");
    ASSERT_EQ(Slice(error_kind_name(ErrorKind::kTrailingComma)), "trailing_comma");
    ASSERT_EQ(Slice(error_kind_name(ErrorKind::kUnexpectedEndOfInput)), "unexpected_end_of_input");
    ASSERT_EQ(Slice(error_kind_name(ErrorKind::kAborted)), "aborted");
    ASSERT_EQ(Result().to_string(), "valid");
}

TEST_F(ValidatorTests, WritesLogFile)
{
    const auto filename = "jsonvfy_validator_log_" + std::to_string(::getpid());
    m_options.log_level = kLogTrace;
    m_options.log_target = kLogFile;
    m_options.log_filename = filename.c_str();
    ASSERT_OK(check_options(m_options));

    assert_error("[[1,]", ErrorKind::kTrailingComma, 4);

    // The logger and its file sink are released when validate() returns.
    std::ifstream file(filename);
    ASSERT_TRUE(file.is_open());
    std::stringstream ss;
    ss << file.rdbuf();
    const auto text = ss.str();
    TEST_LOG << text;
    ASSERT_NE(text.find("validating"), std::string::npos);
    ASSERT_NE(text.find("push array (depth 2)"), std::string::npos);
    ASSERT_NE(text.find("trailing_comma"), std::string::npos);
    file.close();
    ::unlink(filename.c_str());
}

TEST_F(ValidatorTests, ReportsUnopenableLogFile)
{
    // The parent "directory" is a regular file, so the log cannot be created.
    const auto parent = "jsonvfy_validator_parent_" + std::to_string(::getpid());
    write_string_to_file(parent, "");
    const auto filename = parent + "/log";
    m_options.log_level = kLogDebug;
    m_options.log_target = kLogFile;
    m_options.log_filename = filename.c_str();
    const auto r = validate("[]", m_options);
    ::unlink(parent.c_str());
    ASSERT_EQ(r.kind, ErrorKind::kIoError);
    ASSERT_FALSE(r.message.empty());
}

TEST_F(ValidatorTests, RejectsMissingLogFileName)
{
    m_options.log_level = kLogDebug;
    m_options.log_target = kLogFile;
    m_options.log_filename = nullptr;
    auto r = validate("[]", m_options);
    ASSERT_EQ(r.kind, ErrorKind::kIoError);
    ASSERT_NE(r.message.find("log file name"), std::string::npos);

    m_options.log_filename = "";
    r = validate("[]", m_options);
    ASSERT_EQ(r.kind, ErrorKind::kIoError);
}

TEST_F(ValidatorTests, NonAsciiErrorsPointAtFirstByte)
{
    auto r = validate(Slice("[1,\xC3\xA9]"), Options());
    ASSERT_EQ(r.kind, ErrorKind::kUnexpectedToken);
    ASSERT_EQ(r.position, (Position{3, 1, 4}));

    r = validate(Slice("[-\xC3\xA9]"), Options());
    ASSERT_EQ(r.kind, ErrorKind::kInvalidNumberFormat);
    ASSERT_EQ(r.position, (Position{2, 1, 3}));

    r = validate(Slice("\xEF\xBB\xBF{}"), Options());
    ASSERT_EQ(r.kind, ErrorKind::kUnexpectedToken);
    ASSERT_EQ(r.position, (Position{0, 1, 1}));
    ASSERT_EQ(r.to_string().substr(0, 4), "1:1:");
}

} // namespace jsonvfy::test
