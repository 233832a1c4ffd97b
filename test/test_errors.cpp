#include "test_common.hpp"
#include "test_types.hpp"

#include <cstring>
#include <string>

using namespace jstream;
using jstream_test::point;

static void test_common_syntax_errors() {
  jstream_test::check_err(decode<point>("{\"x\":1,}").err, error_code::trailing_comma);
  jstream_test::check_err(decode<std::vector<std::int32_t>>("[1 2]").err, error_code::missing_comma);
  jstream_test::check_err(decode<std::string>("\"unterminated").err, error_code::unexpected_eof);
  jstream_test::check_err(decode<point>("{\"x\":1").err, error_code::unexpected_eof);
  jstream_test::check_err(decode<point>("[]").err, error_code::unexpected_token);
}

static void test_error_line_column_tracking() {
  const char* json = "{\n  \"x\": 1,\n  \"y\": 1x\n}";
  const auto r = decode<point>(json);
  jstream_test::check_err(r.err, error_code::invalid_literal);
  JSTREAM_CHECK(r.err.offset < std::strlen(json));
  // The bad token is on line 3, after two spaces, the key, a colon and a space.
  JSTREAM_CHECK(r.err.line == 3);
  JSTREAM_CHECK(r.err.column == 8);
}

static void test_decode_result_fields() {
  {
    const auto r = decode<point>(R"({"x":1,"y":2})");
    JSTREAM_CHECK(!r.err);
    JSTREAM_CHECK(r.err.code == error_code::ok);
    JSTREAM_CHECK(r.message.empty());
  }
  {
    const auto r = decode<point>(R"({"x":1,"y":true})");
    JSTREAM_CHECK(static_cast<bool>(r.err));
    JSTREAM_CHECK(r.err.offset == 11);
    JSTREAM_CHECK(r.err.line == 1);
    JSTREAM_CHECK(r.err.column == 12);
    JSTREAM_CHECK(r.message == "Failed to parse type 'int' for input 'true'");
  }
}

static void test_decode_or_throw() {
  const point p = decode_or_throw<point>(R"({"x":3,"y":4})");
  JSTREAM_CHECK(p.x == 3 && p.y == 4);

  JSTREAM_EXPECT_THROW(decode_or_throw<point>("{"));

  try {
    (void)decode_or_throw<point>(R"({"x":1,"y":2} [])");
    jstream_test::fail("decode_or_throw", __FILE__, __LINE__, "expected decoding_error, got none");
  } catch (const decoding_error& e) {
    JSTREAM_CHECK(e.code() == error_code::trailing_characters);
    JSTREAM_CHECK(e.offset() == 14);
    JSTREAM_CHECK(std::string(e.what()) == "Unexpected JSON token at offset 14: " + e.message());
    JSTREAM_CHECK(jstream_test::contains(e.message(), "'['"));
  }

  // decoding_error is a std::runtime_error.
  try {
    (void)decode_or_throw<std::int32_t>("x");
  } catch (const std::runtime_error& e) {
    JSTREAM_CHECK(jstream_test::contains(e.what(), "offset 0"));
  }
}

static void test_error_context() {
  {
    const std::string ctx = format_error_context("[1, 2, x]", 7);
    JSTREAM_CHECK(ctx == "[1, 2, x]\n       ^");
  }
  {
    const std::string ctx = format_error_context("{\n  \"a\": ?\n}", 9);
    JSTREAM_CHECK(ctx == "  \"a\": ?\n       ^");
  }
  {
    // End of input points one past the last character.
    const std::string ctx = format_error_context("[1,", 3);
    JSTREAM_CHECK(ctx == "[1,\n   ^");
  }
  {
    const std::string line = std::string(100, 'a') + "!" + std::string(100, 'b');
    const std::string ctx = format_error_context(line, 100);
    JSTREAM_CHECK(ctx == "..." + std::string(40, 'a') + "!" + std::string(39, 'b') + "...\n" + std::string(43, ' ') + "^");
  }
  {
    const auto r = decode<std::vector<std::int32_t>>("[1,\n 2,\n oops]");
    jstream_test::check_err(r.err, error_code::invalid_literal);
    try {
      (void)decode_or_throw<std::vector<std::int32_t>>("[1,\n 2,\n oops]");
    } catch (const decoding_error& e) {
      JSTREAM_CHECK(e.context() == " oops]\n ^");
      JSTREAM_CHECK(e.source() == "[1,\n 2,\n oops]");
    }
  }
}

static void test_error_code_names() {
  JSTREAM_CHECK(std::string(to_string(error_code::ok)) == "ok");
  JSTREAM_CHECK(std::string(to_string(error_code::bracket_mismatch)) == "bracket_mismatch");
  JSTREAM_CHECK(std::string(to_string(error_code::special_float_not_allowed)) == "special_float_not_allowed");
  JSTREAM_CHECK(!error{});
}

void test_errors() {
  test_common_syntax_errors();
  test_error_line_column_tracking();
  test_decode_result_fields();
  test_decode_or_throw();
  test_error_context();
  test_error_code_names();
}
