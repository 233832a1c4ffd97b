#include "test_common.hpp"
#include "test_types.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>

using namespace jstream;
using jstream_test::color;

static void test_integer_boundaries() {
  {
    const auto r = decode<std::int8_t>("-128");
    JSTREAM_CHECK(!r.err);
    JSTREAM_CHECK(r.val == (std::numeric_limits<std::int8_t>::min)());
  }
  {
    const auto r = decode<std::int16_t>("32767");
    JSTREAM_CHECK(!r.err);
    JSTREAM_CHECK(r.val == 32767);
  }
  {
    const auto r = decode<std::int64_t>("9223372036854775807");
    JSTREAM_CHECK(!r.err);
    JSTREAM_CHECK(r.val == (std::numeric_limits<std::int64_t>::max)());
  }
  {
    const auto r = decode<std::int64_t>("-9223372036854775808");
    JSTREAM_CHECK(!r.err);
    JSTREAM_CHECK(r.val == (std::numeric_limits<std::int64_t>::min)());
  }
  {
    const auto r = decode<std::int32_t>("-0");
    JSTREAM_CHECK(!r.err);
    JSTREAM_CHECK(r.val == 0);
  }
}

static void test_integer_overflow_and_garbage() {
  {
    const auto r = decode<std::int8_t>("128");
    jstream_test::check_err(r.err, error_code::invalid_literal);
    JSTREAM_CHECK(r.message == "Failed to parse type 'byte' for input '128'");
  }
  {
    const auto r = decode<std::int64_t>("9223372036854775808");
    jstream_test::check_err(r.err, error_code::invalid_literal);
    JSTREAM_CHECK(jstream_test::contains(r.message, "'long'"));
  }
  jstream_test::check_err(decode<std::int32_t>("1.5").err, error_code::invalid_literal);
  jstream_test::check_err(decode<std::int32_t>("1e3").err, error_code::invalid_literal);
  jstream_test::check_err(decode<std::int32_t>("abc").err, error_code::invalid_literal);
  jstream_test::check_err(decode<std::int32_t>("\"\"").err, error_code::invalid_literal);
  jstream_test::check_err(decode<std::int32_t>("[1]").err, error_code::unexpected_token);
  jstream_test::check_err(decode<std::int32_t>("").err, error_code::unexpected_eof);

  // The literal's own offset is reported, not the cursor after it.
  const auto r = decode<std::vector<std::int16_t>>("[1, 70000]");
  jstream_test::check_err(r.err, error_code::invalid_literal);
  JSTREAM_CHECK(r.err.offset == 4);
}

static void test_leading_plus_sign() {
  {
    const auto r = decode<std::vector<std::int32_t>>("[+1, -2, \"+3\"]");
    JSTREAM_CHECK(!r.err);
    JSTREAM_CHECK(r.val.size() == 3);
    JSTREAM_CHECK(r.val[0] == 1);
    JSTREAM_CHECK(r.val[1] == -2);
    JSTREAM_CHECK(r.val[2] == 3);
  }
  {
    const auto r = decode<double>("+1.5");
    JSTREAM_CHECK(!r.err);
    JSTREAM_CHECK(r.val == 1.5);
  }
  {
    const auto r = decode<std::uint32_t>("+7");
    JSTREAM_CHECK(!r.err);
    JSTREAM_CHECK(r.val == 7u);
  }
  {
    const auto r = decode<std::int64_t>("+9223372036854775807");
    JSTREAM_CHECK(!r.err);
    JSTREAM_CHECK(r.val == std::numeric_limits<std::int64_t>::max());
  }
  // Only one sign, and only in front of digits.
  for (const char* bad : {"+", "++1", "+-1", "-+1", "+ 1"}) {
    jstream_test::check_err(decode<std::int32_t>(bad).err, error_code::invalid_literal);
  }
  for (const char* bad : {"++1.5", "+-1.5"}) {
    jstream_test::check_err(decode<double>(bad).err, error_code::invalid_literal);
  }
  {
    const auto r = decode<std::int8_t>("+128");
    jstream_test::check_err(r.err, error_code::invalid_literal);
    JSTREAM_CHECK(r.message == "Failed to parse type 'byte' for input '+128'");
  }
}

static void test_quoted_numbers() {
  const auto i = decode<std::int32_t>("\"42\"");
  JSTREAM_CHECK(!i.err);
  JSTREAM_CHECK(i.val == 42);

  const auto d = decode<double>("\"2.5\"");
  JSTREAM_CHECK(!d.err);
  JSTREAM_CHECK(d.val == 2.5);
}

static void test_floating_point() {
  {
    const auto r = decode<double>("1.25");
    JSTREAM_CHECK(!r.err);
    JSTREAM_CHECK(r.val == 1.25);
  }
  {
    const auto r = decode<double>("-0.5e-3");
    JSTREAM_CHECK(!r.err);
    JSTREAM_CHECK(jstream_test::nearly_equal(r.val, -0.0005));
  }
  {
    const auto r = decode<double>("1E308");
    JSTREAM_CHECK(!r.err);
    JSTREAM_CHECK(jstream_test::nearly_equal(r.val, 1e308));
  }
  {
    const auto r = decode<float>("3.5");
    JSTREAM_CHECK(!r.err);
    JSTREAM_CHECK(r.val == 3.5f);
  }
  {
    const auto r = decode<double>("7");
    JSTREAM_CHECK(!r.err);
    JSTREAM_CHECK(r.val == 7.0);
  }
  {
    // A long literal goes through the heap buffer.
    const std::string token = "0." + std::string(200, '1');
    const auto r = decode<double>(token);
    JSTREAM_CHECK(!r.err);
    JSTREAM_CHECK(jstream_test::nearly_equal(r.val, 1.0 / 9.0));
  }
  jstream_test::check_err(decode<double>("1e").err, error_code::invalid_literal);
  jstream_test::check_err(decode<double>("0x1p3").err, error_code::invalid_literal);
  jstream_test::check_err(decode<double>("1.2.3").err, error_code::invalid_literal);
  jstream_test::check_err(decode<double>("\" 1\"").err, error_code::invalid_literal);

  const auto r = decode<float>("1.5x");
  jstream_test::check_err(r.err, error_code::invalid_literal);
  JSTREAM_CHECK(r.message == "Failed to parse type 'float' for input '1.5x'");
}

static void test_special_floats() {
  for (const char* json : {"NaN", "Infinity", "-Infinity", "\"NaN\""}) {
    const auto r = decode<double>(json);
    jstream_test::check_err(r.err, error_code::special_float_not_allowed);
    JSTREAM_CHECK(jstream_test::contains(r.message, "allow_special_floating_point_values"));
  }
  {
    // Out of range for float overflows to infinity.
    const auto r = decode<float>("1e40");
    jstream_test::check_err(r.err, error_code::special_float_not_allowed);
  }

  decode_options opt;
  opt.allow_special_floating_point_values = true;
  {
    const auto r = decode<double>("NaN", opt);
    JSTREAM_CHECK(!r.err);
    JSTREAM_CHECK(std::isnan(r.val));
  }
  {
    const auto r = decode<double>("Infinity", opt);
    JSTREAM_CHECK(!r.err);
    JSTREAM_CHECK(std::isinf(r.val) && r.val > 0);
  }
  {
    const auto r = decode<std::vector<double>>("[-Infinity, 1]", opt);
    JSTREAM_CHECK(!r.err);
    JSTREAM_CHECK(r.val.size() == 2);
    JSTREAM_CHECK(std::isinf(r.val[0]) && r.val[0] < 0);
  }
  {
    const auto r = decode<float>("1e40", opt);
    JSTREAM_CHECK(!r.err);
    JSTREAM_CHECK(std::isinf(r.val));
  }
}

static void test_booleans_are_strict() {
  JSTREAM_CHECK(decode<bool>("true").val == true);
  JSTREAM_CHECK(decode<bool>(" false ").val == false);
  {
    const auto r = decode<bool>("\"true\"");
    JSTREAM_CHECK(!r.err);
    JSTREAM_CHECK(r.val == true);
  }
  for (const char* json : {"True", "FALSE", "1", "0", "\"yes\"", "truex", "tru"}) {
    const auto r = decode<bool>(json);
    jstream_test::check_err(r.err, error_code::invalid_literal);
    JSTREAM_CHECK(jstream_test::contains(r.message, "'boolean'"));
  }
}

static void test_chars() {
  {
    const auto r = decode<char32_t>("\"a\"");
    JSTREAM_CHECK(!r.err);
    JSTREAM_CHECK(r.val == U'a');
  }
  {
    const auto r = decode<char32_t>("\"\\u00e9\"");
    JSTREAM_CHECK(!r.err);
    JSTREAM_CHECK(r.val == 0xE9);
  }
  {
    const auto r = decode<char32_t>("\"\\uD83D\\uDE03\"");
    JSTREAM_CHECK(!r.err);
    JSTREAM_CHECK(r.val == 0x1F603);
  }
  {
    const auto r = decode<char32_t>("x");
    JSTREAM_CHECK(!r.err);
    JSTREAM_CHECK(r.val == U'x');
  }
  jstream_test::check_err(decode<char32_t>("\"ab\"").err, error_code::invalid_literal);
  jstream_test::check_err(decode<char32_t>("\"\"").err, error_code::invalid_literal);
  jstream_test::check_err(decode<char32_t>("\"\xC3\"").err, error_code::invalid_literal);
}

static void test_strict_and_lenient_strings() {
  {
    const auto r = decode<std::string>("abc");
    jstream_test::check_err(r.err, error_code::unexpected_token);
    JSTREAM_CHECK(jstream_test::contains(r.message, "is_lenient = true"));
  }
  jstream_test::check_err(decode<std::string>("{}").err, error_code::unexpected_token);
  jstream_test::check_err(decode<std::string>("").err, error_code::unexpected_eof);

  decode_options lenient;
  lenient.is_lenient = true;
  {
    const auto r = decode<std::string>("abc", lenient);
    JSTREAM_CHECK(!r.err);
    JSTREAM_CHECK(r.val == "abc");
  }
  {
    const auto r = decode<std::string>("\"a\\u0020b\"", lenient);
    JSTREAM_CHECK(!r.err);
    JSTREAM_CHECK(r.val == "a b");
  }
  {
    const auto r = decode<std::vector<std::string>>("[one, \"two\", 3]", lenient);
    JSTREAM_CHECK(!r.err);
    JSTREAM_CHECK((r.val == std::vector<std::string>{"one", "two", "3"}));
  }
}

static void test_unsigned_wrap() {
  {
    const auto r = decode<std::uint32_t>("4294967295");
    JSTREAM_CHECK(!r.err);
    JSTREAM_CHECK(r.val == 4294967295u);
  }
  {
    reader rd("4294967295");
    decode_options opt;
    decoder d(rd, decode_mode::object, opt);
    inline_decoder in = d.decode_inline(serializer<std::uint32_t>::get_descriptor());
    JSTREAM_CHECK(in.is_unsigned());
    JSTREAM_CHECK(in.decode_int() == -1);
  }
  {
    reader rd("255");
    decode_options opt;
    decoder d(rd, decode_mode::object, opt);
    JSTREAM_CHECK(d.decode_inline(serializer<std::uint8_t>::get_descriptor()).decode_byte() == -1);
  }
  {
    const auto r = decode<std::uint64_t>("18446744073709551615");
    JSTREAM_CHECK(!r.err);
    JSTREAM_CHECK(r.val == (std::numeric_limits<std::uint64_t>::max)());
  }
  {
    const auto r = decode<std::uint16_t>("\"65535\"");
    JSTREAM_CHECK(!r.err);
    JSTREAM_CHECK(r.val == 65535);
  }
  {
    const auto r = decode<std::uint8_t>("256");
    jstream_test::check_err(r.err, error_code::invalid_literal);
    JSTREAM_CHECK(r.message == "Failed to parse type 'UByte' for input '256'");
  }
  {
    const auto r = decode<std::uint32_t>("-1");
    jstream_test::check_err(r.err, error_code::invalid_literal);
    JSTREAM_CHECK(jstream_test::contains(r.message, "'UInt'"));
  }
  jstream_test::check_err(decode<std::uint64_t>("18446744073709551616").err, error_code::invalid_literal);
}

static void test_signed_inline_value() {
  const descriptor id = descriptor::inline_value("Id", descriptor::primitive(serial_kind::int32));
  {
    reader rd("-5");
    decode_options opt;
    decoder d(rd, decode_mode::object, opt);
    inline_decoder in = d.decode_inline(id);
    JSTREAM_CHECK(!in.is_unsigned());
    JSTREAM_CHECK(in.decode_int() == -5);
  }
  {
    reader rd("4294967295");
    decode_options opt;
    decoder d(rd, decode_mode::object, opt);
    const decoding_error e = JSTREAM_EXPECT_ERROR(d.decode_inline(id).decode_int(), error_code::invalid_literal);
    JSTREAM_CHECK(jstream_test::contains(e.message(), "'int'"));
  }
  {
    reader rd("\"hi\"");
    decode_options opt;
    decoder d(rd, decode_mode::object, opt);
    const descriptor name = descriptor::inline_value("Name", descriptor::primitive(serial_kind::string));
    JSTREAM_CHECK(d.decode_inline(name).decode_string() == "hi");
  }
}

static void test_enums() {
  {
    const auto r = decode<color>("\"blue\"");
    JSTREAM_CHECK(!r.err);
    JSTREAM_CHECK(r.val == color::blue);
  }
  {
    const auto r = decode<color>(" \"purple\"");
    jstream_test::check_err(r.err, error_code::unknown_enum_value);
    JSTREAM_CHECK(r.message == "'color' does not contain element with name 'purple'");
    JSTREAM_CHECK(r.err.offset == 1);
  }
  jstream_test::check_err(decode<color>("\"Blue\"").err, error_code::unknown_enum_value);
  jstream_test::check_err(decode<color>("blue").err, error_code::unexpected_token);

  decode_options lenient;
  lenient.is_lenient = true;
  const auto r = decode<color>("red", lenient);
  JSTREAM_CHECK(!r.err);
  JSTREAM_CHECK(r.val == color::red);
}

void test_primitives() {
  test_integer_boundaries();
  test_integer_overflow_and_garbage();
  test_leading_plus_sign();
  test_quoted_numbers();
  test_floating_point();
  test_special_floats();
  test_booleans_are_strict();
  test_chars();
  test_strict_and_lenient_strings();
  test_unsigned_wrap();
  test_signed_inline_value();
  test_enums();
}
