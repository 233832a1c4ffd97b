#pragma once

#include <jstream/descriptor.hpp>
#include <jstream/error.hpp>
#include <jstream/options.hpp>
#include <jstream/reader.hpp>

#include <charconv>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>

namespace jstream {

// Specialized per decodable type; see serializer.hpp.
template <class T, class Enable = void>
struct serializer;

namespace detail {

inline constexpr const char* coerce_input_values_hint =
    "Use 'coerce_input_values = true' in decode_options to coerce nulls to default values.";
inline constexpr const char* special_floating_point_hint =
    "It is possible to deserialize them using 'allow_special_floating_point_values = true' in decode_options.";
inline constexpr const char* ignore_unknown_keys_hint =
    "Use 'ignore_unknown_keys = true' in decode_options to ignore unknown keys.";

// One leading '+' is accepted by every number decoder; from_chars itself only takes '-'.
inline bool strip_plus(std::string_view& token) noexcept {
  if (token.empty() || token.front() != '+') return true;
  token.remove_prefix(1);
  return !token.empty() && token.front() != '+' && token.front() != '-';
}

template <class Int>
inline bool parse_integer(std::string_view token, Int& out) noexcept {
  if (!strip_plus(token)) return false;
  const char* first = token.data();
  const char* last = token.data() + token.size();
  const auto r = std::from_chars(first, last, out);
  return r.ec == std::errc{} && r.ptr == last;
}

template <class Float>
inline bool parse_floating(std::string_view token, Float& out) {
  if (token.empty() || !strip_plus(token)) return false;
#if defined(JSTREAM_USE_FROM_CHARS_DOUBLE) && JSTREAM_USE_FROM_CHARS_DOUBLE && defined(__cpp_lib_to_chars)
  const char* first = token.data();
  const char* last = token.data() + token.size();
  const auto r = std::from_chars(first, last, out, std::chars_format::general);
  return r.ec == std::errc{} && r.ptr == last;
#else
  // strtod also takes leading whitespace and hexadecimal floats; neither is a JSON number.
  for (const char c : token) {
    if (c == 'x' || c == 'X' || is_ws(c)) return false;
  }

  // Token is not NUL-terminated; avoid heap alloc for typical short numbers.
  constexpr std::size_t kStackCap = 128;
  std::string heap;
  char stack_buf[kStackCap];
  char* buf = stack_buf;
  if (token.size() < kStackCap) {
    std::memcpy(stack_buf, token.data(), token.size());
    stack_buf[token.size()] = '\0';
  } else {
    heap.assign(token.data(), token.size());
    buf = heap.data();
  }

  char* end = nullptr;
  if constexpr (std::is_same_v<Float, float>) {
    out = std::strtof(buf, &end);
  } else {
    out = std::strtod(buf, &end);
  }
  return end == buf + token.size();
#endif
}

// Exactly one UTF-8 encoded scalar value.
inline bool decode_single_code_point(std::string_view s, char32_t& out) noexcept {
  if (s.empty()) return false;
  const unsigned char b0 = static_cast<unsigned char>(s[0]);
  std::size_t len = 0;
  char32_t cp = 0;
  if (b0 < 0x80u) {
    len = 1;
    cp = b0;
  } else if ((b0 & 0xE0u) == 0xC0u) {
    len = 2;
    cp = b0 & 0x1Fu;
  } else if ((b0 & 0xF0u) == 0xE0u) {
    len = 3;
    cp = b0 & 0x0Fu;
  } else if ((b0 & 0xF8u) == 0xF0u) {
    len = 4;
    cp = b0 & 0x07u;
  } else {
    return false;
  }
  if (s.size() != len) return false;
  for (std::size_t k = 1; k < len; ++k) {
    const unsigned char b = static_cast<unsigned char>(s[k]);
    if ((b & 0xC0u) != 0x80u) return false;
    cp = (cp << 6) | (b & 0x3Fu);
  }
  if ((len == 2 && cp < 0x80u) || (len == 3 && cp < 0x800u) || (len == 4 && (cp < 0x10000u || cp > 0x10FFFFu))) {
    return false;
  }
  if (cp >= 0xD800u && cp <= 0xDFFFu) return false;
  out = cp;
  return true;
}

[[noreturn]] inline void fail_literal(const reader& r, const char* type_name, std::string_view text) {
  std::string message = std::string("Failed to parse type '") + type_name + "' for input '";
  message.append(text.data(), text.size());
  message += "'";
  if (text == "null") {
    message += ".\n";
    message += coerce_input_values_hint;
  }
  r.fail(error_code::invalid_literal, std::move(message), r.token_position());
}

template <class Int>
inline Int decode_integer_literal(reader& r, const char* type_name) {
  const std::string_view text = r.consume_string_lenient();
  Int v{};
  if (!parse_integer(text, v)) fail_literal(r, type_name, text);
  return v;
}

} // namespace detail

enum class decode_mode { object, array, map, polymorphic_wrapper };

// Integer decodes for inline unsigned wrappers: the text is read as the unsigned type of the
// same width and its bit pattern returned as the signed counterpart.
class unsigned_primitive_decoder {
public:
  explicit unsigned_primitive_decoder(reader& r) noexcept : reader_(&r) {}

  std::int8_t decode_byte() { return static_cast<std::int8_t>(detail::decode_integer_literal<std::uint8_t>(*reader_, "UByte")); }
  std::int16_t decode_short() { return static_cast<std::int16_t>(detail::decode_integer_literal<std::uint16_t>(*reader_, "UShort")); }
  std::int32_t decode_int() { return static_cast<std::int32_t>(detail::decode_integer_literal<std::uint32_t>(*reader_, "UInt")); }
  std::int64_t decode_long() { return static_cast<std::int64_t>(detail::decode_integer_literal<std::uint64_t>(*reader_, "ULong")); }

private:
  reader* reader_;
};

class inline_decoder;

// Field-by-field decoder for one structural level. Instances are cheap values; nested levels are
// returned by begin_structure and share the parent's reader.
class decoder {
public:
  static constexpr int decode_done = -1;

  decoder(reader& r, decode_mode mode, const decode_options& opt, std::size_t depth = 0) noexcept
      : reader_(&r), opt_(&opt), mode_(mode), depth_(depth) {}

  decode_mode mode() const noexcept { return mode_; }
  int current_index() const noexcept { return current_index_; }
  std::size_t depth() const noexcept { return depth_; }
  const decode_options& options() const noexcept { return *opt_; }
  reader& get_reader() noexcept { return *reader_; }

  template <class T>
  T decode_serializable_value() {
    return serializer<T>::deserialize(*this);
  }

  decoder begin_structure(const descriptor& desc) {
    if (desc.kind() == serial_kind::inline_value) return *this;
    if (depth_ >= opt_->max_depth) reader_->fail(error_code::nesting_too_deep, "Nesting is too deep");
    const decode_mode new_mode = switch_mode(desc);
    reader_->consume_expected(begin_token(new_mode), [&](token_class actual) {
      return std::string("Expected ") + describe(begin_token(new_mode)) + " at the start of '" + desc.serial_name() +
             "', but had " + describe(actual) + " instead";
    });
    return decoder(*reader_, new_mode, *opt_, depth_ + 1);
  }

  void end_structure(const descriptor& desc) {
    if (desc.kind() == serial_kind::inline_value) return;
    reader_->consume_expected(end_token(mode_), [&](token_class actual) {
      return std::string("Expected ") + describe(end_token(mode_)) + " at the end of '" + desc.serial_name() +
             "', but had " + describe(actual) + " instead";
    });
  }

  int decode_element_index(const descriptor& desc) {
    if (current_index_ == -1 && reader_->peek_token() == token_class::comma) {
      reader_->fail(error_code::leading_comma, "Unexpected leading comma");
    }
    switch (mode_) {
      case decode_mode::object:
      case decode_mode::polymorphic_wrapper:
        return decode_object_index(desc);
      case decode_mode::map:
        return decode_map_index();
      case decode_mode::array:
        return decode_list_index();
    }
    return decode_done;
  }

  // Leading whitespace is consumed by decode_element_index before a field decode is dispatched.
  bool decode_not_null_mark() { return reader_->try_consume_not_null(); }

  // The literal was already consumed by decode_not_null_mark.
  void decode_null() noexcept {}

  // Only the exact literals are accepted; quoting is tolerated in every mode.
  bool decode_boolean() {
    const std::string_view text = reader_->consume_string_lenient();
    if (text == "true") return true;
    if (text == "false") return false;
    detail::fail_literal(*reader_, "boolean", text);
  }

  std::int8_t decode_byte() { return detail::decode_integer_literal<std::int8_t>(*reader_, "byte"); }
  std::int16_t decode_short() { return detail::decode_integer_literal<std::int16_t>(*reader_, "short"); }
  std::int32_t decode_int() { return detail::decode_integer_literal<std::int32_t>(*reader_, "int"); }
  std::int64_t decode_long() { return detail::decode_integer_literal<std::int64_t>(*reader_, "long"); }

  float decode_float() { return decode_floating<float>("float"); }
  double decode_double() { return decode_floating<double>("double"); }

  char32_t decode_char() {
    const std::string_view text = reader_->consume_string_lenient();
    char32_t c = 0;
    if (!detail::decode_single_code_point(text, c)) detail::fail_literal(*reader_, "char", text);
    return c;
  }

  std::string decode_string() { return std::string(decode_string_view()); }

  // Zero-copy variant; see reader for the lifetime of the returned view.
  std::string_view decode_string_view() {
    if (opt_->is_lenient) return reader_->consume_string_lenient();
    if (reader_->peek_token() == token_class::other) {
      reader_->fail(error_code::unexpected_token,
                    std::string("Expected quoted string, but had unquoted literal instead.\n") + detail::lenient_hint);
    }
    return reader_->consume_string();
  }

  int decode_enum(const descriptor& enum_desc) {
    const std::string_view name = decode_string_view();
    const int index = enum_desc.element_index(name);
    if (index == descriptor::unknown_name) {
      reader_->fail(error_code::unknown_enum_value,
                    "'" + enum_desc.serial_name() + "' does not contain element with name '" + std::string(name) + "'",
                    reader_->token_position());
    }
    return index;
  }

  inline_decoder decode_inline(const descriptor& inline_desc);

  void skip_value() { reader_->skip_element(opt_->is_lenient, opt_->allow_special_floating_point_values); }

private:
  static decode_mode switch_mode(const descriptor& desc) noexcept {
    switch (desc.kind()) {
      case serial_kind::polymorphic: return decode_mode::polymorphic_wrapper;
      case serial_kind::list: return decode_mode::array;
      case serial_kind::map: return decode_mode::map;
      case serial_kind::object:
      case serial_kind::boolean:
      case serial_kind::int8:
      case serial_kind::int16:
      case serial_kind::int32:
      case serial_kind::int64:
      case serial_kind::float32:
      case serial_kind::float64:
      case serial_kind::character:
      case serial_kind::string:
      case serial_kind::enumeration:
      case serial_kind::inline_value:
        return decode_mode::object;
    }
    return decode_mode::object;
  }

  static token_class begin_token(decode_mode mode) noexcept {
    return mode == decode_mode::array ? token_class::begin_array : token_class::begin_object;
  }

  static token_class end_token(decode_mode mode) noexcept {
    return mode == decode_mode::array ? token_class::end_array : token_class::end_object;
  }

  template <class Float>
  Float decode_floating(const char* type_name) {
    const std::string_view text = reader_->consume_string_lenient();
    Float v{};
    if (!detail::parse_floating(text, v)) detail::fail_literal(*reader_, type_name, text);
    if (!opt_->allow_special_floating_point_values && !std::isfinite(v)) {
      std::string message = "Unexpected special floating-point value ";
      message.append(text.data(), text.size());
      message += ". By default, non-finite floating point values are prohibited because they do not conform JSON "
                 "specification.\n";
      message += detail::special_floating_point_hint;
      reader_->fail(error_code::special_float_not_allowed, std::move(message), reader_->token_position());
    }
    return v;
  }

  std::string_view decode_string_key() {
    if (opt_->is_lenient) return reader_->consume_string_lenient();
    if (reader_->peek_token() == token_class::other) {
      reader_->fail(error_code::expected_key_string,
                    std::string("Expected quoted string as an object key, but had unquoted literal instead.\n") +
                        detail::lenient_hint);
    }
    return reader_->consume_key_string();
  }

  // Null for a non-nullable element, or an enum constant the element does not know.
  bool coerce_input_value(const descriptor& desc, int index) {
    const descriptor& element = desc.element_descriptor(static_cast<std::size_t>(index));
    if (!element.is_nullable() && !reader_->try_consume_not_null()) return true;
    if (element.kind() == serial_kind::enumeration) {
      if (reader_->peek_null()) return false;
      const std::optional<std::string> name = reader_->peek_string(opt_->is_lenient);
      // Not a string: decode_enum reports the real error.
      if (!name) return false;
      if (element.element_index(*name) == descriptor::unknown_name) {
        if (opt_->is_lenient) {
          reader_->consume_string_lenient();
        } else {
          reader_->consume_string();
        }
        return true;
      }
    }
    return false;
  }

  void handle_unknown(std::string_view key, std::size_t key_pos) {
    if (opt_->ignore_unknown_keys) {
      reader_->skip_element(opt_->is_lenient, opt_->allow_special_floating_point_values);
      return;
    }
    reader_->fail(error_code::unknown_key,
                  "Encountered an unknown key '" + std::string(key) + "'.\n" + detail::ignore_unknown_keys_hint,
                  key_pos);
  }

  int decode_object_index(const descriptor& desc) {
    bool has_comma = reader_->try_consume_comma();
    while (reader_->can_consume_value()) {
      if (current_index_ != -1 && !has_comma) {
        reader_->fail(error_code::missing_comma, "Expected end of the object or comma");
      }
      ++current_index_;
      has_comma = false;

      const std::string_view key = decode_string_key();
      const std::size_t key_pos = reader_->token_position();
      reader_->consume_expected(token_class::colon, [](token_class actual) {
        return std::string("Expected ':' after the key, but had ") + describe(actual) + " instead";
      });

      const int index = desc.element_index(key);
      if (index != descriptor::unknown_name) {
        if (opt_->coerce_input_values && coerce_input_value(desc, index)) {
          has_comma = reader_->try_consume_comma();
          continue;
        }
        return index;
      }

      handle_unknown(key, key_pos);
      has_comma = reader_->try_consume_comma();
    }
    if (has_comma) reader_->fail(error_code::trailing_comma, "Unexpected trailing comma");
    return decode_done;
  }

  int decode_list_index() {
    const bool has_comma = reader_->try_consume_comma();
    if (has_comma && current_index_ == -1) reader_->fail(error_code::leading_comma, "Unexpected leading comma");
    if (reader_->can_consume_value()) {
      if (current_index_ != -1 && !has_comma) {
        reader_->fail(error_code::missing_comma, "Expected end of the array or comma");
      }
      return ++current_index_;
    }
    if (has_comma) reader_->fail(error_code::trailing_comma, "Unexpected trailing comma");
    return decode_done;
  }

  // Even cursor values are keys, odd ones values; -1 is before the first key.
  int decode_map_index() {
    bool has_comma = false;
    const bool decoding_key = current_index_ % 2 != 0;
    if (decoding_key) {
      if (current_index_ != -1) has_comma = reader_->try_consume_comma();
    } else {
      reader_->consume_expected(token_class::colon, [](token_class actual) {
        return std::string("Expected ':' after the map key, but had ") + describe(actual) + " instead";
      });
    }

    if (reader_->can_consume_value()) {
      if (decoding_key && current_index_ != -1 && !has_comma) {
        reader_->fail(error_code::missing_comma, "Expected comma after the key-value pair");
      }
      return ++current_index_;
    }
    if (!decoding_key) {
      reader_->fail(error_code::unexpected_token,
                    std::string("Expected a map value after ':', but had ") + describe(reader_->peek_token()) +
                        " instead");
    }
    if (has_comma) reader_->fail(error_code::trailing_comma, "Expected '}', but had ',' instead");
    return decode_done;
  }

  reader* reader_;
  const decode_options* opt_;
  decode_mode mode_;
  int current_index_{-1};
  std::size_t depth_{0};
};

// Result of decoder::decode_inline. Integer decodes go to an unsigned_primitive_decoder when the
// inline type wraps an unsigned number; everything else goes to the originating decoder.
class inline_decoder {
public:
  explicit inline_decoder(decoder& self) noexcept : self_(&self) {}
  inline_decoder(decoder& self, unsigned_primitive_decoder unsigned_decoder) noexcept
      : self_(&self), unsigned_(unsigned_decoder) {}

  bool is_unsigned() const noexcept { return unsigned_.has_value(); }

  std::int8_t decode_byte() { return unsigned_ ? unsigned_->decode_byte() : self_->decode_byte(); }
  std::int16_t decode_short() { return unsigned_ ? unsigned_->decode_short() : self_->decode_short(); }
  std::int32_t decode_int() { return unsigned_ ? unsigned_->decode_int() : self_->decode_int(); }
  std::int64_t decode_long() { return unsigned_ ? unsigned_->decode_long() : self_->decode_long(); }

  bool decode_boolean() { return self_->decode_boolean(); }
  float decode_float() { return self_->decode_float(); }
  double decode_double() { return self_->decode_double(); }
  char32_t decode_char() { return self_->decode_char(); }
  std::string decode_string() { return self_->decode_string(); }
  bool decode_not_null_mark() { return self_->decode_not_null_mark(); }

  template <class T>
  T decode_serializable_value() {
    return self_->decode_serializable_value<T>();
  }

private:
  decoder* self_;
  std::optional<unsigned_primitive_decoder> unsigned_;
};

inline inline_decoder decoder::decode_inline(const descriptor& inline_desc) {
  if (inline_desc.is_unsigned_numeric()) return inline_decoder(*this, unsigned_primitive_decoder(*reader_));
  return inline_decoder(*this);
}

} // namespace jstream
