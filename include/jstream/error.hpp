#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace jstream {

enum class error_code {
  ok = 0,
  unexpected_eof,
  unexpected_token,
  invalid_string,
  invalid_escape,
  invalid_unicode_escape,
  invalid_utf16_surrogate,
  expected_colon,
  expected_key_string,
  leading_comma,
  trailing_comma,
  missing_comma,
  bracket_mismatch,
  trailing_characters,
  nesting_too_deep,
  unknown_key,
  unknown_enum_value,
  invalid_literal,
  special_float_not_allowed
};

inline const char* to_string(error_code code) noexcept {
  switch (code) {
    case error_code::ok: return "ok";
    case error_code::unexpected_eof: return "unexpected_eof";
    case error_code::unexpected_token: return "unexpected_token";
    case error_code::invalid_string: return "invalid_string";
    case error_code::invalid_escape: return "invalid_escape";
    case error_code::invalid_unicode_escape: return "invalid_unicode_escape";
    case error_code::invalid_utf16_surrogate: return "invalid_utf16_surrogate";
    case error_code::expected_colon: return "expected_colon";
    case error_code::expected_key_string: return "expected_key_string";
    case error_code::leading_comma: return "leading_comma";
    case error_code::trailing_comma: return "trailing_comma";
    case error_code::missing_comma: return "missing_comma";
    case error_code::bracket_mismatch: return "bracket_mismatch";
    case error_code::trailing_characters: return "trailing_characters";
    case error_code::nesting_too_deep: return "nesting_too_deep";
    case error_code::unknown_key: return "unknown_key";
    case error_code::unknown_enum_value: return "unknown_enum_value";
    case error_code::invalid_literal: return "invalid_literal";
    case error_code::special_float_not_allowed: return "special_float_not_allowed";
  }
  return "unknown";
}

struct error {
  error_code code{error_code::ok};
  std::size_t offset{0};
  std::size_t line{1};
  std::size_t column{1};

  constexpr explicit operator bool() const noexcept { return code != error_code::ok; }
};

namespace detail {

inline void update_line_col(std::string_view s, std::size_t pos, std::size_t& line, std::size_t& col) {
  line = 1;
  col = 1;
  for (std::size_t i = 0; i < pos && i < s.size(); ++i) {
    if (s[i] == '\n') {
      ++line;
      col = 1;
    } else {
      ++col;
    }
  }
}

inline std::string make_what(std::size_t offset, const std::string& message) {
  std::string out = "Unexpected JSON token at offset ";
  out += std::to_string(offset);
  out += ": ";
  out += message;
  return out;
}

} // namespace detail

// Renders the source line containing `offset` followed by a caret under the offending column.
// Long lines are clipped to a window around the caret.
inline std::string format_error_context(std::string_view source, std::size_t offset) {
  constexpr std::size_t kWindow = 40;
  if (offset > source.size()) offset = source.size();

  std::size_t line_begin = offset;
  while (line_begin > 0 && source[line_begin - 1] != '\n') --line_begin;
  std::size_t line_end = offset;
  while (line_end < source.size() && source[line_end] != '\n') ++line_end;

  std::size_t from = line_begin;
  std::size_t to = line_end;
  bool clipped_front = false;
  bool clipped_back = false;
  if (offset - from > kWindow) {
    from = offset - kWindow;
    clipped_front = true;
  }
  if (to - offset > kWindow) {
    to = offset + kWindow;
    clipped_back = true;
  }

  std::string out;
  if (clipped_front) out += "...";
  out.append(source.data() + from, to - from);
  if (clipped_back) out += "...";
  out.push_back('\n');
  out.append((clipped_front ? 3u : 0u) + (offset - from), ' ');
  out.push_back('^');
  return out;
}

class decoding_error : public std::runtime_error {
public:
  decoding_error(error_code code, std::size_t offset, std::string message, std::string_view source)
      : std::runtime_error(detail::make_what(offset, message)),
        message_(std::move(message)),
        source_(source) {
    err_.code = code;
    err_.offset = offset;
    detail::update_line_col(source, offset, err_.line, err_.column);
  }

  const error& err() const noexcept { return err_; }
  error_code code() const noexcept { return err_.code; }
  std::size_t offset() const noexcept { return err_.offset; }

  // Message without the offset prefix carried by what().
  const std::string& message() const noexcept { return message_; }
  const std::string& source() const noexcept { return source_; }

  std::string context() const { return format_error_context(source_, err_.offset); }

private:
  error err_;
  std::string message_;
  std::string source_;
};

} // namespace jstream
