#pragma once

#include <jstream/char_class.hpp>
#include <jstream/error.hpp>

#include <cstddef>
#include <cstdint>
#include <cstring>
#if defined(_M_X64) || defined(__SSE2__)
  #if defined(_MSC_VER)
    #include <intrin.h>
  #endif
  #include <immintrin.h>
#endif
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace jstream {

namespace detail {

inline constexpr const char* lenient_hint = "Use 'is_lenient = true' in decode_options to accept non-compliant JSON.";

inline bool is_ws(char c) noexcept {
  return c == ' ' || c == '\n' || c == '\r' || c == '\t';
}

inline int hex_val(char c) noexcept {
  const unsigned char uc = static_cast<unsigned char>(c);
  if (uc >= static_cast<unsigned char>('0') && uc <= static_cast<unsigned char>('9')) {
    return static_cast<int>(uc - static_cast<unsigned char>('0'));
  }
  const unsigned char lc = static_cast<unsigned char>(uc | 0x20u); // ASCII to-lower
  if (lc >= static_cast<unsigned char>('a') && lc <= static_cast<unsigned char>('f')) {
    return 10 + static_cast<int>(lc - static_cast<unsigned char>('a'));
  }
  return -1;
}

inline void append_utf8(std::string& out, std::uint32_t cp) {
  if (cp <= 0x7Fu) {
    out.push_back(static_cast<char>(cp));
  } else if (cp <= 0x7FFu) {
    out.push_back(static_cast<char>(0xC0u | (cp >> 6)));
    out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
  } else if (cp <= 0xFFFFu) {
    out.push_back(static_cast<char>(0xE0u | (cp >> 12)));
    out.push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
  } else {
    out.push_back(static_cast<char>(0xF0u | (cp >> 18)));
    out.push_back(static_cast<char>(0x80u | ((cp >> 12) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
  }
}

inline std::string quote_char(char c) {
  const unsigned char uc = static_cast<unsigned char>(c);
  if (uc < 0x20u || uc == 0x7Fu) {
    static const char* digits = "0123456789abcdef";
    std::string out = "'\\u00";
    out.push_back(digits[uc >> 4]);
    out.push_back(digits[uc & 0xFu]);
    out.push_back('\'');
    return out;
  }
  return std::string("'") + c + "'";
}

// `true`, `false`, `null`, or a number: an optional sign, digits, an optional fraction and an
// optional exponent. A leading '+' and leading zeros are tolerated, as in the number decoders.
inline bool is_strict_literal(std::string_view s, bool special_floats) noexcept {
  if (s == "true" || s == "false" || s == "null") return true;
  if (special_floats && (s == "NaN" || s == "Infinity" || s == "-Infinity" || s == "nan" || s == "inf" || s == "-inf")) {
    return true;
  }
  std::size_t i = 0;
  const std::size_t n = s.size();
  const auto digits = [&]() {
    const std::size_t from = i;
    while (i < n && s[i] >= '0' && s[i] <= '9') ++i;
    return i > from;
  };
  if (i < n && (s[i] == '-' || s[i] == '+')) ++i;
  if (!digits()) return false;
  if (i < n && s[i] == '.') {
    ++i;
    if (!digits()) return false;
  }
  if (i < n && (s[i] == 'e' || s[i] == 'E')) {
    ++i;
    if (i < n && (s[i] == '-' || s[i] == '+')) ++i;
    if (!digits()) return false;
  }
  return i == n;
}

} // namespace detail

// Cursor over an immutable JSON text. Views returned by the string-consuming calls point either
// into the source or into the reader's unescape buffer; the latter stay valid until the next
// string-consuming call.
class reader {
public:
  explicit reader(std::string_view source, std::size_t max_depth = 256) noexcept
      : source_(source), max_depth_(max_depth) {}

  reader(const reader&) = delete;
  reader& operator=(const reader&) = delete;

  std::string_view source() const noexcept { return source_; }
  std::size_t position() const noexcept { return pos_; }
  // Offset of the first character (including an opening quote) of the last string or literal.
  std::size_t token_position() const noexcept { return token_pos_; }

  token_class peek_token() noexcept {
    skip_whitespace();
    if (pos_ >= source_.size()) return token_class::eof;
    return char_to_token_class(source_[pos_]);
  }

  token_class consume_token() noexcept {
    const token_class tc = peek_token();
    if (tc != token_class::eof) ++pos_;
    return tc;
  }

  template <class ErrorFn>
  token_class consume_expected(token_class expected, ErrorFn&& error_fn) {
    const token_class actual = peek_token();
    if (actual != expected) fail(mismatch_code(expected, actual), error_fn(actual), pos_);
    ++pos_;
    return actual;
  }

  token_class consume_expected(token_class expected) {
    return consume_expected(expected, [expected](token_class actual) {
      return std::string("Expected ") + describe(expected) + ", but had " + describe(actual) + " instead";
    });
  }

  bool try_consume_comma() noexcept {
    if (peek_token() != token_class::comma) return false;
    ++pos_;
    return true;
  }

  bool can_consume_value() noexcept {
    switch (peek_token()) {
      case token_class::begin_array:
      case token_class::begin_object:
      case token_class::other:
      case token_class::string:
      case token_class::null:
        return true;
      default:
        return false;
    }
  }

  // True when the next value is the literal `null`. Consumes whitespace only.
  bool peek_null() noexcept {
    skip_whitespace();
    if (source_.size() - pos_ < 4) return false;
    if (source_.compare(pos_, 4, "null") != 0) return false;
    return pos_ + 4 == source_.size() || char_to_token_class(source_[pos_ + 4]) != token_class::other;
  }

  // Returns false and consumes the literal when the next value is `null`; otherwise consumes nothing.
  bool try_consume_not_null() noexcept {
    if (!peek_null()) return true;
    pos_ += 4;
    return false;
  }

  std::string_view consume_string() {
    consume_expected(token_class::string, [](token_class actual) {
      return std::string("Expected quoted string, but had ") + describe(actual) + " instead";
    });
    return scan_string(pos_ - 1);
  }

  std::string_view consume_key_string() {
    const token_class tc = peek_token();
    if (tc != token_class::string) {
      fail(tc == token_class::eof ? error_code::unexpected_eof : error_code::expected_key_string,
           std::string("Expected quoted string as an object key, but had ") + describe(tc) + " instead", pos_);
    }
    const std::size_t open = pos_;
    const char* begin = source_.data() + open + 1;
    const void* q = std::memchr(begin, '"', source_.size() - open - 1);
    if (q == nullptr) fail(error_code::unexpected_eof, "Unterminated object key", open);
    const char* quote = static_cast<const char*>(q);
    for (const char* p = begin; p != quote; ++p) {
      // Escaped keys take the full unescaping path; the quote found above may itself be escaped.
      if (*p == '\\') return scan_string(open);
      if (static_cast<unsigned char>(*p) < 0x20u) {
        fail(error_code::invalid_string, "Unescaped control character " + detail::quote_char(*p) + " in object key",
             static_cast<std::size_t>(p - source_.data()));
      }
    }
    token_pos_ = open;
    pos_ = static_cast<std::size_t>(quote - source_.data()) + 1;
    return std::string_view(begin, static_cast<std::size_t>(quote - begin));
  }

  // Quoted strings are unescaped as in consume_string; otherwise the run of literal characters is returned.
  std::string_view consume_string_lenient() {
    const token_class tc = peek_token();
    if (tc == token_class::string) {
      ++pos_;
      return scan_string(pos_ - 1);
    }
    const std::size_t start = pos_;
    while (pos_ < source_.size() && char_to_token_class(source_[pos_]) == token_class::other) ++pos_;
    if (pos_ == start) {
      fail(tc == token_class::eof ? error_code::unexpected_eof : error_code::unexpected_token,
           std::string("Expected string or literal, but had ") + describe(tc) + " instead", start);
    }
    token_pos_ = start;
    return source_.substr(start, pos_ - start);
  }

  // Reads the next string without moving the cursor. Returns nullopt if no string (or, when
  // lenient, no literal) follows. Invalidates views into the unescape buffer.
  std::optional<std::string> peek_string(bool lenient) {
    const token_class tc = peek_token();
    if (tc != token_class::string && !(lenient && tc == token_class::other)) return std::nullopt;
    const std::size_t snapshot = pos_;
    const std::size_t token_snapshot = token_pos_;
    std::string out(lenient ? consume_string_lenient() : consume_string());
    pos_ = snapshot;
    token_pos_ = token_snapshot;
    return out;
  }

  // Consumes one complete value and checks its grammar without decoding it. In lenient mode any
  // run of literal characters is a value or a key; otherwise literals must be `true`, `false`,
  // `null` or a number, plus `NaN` and the infinities when `special_floats` is set.
  void skip_element(bool lenient = false, bool special_floats = false) {
    std::vector<skip_frame> stack;
    do {
      const token_class tc = peek_token();
      const std::size_t at = pos_;
      skip_frame* top = stack.empty() ? nullptr : &stack.back();
      switch (tc) {
        case token_class::end_object:
        case token_class::end_array: {
          if (top == nullptr) fail_skip(top, tc, at);
          const token_class closing = top->tc == token_class::begin_object ? token_class::end_object : token_class::end_array;
          if (tc != closing) {
            fail(error_code::bracket_mismatch,
                 std::string("found ") + describe(tc) + " closing " + describe(top->tc) + " opened at offset " +
                     std::to_string(top->at) + ", expected " + describe(closing),
                 at);
          }
          if (top->next != skip_state::first && top->next != skip_state::comma_or_close) fail_skip(top, tc, at);
          stack.pop_back();
          ++pos_;
          break;
        }
        case token_class::comma:
          if (top == nullptr || top->next != skip_state::comma_or_close) fail_skip(top, tc, at);
          top->next = skip_state::after_comma;
          ++pos_;
          break;
        case token_class::colon:
          if (top == nullptr || top->next != skip_state::colon) fail_skip(top, tc, at);
          top->next = skip_state::member_value;
          ++pos_;
          break;
        case token_class::begin_object:
        case token_class::begin_array:
        case token_class::string:
        case token_class::other:
          if (top != nullptr && top->expects_key()) {
            if (tc == token_class::string) {
              ++pos_;
              skip_string_body(at);
            } else if (tc == token_class::other && lenient) {
              skip_literal_run();
            } else {
              fail_skip(top, tc, at);
            }
            top->next = skip_state::colon;
            break;
          }
          if (top != nullptr && !top->expects_value()) fail_skip(top, tc, at);
          if (top != nullptr) top->next = skip_state::comma_or_close;
          if (tc == token_class::begin_object || tc == token_class::begin_array) {
            if (stack.size() >= max_depth_) fail(error_code::nesting_too_deep, "Nesting is too deep", at);
            stack.push_back(skip_frame{tc, at, skip_state::first});
            ++pos_;
          } else if (tc == token_class::string) {
            ++pos_;
            skip_string_body(at);
          } else {
            const std::string_view text = skip_literal_run();
            if (!lenient && !detail::is_strict_literal(text, special_floats)) {
              fail(error_code::unexpected_token,
                   "Unexpected literal '" + std::string(text) + "'.\n" + detail::lenient_hint,
                   at);
            }
          }
          break;
        case token_class::eof:
          fail(error_code::unexpected_eof,
               stack.empty() ? std::string("Expected a value, but had EOF instead")
                             : std::string("Unexpected EOF inside ") + describe(stack.back().tc) + " opened at offset " +
                                   std::to_string(stack.back().at),
               at);
        case token_class::string_escape:
        case token_class::invalid:
        case token_class::whitespace:
        case token_class::null:
          fail(error_code::unexpected_token, "Unexpected character " + detail::quote_char(source_[at]), at);
      }
    } while (!stack.empty());
  }

  // Consumes trailing whitespace and reports whether the input is exhausted.
  bool at_end() noexcept { return peek_token() == token_class::eof; }

  [[noreturn]] void fail(error_code code, std::string message) const { fail(code, std::move(message), pos_); }

  [[noreturn]] void fail(error_code code, std::string message, std::size_t at) const {
    throw decoding_error(code, at, std::move(message), source_);
  }

private:
  static error_code mismatch_code(token_class expected, token_class actual) noexcept {
    if (actual == token_class::eof) return error_code::unexpected_eof;
    if (expected == token_class::colon) return error_code::expected_colon;
    return error_code::unexpected_token;
  }

  // What a bracket being skipped accepts next. `first` is right after the opening bracket.
  enum class skip_state { first, after_comma, colon, member_value, comma_or_close };

  struct skip_frame {
    token_class tc;
    std::size_t at;
    skip_state next;

    bool is_object() const noexcept { return tc == token_class::begin_object; }
    bool expects_key() const noexcept {
      return is_object() && (next == skip_state::first || next == skip_state::after_comma);
    }
    bool expects_value() const noexcept {
      return next == skip_state::member_value ||
             (!is_object() && (next == skip_state::first || next == skip_state::after_comma));
    }
  };

  [[noreturn]] void fail_skip(const skip_frame* top, token_class actual, std::size_t at) const {
    const bool is_value = actual == token_class::begin_object || actual == token_class::begin_array ||
                          actual == token_class::string || actual == token_class::other;
    const bool is_close = actual == token_class::end_object || actual == token_class::end_array;
    error_code code = error_code::unexpected_token;
    const char* expected = "a value";
    if (top != nullptr) {
      switch (top->next) {
        case skip_state::first:
          if (actual == token_class::comma) {
            code = error_code::leading_comma;
          } else if (top->is_object() && !is_close) {
            code = error_code::expected_key_string;
          }
          expected = top->is_object() ? "a quoted key or '}'" : "a value or ']'";
          break;
        case skip_state::after_comma:
          if (is_close) {
            code = error_code::trailing_comma;
          } else if (top->is_object()) {
            code = error_code::expected_key_string;
          }
          expected = top->is_object() ? "a quoted key" : "a value";
          break;
        case skip_state::colon:
          code = error_code::expected_colon;
          expected = "':'";
          break;
        case skip_state::member_value:
          break;
        case skip_state::comma_or_close:
          if (is_value) code = error_code::missing_comma;
          expected = top->is_object() ? "',' or '}'" : "',' or ']'";
          break;
      }
    }
    fail(code, std::string("Expected ") + expected + ", but had " + describe(actual) + " instead", at);
  }

  std::string_view skip_literal_run() noexcept {
    const std::size_t start = pos_;
    while (pos_ < source_.size() && char_to_token_class(source_[pos_]) == token_class::other) ++pos_;
    return source_.substr(start, pos_ - start);
  }

  void skip_whitespace() noexcept {
    const char* buf = source_.data();
    const std::size_t size = source_.size();
    std::size_t i = pos_;
    // Fast path: SSE2 scan 16 bytes at a time (available on MSVC x64 and most x86).
#if defined(_M_X64) || defined(__SSE2__)
    while (i + 16 <= size) {
      const __m128i v = _mm_loadu_si128(reinterpret_cast<const __m128i*>(buf + i));
      const __m128i is_space = _mm_cmpeq_epi8(v, _mm_set1_epi8(' '));
      const __m128i is_nl = _mm_cmpeq_epi8(v, _mm_set1_epi8('\n'));
      const __m128i is_cr = _mm_cmpeq_epi8(v, _mm_set1_epi8('\r'));
      const __m128i is_tab = _mm_cmpeq_epi8(v, _mm_set1_epi8('\t'));
      const __m128i is_ws_v = _mm_or_si128(_mm_or_si128(is_space, is_nl), _mm_or_si128(is_cr, is_tab));
      const unsigned ws_mask = static_cast<unsigned>(_mm_movemask_epi8(is_ws_v));
      if (ws_mask == 0xFFFFu) {
        i += 16;
        continue;
      }
      const unsigned non = (~ws_mask) & 0xFFFFu;
#if defined(_MSC_VER)
      unsigned long idx = 0;
      _BitScanForward(&idx, non);
      i += static_cast<std::size_t>(idx);
#else
      i += static_cast<std::size_t>(__builtin_ctz(non));
#endif
      pos_ = i;
      return;
    }
#endif
    while (i < size && char_to_token_class(buf[i]) == token_class::whitespace) ++i;
    pos_ = i;
  }

  // `open` is the offset of the opening quote; on return the cursor is past the closing quote.
  std::string_view scan_string(std::size_t open) {
    const char* base = source_.data();
    const std::size_t n = source_.size();
    std::size_t cur = open + 1;
    std::size_t last = cur;
    bool escaped = false;

    while (true) {
#if defined(_M_X64) || defined(__SSE2__)
      {
        const __m128i q = _mm_set1_epi8('"');
        const __m128i bs = _mm_set1_epi8('\\');
        const __m128i k1f = _mm_set1_epi8(0x1F);
        const __m128i zero = _mm_setzero_si128();
        while (cur + 16 <= n) {
          const __m128i v = _mm_loadu_si128(reinterpret_cast<const __m128i*>(base + cur));
          const __m128i is_q = _mm_cmpeq_epi8(v, q);
          const __m128i is_bs = _mm_cmpeq_epi8(v, bs);
          const __m128i sub = _mm_subs_epu8(v, k1f);
          const __m128i is_ctrl = _mm_cmpeq_epi8(sub, zero);
          const __m128i any = _mm_or_si128(_mm_or_si128(is_q, is_bs), is_ctrl);
          const int mask = _mm_movemask_epi8(any);
          if (mask == 0) {
            cur += 16;
            continue;
          }
#if defined(_MSC_VER)
          unsigned long bit = 0;
          _BitScanForward(&bit, static_cast<unsigned long>(mask));
          cur += static_cast<std::size_t>(bit);
#else
          cur += static_cast<std::size_t>(__builtin_ctz(static_cast<unsigned>(mask)));
#endif
          break;
        }
      }
#endif
      if (cur >= n) fail(error_code::unexpected_eof, "Unterminated string", open);

      const char c = base[cur];
      if (c == '"') break;
      if (c == '\\') {
        if (!escaped) {
          escape_buf_.clear();
          escaped = true;
        }
        append_range(last, cur);
        cur = append_escape(cur + 1);
        last = cur;
        continue;
      }
      if (static_cast<unsigned char>(c) < 0x20u) {
        fail(error_code::invalid_string, "Unescaped control character " + detail::quote_char(c) + " in string", cur);
      }
      ++cur;
    }

    token_pos_ = open;
    pos_ = cur + 1;
    if (!escaped) return source_.substr(last, cur - last);
    append_range(last, cur);
    return std::string_view(escape_buf_.data(), escape_buf_.size());
  }

  // Initializes buffer growth on the first escape; capacity at least doubles.
  void append_range(std::size_t from, std::size_t to) {
    const std::size_t add = to - from;
    const std::size_t need = escape_buf_.size() + add;
    if (need > escape_buf_.capacity()) {
      const std::size_t doubled = escape_buf_.capacity() * 2;
      escape_buf_.reserve(need > doubled ? need : doubled);
    }
    escape_buf_.append(source_.data() + from, add);
  }

  // `at` is just past the backslash. Returns the offset after the escape sequence.
  std::size_t append_escape(std::size_t at) {
    if (at >= source_.size()) fail(error_code::unexpected_eof, "Unexpected EOF after escape character", at);
    const char c = source_[at++];
    if (c == 'u') return append_unicode(at);
    const char out = escape_to_char(c);
    if (out == detail::invalid_escape) {
      fail(error_code::invalid_escape, "Invalid escaped char " + detail::quote_char(c), at - 1);
    }
    escape_buf_.push_back(out);
    return at;
  }

  std::size_t append_unicode(std::size_t at) {
    std::uint32_t cp = 0;
    at = read_unicode_escape(at, cp);
    detail::append_utf8(escape_buf_, cp);
    return at;
  }

  // `at` is just past `\u`; a high surrogate must be followed by an escaped low surrogate.
  std::size_t read_unicode_escape(std::size_t at, std::uint32_t& out) const {
    std::uint32_t cp = read_u4(at);
    at += 4;
    if (cp >= 0xD800u && cp <= 0xDBFFu) {
      if (at + 2 > source_.size() || source_[at] != '\\' || source_[at + 1] != 'u') {
        fail(error_code::invalid_utf16_surrogate, "Expected low surrogate after high surrogate in unicode escape", at);
      }
      at += 2;
      const std::uint32_t low = read_u4(at);
      if (low < 0xDC00u || low > 0xDFFFu) {
        fail(error_code::invalid_utf16_surrogate, "Invalid low surrogate in unicode escape", at);
      }
      at += 4;
      cp = 0x10000u + (((cp - 0xD800u) << 10) | (low - 0xDC00u));
    } else if (cp >= 0xDC00u && cp <= 0xDFFFu) {
      fail(error_code::invalid_utf16_surrogate, "Unpaired low surrogate in unicode escape", at - 4);
    }
    out = cp;
    return at;
  }

  std::uint32_t read_u4(std::size_t at) const {
    std::uint32_t v = 0;
    for (std::size_t k = 0; k < 4; ++k) {
      if (at + k >= source_.size()) {
        fail(error_code::unexpected_eof, "Unexpected EOF during unicode escape", source_.size());
      }
      const int h = detail::hex_val(source_[at + k]);
      if (h < 0) {
        fail(error_code::invalid_unicode_escape,
             "Invalid hex char " + detail::quote_char(source_[at + k]) + " in unicode escape", at + k);
      }
      v = (v << 4) | static_cast<std::uint32_t>(h);
    }
    return v;
  }

  // Skips to the closing quote without decoding; escapes and control bytes are checked as in
  // scan_string. The cursor is just past the opening quote.
  void skip_string_body(std::size_t open) {
    std::size_t cur = pos_;
    const std::size_t n = source_.size();
    while (cur < n) {
      const char c = source_[cur];
      if (c == '"') {
        pos_ = cur + 1;
        return;
      }
      if (c == '\\') {
        if (cur + 1 >= n) fail(error_code::unexpected_eof, "Unexpected EOF after escape character", cur + 1);
        const char e = source_[cur + 1];
        if (e == 'u') {
          std::uint32_t cp = 0;
          cur = read_unicode_escape(cur + 2, cp);
          continue;
        }
        if (escape_to_char(e) == detail::invalid_escape) {
          fail(error_code::invalid_escape, "Invalid escaped char " + detail::quote_char(e), cur + 1);
        }
        cur += 2;
        continue;
      }
      if (static_cast<unsigned char>(c) < 0x20u) {
        fail(error_code::invalid_string, "Unescaped control character " + detail::quote_char(c) + " in string", cur);
      }
      ++cur;
    }
    fail(error_code::unexpected_eof, "Unterminated string", open);
  }

  std::string_view source_;
  std::size_t pos_{0};
  std::size_t token_pos_{0};
  std::size_t max_depth_{256};
  std::string escape_buf_;
};

} // namespace jstream
