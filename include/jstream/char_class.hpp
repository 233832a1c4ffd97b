#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace jstream {

enum class token_class : std::uint8_t {
  other = 0, // literal chunk: digits, letters, any byte >= 0x7e
  string,
  string_escape,
  whitespace,
  comma,
  colon,
  begin_object,
  end_object,
  begin_array,
  end_array,
  null, // never produced by the table; `null` starts with an OTHER byte
  invalid,
  eof
};

namespace detail {

inline constexpr std::size_t char_table_size = 0x7e;
inline constexpr std::size_t escape_table_size = 0x75; // 'u' is handled by the caller

inline constexpr char invalid_escape = '\0';

constexpr std::array<token_class, char_table_size> make_char_to_token() noexcept {
  std::array<token_class, char_table_size> t{};
  for (std::size_t i = 0; i < char_table_size; ++i) t[i] = token_class::other;
  for (std::size_t i = 0; i <= 0x20; ++i) t[i] = token_class::invalid;

  t[0x09] = token_class::whitespace;
  t[0x0a] = token_class::whitespace;
  t[0x0d] = token_class::whitespace;
  t[0x20] = token_class::whitespace;
  t[static_cast<std::size_t>(',')] = token_class::comma;
  t[static_cast<std::size_t>(':')] = token_class::colon;
  t[static_cast<std::size_t>('{')] = token_class::begin_object;
  t[static_cast<std::size_t>('}')] = token_class::end_object;
  t[static_cast<std::size_t>('[')] = token_class::begin_array;
  t[static_cast<std::size_t>(']')] = token_class::end_array;
  t[static_cast<std::size_t>('"')] = token_class::string;
  t[static_cast<std::size_t>('\\')] = token_class::string_escape;
  return t;
}

constexpr std::array<char, escape_table_size> make_escape_to_char() noexcept {
  std::array<char, escape_table_size> t{};
  for (std::size_t i = 0; i < escape_table_size; ++i) t[i] = invalid_escape;

  t[static_cast<std::size_t>('b')] = '\b';
  t[static_cast<std::size_t>('t')] = '\t';
  t[static_cast<std::size_t>('n')] = '\n';
  t[static_cast<std::size_t>('f')] = '\f';
  t[static_cast<std::size_t>('r')] = '\r';
  t[static_cast<std::size_t>('/')] = '/';
  t[static_cast<std::size_t>('"')] = '"';
  t[static_cast<std::size_t>('\\')] = '\\';
  return t;
}

inline constexpr std::array<token_class, char_table_size> char_to_token = make_char_to_token();
inline constexpr std::array<char, escape_table_size> escape_to_char_table = make_escape_to_char();

} // namespace detail

constexpr token_class char_to_token_class(char c) noexcept {
  const unsigned char uc = static_cast<unsigned char>(c);
  return uc < detail::char_table_size ? detail::char_to_token[uc] : token_class::other;
}

// Returns detail::invalid_escape for letters that are not short escapes (including 'u').
constexpr char escape_to_char(char c) noexcept {
  const unsigned char uc = static_cast<unsigned char>(c);
  return uc < detail::escape_table_size ? detail::escape_to_char_table[uc] : detail::invalid_escape;
}

inline const char* describe(token_class tc) noexcept {
  switch (tc) {
    case token_class::other: return "literal";
    case token_class::string: return "'\"'";
    case token_class::string_escape: return "'\\'";
    case token_class::whitespace: return "whitespace";
    case token_class::comma: return "','";
    case token_class::colon: return "':'";
    case token_class::begin_object: return "'{'";
    case token_class::end_object: return "'}'";
    case token_class::begin_array: return "'['";
    case token_class::end_array: return "']'";
    case token_class::null: return "null";
    case token_class::invalid: return "invalid character";
    case token_class::eof: return "EOF";
  }
  return "unknown";
}

} // namespace jstream
