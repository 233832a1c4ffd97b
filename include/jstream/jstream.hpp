#pragma once

// jstream: a small, header-only C++17 streaming JSON decoder.
// Values are decoded straight into typed objects, driven by descriptors, without an intermediate tree.
// Strict JSON by default, high-quality errors.

#include <jstream/char_class.hpp>
#include <jstream/decoder.hpp>
#include <jstream/descriptor.hpp>
#include <jstream/error.hpp>
#include <jstream/options.hpp>
#include <jstream/reader.hpp>
#include <jstream/serializer.hpp>

#include <string>
#include <string_view>

namespace jstream {

template <class T>
struct decode_result {
  T val{};
  error err;
  std::string message;
};

template <class T>
inline T decode_or_throw(std::string_view json, decode_options opt = {}) {
  reader r(json, opt.max_depth);
  decoder root(r, decode_mode::object, opt);
  T out = root.decode_serializable_value<T>();
  if (opt.require_eof && !r.at_end()) {
    r.fail(error_code::trailing_characters, "Expected EOF after parsing, but had " +
                                                std::string(describe(r.peek_token())) + " instead");
  }
  return out;
}

template <class T>
inline decode_result<T> decode(std::string_view json, decode_options opt = {}) {
  decode_result<T> r;
  try {
    r.val = decode_or_throw<T>(json, opt);
  } catch (const decoding_error& e) {
    r.err = e.err();
    r.message = e.message();
  }
  return r;
}

} // namespace jstream
