#pragma once

#include <jstream/decoder.hpp>
#include <jstream/descriptor.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// serializer<T> provides:
//   static const descriptor& get_descriptor();
//   static T deserialize(decoder& d);
// Specialize it for user types; the built-ins below cover the standard vocabulary types.

namespace jstream {

namespace detail {

template <serial_kind Kind>
struct primitive_serializer_base {
  static const descriptor& get_descriptor() {
    static const descriptor d = descriptor::primitive(Kind);
    return d;
  }
};

template <serial_kind Kind>
struct unsigned_serializer_base {
  static const descriptor& get_descriptor() {
    static const descriptor d = descriptor::inline_value(name(), descriptor::primitive(Kind), /*is_unsigned=*/true);
    return d;
  }

private:
  static const char* name() noexcept {
    switch (Kind) {
      case serial_kind::int8: return "UByte";
      case serial_kind::int16: return "UShort";
      case serial_kind::int32: return "UInt";
      default: return "ULong";
    }
  }
};

} // namespace detail

template <>
struct serializer<bool> : detail::primitive_serializer_base<serial_kind::boolean> {
  static bool deserialize(decoder& d) { return d.decode_boolean(); }
};

template <>
struct serializer<std::int8_t> : detail::primitive_serializer_base<serial_kind::int8> {
  static std::int8_t deserialize(decoder& d) { return d.decode_byte(); }
};

template <>
struct serializer<std::int16_t> : detail::primitive_serializer_base<serial_kind::int16> {
  static std::int16_t deserialize(decoder& d) { return d.decode_short(); }
};

template <>
struct serializer<std::int32_t> : detail::primitive_serializer_base<serial_kind::int32> {
  static std::int32_t deserialize(decoder& d) { return d.decode_int(); }
};

template <>
struct serializer<std::int64_t> : detail::primitive_serializer_base<serial_kind::int64> {
  static std::int64_t deserialize(decoder& d) { return d.decode_long(); }
};

template <>
struct serializer<float> : detail::primitive_serializer_base<serial_kind::float32> {
  static float deserialize(decoder& d) { return d.decode_float(); }
};

template <>
struct serializer<double> : detail::primitive_serializer_base<serial_kind::float64> {
  static double deserialize(decoder& d) { return d.decode_double(); }
};

template <>
struct serializer<char32_t> : detail::primitive_serializer_base<serial_kind::character> {
  static char32_t deserialize(decoder& d) { return d.decode_char(); }
};

template <>
struct serializer<std::string> : detail::primitive_serializer_base<serial_kind::string> {
  static std::string deserialize(decoder& d) { return d.decode_string(); }
};

// Unsigned integers are inline wrappers over the signed type of the same width.
template <>
struct serializer<std::uint8_t> : detail::unsigned_serializer_base<serial_kind::int8> {
  static std::uint8_t deserialize(decoder& d) {
    return static_cast<std::uint8_t>(d.decode_inline(get_descriptor()).decode_byte());
  }
};

template <>
struct serializer<std::uint16_t> : detail::unsigned_serializer_base<serial_kind::int16> {
  static std::uint16_t deserialize(decoder& d) {
    return static_cast<std::uint16_t>(d.decode_inline(get_descriptor()).decode_short());
  }
};

template <>
struct serializer<std::uint32_t> : detail::unsigned_serializer_base<serial_kind::int32> {
  static std::uint32_t deserialize(decoder& d) {
    return static_cast<std::uint32_t>(d.decode_inline(get_descriptor()).decode_int());
  }
};

template <>
struct serializer<std::uint64_t> : detail::unsigned_serializer_base<serial_kind::int64> {
  static std::uint64_t deserialize(decoder& d) {
    return static_cast<std::uint64_t>(d.decode_inline(get_descriptor()).decode_long());
  }
};

template <class T>
struct serializer<std::optional<T>> {
  static const descriptor& get_descriptor() {
    static const descriptor d = descriptor::nullable(serializer<T>::get_descriptor());
    return d;
  }

  static std::optional<T> deserialize(decoder& d) {
    if (!d.decode_not_null_mark()) {
      d.decode_null();
      return std::nullopt;
    }
    return serializer<T>::deserialize(d);
  }
};

template <class T>
struct serializer<std::vector<T>> {
  static const descriptor& get_descriptor() {
    static const descriptor d = descriptor::list(serializer<T>::get_descriptor());
    return d;
  }

  static std::vector<T> deserialize(decoder& d) {
    const descriptor& desc = get_descriptor();
    decoder c = d.begin_structure(desc);
    std::vector<T> out;
    while (c.decode_element_index(desc) != decoder::decode_done) {
      out.push_back(c.decode_serializable_value<T>());
    }
    c.end_structure(desc);
    return out;
  }
};

template <class K, class V, class Compare, class Alloc>
struct serializer<std::map<K, V, Compare, Alloc>> {
  static const descriptor& get_descriptor() {
    static const descriptor d = descriptor::map(serializer<K>::get_descriptor(), serializer<V>::get_descriptor());
    return d;
  }

  // Later duplicates of a key overwrite earlier ones.
  static std::map<K, V, Compare, Alloc> deserialize(decoder& d) {
    const descriptor& desc = get_descriptor();
    decoder c = d.begin_structure(desc);
    std::map<K, V, Compare, Alloc> out;
    while (c.decode_element_index(desc) != decoder::decode_done) {
      K key = c.decode_serializable_value<K>();
      // A value half always follows a key half; decode_element_index fails otherwise.
      c.decode_element_index(desc);
      out.insert_or_assign(std::move(key), c.decode_serializable_value<V>());
    }
    c.end_structure(desc);
    return out;
  }
};

} // namespace jstream
