#pragma once

#include <jstream/jstream.hpp>

#include <cstddef>
#include <cstdint>
#include <random>
#include <string>

namespace jstream_bench {

struct record {
  std::uint64_t id{0};
  bool ok{false};
  std::string name;
  double val{0.0};
};

// [{"id":N,"ok":B,"name":"...","val":F}, ...]; `with_extra` adds a member no record knows.
inline std::string make_payload(std::size_t n_objects, std::size_t str_len, bool with_extra = false) {
  std::mt19937_64 rng(1234567);
  std::uniform_int_distribution<int> ch('a', 'z');

  std::string s;
  s.reserve(n_objects * (str_len + 96));
  s.push_back('[');
  for (std::size_t i = 0; i < n_objects; ++i) {
    if (i) s.push_back(',');
    s += "{\"id\":";
    s += std::to_string(static_cast<std::uint64_t>(i));
    s += ",\"ok\":";
    s += (i % 2 == 0) ? "true" : "false";
    s += ",\"name\":\"";

    for (std::size_t k = 0; k < str_len; ++k) {
      // Keep it ASCII (no escaping) to make pure decode cost visible.
      s.push_back(static_cast<char>(ch(rng)));
    }

    // Add some escapes/unicode occasionally.
    if ((i % 16) == 0) {
      s += "\\n";
      s += "\\u4F60\\u597D";
    }

    s += "\",\"val\":";
    // Keep this field float-heavy to stress number parsing.
    s += (i % 3 == 0) ? "3.141592653589793" : "1e-10";
    if (with_extra) s += ",\"extra\":{\"tags\":[\"a\",\"b\"],\"n\":null}";
    s += "}";
  }
  s.push_back(']');
  return s;
}

} // namespace jstream_bench

namespace jstream {

template <>
struct serializer<jstream_bench::record> {
  static const descriptor& get_descriptor() {
    static const descriptor d = descriptor::object("record", {
                                                                 {"id", serializer<std::uint64_t>::get_descriptor()},
                                                                 {"ok", serializer<bool>::get_descriptor()},
                                                                 {"name", serializer<std::string>::get_descriptor()},
                                                                 {"val", serializer<double>::get_descriptor()},
                                                             });
    return d;
  }

  static jstream_bench::record deserialize(decoder& d) {
    const descriptor& desc = get_descriptor();
    decoder c = d.begin_structure(desc);
    jstream_bench::record r;
    for (int i = c.decode_element_index(desc); i != decoder::decode_done; i = c.decode_element_index(desc)) {
      switch (i) {
        case 0: r.id = c.decode_serializable_value<std::uint64_t>(); break;
        case 1: r.ok = c.decode_boolean(); break;
        case 2: r.name = c.decode_string(); break;
        case 3: r.val = c.decode_double(); break;
        default: c.skip_value(); break;
      }
    }
    c.end_structure(desc);
    return r;
  }
};

} // namespace jstream
