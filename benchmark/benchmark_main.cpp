#include "record.hpp"

#include <jstream/jstream.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <algorithm>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace {

using clock_type = std::chrono::high_resolution_clock;
using jstream_bench::record;

template <class T>
inline void do_not_optimize(const T& v) {
#if defined(_MSC_VER)
  volatile const char* p = reinterpret_cast<const char*>(&v);
  (void)p;
#else
  asm volatile("" : : "g"(v) : "memory");
#endif
}

struct bench_result {
  double seconds{0.0};
  std::size_t bytes{0};
};

template <class Fn>
bench_result run_median(std::size_t runs, Fn&& fn) {
  if (runs <= 1) return fn();
  std::vector<double> secs;
  secs.reserve(runs);
  std::size_t bytes = 0;
  for (std::size_t r = 0; r < runs; ++r) {
    const auto br = fn();
    secs.push_back(br.seconds);
    bytes = br.bytes;
  }
  std::nth_element(secs.begin(), secs.begin() + (secs.size() / 2), secs.end());
  return {secs[secs.size() / 2], bytes};
}

bench_result bench_decode(std::string_view json, std::size_t iters, const jstream::decode_options& opt) {
  const auto t0 = clock_type::now();
  for (std::size_t i = 0; i < iters; ++i) {
    auto r = jstream::decode<std::vector<record>>(json, opt);
    do_not_optimize(r.err.code);
    do_not_optimize(r.val.size());
  }
  const auto t1 = clock_type::now();
  const double sec = std::chrono::duration<double>(t1 - t0).count();
  return {sec, json.size() * iters};
}

bench_result bench_skim(std::string_view json, std::size_t iters) {
  const auto t0 = clock_type::now();
  for (std::size_t i = 0; i < iters; ++i) {
    jstream::reader r(json);
    r.skip_element();
    do_not_optimize(r.position());
  }
  const auto t1 = clock_type::now();
  const double sec = std::chrono::duration<double>(t1 - t0).count();
  return {sec, json.size() * iters};
}

void print_mbps(const char* name, const bench_result& r) {
  const double mb = static_cast<double>(r.bytes) / (1024.0 * 1024.0);
  const double mbps = (r.seconds > 0.0) ? (mb / r.seconds) : 0.0;
  std::cout << name << ": " << mbps << " MiB/s (" << r.seconds << " s)" << "\n";
}

} // namespace

int main(int argc, char** argv) {
  std::size_t n_objects = 2000;
  std::size_t str_len = 24;
  std::size_t iters = 200;
  std::size_t runs = 5;

  if (argc >= 2) n_objects = static_cast<std::size_t>(std::stoull(argv[1]));
  if (argc >= 3) iters = static_cast<std::size_t>(std::stoull(argv[2]));
  if (argc >= 4) runs = static_cast<std::size_t>(std::stoull(argv[3]));

  const std::string payload = jstream_bench::make_payload(n_objects, str_len);
  const std::string padded = jstream_bench::make_payload(n_objects, str_len, /*with_extra=*/true);
  std::cout << "payload bytes: " << payload.size() << ", with unknown keys: " << padded.size() << "\n";

  // Warm-up, and make sure both payloads decode before timing them.
  jstream::decode_options lax;
  lax.ignore_unknown_keys = true;
  for (const std::string* p : {&payload, &padded}) {
    auto r = jstream::decode<std::vector<record>>(*p, lax);
    if (r.err) {
      std::cerr << "input decode failed: " << jstream::to_string(r.err.code) << " at offset " << r.err.offset << ": "
                << r.message << "\n";
      return 1;
    }
    do_not_optimize(r.val.size());
  }

  const jstream::decode_options strict{};
  print_mbps("decode(records)", run_median(runs, [&] { return bench_decode(payload, iters, strict); }));
  print_mbps("decode(records, ignore_unknown_keys)", run_median(runs, [&] { return bench_decode(padded, iters, lax); }));
  print_mbps("skim", run_median(runs, [&] { return bench_skim(payload, iters); }));

  return 0;
}
