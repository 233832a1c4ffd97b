#include "record.hpp"

#include <jstream/jstream.hpp>

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <algorithm>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

// nlohmann/json
#include <nlohmann/json.hpp>

// jsoncpp
#include <json/json.h>

// RapidJSON
#include <rapidjson/document.h>

// Each library parses the same payload and fills the same vector<record>; jstream decodes it
// directly, the others go through their DOM first.

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

std::string make_numbers_payload(std::size_t n_numbers) {
  // A number-heavy payload to stress float parsing.
  std::string s;
  s.reserve(n_numbers * 24);
  s.push_back('[');
  for (std::size_t i = 0; i < n_numbers; ++i) {
    if (i) s.push_back(',');
    switch (i & 3u) {
      case 0: s += "3.141592653589793"; break;
      case 1: s += "-0.000000000123456789"; break;
      case 2: s += "1.234567890123456e-200"; break;
      default: s += "2.2250738585072014e-308"; break;
    }
  }
  s.push_back(']');
  return s;
}

std::size_t scale_iters(std::size_t base_iters, std::size_t base_bytes, std::size_t new_bytes) {
  if (base_iters == 0) return 0;
  if (base_bytes == 0 || new_bytes == 0) return base_iters;
  const double ratio = static_cast<double>(base_bytes) / static_cast<double>(new_bytes);
  const double scaled = static_cast<double>(base_iters) * ratio;
  const auto out = static_cast<std::size_t>(scaled + 0.5);
  return (out > 0) ? out : 1;
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

void print_mbps(const char* name, const bench_result& r) {
  const double mib = static_cast<double>(r.bytes) / (1024.0 * 1024.0);
  const double mibps = (r.seconds > 0.0) ? (mib / r.seconds) : 0.0;
  std::cout << name << ": " << mibps << " MiB/s (" << r.seconds << " s)" << "\n";
}

bench_result bench_jstream_records(std::string_view json, std::size_t iters) {
  const auto t0 = clock_type::now();
  for (std::size_t i = 0; i < iters; ++i) {
    auto r = jstream::decode<std::vector<record>>(json);
    if (r.err) {
      std::cerr << "jstream: input decode failed: " << r.message << "\n";
      std::exit(1);
    }
    do_not_optimize(r.val.size());
  }
  const auto t1 = clock_type::now();
  return {std::chrono::duration<double>(t1 - t0).count(), json.size() * iters};
}

bench_result bench_jstream_sum_numbers(std::string_view json, std::size_t iters) {
  const auto t0 = clock_type::now();
  for (std::size_t i = 0; i < iters; ++i) {
    auto r = jstream::decode<std::vector<double>>(json);
    if (r.err) {
      std::cerr << "jstream: input decode failed (numbers): " << r.message << "\n";
      std::exit(1);
    }
    double sum = 0.0;
    for (const double v : r.val) sum += v;
    do_not_optimize(sum);
  }
  const auto t1 = clock_type::now();
  return {std::chrono::duration<double>(t1 - t0).count(), json.size() * iters};
}

bench_result bench_nlohmann_records(std::string_view json_text, std::size_t iters) {
  using nlohmann::json;

  const auto t0 = clock_type::now();
  for (std::size_t i = 0; i < iters; ++i) {
    json j = json::parse(json_text, /*callback=*/nullptr, /*allow_exceptions=*/false, /*ignore_comments=*/false);
    if (j.is_discarded() || !j.is_array()) {
      std::cerr << "nlohmann: input parse failed\n";
      std::exit(1);
    }
    std::vector<record> out;
    out.reserve(j.size());
    for (const auto& o : j) {
      record r;
      r.id = o.at("id").get<std::uint64_t>();
      r.ok = o.at("ok").get<bool>();
      r.name = o.at("name").get<std::string>();
      r.val = o.at("val").get<double>();
      out.push_back(std::move(r));
    }
    do_not_optimize(out.size());
  }
  const auto t1 = clock_type::now();
  return {std::chrono::duration<double>(t1 - t0).count(), json_text.size() * iters};
}

bench_result bench_jsoncpp_records(std::string_view json, std::size_t iters) {
  Json::CharReaderBuilder builder;
  builder["collectComments"] = false;
  builder["allowComments"] = false;
  builder["allowTrailingCommas"] = false;
  builder["strictRoot"] = true;

  const auto t0 = clock_type::now();
  for (std::size_t i = 0; i < iters; ++i) {
    Json::Value root;
    std::string errs;
    const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    if (!reader->parse(json.data(), json.data() + json.size(), &root, &errs) || !root.isArray()) {
      std::cerr << "jsoncpp: input parse failed: " << errs << "\n";
      std::exit(1);
    }
    std::vector<record> out;
    out.reserve(root.size());
    for (const auto& o : root) {
      record r;
      r.id = o["id"].asUInt64();
      r.ok = o["ok"].asBool();
      r.name = o["name"].asString();
      r.val = o["val"].asDouble();
      out.push_back(std::move(r));
    }
    do_not_optimize(out.size());
  }
  const auto t1 = clock_type::now();
  return {std::chrono::duration<double>(t1 - t0).count(), json.size() * iters};
}

bench_result bench_rapidjson_records(std::string_view json_text, std::size_t iters) {
  using namespace rapidjson;

  const auto t0 = clock_type::now();
  for (std::size_t i = 0; i < iters; ++i) {
    Document d;
    d.Parse(json_text.data(), json_text.size());
    if (d.HasParseError() || !d.IsArray()) {
      std::cerr << "rapidjson: input parse failed\n";
      std::exit(1);
    }
    std::vector<record> out;
    out.reserve(d.Size());
    for (const auto& o : d.GetArray()) {
      record r;
      r.id = o["id"].GetUint64();
      r.ok = o["ok"].GetBool();
      r.name.assign(o["name"].GetString(), o["name"].GetStringLength());
      r.val = o["val"].GetDouble();
      out.push_back(std::move(r));
    }
    do_not_optimize(out.size());
  }
  const auto t1 = clock_type::now();
  return {std::chrono::duration<double>(t1 - t0).count(), json_text.size() * iters};
}

bench_result bench_rapidjson_sum_numbers(std::string_view json_text, std::size_t iters) {
  using namespace rapidjson;

  const auto t0 = clock_type::now();
  std::size_t bytes = 0;
  for (std::size_t i = 0; i < iters; ++i) {
    Document d;
    d.Parse(json_text.data(), json_text.size());
    if (d.HasParseError() || !d.IsArray()) {
      std::cerr << "rapidjson: input parse failed (numbers)\n";
      std::exit(1);
    }
    double sum = 0.0;
    for (auto& v : d.GetArray()) {
      sum += v.GetDouble();
    }
    do_not_optimize(sum);
    bytes += json_text.size();
  }
  const auto t1 = clock_type::now();
  return {std::chrono::duration<double>(t1 - t0).count(), bytes};
}

} // namespace

int main(int argc, char** argv) {
  std::size_t n_objects = 2000;
  std::size_t iters = 200;
  std::size_t runs = 5;

  if (argc >= 2) n_objects = static_cast<std::size_t>(std::stoull(argv[1]));
  if (argc >= 3) iters = static_cast<std::size_t>(std::stoull(argv[2]));
  if (argc >= 4) runs = static_cast<std::size_t>(std::stoull(argv[3]));

  const std::string payload = jstream_bench::make_payload(n_objects, 24);
  std::cout << "payload bytes: " << payload.size() << "\n";

  // A second payload focused on numeric parsing.
  std::size_t numbers_count = std::max<std::size_t>(1, n_objects * 64);
  const bool custom_numbers_count = (argc >= 5);
  if (custom_numbers_count) numbers_count = static_cast<std::size_t>(std::stoull(argv[4]));
  const std::string numbers_payload = make_numbers_payload(numbers_count);
  const std::size_t numbers_min_iters = custom_numbers_count ? 1 : 50;
  const std::size_t numbers_iters = std::max<std::size_t>(scale_iters(iters, payload.size(), numbers_payload.size()), numbers_min_iters);
  std::cout << "numbers payload bytes: " << numbers_payload.size() << " (" << numbers_count << " numbers, iters=" << numbers_iters << ")\n";

  // Warm-up
  (void)bench_jstream_records(payload, 1);
  (void)bench_nlohmann_records(payload, 1);
  (void)bench_jsoncpp_records(payload, 1);
  (void)bench_rapidjson_records(payload, 1);
  (void)bench_jstream_sum_numbers(numbers_payload, 1);
  (void)bench_rapidjson_sum_numbers(numbers_payload, 1);

  std::cout << "\n== Decode records ==\n";
  print_mbps("jstream decode", run_median(runs, [&] { return bench_jstream_records(payload, iters); }));
  print_mbps("nlohmann parse+extract", run_median(runs, [&] { return bench_nlohmann_records(payload, iters); }));
  print_mbps("jsoncpp parse+extract", run_median(runs, [&] { return bench_jsoncpp_records(payload, iters); }));
  print_mbps("rapidjson parse+extract", run_median(runs, [&] { return bench_rapidjson_records(payload, iters); }));

  std::cout << "\n== Decode+sum (numbers) ==\n";
  print_mbps("jstream +sum", run_median(runs, [&] { return bench_jstream_sum_numbers(numbers_payload, numbers_iters); }));
  print_mbps("rapidjson +sum", run_median(runs, [&] { return bench_rapidjson_sum_numbers(numbers_payload, numbers_iters); }));

  return 0;
}
