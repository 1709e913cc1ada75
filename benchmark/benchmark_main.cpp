#include <feedjson/feedjson.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <algorithm>
#include <iostream>
#include <random>
#include <string>
#include <string_view>
#include <vector>

namespace {

using clock_type = std::chrono::high_resolution_clock;

template <class T>
inline void do_not_optimize(const T& v) {
#if defined(_MSC_VER)
  volatile const char* p = reinterpret_cast<const char*>(&v);
  (void)p;
#else
  asm volatile("" : : "g"(v) : "memory");
#endif
}

std::string make_payload(std::size_t n_objects, std::size_t str_len) {
  std::mt19937_64 rng(1234567);
  std::uniform_int_distribution<int> ch('a', 'z');

  std::string s;
  s.reserve(n_objects * (str_len + 64));
  s.push_back('[');
  for (std::size_t i = 0; i < n_objects; ++i) {
    if (i) s.push_back(',');
    s += "{\"id\":";
    s += std::to_string(static_cast<std::uint64_t>(i));
    s += ",\"ok\":";
    s += (i % 2 == 0) ? "true" : "false";
    s += ",\"name\":\"";

    for (std::size_t k = 0; k < str_len; ++k) {
      s.push_back(static_cast<char>(ch(rng)));
    }

    // Add some escapes/unicode occasionally.
    if ((i % 16) == 0) {
      s += "\\n";
      s += "\\u4F60\\u597D";
    }

    s += "\",\"val\":";
    s += (i % 3 == 0) ? "3.141592653589793" : "1e-10";
    s += ",\"tags\":[null,";
    s += std::to_string(static_cast<std::int64_t>(i) - 1000);
    s += "]}";
  }
  s.push_back(']');
  return s;
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

[[noreturn]] void die(const feedjson::tokenizer& t) {
  const feedjson::error& e = t.last_error();
  std::cerr << "feedjson: input parse failed: " << feedjson::error_message(e.code) << " at offset " << e.offset
            << "\n";
  std::exit(1);
}

// Resolves every scalar once, the way a consumer would.
inline void consume_value(feedjson::event e, const feedjson::tokenizer& t, std::string& scratch) {
  switch (e) {
    case feedjson::event::field_name:
    case feedjson::event::value_string: {
      const feedjson::error err = t.current_string(scratch);
      do_not_optimize(err.code);
      do_not_optimize(scratch.size());
      break;
    }
    case feedjson::event::value_int: {
      std::int64_t v = 0;
      const feedjson::error err = t.current_int(v);
      do_not_optimize(err.code);
      do_not_optimize(v);
      break;
    }
    case feedjson::event::value_float: {
      double v = 0.0;
      const feedjson::error err = t.current_float(v);
      do_not_optimize(err.code);
      do_not_optimize(v);
      break;
    }
    default:
      break;
  }
}

bench_result bench_events_only(std::string_view json, std::size_t iters) {
  const auto t0 = clock_type::now();
  std::size_t events = 0;
  for (std::size_t i = 0; i < iters; ++i) {
    feedjson::buffer_feeder f(json);
    feedjson::tokenizer t;
    for (;;) {
      const feedjson::event e = t.next(f);
      ++events;
      if (e == feedjson::event::eof) break;
      if (e == feedjson::event::error) die(t);
    }
  }
  const auto t1 = clock_type::now();
  do_not_optimize(events);
  return {std::chrono::duration<double>(t1 - t0).count(), json.size() * iters};
}

bench_result bench_events_with_values(std::string_view json, std::size_t iters) {
  std::string scratch;
  const auto t0 = clock_type::now();
  for (std::size_t i = 0; i < iters; ++i) {
    feedjson::buffer_feeder f(json);
    feedjson::tokenizer t;
    for (;;) {
      const feedjson::event e = t.next(f);
      if (e == feedjson::event::eof) break;
      if (e == feedjson::event::error) die(t);
      consume_value(e, t, scratch);
    }
  }
  const auto t1 = clock_type::now();
  return {std::chrono::duration<double>(t1 - t0).count(), json.size() * iters};
}

bench_result bench_push_chunks(std::string_view json, std::size_t iters, std::size_t chunk) {
  std::string scratch;
  const auto t0 = clock_type::now();
  for (std::size_t i = 0; i < iters; ++i) {
    feedjson::push_feeder f(chunk);
    feedjson::tokenizer t;
    std::size_t pos = 0;
    for (;;) {
      feedjson::event e = t.next(f);
      while (e == feedjson::event::need_more_input) {
        pos += f.push(json.data() + pos, (std::min)(chunk, json.size() - pos));
        if (pos == json.size()) f.finish();
        e = t.next(f);
      }
      if (e == feedjson::event::eof) break;
      if (e == feedjson::event::error) die(t);
      consume_value(e, t, scratch);
    }
  }
  const auto t1 = clock_type::now();
  return {std::chrono::duration<double>(t1 - t0).count(), json.size() * iters};
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

  const std::string payload = make_payload(n_objects, str_len);
  std::cout << "payload bytes: " << payload.size() << "\n";

  // Warm-up
  do_not_optimize(bench_events_with_values(payload, 1).seconds);

  print_mbps("events(buffer, no values)", run_median(runs, [&] { return bench_events_only(payload, iters); }));
  print_mbps("events(buffer, values)", run_median(runs, [&] { return bench_events_with_values(payload, iters); }));
  print_mbps("events(push 64 B)", run_median(runs, [&] { return bench_push_chunks(payload, iters, 64); }));
  print_mbps("events(push 4 KiB)", run_median(runs, [&] { return bench_push_chunks(payload, iters, 4096); }));
  print_mbps("events(push 64 KiB)",
             run_median(runs, [&] { return bench_push_chunks(payload, iters, feedjson::push_feeder::default_capacity); }));

  return 0;
}
