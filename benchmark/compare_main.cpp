#include <feedjson/feedjson.hpp>

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <algorithm>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <random>
#include <string>
#include <string_view>
#include <vector>

// nlohmann/json
#include <nlohmann/json.hpp>

// jsoncpp
#include <json/json.h>

// RapidJSON
#include <rapidjson/document.h>
#include <rapidjson/memorystream.h>
#include <rapidjson/reader.h>

namespace {

using clock_type = std::chrono::steady_clock;

template <class T>
inline void do_not_optimize(const T& v) {
#if defined(_MSC_VER)
  volatile const char* p = reinterpret_cast<const char*>(&v);
  (void)p;
#else
  asm volatile("" : : "g"(v) : "memory");
#endif
}

// A stream of log records: short keys, mixed scalars, a few escapes and raw UTF-8.
std::string make_records(std::size_t n_records) {
  static const char* const kLevels[] = {"debug", "info", "warn", "error"};
  static const char* const kWords[] = {"request", "served", "cache", "miss", "upstream", "retry", "caf\xC3\xA9"};
  std::mt19937_64 rng(20261018);

  std::string s;
  s.reserve(n_records * 160);
  s.push_back('[');
  for (std::size_t i = 0; i < n_records; ++i) {
    if (i) s += ",\n";
    s += "{\"seq\":" + std::to_string(i);
    s += ",\"level\":\"";
    s += kLevels[rng() % 4];
    s += "\",\"msg\":\"";
    for (int w = 0; w < 5; ++w) {
      if (w) s.push_back(' ');
      s += kWords[rng() % 7];
    }
    if (i % 8 == 0) s += "\\t\\\"quoted\\\" \\u00e9";
    s += "\",\"latency_ms\":" + std::to_string(static_cast<double>(rng() % 100000) / 64.0);
    s += ",\"bytes\":" + std::to_string(static_cast<std::int64_t>(rng() % 1000000) - 1000);
    s += ",\"ok\":";
    s += (rng() & 1u) ? "true" : "false";
    s += ",\"parent\":null,\"tags\":[\"edge\",\"v2\"]}";
  }
  s.push_back(']');
  return s;
}

struct contender {
  const char* name;
  std::function<void(std::string_view)> run;
};

// Median of `runs` timings, each `iters` passes over `json`, in MiB/s.
double measure_mibps(const contender& c, std::string_view json, std::size_t iters, std::size_t runs) {
  std::vector<double> secs;
  secs.reserve(runs);
  for (std::size_t r = 0; r < runs; ++r) {
    const auto t0 = clock_type::now();
    for (std::size_t i = 0; i < iters; ++i) c.run(json);
    secs.push_back(std::chrono::duration<double>(clock_type::now() - t0).count());
  }
  std::nth_element(secs.begin(), secs.begin() + (secs.size() / 2), secs.end());
  const double mib = static_cast<double>(json.size() * iters) / (1024.0 * 1024.0);
  const double median = secs[secs.size() / 2];
  return median > 0.0 ? mib / median : 0.0;
}

[[noreturn]] void die(const char* who, const char* what) {
  std::cerr << who << ": input parse failed: " << what << "\n";
  std::exit(1);
}

// Drives `t` to eof, resolving scalars when `values` is set.
void drain_feedjson(feedjson::tokenizer& t, feedjson::feeder& f, bool values, std::string& scratch) {
  for (;;) {
    const feedjson::event e = t.next(f);
    switch (e) {
      case feedjson::event::eof:
        return;
      case feedjson::event::error:
        die("feedjson", feedjson::error_message(t.last_error().code));
      case feedjson::event::field_name:
      case feedjson::event::value_string:
        if (values) do_not_optimize(t.current_string(scratch).code);
        break;
      case feedjson::event::value_int:
      case feedjson::event::value_float:
        if (values) {
          double d = 0.0;
          do_not_optimize(t.current_float(d).code);
          do_not_optimize(d);
        }
        break;
      default:
        break;
    }
  }
}

void run_feedjson_push(std::string_view json, std::size_t chunk) {
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
    if (e == feedjson::event::eof) return;
    if (e == feedjson::event::error) die("feedjson", feedjson::error_message(t.last_error().code));
  }
}

// Counts callbacks, the nearest nlohmann equivalent of a tokenizer pass.
struct nlohmann_counter : nlohmann::json_sax<nlohmann::json> {
  std::size_t events{0};

  bool null() override { return ++events, true; }
  bool boolean(bool) override { return ++events, true; }
  bool number_integer(number_integer_t) override { return ++events, true; }
  bool number_unsigned(number_unsigned_t) override { return ++events, true; }
  bool number_float(number_float_t, const string_t&) override { return ++events, true; }
  bool string(string_t&) override { return ++events, true; }
  bool binary(binary_t&) override { return ++events, true; }
  bool start_object(std::size_t) override { return ++events, true; }
  bool key(string_t&) override { return ++events, true; }
  bool end_object() override { return ++events, true; }
  bool start_array(std::size_t) override { return ++events, true; }
  bool end_array() override { return ++events, true; }
  bool parse_error(std::size_t, const std::string&, const nlohmann::detail::exception&) override { return false; }
};

struct rapidjson_counter : rapidjson::BaseReaderHandler<rapidjson::UTF8<>, rapidjson::UTF8<>, rapidjson_counter> {
  std::size_t events{0};
  bool Default() { return ++events, true; }
};

std::vector<contender> event_contenders() {
  return {
      {"feedjson buffer",
       [](std::string_view json) {
         feedjson::buffer_feeder f(json);
         feedjson::tokenizer t;
         std::string scratch;
         drain_feedjson(t, f, /*values=*/false, scratch);
       }},
      {"feedjson buffer+values",
       [](std::string_view json) {
         feedjson::buffer_feeder f(json);
         feedjson::tokenizer t;
         std::string scratch;
         drain_feedjson(t, f, /*values=*/true, scratch);
       }},
      {"feedjson push 4 KiB", [](std::string_view json) { run_feedjson_push(json, 4096); }},
      {"nlohmann sax",
       [](std::string_view json) {
         nlohmann_counter counter;
         if (!nlohmann::json::sax_parse(json, &counter)) die("nlohmann", "sax_parse");
         do_not_optimize(counter.events);
       }},
      {"rapidjson reader",
       [](std::string_view json) {
         rapidjson::Reader reader;
         rapidjson_counter counter;
         rapidjson::MemoryStream ms(json.data(), json.size());
         if (reader.Parse(ms, counter).IsError()) die("rapidjson", "Reader::Parse");
         do_not_optimize(counter.events);
       }},
  };
}

// Building a whole tree is the work a tokenizer lets the caller skip.
std::vector<contender> tree_contenders() {
  return {
      {"nlohmann parse",
       [](std::string_view json) {
         const nlohmann::json j = nlohmann::json::parse(json, nullptr, /*allow_exceptions=*/false);
         if (j.is_discarded()) die("nlohmann", "parse");
       }},
      {"jsoncpp parse",
       [](std::string_view json) {
         Json::CharReaderBuilder builder;
         builder["collectComments"] = false;
         builder["strictRoot"] = true;
         const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
         Json::Value root;
         std::string errs;
         if (!reader->parse(json.data(), json.data() + json.size(), &root, &errs)) die("jsoncpp", errs.c_str());
         do_not_optimize(root.size());
       }},
      {"rapidjson document",
       [](std::string_view json) {
         rapidjson::Document d;
         d.Parse(json.data(), json.size());
         if (d.HasParseError()) die("rapidjson", "Document::Parse");
         do_not_optimize(d.Size());
       }},
  };
}

void report(const char* title, const std::vector<contender>& cs, std::string_view json, std::size_t iters,
            std::size_t runs) {
  std::cout << "\n== " << title << " ==\n";
  for (const contender& c : cs) {
    c.run(json); // warm-up
    std::cout << std::left << std::setw(26) << c.name << std::right << std::fixed << std::setprecision(1)
              << std::setw(9) << measure_mibps(c, json, iters, runs) << " MiB/s\n";
  }
}

} // namespace

int main(int argc, char** argv) {
  std::size_t n_records = 5000;
  std::size_t iters = 50;
  std::size_t runs = 5;

  if (argc >= 2) n_records = static_cast<std::size_t>(std::stoull(argv[1]));
  if (argc >= 3) iters = static_cast<std::size_t>(std::stoull(argv[2]));
  if (argc >= 4) runs = static_cast<std::size_t>(std::stoull(argv[3]));
  if (runs == 0) runs = 1;

  const std::string records = make_records(n_records);
  std::cout << "records: " << n_records << ", bytes: " << records.size() << ", sizeof(feedjson::tokenizer): "
            << sizeof(feedjson::tokenizer) << "\n";

  report("Event stream", event_contenders(), records, iters, runs);
  report("Whole tree", tree_contenders(), records, iters, runs);
  return 0;
}
