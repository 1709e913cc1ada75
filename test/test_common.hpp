#pragma once

#include <feedjson/feedjson.hpp>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <iostream>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

namespace feedjson_test {

[[noreturn]] inline void fail(const char* expr, const char* file, int line, const char* msg = nullptr) {
  std::cerr << "TEST FAILED: " << (expr ? expr : "") << "\n  at " << file << ":" << line;
  if (msg && *msg) std::cerr << "\n  " << msg;
  std::cerr << "\n";
  std::abort();
}

inline void check(bool ok, const char* expr, const char* file, int line) {
  if (!ok) fail(expr, file, line);
}

template <class Fn>
inline void expect_throw(Fn&& fn, const char* expr, const char* file, int line) {
  try {
    fn();
  } catch (const feedjson::value_error&) {
    return;
  }
  fail(expr, file, line, "expected feedjson::value_error, got none");
}

} // namespace feedjson_test

#define FEEDJSON_CHECK(expr) ::feedjson_test::check(!!(expr), #expr, __FILE__, __LINE__)
#define FEEDJSON_EXPECT_THROW(expr) ::feedjson_test::expect_throw([&] { (void)(expr); }, #expr, __FILE__, __LINE__)

namespace feedjson_test {

// One event plus the value it carried, resolved through the decoder.
struct token {
  feedjson::event ev{feedjson::event::error};
  std::string text;

  bool operator==(const token& o) const { return ev == o.ev && text == o.text; }
  bool operator!=(const token& o) const { return !(*this == o); }
};

inline token make_token(feedjson::event ev, const feedjson::tokenizer& t) {
  using feedjson::event;
  token tk;
  tk.ev = ev;
  switch (ev) {
    case event::field_name:
    case event::value_string:
      tk.text = t.current_string();
      break;
    case event::value_int: {
      std::int64_t i = 0;
      if (!t.current_int(i)) tk.text = std::to_string(i);
      else tk.text = std::string(t.current_raw());
      break;
    }
    case event::value_float:
      tk.text = std::string(t.current_raw());
      break;
    default:
      break;
  }
  return tk;
}

// Drives `t` over `f` until eof or error, pushing nothing: for complete feeders.
inline std::vector<token> drain(feedjson::tokenizer& t, feedjson::feeder& f) {
  std::vector<token> out;
  for (;;) {
    const feedjson::event e = t.next(f);
    out.push_back(make_token(e, t));
    if (e == feedjson::event::eof || e == feedjson::event::error || e == feedjson::event::need_more_input) break;
  }
  return out;
}

inline std::vector<token> tokenize(std::string_view json, feedjson::tokenizer_options opt = {}) {
  feedjson::buffer_feeder f(json);
  feedjson::tokenizer t(opt);
  return drain(t, f);
}

// Feeds `json` through a push_feeder `chunk` bytes at a time, finishing once all is pushed.
inline std::vector<token> tokenize_chunked(std::string_view json, std::size_t chunk,
                                           feedjson::tokenizer_options opt = {}) {
  feedjson::push_feeder f;
  feedjson::tokenizer t(opt);
  std::vector<token> out;
  std::size_t i = 0;
  for (;;) {
    feedjson::event e = t.next(f);
    while (e == feedjson::event::need_more_input) {
      const std::size_t n = (std::min)(chunk, json.size() - i);
      i += f.push(json.data() + i, n);
      if (i == json.size()) f.finish();
      e = t.next(f);
    }
    out.push_back(make_token(e, t));
    if (e == feedjson::event::eof || e == feedjson::event::error) break;
  }
  return out;
}

inline std::vector<feedjson::event> events_of(const std::vector<token>& tokens) {
  std::vector<feedjson::event> out;
  out.reserve(tokens.size());
  for (const auto& tk : tokens) out.push_back(tk.ev);
  return out;
}

inline bool ends_with_error(std::string_view json, feedjson::tokenizer_options opt = {}) {
  const auto tokens = tokenize(json, opt);
  return !tokens.empty() && tokens.back().ev == feedjson::event::error;
}

// Tokenizes a complete buffer and returns the error it stopped on.
inline feedjson::error first_error(std::string_view json, feedjson::tokenizer_options opt = {}) {
  feedjson::buffer_feeder f(json);
  feedjson::tokenizer t(opt);
  for (;;) {
    const feedjson::event e = t.next(f);
    if (e == feedjson::event::error) return t.last_error();
    if (e == feedjson::event::eof) return feedjson::error{};
  }
}

inline void check_err(const feedjson::error& e, feedjson::error_code code) {
  ::feedjson_test::check(static_cast<bool>(e), "static_cast<bool>(e)", __FILE__, __LINE__);
  if (e.code != code) {
    std::cerr << "  got: " << feedjson::error_message(e.code) << ", want: " << feedjson::error_message(code) << "\n";
  }
  ::feedjson_test::check(e.code == code, "e.code == code", __FILE__, __LINE__);
}

} // namespace feedjson_test
