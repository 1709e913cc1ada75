#pragma once

// feedjson: a small, header-only C++17 non-blocking JSON tokenizer.
// Goals: never block the caller, resume exactly where input ran short, strict JSON,
// decode values only when asked.

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <charconv>
#include <istream>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <vector>

namespace feedjson {

// Config: floating-point parsing backend.
// Defaults to std::from_chars where the standard library provides it for double.
// Override by defining FEEDJSON_USE_FROM_CHARS_DOUBLE to 0/1 before including this header.
#ifndef FEEDJSON_USE_FROM_CHARS_DOUBLE
  #if defined(__cpp_lib_to_chars)
    #define FEEDJSON_USE_FROM_CHARS_DOUBLE 1
  #else
    #define FEEDJSON_USE_FROM_CHARS_DOUBLE 0
  #endif
#endif

// Result of one tokenizer::next() call.
enum class event : std::uint8_t {
  need_more_input,
  start_object,
  end_object,
  start_array,
  end_array,
  field_name,
  value_string,
  value_int,
  value_float,
  value_true,
  value_false,
  value_null,
  eof,
  error
};

inline const char* event_name(event e) noexcept {
  switch (e) {
    case event::need_more_input: return "need_more_input";
    case event::start_object: return "start_object";
    case event::end_object: return "end_object";
    case event::start_array: return "start_array";
    case event::end_array: return "end_array";
    case event::field_name: return "field_name";
    case event::value_string: return "value_string";
    case event::value_int: return "value_int";
    case event::value_float: return "value_float";
    case event::value_true: return "value_true";
    case event::value_false: return "value_false";
    case event::value_null: return "value_null";
    case event::eof: return "eof";
    case event::error: return "error";
  }
  return "unknown";
}

enum class error_code {
  ok = 0,
  unexpected_eof,
  invalid_value,
  invalid_number,
  invalid_string,
  invalid_escape,
  invalid_unicode_escape,
  invalid_utf16_surrogate,
  invalid_utf8,
  expected_colon,
  expected_comma_or_end,
  expected_key_string,
  mismatched_close,
  trailing_characters,
  nesting_too_deep,
  unterminated_string,
  unterminated_container,
  read_after_end,
  value_mismatch,
  stale_value,
  number_out_of_range
};

inline const char* error_message(error_code code) noexcept {
  switch (code) {
    case error_code::ok: return "ok";
    case error_code::unexpected_eof: return "unexpected end of input";
    case error_code::invalid_value: return "invalid value";
    case error_code::invalid_number: return "invalid number";
    case error_code::invalid_string: return "control character in string";
    case error_code::invalid_escape: return "invalid escape sequence";
    case error_code::invalid_unicode_escape: return "invalid \\u escape";
    case error_code::invalid_utf16_surrogate: return "invalid UTF-16 surrogate";
    case error_code::invalid_utf8: return "invalid UTF-8 in string";
    case error_code::expected_colon: return "expected ':'";
    case error_code::expected_comma_or_end: return "expected ',' or closing bracket";
    case error_code::expected_key_string: return "expected string key";
    case error_code::mismatched_close: return "closing bracket does not match";
    case error_code::trailing_characters: return "trailing characters after document";
    case error_code::nesting_too_deep: return "nesting too deep";
    case error_code::unterminated_string: return "unterminated string";
    case error_code::unterminated_container: return "unterminated object or array";
    case error_code::read_after_end: return "read after end of document";
    case error_code::value_mismatch: return "no such value for the current event";
    case error_code::stale_value: return "value is no longer current";
    case error_code::number_out_of_range: return "number out of range";
  }
  return "unknown error";
}

struct error {
  error_code code{error_code::ok};
  std::size_t offset{0};
  std::size_t line{1};
  std::size_t column{1};

  constexpr explicit operator bool() const noexcept { return code != error_code::ok; }
};

// Thrown by the throwing value accessors only; the driving path never throws.
class value_error : public std::runtime_error {
public:
  explicit value_error(const error& e)
      : std::runtime_error(std::string("feedjson: ") + error_message(e.code)), err_(e) {}

  const error& err() const noexcept { return err_; }

private:
  error err_;
};

namespace detail {

inline bool is_ws(int c) noexcept {
  return c == ' ' || c == '\n' || c == '\r' || c == '\t';
}

inline bool is_digit(int c) noexcept { return c >= '0' && c <= '9'; }

inline int hex_val(int c) noexcept {
  if (c >= '0' && c <= '9') return c - '0';
  const int lc = c | 0x20; // ASCII to-lower
  if (lc >= 'a' && lc <= 'f') return 10 + (lc - 'a');
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

inline bool parse_u4(std::string_view s, std::size_t& i, std::uint32_t& out_cp) noexcept {
  if (i + 4 > s.size()) return false;
  std::uint32_t v = 0;
  for (std::size_t k = 0; k < 4; ++k) {
    const int h = hex_val(static_cast<unsigned char>(s[i + k]));
    if (h < 0) return false;
    v = (v << 4) | static_cast<std::uint32_t>(h);
  }
  i += 4;
  out_cp = v;
  return true;
}

// Resolves the escapes of a raw string span (quotes excluded) into UTF-8.
inline error_code unescape(std::string_view s, std::string& out) {
  out.clear();
  out.reserve(s.size());

  std::size_t i = 0;
  std::size_t chunk_begin = 0;
  while (i < s.size()) {
    if (s[i] != '\\') {
      ++i;
      continue;
    }
    if (i > chunk_begin) out.append(s.data() + chunk_begin, i - chunk_begin);
    ++i;
    if (i >= s.size()) return error_code::invalid_escape;
    const char esc = s[i++];
    switch (esc) {
      case '"': out.push_back('"'); break;
      case '\\': out.push_back('\\'); break;
      case '/': out.push_back('/'); break;
      case 'b': out.push_back('\b'); break;
      case 'f': out.push_back('\f'); break;
      case 'n': out.push_back('\n'); break;
      case 'r': out.push_back('\r'); break;
      case 't': out.push_back('\t'); break;
      case 'u': {
        std::uint32_t cp = 0;
        if (!parse_u4(s, i, cp)) return error_code::invalid_unicode_escape;
        if (cp >= 0xD800u && cp <= 0xDBFFu) {
          if (i + 2 > s.size() || s[i] != '\\' || s[i + 1] != 'u') return error_code::invalid_utf16_surrogate;
          i += 2;
          std::uint32_t low = 0;
          if (!parse_u4(s, i, low)) return error_code::invalid_unicode_escape;
          if (low < 0xDC00u || low > 0xDFFFu) return error_code::invalid_utf16_surrogate;
          cp = 0x10000u + (((cp - 0xD800u) << 10) | (low - 0xDC00u));
        } else if (cp >= 0xDC00u && cp <= 0xDFFFu) {
          return error_code::invalid_utf16_surrogate;
        }
        append_utf8(out, cp);
        break;
      }
      default:
        return error_code::invalid_escape;
    }
    chunk_begin = i;
  }
  if (s.size() > chunk_begin) out.append(s.data() + chunk_begin, s.size() - chunk_begin);
  return error_code::ok;
}

// Accumulates an integer token into T, reporting overflow instead of truncating.
template <class T>
inline error_code parse_integer(std::string_view s, T& out) noexcept {
  static_assert(std::is_integral<T>::value && !std::is_same<T, bool>::value,
                "feedjson: integer target must be an integral type");
  using U = typename std::make_unsigned<T>::type;

  std::size_t i = 0;
  const bool neg = !s.empty() && s[0] == '-';
  if (neg) ++i;
  if (i >= s.size()) return error_code::invalid_number;

  U limit = static_cast<U>((std::numeric_limits<T>::max)());
  if (neg && std::is_signed<T>::value) limit = static_cast<U>(limit + 1u);

  U acc = 0;
  for (; i < s.size(); ++i) {
    if (!is_digit(static_cast<unsigned char>(s[i]))) return error_code::invalid_number;
    const U d = static_cast<U>(s[i] - '0');
    if (acc > static_cast<U>((limit - d) / 10u)) return error_code::number_out_of_range;
    acc = static_cast<U>(acc * 10u + d);
  }

  if (!neg) {
    out = static_cast<T>(acc);
    return error_code::ok;
  }
  if (!std::is_signed<T>::value) {
    // "-0" is the only negative token an unsigned target can hold.
    if (acc != 0) return error_code::number_out_of_range;
    out = 0;
    return error_code::ok;
  }
  if (acc == limit) {
    out = (std::numeric_limits<T>::min)();
  } else {
    out = static_cast<T>(-static_cast<T>(acc));
  }
  return error_code::ok;
}

inline double parse_double(std::string_view token) {
  // Backend choice:
  // - from_chars: locale-free and allocation-free, but availability varies by STL.
  // - strtod: follows LC_NUMERIC; used when from_chars is off or rejects the token.
#if defined(FEEDJSON_USE_FROM_CHARS_DOUBLE) && FEEDJSON_USE_FROM_CHARS_DOUBLE
#if defined(__cpp_lib_to_chars)
  {
    double v = 0.0;
    const char* first = token.data();
    const char* last = token.data() + token.size();
    auto r = std::from_chars(first, last, v, std::chars_format::general);
    if (r.ec == std::errc{} && r.ptr == last) return v;
  }
#endif
#endif

  // Token is not NUL-terminated; avoid heap alloc for typical short numbers.
  constexpr std::size_t kStackCap = 128;
  if (token.size() < kStackCap) {
    char buf[kStackCap];
    if (!token.empty()) std::memcpy(buf, token.data(), token.size());
    buf[token.size()] = '\0';
    return std::strtod(buf, nullptr);
  }
  return std::strtod(std::string(token).c_str(), nullptr);
}

} // namespace detail

// -----------------------------
// Feeders
// -----------------------------

// Supplies bytes to the tokenizer. Positions passed to pin() and slice() are
// absolute: the number of bytes consumed since the feeder was created.
class feeder {
public:
  virtual ~feeder() = default;

  // Unconsumed bytes that are buffered right now.
  virtual std::string_view window() const noexcept = 0;
  virtual void advance(std::size_t n) noexcept = 0;
  // True once no further bytes will ever arrive.
  virtual bool done() const noexcept = 0;
  virtual std::size_t position() const noexcept = 0;

  // Keep bytes from absolute position `pos` addressable through slice() until unpin().
  virtual void pin(std::size_t pos) noexcept = 0;
  virtual void unpin() noexcept = 0;
  virtual std::string_view slice(std::size_t begin, std::size_t end) const noexcept = 0;

  // Byte `offset` positions past the read cursor, or -1 if it is not buffered.
  int peek(std::size_t offset = 0) const noexcept {
    const std::string_view w = window();
    return offset < w.size() ? static_cast<int>(static_cast<unsigned char>(w[offset])) : -1;
  }

  std::size_t available() const noexcept { return window().size(); }
};

// The whole input is available up front. Borrows the bytes; they must outlive
// every use of the tokenizer driven by this feeder.
class buffer_feeder final : public feeder {
public:
  explicit buffer_feeder(std::string_view json) noexcept : src_(json) {}
  buffer_feeder(const char* data, std::size_t size) noexcept : src_(data, size) {}

  std::string_view window() const noexcept override { return src_.substr(pos_); }
  void advance(std::size_t n) noexcept override { pos_ += (std::min)(n, src_.size() - pos_); }
  bool done() const noexcept override { return true; }
  std::size_t position() const noexcept override { return pos_; }

  void pin(std::size_t) noexcept override {}
  void unpin() noexcept override {}

  std::string_view slice(std::size_t begin, std::size_t end) const noexcept override {
    if (begin > end || end > src_.size()) return {};
    return src_.substr(begin, end - begin);
  }

private:
  std::string_view src_;
  std::size_t pos_{0};
};

// Caller pushes chunks over time. Consumed bytes are dropped from the front on
// the next push, except those still pinned by an in-flight token.
class push_feeder : public feeder {
public:
  static constexpr std::size_t default_capacity = 64 * 1024;

  explicit push_feeder(std::size_t capacity = default_capacity)
      : capacity_(capacity != 0 ? capacity : 1) {}

  // Appends as many bytes as fit in the free capacity; returns how many were accepted.
  std::size_t push(const char* data, std::size_t size) {
    if (done_ || size == 0) return 0;
    compact();
    const std::size_t unconsumed = buf_.size() - head_;
    if (unconsumed >= capacity_) return 0;
    const std::size_t take = (std::min)(size, capacity_ - unconsumed);
    buf_.append(data, take);
    return take;
  }

  std::size_t push(std::string_view bytes) { return push(bytes.data(), bytes.size()); }

  // No more input will arrive.
  void finish() noexcept { done_ = true; }

  bool is_full() const noexcept { return done_ || buf_.size() - head_ >= capacity_; }
  std::size_t capacity() const noexcept { return capacity_; }
  // Bytes held in memory: unconsumed input plus the pinned token.
  std::size_t buffered() const noexcept { return buf_.size(); }

  std::string_view window() const noexcept override {
    return std::string_view(buf_.data() + head_, buf_.size() - head_);
  }
  void advance(std::size_t n) noexcept override { head_ += (std::min)(n, buf_.size() - head_); }
  bool done() const noexcept override { return done_; }
  std::size_t position() const noexcept override { return base_ + head_; }

  void pin(std::size_t pos) noexcept override { pin_ = pos; }
  void unpin() noexcept override { pin_ = npos; }

  std::string_view slice(std::size_t begin, std::size_t end) const noexcept override {
    if (begin < base_ || begin > end || end - base_ > buf_.size()) return {};
    return std::string_view(buf_.data() + (begin - base_), end - begin);
  }

private:
  static constexpr std::size_t npos = static_cast<std::size_t>(-1);

  void compact() {
    std::size_t keep = base_ + head_;
    if (pin_ < keep) keep = (std::max)(pin_, base_);
    const std::size_t drop = keep - base_;
    if (drop == 0) return;
    buf_.erase(0, drop);
    base_ += drop;
    head_ -= drop;
  }

  std::string buf_;
  std::size_t base_{0};   // absolute position of buf_[0]
  std::size_t head_{0};   // read cursor within buf_
  std::size_t pin_{npos};
  std::size_t capacity_;
  bool done_{false};
};

// A push_feeder the caller refills from a stream after each need_more_input.
class stream_feeder final : public push_feeder {
public:
  explicit stream_feeder(std::istream& in, std::size_t capacity = default_capacity)
      : push_feeder(capacity), in_(in), chunk_(this->capacity(), '\0') {}

  // Reads up to the free capacity. Finishes the feeder at end of stream.
  std::size_t fill() {
    if (done()) return 0;
    const std::size_t room = capacity() - available();
    if (room == 0) return 0;
    in_.read(&chunk_[0], static_cast<std::streamsize>(room));
    const std::size_t got = static_cast<std::size_t>(in_.gcount());
    const std::size_t took = push(chunk_.data(), got);
    if (got < room) finish();
    return took;
  }

  // The stream stopped on an I/O error rather than at its end.
  bool failed() const { return in_.bad(); }

private:
  std::istream& in_;
  std::string chunk_;
};

// -----------------------------
// Tokenizer
// -----------------------------

struct tokenizer_options {
  // Maximum number of simultaneously open objects/arrays; a top-level container is depth 1.
  std::size_t max_depth{2048};
};

class tokenizer {
public:
  explicit tokenizer(tokenizer_options opt = {}) : opt_(opt) {}

  // Advances using whatever bytes `f` can supply right now and returns exactly one event.
  // Drive with the same feeder until eof or error.
  event next(feeder& f);

  const error& last_error() const noexcept { return err_; }
  event current_event() const noexcept { return last_; }
  std::size_t depth() const noexcept { return stack_.size(); }
  std::size_t parsed_bytes() const noexcept { return pos_; }
  const tokenizer_options& options() const noexcept { return opt_; }

  // Value decoder. Valid for the event just returned, until the next call to next().
  error current_string(std::string& out) const;
  template <class T>
  error current_int(T& out) const;
  error current_float(double& out) const;
  // Undecoded bytes of the current scalar (string quotes excluded); empty if there is none.
  std::string_view current_raw() const noexcept;

  std::string current_string() const {
    std::string out;
    const error e = current_string(out);
    if (e) throw value_error(e);
    return out;
  }

  template <class T>
  T current_int() const {
    T out{};
    const error e = current_int(out);
    if (e) throw value_error(e);
    return out;
  }

  double current_float() const {
    double out = 0.0;
    const error e = current_float(out);
    if (e) throw value_error(e);
    return out;
  }

private:
  enum class container : std::uint8_t { object, array };
  enum class expect : std::uint8_t { key_or_end, key, colon, value_or_end, value, comma_or_end };

  struct frame {
    container kind;
    expect state;
  };

  enum class phase : std::uint8_t { value, end_pending, finished, failed };
  enum class lexeme : std::uint8_t { none, literal, string, number };
  enum class num_part : std::uint8_t { start, minus, zero, integer, dot, fraction, exp_mark, exp_sign, exponent };

  event scan(feeder& f);
  event begin_value(feeder& f, int c);
  event open(feeder& f, container kind);
  event close(feeder& f, container kind);
  event begin_literal(feeder& f, const char* lit, std::size_t len, event ev);
  event scan_literal(feeder& f);
  event begin_string(feeder& f, bool key);
  event scan_string(feeder& f);
  error_code end_unicode_escape() noexcept;
  bool begin_utf8(int lead) noexcept;
  event begin_number(feeder& f);
  event scan_number(feeder& f);
  event end_of_input(feeder& f);
  void skip_ws(feeder& f);
  void value_done() noexcept;
  event fail(error_code code, std::size_t offset);
  error make_error(error_code code, std::size_t offset) const noexcept;
  error check_current(event a, event b) const noexcept;

  tokenizer_options opt_;
  std::vector<frame> stack_;
  phase phase_{phase::value};
  event last_{event::need_more_input};
  error err_;

  // Position bookkeeping for diagnostics and stale-value checks.
  const feeder* feeder_{nullptr};
  std::size_t pos_{0};
  std::size_t line_{1};
  std::size_t line_start_{0};

  // Span of the current scalar, in absolute feeder positions.
  std::size_t token_begin_{0};
  std::size_t token_end_{0};

  // Scalar sub-state, preserved across need_more_input.
  lexeme lex_{lexeme::none};
  const char* lit_{nullptr};
  std::uint8_t lit_len_{0};
  std::uint8_t lit_matched_{0};
  event lit_event_{event::value_null};
  bool key_{false};
  bool escape_{false};
  std::uint8_t hex_left_{0};
  std::uint32_t cp_{0};
  bool want_low_{false};
  std::uint8_t u8_left_{0};   // continuation bytes still owed
  std::uint8_t u8_lo_{0x80};  // allowed range of the next continuation byte
  std::uint8_t u8_hi_{0xBF};
  num_part num_{num_part::start};
  bool has_fraction_{false};
  bool has_exponent_{false};
};

inline event tokenizer::next(feeder& f) {
  if (phase_ == phase::failed) return event::error;
  if (phase_ == phase::finished) {
    last_ = fail(error_code::read_after_end, f.position());
    return last_;
  }

  // The previous event's span is released unless a token is still in flight.
  if (lex_ == lexeme::none) f.unpin();
  feeder_ = &f;

  last_ = scan(f);
  pos_ = f.position();
  return last_;
}

inline event tokenizer::scan(feeder& f) {
  switch (lex_) {
    case lexeme::literal: return scan_literal(f);
    case lexeme::string: return scan_string(f);
    case lexeme::number: return scan_number(f);
    case lexeme::none: break;
  }

  for (;;) {
    skip_ws(f);
    const int c = f.peek();
    if (c < 0) {
      if (!f.done()) return event::need_more_input;
      return end_of_input(f);
    }

    if (phase_ == phase::end_pending) return fail(error_code::trailing_characters, f.position());
    if (stack_.empty()) return begin_value(f, c);

    frame& top = stack_.back();
    switch (top.state) {
      case expect::key_or_end:
        if (c == '}') return close(f, container::object);
        if (c != '"') return fail(error_code::expected_key_string, f.position());
        return begin_string(f, /*key=*/true);
      case expect::key:
        if (c != '"') return fail(error_code::expected_key_string, f.position());
        return begin_string(f, /*key=*/true);
      case expect::colon:
        if (c != ':') return fail(error_code::expected_colon, f.position());
        f.advance(1);
        top.state = expect::value;
        continue;
      case expect::value_or_end:
        if (c == ']') return close(f, container::array);
        return begin_value(f, c);
      case expect::value:
        return begin_value(f, c);
      case expect::comma_or_end:
        if (c == ',') {
          f.advance(1);
          top.state = (top.kind == container::object) ? expect::key : expect::value;
          continue;
        }
        if (c == '}') return close(f, container::object);
        if (c == ']') return close(f, container::array);
        return fail(error_code::expected_comma_or_end, f.position());
    }
  }
}

inline event tokenizer::begin_value(feeder& f, int c) {
  switch (c) {
    case '{': return open(f, container::object);
    case '[': return open(f, container::array);
    case '"': return begin_string(f, /*key=*/false);
    case 't': return begin_literal(f, "true", 4, event::value_true);
    case 'f': return begin_literal(f, "false", 5, event::value_false);
    case 'n': return begin_literal(f, "null", 4, event::value_null);
    default:
      if (c == '-' || detail::is_digit(c)) return begin_number(f);
      return fail(error_code::invalid_value, f.position());
  }
}

inline event tokenizer::open(feeder& f, container kind) {
  // Depth is checked before the push: max_depth + 1 is never reached.
  if (stack_.size() >= opt_.max_depth) return fail(error_code::nesting_too_deep, f.position());
  f.advance(1);
  if (kind == container::object) {
    stack_.push_back(frame{container::object, expect::key_or_end});
    return event::start_object;
  }
  stack_.push_back(frame{container::array, expect::value_or_end});
  return event::start_array;
}

inline event tokenizer::close(feeder& f, container kind) {
  if (stack_.back().kind != kind) return fail(error_code::mismatched_close, f.position());
  f.advance(1);
  stack_.pop_back();
  value_done();
  return kind == container::object ? event::end_object : event::end_array;
}

inline event tokenizer::begin_literal(feeder& f, const char* lit, std::size_t len, event ev) {
  lex_ = lexeme::literal;
  lit_ = lit;
  lit_len_ = static_cast<std::uint8_t>(len);
  lit_matched_ = 0;
  lit_event_ = ev;
  return scan_literal(f);
}

inline event tokenizer::scan_literal(feeder& f) {
  while (lit_matched_ < lit_len_) {
    const int c = f.peek();
    if (c < 0) {
      if (!f.done()) return event::need_more_input;
      return fail(error_code::unexpected_eof, f.position());
    }
    if (c != static_cast<unsigned char>(lit_[lit_matched_])) return fail(error_code::invalid_value, f.position());
    f.advance(1);
    ++lit_matched_;
  }
  lex_ = lexeme::none;
  value_done();
  return lit_event_;
}

inline event tokenizer::begin_string(feeder& f, bool key) {
  f.advance(1); // opening quote
  lex_ = lexeme::string;
  key_ = key;
  escape_ = false;
  hex_left_ = 0;
  cp_ = 0;
  want_low_ = false;
  u8_left_ = 0;
  token_begin_ = f.position();
  f.pin(token_begin_);
  return scan_string(f);
}

inline event tokenizer::scan_string(feeder& f) {
  for (;;) {
    if (!escape_ && hex_left_ == 0 && !want_low_ && u8_left_ == 0) {
      // Plain run: printable ASCII up to a quote or backslash.
      const std::string_view w = f.window();
      std::size_t i = 0;
      while (i < w.size()) {
        const unsigned char uc = static_cast<unsigned char>(w[i]);
        if (uc == '"' || uc == '\\' || uc < 0x20u || uc >= 0x80u) break;
        ++i;
      }
      f.advance(i);
    }

    const int c = f.peek();
    if (c < 0) {
      if (!f.done()) return event::need_more_input;
      return fail(error_code::unterminated_string, f.position());
    }

    if (u8_left_ != 0) {
      if (c < u8_lo_ || c > u8_hi_) return fail(error_code::invalid_utf8, f.position());
      u8_lo_ = 0x80;
      u8_hi_ = 0xBF;
      --u8_left_;
      f.advance(1);
      continue;
    }

    if (hex_left_ != 0) {
      const int h = detail::hex_val(c);
      if (h < 0) return fail(error_code::invalid_unicode_escape, f.position());
      cp_ = (cp_ << 4) | static_cast<std::uint32_t>(h);
      f.advance(1);
      if (--hex_left_ == 0) {
        const error_code ec = end_unicode_escape();
        if (ec != error_code::ok) return fail(ec, f.position());
      }
      continue;
    }

    if (escape_) {
      if (want_low_ && c != 'u') return fail(error_code::invalid_utf16_surrogate, f.position());
      switch (c) {
        case '"': case '\\': case '/': case 'b': case 'f': case 'n': case 'r': case 't':
          break;
        case 'u':
          hex_left_ = 4;
          cp_ = 0;
          break;
        default:
          return fail(error_code::invalid_escape, f.position());
      }
      escape_ = false;
      f.advance(1);
      continue;
    }

    if (want_low_ && c != '\\') return fail(error_code::invalid_utf16_surrogate, f.position());

    if (c == '\\') {
      escape_ = true;
      f.advance(1);
      continue;
    }

    if (c == '"') {
      token_end_ = f.position();
      f.advance(1);
      lex_ = lexeme::none;
      if (key_) {
        stack_.back().state = expect::colon;
        return event::field_name;
      }
      value_done();
      return event::value_string;
    }

    if (c >= 0x80) {
      if (!begin_utf8(c)) return fail(error_code::invalid_utf8, f.position());
      f.advance(1);
      continue;
    }

    return fail(error_code::invalid_string, f.position());
  }
}

inline error_code tokenizer::end_unicode_escape() noexcept {
  if (want_low_) {
    want_low_ = false;
    if (cp_ < 0xDC00u || cp_ > 0xDFFFu) return error_code::invalid_utf16_surrogate;
    return error_code::ok;
  }
  if (cp_ >= 0xD800u && cp_ <= 0xDBFFu) {
    want_low_ = true;
    return error_code::ok;
  }
  if (cp_ >= 0xDC00u && cp_ <= 0xDFFFu) return error_code::invalid_utf16_surrogate;
  return error_code::ok;
}

// Sets up the continuation bytes owed after `lead`. Overlong forms, encoded
// surrogates and code points above U+10FFFF are ruled out through the range
// allowed for the first continuation byte.
inline bool tokenizer::begin_utf8(int lead) noexcept {
  u8_lo_ = 0x80;
  u8_hi_ = 0xBF;
  if (lead >= 0xC2 && lead <= 0xDF) {
    u8_left_ = 1;
  } else if (lead >= 0xE0 && lead <= 0xEF) {
    u8_left_ = 2;
    if (lead == 0xE0) u8_lo_ = 0xA0;
    else if (lead == 0xED) u8_hi_ = 0x9F;
  } else if (lead >= 0xF0 && lead <= 0xF4) {
    u8_left_ = 3;
    if (lead == 0xF0) u8_lo_ = 0x90;
    else if (lead == 0xF4) u8_hi_ = 0x8F;
  } else {
    return false;
  }
  return true;
}

inline event tokenizer::begin_number(feeder& f) {
  lex_ = lexeme::number;
  num_ = num_part::start;
  has_fraction_ = false;
  has_exponent_ = false;
  token_begin_ = f.position();
  f.pin(token_begin_);
  return scan_number(f);
}

// -?(0|[1-9][0-9]*)(\.[0-9]+)?([eE][+-]?[0-9]+)?
// The byte that ends the number is left unconsumed.
inline event tokenizer::scan_number(feeder& f) {
  for (;;) {
    const int c = f.peek();
    if (c < 0 && !f.done()) return event::need_more_input;

    bool complete = false;
    switch (num_) {
      case num_part::start:
        num_ = (c == '-') ? num_part::minus : (c == '0' ? num_part::zero : num_part::integer);
        break;
      case num_part::minus:
        if (c == '0') num_ = num_part::zero;
        else if (detail::is_digit(c)) num_ = num_part::integer;
        else return fail(error_code::invalid_number, f.position());
        break;
      case num_part::zero:
        if (detail::is_digit(c)) return fail(error_code::invalid_number, f.position());
        if (c == '.') num_ = num_part::dot;
        else if (c == 'e' || c == 'E') num_ = num_part::exp_mark;
        else complete = true;
        break;
      case num_part::integer:
        if (detail::is_digit(c)) break;
        if (c == '.') num_ = num_part::dot;
        else if (c == 'e' || c == 'E') num_ = num_part::exp_mark;
        else complete = true;
        break;
      case num_part::dot:
        if (!detail::is_digit(c)) return fail(error_code::invalid_number, f.position());
        num_ = num_part::fraction;
        has_fraction_ = true;
        break;
      case num_part::fraction:
        if (detail::is_digit(c)) break;
        if (c == 'e' || c == 'E') num_ = num_part::exp_mark;
        else complete = true;
        break;
      case num_part::exp_mark:
        if (c == '+' || c == '-') num_ = num_part::exp_sign;
        else if (detail::is_digit(c)) num_ = num_part::exponent;
        else return fail(error_code::invalid_number, f.position());
        has_exponent_ = true;
        break;
      case num_part::exp_sign:
        if (!detail::is_digit(c)) return fail(error_code::invalid_number, f.position());
        num_ = num_part::exponent;
        break;
      case num_part::exponent:
        if (!detail::is_digit(c)) complete = true;
        break;
    }

    if (complete) {
      token_end_ = f.position();
      lex_ = lexeme::none;
      value_done();
      return (has_fraction_ || has_exponent_) ? event::value_float : event::value_int;
    }
    f.advance(1);
  }
}

inline event tokenizer::end_of_input(feeder& f) {
  if (phase_ == phase::end_pending) {
    phase_ = phase::finished;
    return event::eof;
  }
  if (!stack_.empty()) return fail(error_code::unterminated_container, f.position());
  return fail(error_code::unexpected_eof, f.position());
}

inline void tokenizer::skip_ws(feeder& f) {
  const std::string_view w = f.window();
  std::size_t i = 0;
  while (i < w.size() && detail::is_ws(static_cast<unsigned char>(w[i]))) {
    if (w[i] == '\n') {
      ++line_;
      line_start_ = f.position() + i + 1;
    }
    ++i;
  }
  f.advance(i);
}

inline void tokenizer::value_done() noexcept {
  if (stack_.empty()) {
    phase_ = phase::end_pending;
  } else {
    stack_.back().state = expect::comma_or_end;
  }
}

inline event tokenizer::fail(error_code code, std::size_t offset) {
  phase_ = phase::failed;
  lex_ = lexeme::none;
  err_ = make_error(code, offset);
  return event::error;
}

inline error tokenizer::make_error(error_code code, std::size_t offset) const noexcept {
  error e;
  e.code = code;
  e.offset = offset;
  e.line = line_;
  e.column = (offset >= line_start_) ? (offset - line_start_ + 1) : 1;
  return e;
}

inline error tokenizer::check_current(event a, event b) const noexcept {
  if (last_ != a && last_ != b) return make_error(error_code::value_mismatch, pos_);
  // The feeder has moved on since the event: the span may be gone.
  if (feeder_ == nullptr || feeder_->position() != pos_) return make_error(error_code::stale_value, pos_);
  return error{};
}

inline std::string_view tokenizer::current_raw() const noexcept {
  switch (last_) {
    case event::field_name:
    case event::value_string:
    case event::value_int:
    case event::value_float:
      break;
    default:
      return {};
  }
  if (feeder_ == nullptr || feeder_->position() != pos_) return {};
  return feeder_->slice(token_begin_, token_end_);
}

inline error tokenizer::current_string(std::string& out) const {
  error e = check_current(event::field_name, event::value_string);
  if (e) return e;
  const error_code ec = detail::unescape(feeder_->slice(token_begin_, token_end_), out);
  if (ec != error_code::ok) return make_error(ec, token_begin_);
  return e;
}

template <class T>
inline error tokenizer::current_int(T& out) const {
  error e = check_current(event::value_int, event::value_int);
  if (e) return e;
  const error_code ec = detail::parse_integer(feeder_->slice(token_begin_, token_end_), out);
  if (ec != error_code::ok) return make_error(ec, token_begin_);
  return e;
}

// Integer tokens resolve as floats too; every JSON number is a double candidate.
inline error tokenizer::current_float(double& out) const {
  error e = check_current(event::value_float, event::value_int);
  if (e) return e;
  const double v = detail::parse_double(feeder_->slice(token_begin_, token_end_));
  if (std::isinf(v)) return make_error(error_code::number_out_of_range, token_begin_);
  out = v;
  return e;
}

} // namespace feedjson
