#include <feedjson/feedjson.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>
#include <string_view>

namespace {

struct cli_options {
  std::size_t chunk{feedjson::push_feeder::default_capacity};
  feedjson::tokenizer_options tok;
};

struct file_result {
  int rc{0}; // 0 ok, 1 invalid JSON, 2 I/O failure
  feedjson::error err;
  std::size_t events{0};
};

// Streams `path` through a stream_feeder, `chunk` bytes at a time. Strings
// are decoded as they arrive.
file_result check_one(const char* path, const cli_options& opt) {
  file_result res;
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    res.rc = 2;
    return res;
  }

  feedjson::stream_feeder f(in, opt.chunk);
  feedjson::tokenizer t(opt.tok);
  for (;;) {
    feedjson::event e = t.next(f);
    while (e == feedjson::event::need_more_input) {
      f.fill();
      if (f.failed()) {
        res.rc = 2;
        return res;
      }
      e = t.next(f);
    }
    ++res.events;

    feedjson::error verr;
    std::string s;
    switch (e) {
      case feedjson::event::field_name:
      case feedjson::event::value_string:
        verr = t.current_string(s);
        break;
      case feedjson::event::eof:
        return res;
      case feedjson::event::error:
        res.rc = 1;
        res.err = t.last_error();
        return res;
      default:
        break;
    }
    if (verr) {
      res.rc = 1;
      res.err = verr;
      return res;
    }
  }
}

void print_error(const char* path, const feedjson::error& e) {
  std::cerr << "parse failed: " << path << "\n";
  std::cerr << "  " << feedjson::error_message(e.code)
            << " (code=" << static_cast<int>(e.code) << ")"
            << " offset=" << e.offset
            << " line=" << e.line
            << " column=" << e.column << "\n";
}

bool parse_size(const char* s, std::size_t& out) {
  char* end = nullptr;
  const unsigned long long v = std::strtoull(s, &end, 10);
  if (end == s || *end != '\0') return false;
  out = static_cast<std::size_t>(v);
  return true;
}

void usage() {
  std::cerr << "usage: feedjson_parse_file [--chunk N] [--max-depth N] <file.json>\n";
  std::cerr << "       feedjson_parse_file [--chunk N] [--max-depth N] --list <paths.txt>\n";
}

} // namespace

int main(int argc, char** argv) {
  cli_options opt;
  const char* list_path = nullptr;
  const char* path = nullptr;

  for (int i = 1; i < argc; ++i) {
    const std::string_view arg{argv[i]};
    if ((arg == "--chunk" || arg == "--max-depth" || arg == "--list") && i + 1 >= argc) {
      usage();
      return 2;
    }
    if (arg == "--chunk") {
      if (!parse_size(argv[++i], opt.chunk) || opt.chunk == 0) {
        std::cerr << "invalid --chunk value: " << argv[i] << "\n";
        return 2;
      }
    } else if (arg == "--max-depth") {
      if (!parse_size(argv[++i], opt.tok.max_depth)) {
        std::cerr << "invalid --max-depth value: " << argv[i] << "\n";
        return 2;
      }
    } else if (arg == "--list") {
      list_path = argv[++i];
    } else if (path == nullptr && !arg.empty() && arg[0] != '-') {
      path = argv[i];
    } else {
      usage();
      return 2;
    }
  }

  if (list_path != nullptr) {
    if (path != nullptr) {
      usage();
      return 2;
    }
    std::ifstream in(list_path);
    if (!in) {
      std::cerr << "failed to read list file: " << list_path << "\n";
      return 2;
    }

    bool any_fail = false;
    bool any_io_fail = false;
    std::string line;
    while (std::getline(in, line)) {
      if (line.empty()) continue;
      const file_result r = check_one(line.c_str(), opt);
      if (r.rc == 0) {
        std::cout << line << "\tOK\n";
      } else {
        std::cout << line << "\tFAIL\n";
        any_fail = true;
        if (r.rc == 2) any_io_fail = true;
      }
    }
    return any_io_fail ? 2 : (any_fail ? 1 : 0);
  }

  if (path == nullptr) {
    usage();
    return 2;
  }

  const file_result r = check_one(path, opt);
  if (r.rc == 2) {
    std::cerr << "failed to read file: " << path << "\n";
    return 2;
  }
  if (r.rc == 1) {
    print_error(path, r.err);
    return 1;
  }
  std::cout << path << ": " << r.events << " events\n";
  return 0;
}
