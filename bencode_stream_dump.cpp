#include "bencode_stream.hpp"
#include "bencode_stream_json.hpp"
#include "bencode_stream_print.hpp"

#include <cstddef>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <iostream>
#include <istream>
#include <string>
#include <string_view>

#ifdef VERBOSE
#  define TRACE(str) (std::cerr << str << std::endl)
#  define TRACEFUNC TRACE(__PRETTY_FUNCTION__)
#else
#  define TRACE(str)
#  define TRACEFUNC
#endif

namespace {

struct dump_options {
  bool json = false;
  std::size_t chunk_size = 1024;
  std::string path;  // empty: read stdin
};

void usage(const char* argv0) {
  std::cerr << "Usage: " << argv0 << " [--json] [--chunk-size N] [file]" << std::endl;
}

// Returns false on a malformed command line
bool parse_command_line(int argc, char* argv[], dump_options& options) {
  for (int i = 1; i < argc; i++) {
    const std::string_view arg = argv[i];
    if (arg == "--json") {
      options.json = true;
    } else if (arg == "--no-json") {
      options.json = false;
    } else if (arg == "--chunk-size") {
      if (i + 1 >= argc) {
        return false;
      }
      char* end = nullptr;
      const unsigned long long value = std::strtoull(argv[++i], &end, 10);
      if (end == argv[i] || *end != '\0' || value == 0) {
        return false;
      }
      options.chunk_size = static_cast<std::size_t>(value);
    } else if (!arg.empty() && arg[0] == '-' && arg != "-") {
      return false;
    } else if (options.path.empty()) {
      options.path = (arg == "-") ? "" : std::string(arg);
    } else {
      return false;
    }
  }
  return true;
}

// Decoding errors come from the decoder with their offset, anything else (an
// unreadable file, a key json_handler refuses) is reported as is
template <typename Handler>
int run(std::istream& in, Handler& handler, const dump_options& options) {
  TRACEFUNC;

  try {
    bencode_stream::parse(in, handler, options.chunk_size);
  } catch (const bencode_stream::parse_error& e) {
    std::cerr << "EXCEPTION: " << e.what() << " (at byte " << e.offset() << ")" << std::endl;
    return -1;
  } catch (const std::exception& e) {
    std::cerr << "EXCEPTION: " << e.what() << std::endl;
    return -1;
  }

  return 0;
}

int dump(std::istream& in, const dump_options& options) {
  if (options.json) {
    bencode_stream::json_handler handler(std::cout);
    const int status = run(in, handler, options);
    if (status == 0) {
      std::cout << std::endl;
    }
    return status;
  }

  bencode_stream::print_handler handler(std::cout);
  return run(in, handler, options);
}

}  // namespace

int main(int argc, char* argv[]) {
  dump_options options;
  if (!parse_command_line(argc, argv, options)) {
    usage(argv[0]);
    return 1;
  }

  TRACE("json: " << options.json << ", chunk size: " << options.chunk_size);

  if (options.path.empty()) {
    return dump(std::cin, options);
  }

  std::ifstream file(options.path, std::ios::binary);
  if (!file) {
    std::cerr << "EXCEPTION: cannot open " << options.path << std::endl;
    return -1;
  }

  TRACE("reading " << options.path);
  return dump(file, options);
}
