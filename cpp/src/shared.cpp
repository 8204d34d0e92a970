#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <blake2.h>

#include "shared.hpp"
#include "arguments.hpp"

using namespace exec;

namespace shared {

  // Init our shared values.
  std::random_device TemporaryDirectory::dev = {};
  std::mt19937 TemporaryDirectory::prng(TemporaryDirectory::dev());
  std::uniform_int_distribution<uint64_t> TemporaryDirectory::rand(0);

  static uint_fast32_t warning_count = 0;

  // Environment variables.
  const std::string
    home = std::getenv("HOME") == nullptr ? "/" : std::getenv("HOME"),
    config = std::getenv("XDG_CONFIG_HOME") == nullptr ? home + "/.config/" : std::getenv("XDG_CONFIG_HOME");


  // Log to output
  void log(const list& msg, const std::string& level) {
    if (arg::at("verbose") >= level) {
      for (const auto& x : msg)
        std::cout << x << ' ';
      std::cout << std::endl;
    }
  }


  // Warnings always print.
  void warning(const list& msg) {
    ++warning_count;
    std::cerr << "WARN: ";
    for (const auto& x : msg) std::cerr << x << ' ';
    std::cerr << std::endl;
  }
  uint_fast32_t warnings() {return warning_count;}


  // Join a container into a string.
  template <class T> std::string join(const T& list, const char& joiner) {
    if (list.empty()) return "";
    std::stringstream in;
    for (const auto& x : list)
      in << x << joiner;
    auto str = in.str();
    return str.erase(str.length() - 1);
  }
  template std::string join(const vector&, const char&);
  template std::string join(const set&, const char&);


  bool contains(const char& v, const char& d) {return v == d;}
  bool contains(const char& v, const std::string_view& d) {return d.contains(v);}

  // Trim characters from start and end.
  template <typename T> std::string trim(const std::string_view& in, const T& to_strip) {
    if (in.empty()) return "";
    size_t l = 0, r = in.length();
    while (l < r && contains(in[l], to_strip)) ++l;
    while (r > l && contains(in[r - 1], to_strip)) --r;
    return std::string(in.substr(l, r - l));
  }
  template std::string trim(const std::string_view&, const char&);
  template std::string trim(const std::string_view&, const std::string_view&);


  // Resolve wildcards.
  set wildcard(const std::string_view& pattern, const std::string_view& path, const list& args) {
    vector command;
    command.reserve(5 + args.size());

    auto local = pattern.contains('/');

    command.insert(command.end(), {"find", local ? std::filesystem::path(pattern).parent_path().string() : std::string(path)});
    command.insert(command.end(), args.begin(), args.end());
    command.insert(command.end(), {"-name", local ? std::filesystem::path(pattern).filename().string() : std::string(pattern)});
    return execute<set>(command, fd_splitter<set, '\n'>, {.cap = STDOUT, .verbose = arg::at("verbose") >= "debug"});
  };


  // Extend a vector with a container.
  template <class T> void extend(vector& dest, T source) {
    dest.reserve(dest.size() + source.size());
    dest.insert(dest.end(), std::make_move_iterator(source.begin()), std::make_move_iterator(source.end()));
  }
  template void extend(vector&, list);
  template void extend(vector&, vector);
  template void extend(vector&, set);


  // Hash a file.
  std::string hash_file(const std::filesystem::path& path) {
    auto file = std::ifstream(path, std::ios::binary);
    if (!file.is_open()) throw std::runtime_error("Failed to open file for hashing: " + path.string());

    blake2b_state state;
    if (blake2b_init(&state, BLAKE2B_OUTBYTES) != 0) throw std::runtime_error("Failed to initialize hash!");

    char buffer[1 << 16];
    while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
      if (blake2b_update(&state, reinterpret_cast<const uint8_t*>(buffer), file.gcount()) != 0)
        throw std::runtime_error("Failed to hash file: " + path.string());
    }
    if (file.bad()) throw std::runtime_error("Failed to read file: " + path.string());

    uint8_t hash[BLAKE2B_OUTBYTES] = {0};
    if (blake2b_final(&state, hash, BLAKE2B_OUTBYTES) != 0) throw std::runtime_error("Failed to hash file: " + path.string());

    std::stringstream hex_hash;
    hex_hash << std::hex << std::setfill('0');
    for (size_t i = 0; i < BLAKE2B_OUTBYTES; ++i)
      hex_hash << std::setw(2) << static_cast<unsigned>(hash[i]);
    return hex_hash.str();
  }
}
