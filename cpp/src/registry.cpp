#include <sstream>

#include "registry.hpp"
#include "arguments.hpp"

using namespace shared;
using namespace exec;

namespace registry {

  entries_t parse(const std::string_view& output) {
    entries_t entries;

    auto stream = std::istringstream(std::string(output));
    std::string line;
    while (std::getline(stream, line)) {

      // \tlibX11.so.6 (libc6,x86-64) => /lib/x86_64-linux-gnu/libX11.so.6
      line = trim<std::string_view>(line, " \t\r");
      auto space = line.find(' ');
      if (space == std::string::npos || space == 0) continue;

      auto open = line.find_first_not_of(' ', space);
      if (open == std::string::npos || line[open] != '(') continue;
      auto close = line.find(')', open);
      if (close == std::string::npos) continue;

      auto arrow = line.find("=>", close);
      if (arrow == std::string::npos || !trim<std::string_view>(std::string_view(line).substr(close + 1, arrow - close - 1), ' ').empty()) continue;

      const auto name = line.substr(0, space);
      const auto path = trim<std::string_view>(std::string_view(line).substr(arrow + 2), " \t");
      if (!path.starts_with('/')) continue;
      if (entries.contains(name)) continue;

      // The cache can be stale.
      std::error_code ec;
      if (!std::filesystem::exists(path, ec)) {
        log({"Dropping stale registry entry:", name, "=>", path}, "debug");
        continue;
      }
      entries.emplace(name, path);
    }
    return entries;
  }


  std::optional<std::string> ldconfig() {

    // ldconfig usually lives in sbin, which is not always in PATH.
    std::string binary;
    for (const auto& candidate : {"/usr/sbin/ldconfig", "/sbin/ldconfig"}) {
      if (std::filesystem::exists(candidate)) {
        binary = candidate;
        break;
      }
    }
    if (binary.empty()) {
      try {
        binary = execute<std::string>({"which", "ldconfig"}, one_line, {.cap = STDOUT, .verbose = arg::at("verbose") >= "debug"});
      }
      catch (const std::exception& e) {
        log({"Could not search PATH for ldconfig:", e.what()}, "debug");
      }
    }
    if (binary.empty()) {
      warning({"ldconfig not found, libraries will only be searched for on disk"});
      return std::nullopt;
    }

    try {
      auto output = execute<std::string>({binary, "-p"}, dump, {.cap = STDOUT, .verbose = arg::at("verbose") >= "debug"});
      if (!output.contains("=>")) {
        warning({"ldconfig returned no libraries, libraries will only be searched for on disk"});
        return std::nullopt;
      }
      return output;
    }
    catch (const std::exception& e) {
      warning({"Failed to read the library registry:", e.what()});
      return std::nullopt;
    }
  }


  const entries_t& Index::entries() {
    if (!cache.has_value()) {
      log({"Building the library index"});
      auto output = source ? source() : std::nullopt;
      cache = output.has_value() ? parse(*output) : entries_t{};
      log({"Indexed", std::to_string(cache->size()), "libraries"}, "debug");
    }
    return *cache;
  }


  std::optional<std::filesystem::path> Index::find(const std::string& name) {
    const auto& indexed = entries();
    auto entry = indexed.find(name);
    if (entry == indexed.end()) return std::nullopt;
    return entry->second;
  }
}
