#include "resolver.hpp"
#include "arguments.hpp"

using namespace shared;

namespace resolver {

  // Searched recursively, so Debian's /usr/lib/<triple> is covered by /usr/lib.
  const std::vector<std::filesystem::path> roots = {"/usr/lib", "/lib", "/usr/lib64"};


  std::optional<std::filesystem::path> Resolver::find(const std::string& name) const {
    for (const auto& root : search) {
      if (!std::filesystem::is_directory(root)) continue;

      set found;
      try {
        found = wildcard(name, root.string(), {"-type", "f,l"});
      }
      catch (const std::exception& e) {
        warning({"Failed to search", root.string(), ":", e.what()});
        continue;
      }

      for (const auto& candidate : found) {
        const auto path = std::filesystem::path(candidate);
        std::error_code ec;
        if (path.filename() == name && std::filesystem::is_regular_file(path, ec)) return path;
      }
    }
    return std::nullopt;
  }


  std::optional<std::filesystem::path> Resolver::resolve(const std::string& name) {
    if (name.empty()) return std::nullopt;

    // An explicit path needs no resolution.
    if (name.contains('/')) {
      if (std::filesystem::is_regular_file(name)) return name;
      return std::nullopt;
    }

    if (auto indexed = index.find(name); indexed.has_value()) {
      std::error_code ec;
      if (std::filesystem::exists(*indexed, ec)) {
        log({"Resolved", name, "from the index:", indexed->string()}, "debug");
        return indexed;
      }
      log({"Index entry for", name, "has vanished"}, "debug");
    }

    auto found = find(name);
    if (found.has_value()) log({"Resolved", name, "on disk:", found->string()}, "debug");
    return found;
  }


  libraries::lib_t Resolver::glob(const std::string& pattern) const {
    libraries::lib_t found;
    for (const auto& root : search) {
      if (!std::filesystem::is_directory(root)) continue;
      try {
        for (const auto& candidate : wildcard(pattern, root.string(), {"-maxdepth", "2", "-type", "f,l"})) {
          std::error_code ec;
          if (std::filesystem::is_regular_file(candidate, ec)) found.emplace(candidate);
        }
      }
      catch (const std::exception& e) {
        warning({"Failed to search", root.string(), ":", e.what()});
      }
    }
    return found;
  }
}
