#include "binaries.hpp"
#include "arguments.hpp"

#include <fstream>
#include <unistd.h>

using namespace shared;

namespace binaries {

  std::filesystem::path locate(const std::string& target, const std::string& root) {
    if (target.empty()) throw std::runtime_error("No target binary provided!");

    if (std::filesystem::is_regular_file(target)) return target;
    if (root.empty() || target.contains('/'))
      throw std::runtime_error("Could not locate binary: " + target);

    if (!std::filesystem::is_directory(root))
      throw std::runtime_error("Search root does not exist: " + root);

    log({"Searching", root, "for", target});
    for (const auto& candidate : wildcard(target, root, {"-type", "f,l"})) {
      std::error_code ec;
      if (std::filesystem::is_regular_file(candidate, ec) && access(candidate.c_str(), X_OK) == 0) {
        log({"Using", candidate});
        return candidate;
      }
    }
    throw std::runtime_error("Could not locate binary " + target + " under " + root);
  }


  bool is_elf(const std::filesystem::path& path) {
    auto file = std::ifstream(path, std::ios::binary);
    char header[4] = {0};
    if (!file.read(header, sizeof(header))) return false;
    return std::string_view(header, sizeof(header)) == "\177ELF";
  }
}
