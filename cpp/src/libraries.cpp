#include <algorithm>
#include <filesystem>
#include <sstream>

#include "shared.hpp"
#include "libraries.hpp"
#include "arguments.hpp"

using namespace shared;
using namespace exec;

namespace libraries {

  // These must match the kernel and C runtime of whatever runs the package.
  const exclusions_t host_abi = {
    "ld-linux",
    "libc.so",
    "libm.so",
    "libpthread.so",
    "libdl.so",
    "librt.so",
  };


  bool excluded(const std::string_view& path, const exclusions_t& exclusions) {
    return std::any_of(exclusions.begin(), exclusions.end(), [&path](const std::string& marker) {
      return path.contains(marker);
    });
  }


  lib_t parse_ldd(const std::string_view& output, const exclusions_t& exclusions) {
    lib_t libraries;

    auto stream = std::istringstream(std::string(output));
    std::string line;
    while (std::getline(stream, line)) {

      // libX11.so.6 => /usr/lib/libX11.so.6 (0x00007f...)
      auto arrow = line.find("=>");
      if (arrow == std::string::npos) continue;

      auto start = line.find_first_not_of(" \t", arrow + 2);
      if (start == std::string::npos) continue;
      auto end = line.find_first_of(" \t", start);
      auto shared_lib = line.substr(start, end == std::string::npos ? std::string::npos : end - start);

      // not found, or a virtual library.
      if (!shared_lib.starts_with('/')) continue;

      if (excluded(shared_lib, exclusions)) {
        log({"Excluding host library:", shared_lib}, "debug");
        continue;
      }
      libraries.emplace(shared_lib);
    }
    return libraries;
  }


  // Any dynamic binary reports at least its interpreter. Static binaries,
  // and files the loader refuses, leave us with nothing.
  void check_ldd(const std::string_view& output, const std::string& command) {
    if (trim<std::string_view>(output, " \t\n").empty())
      throw command_error("ldd produced no output", command);
    if (output.contains("not a dynamic executable"))
      throw command_error("Not a dynamic executable", command, std::string(output));
  }


  // Get all dependencies for a binary.
  lib_t scan(const std::filesystem::path& binary, const exclusions_t& exclusions) {
    const vector command = {"ldd", binary.string()};
    const auto joined = join(command, ' ');

    if (!std::filesystem::is_regular_file(binary))
      throw command_error("Binary does not exist: " + binary.string(), joined);

    // LDD it!
    std::string output;
    try {
      output = execute<std::string>(command, dump, {.cap = STDOUT, .verbose = arg::at("verbose") >= "debug"});
    }
    catch (const std::exception& e) {
      throw command_error(std::string("Failed to run ldd: ") + e.what(), joined);
    }

    check_ldd(output, joined);
    return parse_ldd(output, exclusions);
  }


  // Clear out the last run.
  void reset(const std::filesystem::path& sof) {
    std::filesystem::remove_all(sof);
    std::filesystem::create_directories(sof);
  }


  // Copy a library into the SOF, verifying the copy.
  bool stage(const std::filesystem::path& library, const std::filesystem::path& sof) {
    std::error_code ec;
    std::filesystem::create_directories(sof, ec);
    if (ec) {
      warning({"Failed to create", sof.string(), ":", ec.message()});
      return false;
    }

    const auto staged = sof / library.filename();
    auto partial = staged; partial += ".tmp";

    // copy_file follows the symlink chain, so versioned links
    // are written out as the final library.
    std::filesystem::copy_file(library, partial, std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
      warning({"Failed to copy", library.string(), ":", ec.message()});
      std::filesystem::remove(partial, ec);
      return false;
    }

    try {
      if (hash_file(library) != hash_file(partial)) {
        warning({"Staged copy of", library.string(), "does not match its source"});
        std::filesystem::remove(partial, ec);
        return false;
      }
    }
    catch (const std::runtime_error& e) {
      warning({"Failed to verify", partial.string(), ":", e.what()});
      std::filesystem::remove(partial, ec);
      return false;
    }

    // Only a verified copy replaces what is staged.
    std::filesystem::rename(partial, staged, ec);
    if (ec) {
      warning({"Failed to stage", staged.string(), ":", ec.message()});
      std::filesystem::remove(partial, ec);
      return false;
    }

    log({"Staged", library.string(), "->", staged.string()}, "debug");
    return true;
  }
}
