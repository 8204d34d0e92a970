#pragma once
/**
 * @brief Shared-Library Dependency Resolution
 * This header contains the functions for determining the shared-libraries a binary is linked against,
 * and for staging them into the SOF, the flat folder the packaging step embeds. Link dependencies are
 * found by running LDD against the binary. Libraries that belong to the host ABI (The dynamic linker and
 * the core glibc libraries) are never bundled, as they must match whatever kernel the package runs on.
 */

#include "shared.hpp"

namespace libraries {

  using lib_t = shared::set;

  // An ordered list of path substrings.
  using exclusions_t = std::vector<std::string>;

  /**
   * @brief The host ABI libraries.
   * @info ld-linux, libc, libm, libpthread, libdl and librt.
   */
  extern const exclusions_t host_abi;


  /**
   * @brief Check if a library belongs to the host.
   * @param path: The path to the library. It does not need to exist.
   * @param exclusions: The substrings that mark a host library.
   * @returns Whether any of the exclusions occurs anywhere in the path.
   * @note This is plain substring containment over the whole path, not
   * just the filename.
   */
  bool excluded(const std::string_view& path, const exclusions_t& exclusions = host_abi);


  /**
   * @brief Parse the output of LDD.
   * @param output: The captured output.
   * @param exclusions: Libraries to drop.
   * @returns The absolute paths of every resolved, bundlable library.
   * @info Only lines with a "=>" are considered, and the token that follows it
   * must be an absolute path. This drops linux-vdso, the interpreter line, and
   * "not found" entries.
   */
  lib_t parse_ldd(const std::string_view& output, const exclusions_t& exclusions = host_abi);


  /**
   * @brief Reject LDD output that describes no dynamic binary.
   * @param output: The captured output.
   * @param command: The command that produced it.
   * @throws shared::command_error if the output is empty, or LDD refused the file.
   */
  void check_ldd(const std::string_view& output, const std::string& command);


  /**
   * @brief Get the link dependencies of a binary.
   * @param binary: The path to the binary.
   * @param exclusions: Libraries to drop.
   * @returns A set of all shared libraries to bundle.
   * @throws shared::command_error if LDD cannot be run against the binary.
   */
  lib_t scan(const std::filesystem::path& binary, const exclusions_t& exclusions = host_abi);


  /**
   * @brief Delete and recreate the SOF.
   * @param sof: The staging directory.
   * @throws std::filesystem::filesystem_error if the directory cannot be recreated.
   */
  void reset(const std::filesystem::path& sof);


  /**
   * @brief Stage a library into the SOF.
   * @param library: The path to the library. Symlinks are followed, and the final target's
   * contents are copied under the library's own filename.
   * @param sof: The staging directory, which is created if missing.
   * @returns Whether the library was staged.
   * @note A file of the same name already in the SOF is overwritten, the last library staged wins.
   * Failures are logged as warnings. A failed copy leaves nothing behind, and never replaces
   * a library that is already staged.
   */
  bool stage(const std::filesystem::path& library, const std::filesystem::path& sof);


  /**
   * @brief Stage a collection of libraries.
   * @param libraries: The libraries, staged in order.
   * @param sof: The staging directory.
   * @returns The number of libraries staged.
   */
  template <class C> size_t stage_all(const C& libraries, const std::filesystem::path& sof) {
    size_t staged = 0;
    for (const auto& lib : libraries) {
      if (stage(lib, sof)) ++staged;
    }
    return staged;
  }
}
