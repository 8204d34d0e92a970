#pragma once
/**
 * @brief Target Binary Location
 * The binary being packaged is either given as a path, or by name, in which case it is searched
 * for beneath a root directory (Such as the package directory of a bundled browser). Without the
 * binary there is nothing to package, so failing to find it aborts the build.
 */

#include "shared.hpp"

namespace binaries {

  /**
   * @brief Locate the target binary.
   * @param target: A path, or a filename.
   * @param root: Where to search for the filename. Empty to only accept paths.
   * @returns The path to the binary.
   * @throws std::runtime_error if the binary cannot be found.
   * @info When searching, the first executable regular file named target, in sorted
   * order, is used.
   */
  std::filesystem::path locate(const std::string& target, const std::string& root = "");


  /**
   * @brief Check for an ELF header.
   * @param path: The file.
   * @returns Whether the file starts with the ELF magic.
   */
  bool is_elf(const std::filesystem::path& path);
}
