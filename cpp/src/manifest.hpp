#pragma once
/**
 * @brief Bundling Directives
 * Once the SOF has been populated, every file in it becomes a directive for the packaging step:
 * embed this file, under this directory. The directives are sorted by filename, so that the same
 * SOF always yields the same packaging command.
 */

#include "shared.hpp"

namespace manifest {

  struct directive {
    std::filesystem::path source;
    std::string destination;

    bool operator==(const directive&) const = default;
  };

  using directives_t = std::vector<directive>;


  /**
   * @brief Build the directives for a SOF.
   * @param sof: The staging directory.
   * @param destination: The directory within the package the files belong in.
   * @returns One directive per regular file directly within the SOF, sorted by filename.
   * @note A missing SOF yields no directives.
   */
  directives_t build(const std::filesystem::path& sof, const std::string& destination = "lib");


  /**
   * @brief Render directives for the packaging step.
   * @param directives: The directives.
   * @param format: "add-binary" for --add-binary SRC:DEST pairs, "plain" for SRC:DEST.
   * @returns The rendered arguments, in directive order.
   */
  shared::vector render(const directives_t& directives, const std::string& format = "add-binary");


  /**
   * @brief Write rendered directives to a file, one per line.
   * @param lines: The rendered directives.
   * @param path: The file, which is replaced.
   * @throws std::runtime_error if the file cannot be written.
   */
  void write(const shared::vector& lines, const std::filesystem::path& path);
}
