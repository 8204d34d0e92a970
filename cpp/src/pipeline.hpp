#pragma once
/**
 * @brief The Staging Run
 * One run takes the configured target from nothing to a populated SOF and its directives. The order
 * is fixed: the SOF is cleared, then link dependencies are staged, then named libraries, then pattern
 * matches. Since the last library staged under a filename wins, later steps override earlier ones.
 */

#include "manifest.hpp"
#include "registry.hpp"
#include "resolver.hpp"

namespace pipeline {

  /**
   * @brief Run every step against the parsed arguments.
   * @param index: The library index for this run.
   * @param roots: The directories searched for named and pattern libraries.
   * @returns The directives, which have already been printed or written to --manifest.
   * @throws std::runtime_error if the target cannot be found or scanned, or the manifest cannot be written.
   * Everything else is a warning.
   */
  manifest::directives_t run(registry::Index& index, const std::vector<std::filesystem::path>& roots = resolver::roots);
}
