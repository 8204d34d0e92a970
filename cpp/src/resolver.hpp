#pragma once
/**
 * @brief Named Library Resolution
 * Libraries that a binary loads by name at runtime, such as the NSS modules, never show up in LDD.
 * They are resolved here by name: first against the system library index, and failing that, by
 * searching the library roots on disk. A library that cannot be found is not an error, as optional
 * libraries are not present on every host.
 */

#include <optional>

#include "libraries.hpp"
#include "registry.hpp"

namespace resolver {

  /**
   * @brief The directories searched, in order, when the index has no answer.
   */
  extern const std::vector<std::filesystem::path> roots;


  class Resolver {
    private:
      registry::Index& index;
      std::vector<std::filesystem::path> search;

      /**
       * @brief Search the roots for a file.
       * @param name: The exact filename.
       * @returns The first regular file found, in root order.
       */
      std::optional<std::filesystem::path> find(const std::string& name) const;

    public:

      /**
       * @brief Construct a resolver.
       * @param idx: The index for this run. The resolver does not own it.
       * @param dirs: The directories to search.
       */
      Resolver(registry::Index& idx, std::vector<std::filesystem::path> dirs = roots) : index(idx), search(std::move(dirs)) {}

      /**
       * @brief Resolve a library by name.
       * @param name: The filename of the library, like libnss3.so
       * @returns The path to the library, or std::nullopt if it is not on this host.
       * @info The index is preferred over the filesystem, even if both would find the name.
       */
      std::optional<std::filesystem::path> resolve(const std::string& name);

      /**
       * @brief Resolve a filename pattern.
       * @param pattern: A filename glob, like libGLESv2.so*
       * @returns Every existing library under the roots, at most two levels deep, whose name matches.
       */
      libraries::lib_t glob(const std::string& pattern) const;

      const std::vector<std::filesystem::path>& directories() const {return search;}
  };
}
