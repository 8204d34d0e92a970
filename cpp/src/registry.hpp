#pragma once
/**
 * @brief The System Library Index
 * A name to path lookup built from the host's library registry, `ldconfig -p`. The index is built
 * lazily, at most once for the lifetime of the object, and never changes afterwards. A build run
 * constructs one index and hands it to whatever needs it. If the registry cannot be read, the index
 * is simply empty, and resolution falls back to searching the filesystem.
 */

#include <functional>
#include <map>
#include <optional>

#include "shared.hpp"

namespace registry {

  using entries_t = std::map<std::string, std::filesystem::path>;

  /**
   * @brief A source of registry output.
   * @returns The listing, or std::nullopt if the registry could not be read.
   */
  using source_t = std::function<std::optional<std::string>()>;


  /**
   * @brief Parse the output of ldconfig -p.
   * @param output: The listing.
   * @returns Every library whose path currently exists, keyed by name.
   * @info Lines are of the form `name (arch) => /path`. Other lines are skipped. If a
   * name appears more than once, the first entry that exists is kept.
   */
  entries_t parse(const std::string_view& output);


  /**
   * @brief Read the registry from ldconfig.
   * @returns The output of ldconfig -p, or std::nullopt if ldconfig is missing or fails.
   */
  std::optional<std::string> ldconfig();


  class Index {
    private:
      source_t source;
      std::optional<entries_t> cache = std::nullopt;

    public:

      /**
       * @brief Construct an index.
       * @param src: Where the registry is read from.
       * @note Nothing is read until the index is first queried.
       */
      explicit Index(source_t src = ldconfig) : source(std::move(src)) {}

      /**
       * @brief Get every entry, building the index on first use.
       * @returns The entries.
       */
      const entries_t& entries();

      /**
       * @brief Look up a library.
       * @param name: The library's filename, such as libnss3.so
       * @returns The indexed path, if any.
       * @note The path existed when the index was built, but that may no longer hold.
       */
      std::optional<std::filesystem::path> find(const std::string& name);

      /**
       * @brief Whether the index has been built.
       */
      bool built() const {return cache.has_value();}
  };
}
