#include <iostream>

#include "pipeline.hpp"
#include "arguments.hpp"
#include "binaries.hpp"
#include "libraries.hpp"

using namespace shared;

namespace pipeline {

  // Lists can be switched off entirely.
  static bool disabled(const set& values) {return values.empty() || values.contains("none");}


  manifest::directives_t run(registry::Index& index, const std::vector<std::filesystem::path>& roots) {
    const auto sof = std::filesystem::absolute(arg::get("staging"));

    // [1/4] Find what we are packaging.
    const auto target = binaries::locate(arg::get("target"), arg::get("search_root"));
    if (!binaries::is_elf(target))
      throw std::runtime_error("Not an ELF binary: " + target.string());
    log({"[1/4] Packaging", target.string()});

    libraries::reset(sof);

    // [2/4] Link dependencies.
    log({"[2/4] Collecting shared libraries via ldd"});
    auto linked = libraries::scan(target);
    log({"Found", std::to_string(linked.size()), "link dependencies"});
    libraries::stage_all(linked, sof);

    // [3/4] Libraries loaded at runtime. Nothing here is fatal.
    log({"[3/4] Resolving runtime libraries"});
    resolver::Resolver resolver(index, roots);

    if (!disabled(arg::list("libraries"))) {
      for (const auto& name : arg::list("libraries")) {
        auto path = resolver.resolve(name);
        if (path.has_value()) libraries::stage(*path, sof);
        else warning({"Library not found, skipping:", name});
      }
    }

    if (!disabled(arg::list("patterns"))) {
      for (const auto& pattern : arg::list("patterns")) {
        auto matches = resolver.glob(pattern);
        if (matches.empty()) warning({"No libraries match:", pattern});
        libraries::stage_all(matches, sof);
      }
    }

    // [4/4] Emit the directives.
    log({"[4/4] Writing bundling directives"});
    auto directives = manifest::build(sof, arg::get("destination"));
    const auto rendered = manifest::render(directives, arg::get("format"));

    if (arg::at("manifest")) {
      manifest::write(rendered, arg::get("manifest"));
      log({"Wrote", arg::get("manifest")});
    }
    else {
      for (const auto& line : rendered) std::cout << line << '\n';
      std::cout.flush();
    }

    log({"Staged", std::to_string(directives.size()), "libraries into", sof.string()});
    return directives;
  }
}
