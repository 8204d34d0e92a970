#include <algorithm>
#include <fstream>

#include "manifest.hpp"

using namespace shared;

namespace manifest {

  directives_t build(const std::filesystem::path& sof, const std::string& destination) {
    directives_t directives;
    if (!std::filesystem::is_directory(sof)) return directives;

    // The SOF is flat; anything below it was not put there by us.
    for (const auto& entry : std::filesystem::directory_iterator(sof)) {
      if (entry.is_regular_file()) directives.emplace_back(directive{entry.path(), destination});
    }

    std::sort(directives.begin(), directives.end(), [](const directive& a, const directive& b) {
      return a.source.filename().string() < b.source.filename().string();
    });
    return directives;
  }


  vector render(const directives_t& directives, const std::string& format) {
    vector rendered;
    rendered.reserve(format == "plain" ? directives.size() : directives.size() * 2);
    for (const auto& [source, destination] : directives) {
      auto pair = source.string() + ':' + destination;
      if (format == "plain") rendered.emplace_back(std::move(pair));
      else extend(rendered, {"--add-binary", pair});
    }
    return rendered;
  }


  void write(const vector& lines, const std::filesystem::path& path) {
    if (path.has_parent_path()) std::filesystem::create_directories(path.parent_path());

    // Written aside, then moved into place.
    auto temp = path; temp += ".tmp";
    std::error_code ec;
    {
      auto file = std::ofstream(temp, std::ios::trunc);
      if (!file.is_open()) throw std::runtime_error("Failed to open manifest: " + temp.string());
      for (const auto& line : lines) file << line << '\n';
      file.close();
      if (!file) {
        std::filesystem::remove(temp, ec);
        throw std::runtime_error("Failed to write manifest: " + temp.string());
      }
    }

    std::filesystem::rename(temp, path, ec);
    if (ec) {
      const auto reason = ec.message();
      std::filesystem::remove(temp, ec);
      throw std::runtime_error("Failed to replace manifest " + path.string() + ": " + reason);
    }
  }
}
