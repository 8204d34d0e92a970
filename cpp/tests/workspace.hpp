#pragma once
/**
 * @brief A scratch directory for filesystem tests.
 */

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>

#include "shared.hpp"

namespace sofpack::tests {

  class Workspace : public ::testing::Test {
    protected:
      std::unique_ptr<shared::TemporaryDirectory> temp;
      std::filesystem::path root;

      void SetUp() override {
        temp = std::make_unique<shared::TemporaryDirectory>(std::filesystem::temp_directory_path().string(), "sofpack-test");
        root = temp->get_path();
      }

      void TearDown() override {temp.reset();}

      // Write a file, creating its parents.
      std::filesystem::path write(const std::string& name, const std::string& contents) {
        const auto path = root / name;
        std::filesystem::create_directories(path.parent_path());
        auto file = std::ofstream(path, std::ios::binary | std::ios::trunc);
        file << contents;
        return path;
      }

      // Create a symlink at name, pointing at target.
      std::filesystem::path link(const std::string& name, const std::filesystem::path& target) {
        const auto path = root / name;
        std::filesystem::create_directories(path.parent_path());
        std::filesystem::create_symlink(target, path);
        return path;
      }

      static std::string read(const std::filesystem::path& path) {
        auto file = std::ifstream(path, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
      }
  };

  inline bool have_ldd() {return std::filesystem::exists("/usr/bin/ldd") || std::filesystem::exists("/bin/ldd");}
}
