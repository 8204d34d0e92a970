#include <gtest/gtest.h>

#include "binaries.hpp"
#include "workspace.hpp"

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

namespace
{
  class BinariesTest : public sofpack::tests::Workspace
  {
  protected:
    fs::path executable(const std::string& name, const std::string& contents = "\177ELF")
    {
      const auto path = write(name, contents);
      fs::permissions(path, fs::perms::owner_exec, fs::perm_options::add);
      return path;
    }
  };

  TEST_F(BinariesTest, PathIsUsedAsIs)
  {
    const auto binary = executable("headless_shell");
    EXPECT_EQ(binaries::locate(binary.string()), binary);
    EXPECT_EQ(binaries::locate(binary.string(), (root / "elsewhere").string()), binary);
  }

  TEST_F(BinariesTest, NameIsSearchedForUnderTheRoot)
  {
    write("pkg/a/headless_shell", "not executable");
    const auto binary = executable("pkg/b/headless_shell");

    EXPECT_EQ(binaries::locate("headless_shell", (root / "pkg").string()), binary);
  }

  TEST_F(BinariesTest, MissingBinaryIsFatal)
  {
    fs::create_directories(root / "pkg");

    EXPECT_THROW(binaries::locate("headless_shell", (root / "pkg").string()), std::runtime_error);
    EXPECT_THROW(binaries::locate((root / "headless_shell").string()), std::runtime_error);
    EXPECT_THROW(binaries::locate("headless_shell"), std::runtime_error);
    EXPECT_THROW(binaries::locate(""), std::runtime_error);
  }

  TEST_F(BinariesTest, MissingRootIsFatal)
  {
    EXPECT_THROW(binaries::locate("headless_shell", (root / "missing").string()), std::runtime_error);
  }

  TEST_F(BinariesTest, PathsAreNotSearchedFor)
  {
    executable("pkg/bin/headless_shell");
    EXPECT_THROW(binaries::locate("bin/headless_shell", (root / "pkg").string()), std::runtime_error);
  }

  TEST_F(BinariesTest, ElfMagic)
  {
    EXPECT_TRUE(binaries::is_elf(executable("elf", std::string("\177ELF\2\1\1", 7))));
    EXPECT_TRUE(binaries::is_elf("/proc/self/exe"));

    EXPECT_FALSE(binaries::is_elf(write("script", "#!/bin/sh\necho hi\n")));
    EXPECT_FALSE(binaries::is_elf(write("short", "\177EL")));
    EXPECT_FALSE(binaries::is_elf(write("empty", "")));
    EXPECT_FALSE(binaries::is_elf(root / "missing"));
  }
}
