#include <gtest/gtest.h>

#include "shared.hpp"
#include "workspace.hpp"

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

namespace
{
  class SharedTest : public sofpack::tests::Workspace {};

  TEST_F(SharedTest, HashIsBlake2b512)
  {
    EXPECT_EQ(
      shared::hash_file(write("empty", "")),
      "786a02f742015903c6c6fd852552d272912f4740e15847618a86e217f71f5419"
      "d25e1031afee585313896444934eb04b903a685b1448b755d56f701afe9be2ce"
    );
    EXPECT_EQ(
      shared::hash_file(write("abc", "abc")),
      "ba80a53f981c4d0d6a2797b69f12f6e94c212f14685ac4b74b12bb6fdbffa2d1"
      "7d87c5392aab792dc252d5de4533cc9518d38aa8dbf1925ab92386edd4009923"
    );
  }

  TEST_F(SharedTest, HashFollowsSymlinks)
  {
    const auto real = write("libfoo.so.1", std::string(200000, 'x'));
    const auto alias = link("libfoo.so", "libfoo.so.1");
    EXPECT_EQ(shared::hash_file(alias), shared::hash_file(real));
    EXPECT_NE(shared::hash_file(real), shared::hash_file(write("other", std::string(200000, 'y'))));
  }

  TEST_F(SharedTest, HashOfMissingFileThrows)
  {
    EXPECT_THROW(shared::hash_file(root / "missing"), std::runtime_error);
  }

  TEST(JoinTest, Containers)
  {
    EXPECT_EQ(shared::join(shared::vector{"ldd", "/bin/app"}), "ldd /bin/app");
    EXPECT_EQ(shared::join(shared::set{"b", "a"}, ','), "a,b");
    EXPECT_EQ(shared::join(shared::vector{}), "");
  }

  TEST(TrimTest, BothEnds)
  {
    EXPECT_EQ(shared::trim<std::string_view>("\t libfoo.so \r", " \t\r"), "libfoo.so");
    EXPECT_EQ(shared::trim('\n' + std::string("x") + '\n', '\n'), "x");
    EXPECT_EQ(shared::trim<std::string_view>("   ", " "), "");
    EXPECT_EQ(shared::trim(std::string_view(""), ' '), "");
  }

  TEST(ExtendTest, AppendsInOrder)
  {
    shared::vector dest = {"find", "/usr/lib"};
    shared::extend(dest, {"-type", "f"});
    shared::extend(dest, shared::vector{"-name", "libnss3.so"});
    EXPECT_EQ(dest, (shared::vector{"find", "/usr/lib", "-type", "f", "-name", "libnss3.so"}));
  }

  TEST(TemporaryDirectoryTest, RemovedWhenDestroyed)
  {
    std::string path;
    {
      shared::TemporaryDirectory temp;
      path = temp.get_path();
      EXPECT_TRUE(fs::is_directory(path));
      EXPECT_TRUE(temp.get_name().starts_with("sofpack-"));

      const auto nested = temp.sub("a/b", true);
      EXPECT_TRUE(fs::is_directory(nested));
      EXPECT_FALSE(fs::exists(temp.sub("file")));
    }
    EXPECT_FALSE(fs::exists(path));
  }

  TEST(CommandErrorTest, CarriesCommandAndOutput)
  {
    const shared::command_error e("ldd failed", "ldd /bin/app", "not a dynamic executable");
    EXPECT_EQ(e.command(), "ldd /bin/app");
    EXPECT_EQ(e.output(), "not a dynamic executable");

    const std::string what = e.what();
    EXPECT_TRUE(what.starts_with("ldd failed"));
    EXPECT_TRUE(what.contains("ldd /bin/app"));
    EXPECT_TRUE(what.contains("not a dynamic executable"));
  }

  TEST_F(SharedTest, WildcardFindsByName)
  {
    const auto a = write("usr/lib/libnss3.so", "a");
    const auto b = write("usr/lib/nss/libnss3.so", "b");
    write("usr/lib/libnssutil3.so", "c");

    const shared::set expected = {a.string(), b.string()};
    EXPECT_EQ(shared::wildcard("libnss3.so", (root / "usr/lib").string()), expected);
    EXPECT_EQ(shared::wildcard("libnss3.so", (root / "usr/lib").string(), {"-maxdepth", "1"}), shared::set{a.string()});
  }
}
