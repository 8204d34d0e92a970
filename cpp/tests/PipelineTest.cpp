#include <gtest/gtest.h>

#include "arguments.hpp"
#include "libraries.hpp"
#include "pipeline.hpp"
#include "workspace.hpp"

#include <algorithm>
#include <filesystem>
#include <map>
#include <string>

namespace fs = std::filesystem;

namespace
{
  class PipelineTest : public sofpack::tests::Workspace
  {
  protected:
    std::map<std::string, arg::Arg> saved;
    fs::path self, sof, manifest;

    // The filename of one of our own link dependencies.
    std::string linked;

    void SetUp() override {
      Workspace::SetUp();
      saved = arg::switches;

      if (!sofpack::tests::have_ldd()) GTEST_SKIP() << "ldd is not installed";
      self = fs::read_symlink("/proc/self/exe");
      const auto libs = libraries::scan(self);
      if (libs.empty()) GTEST_SKIP() << "test binary has no bundlable link dependencies";
      linked = fs::path(*libs.begin()).filename().string();

      sof = root / "sof";
      manifest = root / "out" / "manifest.txt";
      arg::emplace("target", self.string());
      arg::emplace("staging", sof.string());
      arg::emplace("manifest", manifest.string());
      arg::emplace("patterns", "none");
    }

    void TearDown() override {
      arg::switches = saved;
      Workspace::TearDown();
    }

    static registry::Index unreadable() {
      return registry::Index([]() -> std::optional<std::string> {return std::nullopt;});
    }
  };

  TEST_F(PipelineTest, StagingIsResetBeforeAnyWrite)
  {
    write("sof/libstale.so", "stale");
    write("sof/nested/libstale.so", "stale");
    arg::emplace("libraries", "none");

    auto index = unreadable();
    const auto directives = pipeline::run(index, {root / "roots"});

    EXPECT_FALSE(fs::exists(sof / "libstale.so"));
    EXPECT_FALSE(fs::exists(sof / "nested"));
    EXPECT_TRUE(fs::is_regular_file(sof / linked));
    for (const auto& d : directives) EXPECT_NE(d.source.filename(), "libstale.so");
  }

  TEST_F(PipelineTest, UnreadableRegistryStillProducesDirectives)
  {
    arg::emplace("libraries", "none");

    auto index = unreadable();
    const auto directives = pipeline::run(index, {root / "roots"});

    ASSERT_FALSE(directives.empty());
    EXPECT_EQ(directives, manifest::build(sof, "lib"));
    EXPECT_EQ(manifest::render(directives).size(), 2 * directives.size());

    const auto written = read(manifest);
    EXPECT_EQ(static_cast<size_t>(std::count(written.begin(), written.end(), '\n')), 2 * directives.size());
    EXPECT_TRUE(written.starts_with("--add-binary\n"));
  }

  TEST_F(PipelineTest, NamedLibraryOverridesLinkDependency)
  {
    const auto named = write("vendor/" + linked, "named");
    arg::emplace("libraries", named.string());

    auto index = unreadable();
    const auto directives = pipeline::run(index, {root / "roots"});

    EXPECT_EQ(read(sof / linked), "named");
    EXPECT_EQ(directives, manifest::build(sof, "lib"));
  }

  TEST_F(PipelineTest, PatternOverridesNamedLibrary)
  {
    const auto named = write("vendor/" + linked, "named");
    write("roots/" + linked, "pattern");
    arg::emplace("libraries", named.string());
    arg::emplace("patterns", "!");
    arg::emplace("patterns", linked);

    auto index = unreadable();
    pipeline::run(index, {root / "roots"});

    EXPECT_EQ(read(sof / linked), "pattern");
  }

  TEST_F(PipelineTest, MissingNamedLibraryIsAWarning)
  {
    arg::emplace("libraries", "libsofpack-absent.so");
    fs::create_directories(root / "roots");
    const auto before = shared::warnings();

    auto index = unreadable();
    EXPECT_NO_THROW(pipeline::run(index, {root / "roots"}));

    EXPECT_GT(shared::warnings(), before);
    EXPECT_FALSE(fs::exists(sof / "libsofpack-absent.so"));
  }

  TEST_F(PipelineTest, MissingTargetIsFatalAndLeavesStagingAlone)
  {
    write("sof/libprevious.so", "previous");
    arg::emplace("target", (root / "missing").string());

    auto index = unreadable();
    EXPECT_THROW(pipeline::run(index, {root / "roots"}), std::runtime_error);

    EXPECT_EQ(read(sof / "libprevious.so"), "previous");
    EXPECT_FALSE(index.built());
  }
}
