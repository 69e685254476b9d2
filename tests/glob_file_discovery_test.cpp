#include <cqa/errors.h>
#include <cqa/glob_file_discovery.h>

#include "test_support/temporary_project.h"

#include <gtest/gtest.h>

#include <string>

namespace cqa {
namespace {

std::vector<std::string>
RelativeNames(const std::vector<std::filesystem::path> &files,
              const std::filesystem::path &root) {
  std::vector<std::string> names;
  for (const auto &file : files) {
    names.push_back(file.lexically_relative(root).generic_string());
  }
  return names;
}

TEST(GlobFileDiscoveryTest, DefaultPatternsCollectSourcesAndSkipBuildTrees) {
  test::TemporaryProject project;
  project.AddFile("src/main.cpp");
  project.AddFile("src/util.h");
  project.AddFile("src/legacy.c");
  project.AddFile("README.md");
  project.AddFile("build/generated.cpp");
  project.AddFile(".git/hooks/sample.c");
  project.AddFile(".cqa_cache/files/entry.cpp");

  GlobFileDiscovery discovery;
  const auto files =
      discovery.Discover(project.root(), DefaultIncludePatterns(),
                         DefaultExcludePatterns(), 10.0);
  const std::vector<std::string> expected = {"src/legacy.c", "src/main.cpp",
                                             "src/util.h"};
  EXPECT_EQ(expected, RelativeNames(files, project.root()));
}

TEST(GlobFileDiscoveryTest, EmptyIncludeListFallsBackToDefaults) {
  test::TemporaryProject project;
  project.AddFile("a.cpp");
  project.AddFile("notes.txt");

  GlobFileDiscovery discovery;
  const auto files = discovery.Discover(project.root(), {}, {}, 10.0);
  EXPECT_EQ(std::vector<std::string>{"a.cpp"},
            RelativeNames(files, project.root()));
}

TEST(GlobFileDiscoveryTest, ExcludePatternsMatchFileNames) {
  test::TemporaryProject project;
  project.AddFile("widget.cpp");
  project.AddFile("widget_test.cpp");
  project.AddFile("third_party/lib.cpp");

  GlobFileDiscovery discovery;
  const auto files = discovery.Discover(
      project.root(), {"*.cpp"}, {"*_test.cpp", "third_party/**"}, 10.0);
  EXPECT_EQ(std::vector<std::string>{"widget.cpp"},
            RelativeNames(files, project.root()));
}

TEST(GlobFileDiscoveryTest, SkipsFilesOverSizeLimit) {
  test::TemporaryProject project;
  project.AddFile("small.cpp", "int x;\n");
  project.AddFile("large.cpp", std::string(2 * 1024 * 1024, 'x'));

  GlobFileDiscovery discovery;
  const auto files = discovery.Discover(project.root(), {"*.cpp"}, {}, 1.0);
  EXPECT_EQ(std::vector<std::string>{"small.cpp"},
            RelativeNames(files, project.root()));
}

TEST(GlobFileDiscoveryTest, SingleFileRootYieldsThatFile) {
  test::TemporaryProject project;
  const auto path = project.AddFile("only.cpp", "int x;\n");

  GlobFileDiscovery discovery;
  const auto files = discovery.Discover(path, {}, {}, 10.0);
  ASSERT_EQ(1u, files.size());
  EXPECT_EQ(path, files[0]);

  EXPECT_TRUE(discovery.Discover(path, {"*.c"}, {}, 10.0).empty());
}

TEST(GlobFileDiscoveryTest, DirectoriesAboveRootDoNotTriggerExcludes) {
  test::TemporaryProject project;
  project.AddFile("build/app/main.cpp");

  GlobFileDiscovery discovery;
  const auto root = project.root() / "build" / "app";
  const auto files =
      discovery.Discover(root, {}, DefaultExcludePatterns(), 10.0);
  EXPECT_EQ(std::vector<std::string>{"main.cpp"}, RelativeNames(files, root));
}

TEST(GlobFileDiscoveryTest, BrokenSymlinksAreSkippedWithoutError) {
  test::TemporaryProject project;
  project.AddFile("src/main.cpp");
  std::filesystem::create_symlink(project.root() / "src" / "gone.cpp",
                                  project.root() / "src" / "dangling.cpp");
  std::filesystem::create_directory_symlink(project.root() / "missing",
                                            project.root() / "linked_dir");

  GlobFileDiscovery discovery;
  std::vector<std::filesystem::path> files;
  EXPECT_NO_THROW(files = discovery.Discover(project.root(),
                                             DefaultIncludePatterns(),
                                             DefaultExcludePatterns(), 10.0));
  const std::vector<std::string> expected = {"src/main.cpp"};
  EXPECT_EQ(expected, RelativeNames(files, project.root()));
}

TEST(GlobFileDiscoveryTest, MissingRootIsResourceError) {
  test::TemporaryProject project;
  GlobFileDiscovery discovery;
  EXPECT_THROW(discovery.Discover(project.root() / "absent", {}, {}, 10.0),
               ResourceError);
  EXPECT_THROW(discovery.Discover("", {}, {}, 10.0), ResourceError);
}

TEST(MatchesAnyPatternTest, RecursivePatternsMatchNestedPaths) {
  EXPECT_TRUE(MatchesAnyPattern("vendor/a/b.cpp", {"vendor/**"}));
  EXPECT_TRUE(MatchesAnyPattern("src/vendor/b.cpp", {"vendor/**"}));
  EXPECT_TRUE(MatchesAnyPattern("src/deep/file.h", {"*.h"}));
  EXPECT_FALSE(MatchesAnyPattern("src/file.cpp", {"*.h", "vendor/**"}));
}

} // namespace
} // namespace cqa
