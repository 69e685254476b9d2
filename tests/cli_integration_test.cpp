#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <sys/wait.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "test_support/temporary_project.h"

namespace cqa {
namespace {

using ::testing::Gt;
using ::testing::HasSubstr;

std::string LoadFile(const std::filesystem::path &path) {
  std::ifstream stream(path);
  return std::string((std::istreambuf_iterator<char>(stream)),
                     std::istreambuf_iterator<char>());
}

std::filesystem::path ExecutableUnderTest() {
  return std::filesystem::current_path() / "cqa";
}

int ExitCode(const std::string &command) {
  return WEXITSTATUS(std::system(command.c_str()));
}

// A single function long and branchy enough to be a high severity finding.
std::string BranchyFunction() {
  std::string source = "int Dispatch(int value) {\n  int total = 0;\n";
  for (int i = 0; i < 70; ++i) {
    source += "  if (value == " + std::to_string(i) + ") { total += " +
              std::to_string(i) + "; }\n";
  }
  source += "  return total;\n}\n";
  return source;
}

TEST(CliIntegrationTest, GeneratesReportsAndFlagsBlockingIssues) {
  test::TemporaryProject project;
  project.AddFile("src/dispatch.cpp", BranchyFunction());

  const auto cli = ExecutableUnderTest();
  ASSERT_TRUE(std::filesystem::exists(cli))
      << "Expected CLI executable at " << cli;

  const auto output_directory = project.root() / "artifacts";
  const std::string command =
      cli.string() + " analyze --root " + project.root().string() +
      " --format markdown,json --out " + output_directory.string();

  ASSERT_EQ(ExitCode(command), 2);

  const auto markdown_report = output_directory / "cqa_report.md";
  const auto json_report = output_directory / "cqa_report.json";
  ASSERT_TRUE(std::filesystem::exists(markdown_report));
  ASSERT_TRUE(std::filesystem::exists(json_report));
  EXPECT_THAT(LoadFile(markdown_report),
              HasSubstr("Long and complex function 'Dispatch'"));
  EXPECT_THAT(LoadFile(json_report), HasSubstr("\"severity\":\"high\""));
}

TEST(CliIntegrationTest, CleanProjectWritesMarkdownToRoot) {
  test::TemporaryProject project;
  project.AddFile("src/example.cpp", "int Example() { return 42; }\n");

  const auto cli = ExecutableUnderTest();
  ASSERT_TRUE(std::filesystem::exists(cli))
      << "Expected CLI executable at " << cli;

  const std::string command = cli.string() + " --root " +
                              project.root().string();
  ASSERT_EQ(ExitCode(command), 0);

  const auto markdown_report = project.root() / "cqa_report.md";
  ASSERT_TRUE(std::filesystem::exists(markdown_report));
  EXPECT_FALSE(std::filesystem::exists(project.root() / "cqa_report.json"));
  EXPECT_THAT(LoadFile(markdown_report).size(), Gt<std::size_t>(0));
  EXPECT_TRUE(std::filesystem::exists(project.root() / ".cqa_cache"));
}

TEST(CliIntegrationTest, UsesConfigFileAndCacheCommands) {
  test::TemporaryProject project;
  project.AddFile("src/example.cpp", "int Example() { return 42; }\n");
  const auto cache_dir = project.root() / "cqa-cache";
  const auto config_path = project.AddFile(
      "cqa.yaml", "root: " + project.root().string() + "\n" +
                      "formats: markdown,json\n" + "workers: 2\n" +
                      "cache_dir: " + cache_dir.string() + "\n" +
                      "exclude:\n  - 'cqa-cache/**'\n");

  const auto cli = ExecutableUnderTest();
  ASSERT_TRUE(std::filesystem::exists(cli))
      << "Expected CLI executable at " << cli;

  const std::string command =
      cli.string() + " analyze --config " + config_path.string();
  ASSERT_EQ(ExitCode(command), 0);
  ASSERT_EQ(ExitCode(command), 0);

  EXPECT_TRUE(std::filesystem::exists(project.root() / "cqa_report.md"));
  EXPECT_TRUE(std::filesystem::exists(project.root() / "cqa_report.json"));
  EXPECT_FALSE(std::filesystem::is_empty(cache_dir / "files"));
  EXPECT_FALSE(std::filesystem::is_empty(cache_dir / "runs"));

  const auto cache_arguments = " --root " + project.root().string() +
                               " --cache-dir " + cache_dir.string();
  ASSERT_EQ(ExitCode(cli.string() + " cache stats" + cache_arguments), 0);
  ASSERT_EQ(ExitCode(cli.string() + " cache cleanup" + cache_arguments), 0);
  ASSERT_EQ(ExitCode(cli.string() + " cache clean" + cache_arguments), 0);
  EXPECT_FALSE(std::filesystem::exists(cache_dir / "files"));
  EXPECT_FALSE(std::filesystem::exists(cache_dir / "runs"));
}

TEST(CliIntegrationTest, RejectsUnknownCommand) {
  const auto cli = ExecutableUnderTest();
  ASSERT_TRUE(std::filesystem::exists(cli))
      << "Expected CLI executable at " << cli;
  EXPECT_EQ(ExitCode(cli.string() + " frobnicate > /dev/null 2>&1"), 1);
}

} // namespace
} // namespace cqa
