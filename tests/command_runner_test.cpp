// STL headers
#include <stdexcept>

// fieldkit headers
#include "core/Errors.hpp"
#include "io/CommandRunner.hpp"
#include "io/FileOps.hpp"

#include "TempDir.hpp"

// GTest headers
#include <gtest/gtest.h>

using fieldkit::io::PosixCommandRunner;
using fieldkit::test::TempDir;

TEST(command_runner, captures_merged_output_and_exit_code) {
  PosixCommandRunner runner;
  const auto r = runner.run({ "sh", "-c", "echo out; echo err 1>&2; exit 3" });
  EXPECT_EQ(r.exitCode, 3);
  EXPECT_NE(r.output.find("out\n"), std::string::npos);
  EXPECT_NE(r.output.find("err\n"), std::string::npos);
}

TEST(command_runner, feeds_stdin) {
  PosixCommandRunner runner;
  const auto r = runner.run({ "cat" }, "ABCDEF:6:\n");
  EXPECT_TRUE(r.ok());
  EXPECT_EQ(r.output, "ABCDEF:6:\n");
}

TEST(command_runner, missing_program_is_127) {
  PosixCommandRunner runner;
  EXPECT_EQ(runner.run({ "fieldkit-definitely-not-installed" }).exitCode, 127);
  EXPECT_FALSE(runner.hasProgram("fieldkit-definitely-not-installed"));
  EXPECT_TRUE(runner.hasProgram("sh"));
}

TEST(command_runner, run_checked_throws_command_error) {
  PosixCommandRunner runner;
  try {
    runner.runChecked({ "sh", "-c", "echo nope; exit 2" });
    FAIL() << "expected CommandError";
  } catch (const fieldkit::core::CommandError& e) {
    EXPECT_EQ(e.exitCode(), 2);
    EXPECT_EQ(e.output(), "nope\n");
    EXPECT_EQ(e.argv().front(), "sh");
  }
  EXPECT_EQ(runner.runChecked({ "sh", "-c", "printf ok" }), "ok");
}

TEST(file_ops, atomic_write_keeps_mode_and_hook_can_abort) {
  TempDir dir;
  const auto path = dir.write("target", "v1\n");
  fieldkit::io::writeFileAtomic(path, "v2\n", 0600);
  EXPECT_EQ(dir.read("target"), "v2\n");

  EXPECT_THROW(fieldkit::io::writeFileAtomic(path, "v3\n", 0600,
                                             [](const std::string&) {
                                               throw std::runtime_error("rejected");
                                             }),
               std::runtime_error);
  EXPECT_EQ(dir.read("target"), "v2\n");
}

TEST(file_ops, backup_once_never_overwrites) {
  TempDir dir;
  const auto source = dir.write("source", "pristine\n");
  EXPECT_TRUE(fieldkit::io::createBackupOnce(source, dir.path("backup")));
  dir.write("source", "modified\n");
  EXPECT_FALSE(fieldkit::io::createBackupOnce(source, dir.path("backup")));
  EXPECT_EQ(dir.read("backup"), "pristine\n");
  EXPECT_FALSE(fieldkit::io::readFile(dir.path("absent")).has_value());
}
