// STL headers
#include <filesystem>
#include <stdexcept>

// fieldkit headers
#include "core/Errors.hpp"
#include "provisioning/TransactionalConfigWriter.hpp"

#include "CapturedLog.hpp"
#include "MockCommandRunner.hpp"
#include "TempDir.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

using namespace fieldkit::provisioning;
using namespace fieldkit::test;
using ::testing::_;
using ::testing::Return;

namespace {

  const std::string kPristine = "Defaults\tenv_reset\nroot\tALL=(ALL:ALL) ALL\n@includedir /etc/sudoers.d\n";
  const std::string kComment = "# Raspberry Pi Camera GPIO and Camera Access";

} // namespace

class ConfigWriterTest : public ::testing::Test {
protected:
  void SetUp() override { resource = dir.write("sudoers", kPristine); }

  TransactionalConfigWriter writer() {
    return TransactionalConfigWriter{ resource, dir.path("sudoers.backup"), kComment, sink.log };
  }

  TempDir dir;
  CapturedLog sink;
  std::string resource;
};

TEST_F(ConfigWriterTest, grant_AppendsCommentAndEntriesOnce) {
  auto w = writer();
  EXPECT_EQ(w.grant({ "u ALL=(ALL) NOPASSWD: /usr/bin/gpio" }), GrantOutcome::Applied);
  EXPECT_EQ(dir.read("sudoers"),
            kPristine + "\n" + kComment + "\nu ALL=(ALL) NOPASSWD: /usr/bin/gpio\n");

  EXPECT_EQ(w.grant({ "u ALL=(ALL) NOPASSWD: /usr/bin/gpio" }), GrantOutcome::AlreadyApplied);
  EXPECT_EQ(dir.read("sudoers"),
            kPristine + "\n" + kComment + "\nu ALL=(ALL) NOPASSWD: /usr/bin/gpio\n");
  EXPECT_TRUE(w.transaction().applied);
}

TEST_F(ConfigWriterTest, grant_BacksUpOnlyOnce) {
  auto w = writer();
  w.grant({ "u ALL=(ALL) NOPASSWD: /usr/bin/gpio" });
  EXPECT_EQ(dir.read("sudoers.backup"), kPristine);

  // a second writer (next run) must not overwrite the pristine copy
  auto next = writer();
  next.grant({ "u ALL=(ALL) NOPASSWD: /usr/bin/ffmpeg" });
  EXPECT_EQ(dir.read("sudoers.backup"), kPristine);
  EXPECT_TRUE(next.hasBackup());
}

TEST_F(ConfigWriterTest, restore_IsByteExact) {
  auto w = writer();
  w.grant({ "u ALL=(ALL) NOPASSWD: /usr/bin/gpio", "u ALL=(ALL) NOPASSWD: /usr/bin/ffmpeg" });
  ASSERT_NE(dir.read("sudoers"), kPristine);

  w.restore();
  EXPECT_EQ(dir.read("sudoers"), kPristine);
}

TEST_F(ConfigWriterTest, restore_AfterThreeIndependentGrants) {
  // toolA, then toolB, then A+B+C across three runs; restore gives the original
  writer().grant({ "u ALL=(ALL) NOPASSWD: /opt/toolA" });
  writer().grant({ "u ALL=(ALL) NOPASSWD: /opt/toolB" });
  auto last = writer();
  EXPECT_EQ(last.grant({ "u ALL=(ALL) NOPASSWD: /opt/toolA", "u ALL=(ALL) NOPASSWD: /opt/toolB",
                         "u ALL=(ALL) NOPASSWD: /opt/toolC" }),
            GrantOutcome::Applied);

  const auto content = dir.read("sudoers");
  EXPECT_EQ(content.find("/opt/toolA"), content.rfind("/opt/toolA"));
  EXPECT_EQ(content.find(kComment), content.rfind(kComment));

  last.restore();
  EXPECT_EQ(dir.read("sudoers"), kPristine);
}

TEST_F(ConfigWriterTest, grant_OverlappingSetsKeepEachLineOnceAndFirstBackup) {
  const std::string a = "u ALL=(ALL) NOPASSWD: /opt/toolA";
  const std::string b = "u ALL=(ALL) NOPASSWD: /opt/toolB";
  const std::string c = "u ALL=(ALL) NOPASSWD: /opt/toolC";
  const auto count = [](const std::string& text, const std::string& line) {
    std::size_t n = 0;
    for (auto pos = text.find(line); pos != std::string::npos; pos = text.find(line, pos + 1))
      ++n;
    return n;
  };

  EXPECT_EQ(writer().grant({ a, b }), GrantOutcome::Applied);
  const auto backup = dir.read("sudoers.backup");
  EXPECT_EQ(backup, kPristine);

  EXPECT_EQ(writer().grant({ a, c }), GrantOutcome::Applied);
  const auto content = dir.read("sudoers");
  EXPECT_EQ(count(content, a), 1u);
  EXPECT_EQ(count(content, b), 1u);
  EXPECT_EQ(count(content, c), 1u);
  EXPECT_EQ(count(content, kComment), 1u);
  EXPECT_EQ(content.rfind(kPristine, 0), 0u);
  EXPECT_EQ(dir.read("sudoers.backup"), backup);
}

TEST_F(ConfigWriterTest, restore_WithoutBackupThrowsNoBackup) {
  auto w = writer();
  EXPECT_THROW(w.restore(), fieldkit::core::NoBackupError);
  EXPECT_EQ(dir.read("sudoers"), kPristine);
}

TEST_F(ConfigWriterTest, grant_MissingResourceIsTransactionError) {
  TransactionalConfigWriter w{ dir.path("absent"), dir.path("absent.backup"), kComment, sink.log };
  EXPECT_THROW(w.grant({ "x" }), fieldkit::core::TransactionError);
  EXPECT_THROW(w.missing({ "x" }), fieldkit::core::TransactionError);
  EXPECT_FALSE(std::filesystem::exists(dir.path("absent.backup")));
}

TEST_F(ConfigWriterTest, grant_RejectedCandidateLeavesResourceUntouched) {
  MockCommandRunner runner;
  EXPECT_CALL(runner, hasProgram("visudo")).WillOnce(Return(true));
  EXPECT_CALL(runner, run(::testing::ElementsAre("visudo", "-cf", _), _))
      .WillOnce(Return(fieldkit::io::CommandResult{ 1, "syntax error near line 4\n" }));

  TransactionalConfigWriter w{ resource, dir.path("sudoers.backup"), kComment, sink.log,
                               visudoValidator(runner) };
  EXPECT_THROW(w.grant({ "u ALL=(ALL) NOPASSWD /broken" }), fieldkit::core::TransactionError);
  EXPECT_EQ(dir.read("sudoers"), kPristine);
}

TEST_F(ConfigWriterTest, present_ReportsOnlyGrantedEntries) {
  auto w = writer();
  w.grant({ "u ALL=(ALL) NOPASSWD: /usr/bin/gpio" });
  EXPECT_EQ(w.present({ "u ALL=(ALL) NOPASSWD: /usr/bin/ffmpeg", "u ALL=(ALL) NOPASSWD: /usr/bin/gpio" }),
            (std::vector<std::string>{ "u ALL=(ALL) NOPASSWD: /usr/bin/gpio" }));
  EXPECT_EQ(w.missing({ "u ALL=(ALL) NOPASSWD: /usr/bin/ffmpeg" }).size(), 1u);
}
