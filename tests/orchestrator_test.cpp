// STL headers
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

// fieldkit headers
#include "core/ApplianceConfig.hpp"
#include "core/Errors.hpp"
#include "provisioning/ExecutionContext.hpp"
#include "provisioning/ProvisioningOrchestrator.hpp"
#include "provisioning/TransactionalConfigWriter.hpp"

#include "CapturedLog.hpp"
#include "FakeCommandRunner.hpp"
#include "TempDir.hpp"

// GTest headers
#include <gtest/gtest.h>

using namespace fieldkit::provisioning;
using namespace fieldkit::test;
namespace core = fieldkit::core;
namespace fs = std::filesystem;

namespace {

  ProvisioningStep gateStep(bool pass) {
    ProvisioningStep s;
    s.id = "privilege-context";
    s.title = "Checking privilege context";
    s.kind = StepKind::Check;
    s.gate = true;
    s.apply = [pass](ExecutionContext&) {
      if (!pass)
        throw core::PreconditionError("This must be run as root");
    };
    return s;
  }

  /// Mutation step that creates \p path; satisfied/verified once it exists.
  ProvisioningStep touchStep(const std::string& id, std::string path, int* applies = nullptr) {
    ProvisioningStep s;
    s.id = id;
    s.title = "Creating " + id;
    s.satisfied = [path](ExecutionContext&) { return fs::exists(path); };
    s.apply = [path, applies](ExecutionContext&) {
      std::ofstream(path) << "x";
      if (applies)
        ++*applies;
    };
    s.verify = s.satisfied;
    return s;
  }

  template <typename E>
  ProvisioningStep throwingStep(const std::string& id, Severity severity, E error) {
    ProvisioningStep s;
    s.id = id;
    s.title = id;
    s.severity = severity;
    s.apply = [error](ExecutionContext&) { throw error; };
    return s;
  }

  StepStatus statusOf(const Report& r, const std::string& id) {
    const auto* rec = r.find(id);
    if (rec == nullptr)
      throw std::logic_error("no record for " + id);
    return rec->status;
  }

} // namespace

class OrchestratorTest : public ::testing::Test {
protected:
  OrchestratorTest() : ctx{ cfg, runner, sink.log } {}

  Report runPlan(std::vector<ProvisioningStep> steps, Mode mode = Mode::Apply,
                 ProvisioningOrchestrator::Confirm confirm = [](const std::string&) { return true; }) {
    Plan plan;
    plan.phase = Phase::Elevated;
    plan.title = "Test Plan";
    plan.usage = "Usage: test-plan";
    plan.steps = std::move(steps);
    plan.summarize = [this](ExecutionContext&, Report&) { ++summaries; };
    plan.epilogue = [this](ExecutionContext&, const Report&) { ++epilogues; };

    ProvisioningOrchestrator orchestrator{ ctx, std::move(confirm) };
    orchestrator.addPlan(std::move(plan));
    return orchestrator.run(Phase::Elevated, mode);
  }

  TempDir dir;
  CapturedLog sink;
  core::ApplianceConfig cfg;
  FakeCommandRunner runner;
  ExecutionContext ctx;
  int summaries{ 0 };
  int epilogues{ 0 };
};

TEST_F(OrchestratorTest, apply_SecondRunPerformsNoMutations) {
  int applies = 0;
  const auto plan = [&] {
    return std::vector<ProvisioningStep>{ gateStep(true), touchStep("a", dir.path("a"), &applies),
                                          touchStep("b", dir.path("b"), &applies) };
  };

  const auto first = runPlan(plan());
  EXPECT_EQ(first.exitCode, 0);
  EXPECT_EQ(first.mutations(), 2u);
  EXPECT_EQ(statusOf(first, "privilege-context"), StepStatus::Passed);
  EXPECT_EQ(statusOf(first, "a"), StepStatus::Applied);

  const auto second = runPlan(plan());
  EXPECT_EQ(second.exitCode, 0);
  EXPECT_EQ(second.mutations(), 0u);
  EXPECT_EQ(statusOf(second, "a"), StepStatus::AlreadyApplied);
  EXPECT_EQ(statusOf(second, "b"), StepStatus::AlreadyApplied);
  EXPECT_EQ(applies, 2);
  EXPECT_EQ(epilogues, 2);
}

TEST_F(OrchestratorTest, apply_FatalFailureStopsThePhase) {
  int applies = 0;
  const auto report =
      runPlan({ touchStep("a", dir.path("a"), &applies),
                throwingStep("boom", Severity::Soft, core::PreconditionError("missing marker")),
                touchStep("c", dir.path("c"), &applies) });

  EXPECT_TRUE(report.aborted);
  EXPECT_EQ(report.exitCode, 1);
  EXPECT_EQ(statusOf(report, "a"), StepStatus::Applied);
  EXPECT_EQ(statusOf(report, "boom"), StepStatus::Failed);
  EXPECT_EQ(statusOf(report, "c"), StepStatus::Skipped);
  EXPECT_EQ(applies, 1);
  EXPECT_FALSE(fs::exists(dir.path("c")));
  // nothing already applied is rolled back
  EXPECT_TRUE(fs::exists(dir.path("a")));
  EXPECT_EQ(summaries, 0);
  EXPECT_EQ(epilogues, 0);
  EXPECT_TRUE(sink.contains("Aborting the elevated phase"));
}

TEST_F(OrchestratorTest, apply_ClassifiesByErrorKindThenSeverity) {
  const auto report = runPlan({
      throwingStep("transient", Severity::Fatal, core::TransientStepWarning("curl missing")),
      throwingStep("smoke", Severity::Fatal, core::ServiceSmokeTestFailure("failed", "log")),
      throwingStep("deferred", Severity::Fatal, core::HardwareDeferred("reboot first")),
      throwingStep("fault", Severity::Fatal, core::HardwareFault("no LED")),
      throwingStep("soft-command", Severity::Soft, core::CommandError({ "loginctl" }, 1, "")),
      throwingStep("fatal-command", Severity::Fatal, core::CommandError({ "useradd" }, 9, "")),
      throwingStep("never-reached", Severity::Soft, std::runtime_error("x")),
  });

  EXPECT_EQ(statusOf(report, "transient"), StepStatus::Warning);
  EXPECT_EQ(statusOf(report, "smoke"), StepStatus::Warning);
  EXPECT_EQ(statusOf(report, "deferred"), StepStatus::Deferred);
  EXPECT_EQ(statusOf(report, "fault"), StepStatus::Warning);
  EXPECT_EQ(statusOf(report, "soft-command"), StepStatus::Warning);
  EXPECT_EQ(statusOf(report, "fatal-command"), StepStatus::Failed);
  EXPECT_EQ(statusOf(report, "never-reached"), StepStatus::Skipped);
  EXPECT_EQ(report.exitCode, 1);
}

TEST_F(OrchestratorTest, apply_TransactionErrorIsFatalEvenForSoftSteps) {
  const auto report =
      runPlan({ throwingStep("grants", Severity::Soft, core::TransactionError("read-only")) });
  EXPECT_EQ(statusOf(report, "grants"), StepStatus::Failed);
  EXPECT_TRUE(report.aborted);
}

TEST_F(OrchestratorTest, apply_UnmetPostconditionFails) {
  ProvisioningStep s;
  s.id = "liar";
  s.title = "Claims success";
  s.apply = [](ExecutionContext&) {};
  s.verify = [](ExecutionContext&) { return false; };

  const auto report = runPlan({ s });
  EXPECT_EQ(statusOf(report, "liar"), StepStatus::Failed);
  EXPECT_NE(report.find("liar")->detail.find("postcondition"), std::string::npos);
}

TEST_F(OrchestratorTest, apply_CheckStepsAreNotMutations) {
  ProvisioningStep check;
  check.id = "probe";
  check.title = "Probe";
  check.kind = StepKind::Check;
  check.apply = [](ExecutionContext&) {};

  const auto report = runPlan({ check });
  EXPECT_EQ(statusOf(report, "probe"), StepStatus::Passed);
  EXPECT_EQ(report.mutations(), 0u);
}

TEST_F(OrchestratorTest, verify_NeverApplies) {
  int applies = 0;
  std::ofstream(dir.path("a")) << "x";
  const auto report = runPlan({ gateStep(true), touchStep("a", dir.path("a"), &applies),
                                touchStep("b", dir.path("b"), &applies) },
                              Mode::Verify);

  EXPECT_EQ(applies, 0);
  EXPECT_EQ(report.exitCode, 0);
  EXPECT_EQ(statusOf(report, "a"), StepStatus::Verified);
  EXPECT_EQ(statusOf(report, "b"), StepStatus::NotSatisfied);
  EXPECT_FALSE(fs::exists(dir.path("b")));
  EXPECT_EQ(summaries, 1);
  EXPECT_EQ(epilogues, 0);
}

TEST_F(OrchestratorTest, verify_FailedGateStopsEvaluation) {
  int applies = 0;
  const auto report =
      runPlan({ gateStep(false), touchStep("a", dir.path("a"), &applies) }, Mode::Verify);

  EXPECT_EQ(report.exitCode, 1);
  EXPECT_EQ(report.find("a"), nullptr);
  EXPECT_EQ(summaries, 0);
}

TEST_F(OrchestratorTest, restore_ConfirmedPutsBackupBack) {
  const auto resource = dir.write("sudoers", "root ALL=(ALL) ALL\n");
  TransactionalConfigWriter writer{ resource, dir.path("sudoers.backup"), "# grants", sink.log };
  writer.grant({ "u ALL=(ALL) NOPASSWD: /usr/bin/gpio" });
  ctx.grantWriter = &writer;

  const auto report = runPlan({ gateStep(true) }, Mode::Restore);
  EXPECT_EQ(report.exitCode, 0);
  EXPECT_EQ(statusOf(report, "restore"), StepStatus::Applied);
  EXPECT_EQ(dir.read("sudoers"), "root ALL=(ALL) ALL\n");
}

TEST_F(OrchestratorTest, restore_DeclinedLeavesResourceAlone) {
  const auto resource = dir.write("sudoers", "root ALL=(ALL) ALL\n");
  TransactionalConfigWriter writer{ resource, dir.path("sudoers.backup"), "# grants", sink.log };
  writer.grant({ "u ALL=(ALL) NOPASSWD: /usr/bin/gpio" });
  const auto granted = dir.read("sudoers");
  ctx.grantWriter = &writer;

  std::string asked;
  const auto report = runPlan({ gateStep(true) }, Mode::Restore, [&](const std::string& q) {
    asked = q;
    return false;
  });
  EXPECT_EQ(report.exitCode, 0);
  EXPECT_EQ(statusOf(report, "restore"), StepStatus::Skipped);
  EXPECT_EQ(dir.read("sudoers"), granted);
  EXPECT_NE(asked.find("(y/N)"), std::string::npos);
}

TEST_F(OrchestratorTest, restore_WithoutBackupExitsNonZero) {
  const auto resource = dir.write("sudoers", "root ALL=(ALL) ALL\n");
  TransactionalConfigWriter writer{ resource, dir.path("sudoers.backup"), "# grants", sink.log };
  ctx.grantWriter = &writer;

  const auto report = runPlan({ gateStep(true) }, Mode::Restore);
  EXPECT_EQ(report.exitCode, 1);
  EXPECT_EQ(statusOf(report, "restore"), StepStatus::Failed);
  EXPECT_TRUE(sink.contains("No backup file found"));
}

TEST_F(OrchestratorTest, restore_RequiresThePrivilegeGate) {
  const auto resource = dir.write("sudoers", "root ALL=(ALL) ALL\n");
  TransactionalConfigWriter writer{ resource, dir.path("sudoers.backup"), "# grants", sink.log };
  ctx.grantWriter = &writer;

  bool asked = false;
  const auto report = runPlan({ gateStep(false) }, Mode::Restore, [&](const std::string&) {
    asked = true;
    return true;
  });
  EXPECT_EQ(report.exitCode, 1);
  EXPECT_FALSE(asked);
}

TEST_F(OrchestratorTest, hardwareTest_RunsOnlyTheSelfTest) {
  int applies = 0;
  bool tested = false;
  ProvisioningStep hw;
  hw.id = "hardware-self-test";
  hw.title = "Testing GPIO";
  hw.kind = StepKind::Check;
  hw.severity = Severity::Soft;
  hw.apply = [&tested](ExecutionContext&) { tested = true; };

  const auto report =
      runPlan({ gateStep(true), touchStep("a", dir.path("a"), &applies), hw }, Mode::HardwareTest);
  EXPECT_TRUE(tested);
  EXPECT_EQ(applies, 0);
  EXPECT_EQ(report.exitCode, 0);
  EXPECT_EQ(statusOf(report, "hardware-self-test"), StepStatus::Passed);
}

TEST_F(OrchestratorTest, help_PrintsUsageOnly) {
  int applies = 0;
  const auto report = runPlan({ touchStep("a", dir.path("a"), &applies) }, Mode::Help);
  EXPECT_EQ(report.exitCode, 0);
  EXPECT_TRUE(report.steps.empty());
  EXPECT_TRUE(sink.contains("Usage: test-plan"));
  EXPECT_EQ(applies, 0);
}

TEST_F(OrchestratorTest, plan_UnknownPhaseIsLogicError) {
  ProvisioningOrchestrator orchestrator{ ctx, [](const std::string&) { return false; } };
  EXPECT_THROW(orchestrator.run(Phase::Unprivileged, Mode::Apply), std::logic_error);
}
