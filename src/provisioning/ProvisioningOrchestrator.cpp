/* @file ProvisioningOrchestrator.cpp
 * @brief Mode dispatch, per-step execution and error classification.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <iostream>
#include <stdexcept>

// fieldkit headers
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "provisioning/ExecutionContext.hpp"
#include "provisioning/ProvisioningOrchestrator.hpp"
#include "provisioning/TransactionalConfigWriter.hpp"

using namespace fieldkit::provisioning;

namespace {

  constexpr const char* kHardwareStep = "hardware-self-test";

} // namespace

namespace fieldkit {
  namespace provisioning {

    const char* toString(StepStatus s) {
      switch (s) {
      case StepStatus::AlreadyApplied:
        return "already applied";
      case StepStatus::Applied:
        return "applied";
      case StepStatus::Passed:
        return "passed";
      case StepStatus::Verified:
        return "verified";
      case StepStatus::NotSatisfied:
        return "not satisfied";
      case StepStatus::Warning:
        return "warning";
      case StepStatus::Deferred:
        return "deferred";
      case StepStatus::Failed:
        return "failed";
      case StepStatus::Skipped:
        return "skipped";
      default:
        return "unknown";
      }
    }

    bool confirmOnStdin(const std::string& question) {
      std::cout << question << std::flush;
      std::string answer;
      if (!std::getline(std::cin, answer))
        return false;
      return !answer.empty() && (answer.front() == 'y' || answer.front() == 'Y');
    }

  } // namespace provisioning
} // namespace fieldkit

std::size_t Report::mutations() const {
  return static_cast<std::size_t>(std::count_if(
      steps.begin(), steps.end(), [](const StepRecord& r) { return r.status == StepStatus::Applied; }));
}

const StepRecord* Report::find(const std::string& id) const {
  const auto it =
      std::find_if(steps.begin(), steps.end(), [&](const StepRecord& r) { return r.id == id; });
  return it == steps.end() ? nullptr : &*it;
}

ProvisioningOrchestrator::ProvisioningOrchestrator(ExecutionContext& ctx, Confirm confirm)
    : ctx_{ ctx }, confirm_{ confirm ? std::move(confirm) : Confirm{ confirmOnStdin } } {}

void ProvisioningOrchestrator::addPlan(Plan plan) {
  const auto phase = plan.phase;
  plans_[phase] = std::move(plan);
}

const Plan& ProvisioningOrchestrator::plan(Phase phase) const {
  const auto it = plans_.find(phase);
  if (it == plans_.end())
    throw std::logic_error(std::string("[Orchestrator] no plan registered for the ") +
                           toString(phase) + " phase");
  return it->second;
}

Report ProvisioningOrchestrator::run(Phase phase, Mode mode) {
  const Plan& p = plan(phase);
  Report report;
  report.phase = phase;
  report.mode = mode;

  if (mode == Mode::Help) {
    ctx_.log.line(p.usage);
    return report;
  }

  ctx_.log.banner(p.title, "Raspberry Pi Camera Setup");
  switch (mode) {
  case Mode::Apply:
    applyAll(p, report);
    break;
  case Mode::Verify:
    verifyAll(p, report);
    break;
  case Mode::Restore:
    restore(p, report);
    break;
  case Mode::HardwareTest:
    hardwareTest(p, report);
    break;
  default:
    break;
  }

  report.rebootRequired = ctx_.rebootRequired;
  report.hardware = ctx_.hardwareResults;
  ctx_.log.flush();
  return report;
}

//---------------------------------------------------------------------------
// per-step execution
//---------------------------------------------------------------------------
void ProvisioningOrchestrator::applyStep(const ProvisioningStep& step, Report& report) {
  ctx_.log.info(step.title + "...");
  try {
    if (step.kind == StepKind::Mutation && step.satisfied && step.satisfied(ctx_)) {
      report.steps.push_back({ step.id, StepStatus::AlreadyApplied, {} });
      ctx_.log.success(step.title + ": already applied");
      return;
    }

    step.apply(ctx_);

    if (step.verify && !step.verify(ctx_))
      throw std::runtime_error("postcondition not met after apply");

    if (step.kind == StepKind::Check) {
      report.steps.push_back({ step.id, StepStatus::Passed, {} });
      ctx_.log.success(step.title + ": passed");
    } else {
      report.steps.push_back({ step.id, StepStatus::Applied, {} });
      ctx_.log.success(step.title + ": done");
    }
  } catch (const std::exception& e) {
    classify(step, e, report);
  }
}

void ProvisioningOrchestrator::classify(const ProvisioningStep& step, const std::exception& e,
                                        Report& report) {
  const auto* pe = dynamic_cast<const core::ProvisioningError*>(&e);

  if (pe && pe->kind() == core::ErrorKind::HardwareDeferred) {
    report.steps.push_back({ step.id, StepStatus::Deferred, e.what() });
    ctx_.log.info(step.title + " deferred: " + e.what());
    return;
  }

  bool fatal = step.severity == Severity::Fatal;
  if (pe && pe->alwaysFatal())
    fatal = true;
  else if (pe && pe->neverFatal())
    fatal = false;

  if (fatal) {
    report.steps.push_back({ step.id, StepStatus::Failed, e.what() });
    report.aborted = true;
    report.exitCode = 1;
    ctx_.log.error(step.title + " failed: " + e.what());
  } else {
    report.steps.push_back({ step.id, StepStatus::Warning, e.what() });
    ctx_.log.warning(step.title + ": " + e.what());
  }
}

bool ProvisioningOrchestrator::runGates(const Plan& plan, Report& report,
                                        const std::string& onlyId) {
  for (const auto& step : plan.steps) {
    if (!step.gate || (!onlyId.empty() && step.id != onlyId))
      continue;
    applyStep(step, report);
    if (report.aborted)
      return false;
  }
  return true;
}

//---------------------------------------------------------------------------
// modes
//---------------------------------------------------------------------------
void ProvisioningOrchestrator::applyAll(const Plan& plan, Report& report) {
  for (std::size_t i = 0; i < plan.steps.size(); ++i) {
    applyStep(plan.steps[i], report);
    if (!report.aborted)
      continue;

    for (std::size_t j = i + 1; j < plan.steps.size(); ++j)
      report.steps.push_back({ plan.steps[j].id, StepStatus::Skipped, {} });
    ctx_.log.error(std::string("Aborting the ") + toString(plan.phase) +
                   " phase; steps already applied are left in place");
    return;
  }

  report.rebootRequired = ctx_.rebootRequired;
  if (plan.summarize)
    plan.summarize(ctx_, report);
  if (plan.epilogue)
    plan.epilogue(ctx_, report);
}

void ProvisioningOrchestrator::verifyAll(const Plan& plan, Report& report) {
  if (!runGates(plan, report))
    return;

  for (const auto& step : plan.steps) {
    if (step.gate)
      continue;
    const auto& check = step.verify ? step.verify : step.satisfied;
    if (!check) {
      report.steps.push_back({ step.id, StepStatus::Skipped, {} });
      continue;
    }
    try {
      if (check(ctx_)) {
        report.steps.push_back({ step.id, StepStatus::Verified, {} });
        ctx_.log.success(step.title + ": verified");
      } else {
        report.steps.push_back({ step.id, StepStatus::NotSatisfied, {} });
        ctx_.log.warning(step.title + ": not satisfied");
      }
    } catch (const std::exception& e) {
      report.steps.push_back({ step.id, StepStatus::Warning, e.what() });
      ctx_.log.warning(step.title + ": could not verify (" + e.what() + ")");
    }
  }

  if (plan.summarize)
    plan.summarize(ctx_, report);
}

void ProvisioningOrchestrator::restore(const Plan& plan, Report& report) {
  if (!runGates(plan, report, "privilege-context"))
    return;

  auto& writer = ctx_.grants();
  ctx_.log.warning("This will restore " + writer.resourcePath() +
                   " from its backup and remove all custom configurations!");
  if (!confirm_("Are you sure you want to continue? (y/N): ")) {
    report.steps.push_back({ "restore", StepStatus::Skipped, "cancelled" });
    ctx_.log.info("Restore cancelled");
    return;
  }

  try {
    writer.restore();
    report.steps.push_back({ "restore", StepStatus::Applied, {} });
  } catch (const core::ProvisioningError& e) {
    report.steps.push_back({ "restore", StepStatus::Failed, e.what() });
    report.exitCode = 1;
    ctx_.log.error(e.what());
  }
}

void ProvisioningOrchestrator::hardwareTest(const Plan& plan, Report& report) {
  if (!runGates(plan, report))
    return;

  const auto it = std::find_if(plan.steps.begin(), plan.steps.end(),
                               [](const ProvisioningStep& s) { return s.id == kHardwareStep; });
  if (it == plan.steps.end()) {
    report.exitCode = 1;
    ctx_.log.error(std::string("The ") + toString(plan.phase) +
                   " phase has no hardware self-test");
    return;
  }
  applyStep(*it, report);
}
