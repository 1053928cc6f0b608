#pragma once
/** @file  ProvisioningOrchestrator.hpp
 *  @brief Runs a phase's ordered plan in one of the five modes and reports.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <map>
#include <string>
#include <vector>

// fieldkit headers
#include "provisioning/HardwareTestResult.hpp"
#include "provisioning/ProvisioningStep.hpp"
#include "provisioning/Types.hpp"

namespace fieldkit {
  namespace provisioning {

    enum class StepStatus : std::uint8_t {
      AlreadyApplied, ///< precondition held, nothing done
      Applied,        ///< mutation performed and verified
      Passed,         ///< check step succeeded
      Verified,       ///< verify mode: postcondition holds
      NotSatisfied,   ///< verify mode: postcondition does not hold
      Warning,        ///< soft failure, plan continued
      Deferred,       ///< hardware not ready yet (reboot pending)
      Failed,         ///< fatal failure, plan aborted here
      Skipped         ///< not evaluated in this mode
    };

    const char* toString(StepStatus s);

    struct StepRecord {
      std::string id;
      StepStatus status{ StepStatus::Skipped };
      std::string detail;
    };

    struct Report {
      Phase phase{ Phase::Elevated };
      Mode mode{ Mode::Apply };
      std::vector<StepRecord> steps;
      bool aborted{ false };
      int exitCode{ 0 };

      // --- summary ---
      std::vector<std::string> capabilities; ///< grant lines present in the resource
      std::vector<std::string> groups;       ///< current groups of the account
      std::string backupLocation;            ///< empty = no backup
      std::vector<HardwareTestResult> hardware;
      bool rebootRequired{ false };

      /// Steps that changed system state in this run.
      std::size_t mutations() const;
      const StepRecord* find(const std::string& id) const;
    };

    /// Fixed, ordered step list for one phase plus its reporting hooks.
    struct Plan {
      Phase phase{ Phase::Elevated };
      std::string title;
      std::vector<ProvisioningStep> steps;
      std::function<void(ExecutionContext&, Report&)> summarize; ///< apply + verify, optional
      std::function<void(ExecutionContext&, const Report&)> epilogue; ///< apply only, optional
      std::string usage;
    };

    /**
 * @class ProvisioningOrchestrator
 * @brief Sequential, single-threaded executor with error classification.
 *
 *  * apply: gates, then each step: satisfied? -> apply -> verify.
 *  * verify: gates, then read-only evaluation; never mutates, never aborts.
 *  * restore: privilege gate, confirmation, TransactionalConfigWriter::restore().
 *  * hardware-test: gates, then the harness on its own.
 *  * help: prints the plan's usage text.
 *  * A fatal failure stops the phase; nothing already applied is undone.
 */
    class ProvisioningOrchestrator {
    public:
      using Confirm = std::function<bool(const std::string& question)>;

      ProvisioningOrchestrator(ExecutionContext& ctx, Confirm confirm = {});

      void addPlan(Plan plan);
      const Plan& plan(Phase phase) const;

      Report run(Phase phase, Mode mode);

    private:
      void applyAll(const Plan& plan, Report& report);
      void verifyAll(const Plan& plan, Report& report);
      void restore(const Plan& plan, Report& report);
      void hardwareTest(const Plan& plan, Report& report);

      /// Runs the gate steps (all, or only \p onlyId); false = a gate failed.
      bool runGates(const Plan& plan, Report& report, const std::string& onlyId = {});
      void applyStep(const ProvisioningStep& step, Report& report);
      void classify(const ProvisioningStep& step, const std::exception& e, Report& report);

      ExecutionContext& ctx_;
      Confirm confirm_;
      std::map<Phase, Plan> plans_;
    };

    /// Reads one line from stdin; y/Y confirms.
    bool confirmOnStdin(const std::string& question);

  } // namespace provisioning
} // namespace fieldkit
