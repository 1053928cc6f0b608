#pragma once
/** @file  HardwareSelfTest.hpp
 *  @brief Standalone, narrated LED + button check (no orchestrator).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <vector>

#include "provisioning/HardwareTestResult.hpp"

namespace fieldkit {
  namespace provisioning {

    struct ExecutionContext;

    /**
 * @class HardwareSelfTest
 * @brief Host check, interface / permission report, both tests, results table.
 *
 *  * Uses the context's harness; the entrypoint builds it without an
 *    interface gate, so the tests always run.
 *  * `run()` returns 0 after a completed run, 1 only if the host check fails.
 */
    class HardwareSelfTest {
    public:
      explicit HardwareSelfTest(ExecutionContext& ctx) : ctx_{ ctx } {}

      int run();

      const std::vector<HardwareTestResult>& results() const noexcept { return results_; }

    private:
      void reportInterfaces();
      void reportPermissions();
      void printResults();

      ExecutionContext& ctx_;
      std::vector<HardwareTestResult> results_;
    };

  } // namespace provisioning
} // namespace fieldkit
