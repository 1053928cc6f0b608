#pragma once
/** @file  Runtime.hpp
 *  @brief Owns and wires the collaborators of one entrypoint invocation.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdint>
#include <memory>

#include "core/ApplianceConfig.hpp"
#include "io/CommandRunner.hpp"
#include "provisioning/PrivilegeScope.hpp"

namespace fieldkit {
  namespace core {
    class Logger;
  } // namespace core

  namespace provisioning {
    struct ExecutionContext;
    class TransactionalConfigWriter;
    class ServiceLifecycleManager;
    class HardwareTestHarness;
    class ProvisioningOrchestrator;
  } // namespace provisioning

  namespace cli {

    enum class Entrypoint : std::uint8_t { Setup, Install, GpioTest };

    /**
 * @class Runtime
 * @brief Construction order = dependency order; destruction releases in reverse.
 *
 *  * Setup:    grant writer (visudo-validated), system-scope unit manager, gated harness.
 *  * Install:  user-scope unit manager only.
 *  * GpioTest: ungated harness only.
 */
    class Runtime {
    public:
      Runtime(Entrypoint entry, core::ApplianceConfig config, std::unique_ptr<core::Logger> log);
      ~Runtime();

      provisioning::ExecutionContext& context() { return *ctx_; }
      provisioning::ProvisioningOrchestrator& orchestrator() { return *orchestrator_; }
      core::Logger& log() { return *log_; }

      Runtime(const Runtime&) = delete;
      Runtime& operator=(const Runtime&) = delete;

    private:
      core::ApplianceConfig config_;
      std::unique_ptr<core::Logger> log_;
      io::PosixCommandRunner runner_;
      provisioning::CurrentPrivilege current_;
      provisioning::AccountPrivilege account_;

      std::unique_ptr<provisioning::TransactionalConfigWriter> writer_;
      std::unique_ptr<provisioning::ServiceLifecycleManager> service_;
      std::unique_ptr<provisioning::HardwareTestHarness> harness_;
      std::unique_ptr<provisioning::ExecutionContext> ctx_;
      std::unique_ptr<provisioning::ProvisioningOrchestrator> orchestrator_;
    };

    /// Full entrypoint: parse flags, resolve config, run, map to an exit code.
    int run(Entrypoint entry, int argc, char** argv);

  } // namespace cli
} // namespace fieldkit
