/* @file Runtime.cpp
 * @brief Entrypoint wiring: config, logger, real runner / GPIO / privilege scopes.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <exception>

// fieldkit headers
#include "cli/CommandLine.hpp"
#include "cli/Runtime.hpp"
#include "core/ConfigLoader.hpp"
#include "core/Logger.hpp"
#include "io/GpioChip.hpp"
#include "provisioning/ExecutionContext.hpp"
#include "provisioning/HardwareSelfTest.hpp"
#include "provisioning/HardwareTestHarness.hpp"
#include "provisioning/HostProbe.hpp"
#include "provisioning/Plans.hpp"
#include "provisioning/ProvisioningOrchestrator.hpp"
#include "provisioning/ServiceLifecycleManager.hpp"
#include "provisioning/TransactionalConfigWriter.hpp"

namespace fieldkit::cli {

  using namespace fieldkit::provisioning;

  namespace {

    constexpr const char* kGpioTestUsage =
        "Usage: fieldkit-gpio-test\n"
        "\n"
        "Blinks the LED and waits for a button press on the configured pins,\n"
        "then prints a results table. Run after the interfaces were enabled and\n"
        "the Pi was rebooted.";

  } // namespace

  Runtime::Runtime(Entrypoint entry, core::ApplianceConfig config,
                   std::unique_ptr<core::Logger> log)
      : config_{ std::move(config) }, log_{ std::move(log) }, account_{ config_.account } {
    const auto chipPath = config_.hardware.chip;
    auto chips = [chipPath]() -> std::unique_ptr<io::GpioChip> {
      return std::make_unique<io::CharDevGpioChip>(chipPath);
    };

    switch (entry) {
    case Entrypoint::Setup:
      writer_ = std::make_unique<TransactionalConfigWriter>(
          config_.sudoersPath, config_.sudoersBackupPath, config_.grantComment, *log_,
          visudoValidator(runner_));
      service_ = std::make_unique<ServiceLifecycleManager>(runner_, *log_, UnitScope::System,
                                                           config_.service.unitDirectory,
                                                           config_.service.name);
      harness_ = std::make_unique<HardwareTestHarness>(
          chips, current_, account_, *log_, [this] { return interfacesEnabled(config_); },
          config_.hardware.pollInterval);
      break;
    case Entrypoint::Install:
      service_ = std::make_unique<ServiceLifecycleManager>(runner_, *log_, UnitScope::User,
                                                           config_.service.unitDirectory,
                                                           config_.service.name);
      break;
    case Entrypoint::GpioTest:
      harness_ = std::make_unique<HardwareTestHarness>(chips, current_, account_, *log_,
                                                       HardwareTestHarness::InterfaceGate{},
                                                       config_.hardware.pollInterval);
      break;
    }

    ctx_ = std::make_unique<ExecutionContext>(ExecutionContext::fromProcess(config_, runner_, *log_));
    ctx_->grantWriter = writer_.get();
    ctx_->serviceManager = service_.get();
    ctx_->harness = harness_.get();

    orchestrator_ = std::make_unique<ProvisioningOrchestrator>(*ctx_);
    if (entry == Entrypoint::Setup)
      orchestrator_->addPlan(elevatedPlan(config_));
    else if (entry == Entrypoint::Install)
      orchestrator_->addPlan(unprivilegedPlan());
  }

  Runtime::~Runtime() = default;

  int run(Entrypoint entry, int argc, char** argv) {
    const auto args = toArgs(argc, argv);
    const auto invocation = entry == Entrypoint::Setup ? parseSetupArgs(args) : parsePlainArgs(args);

    core::ApplianceConfig config;
    std::unique_ptr<core::Logger> log;
    try {
      config = core::ConfigLoader::resolve();
      log = core::Logger::console(config.auditLog);
    } catch (const std::exception& e) {
      core::Logger::console()->error(e.what());
      return 1;
    }

    try {
      Runtime runtime{ entry, std::move(config), std::move(log) };
      if (!invocation.error.empty())
        runtime.log().error(invocation.error);

      if (entry == Entrypoint::GpioTest) {
        if (invocation.mode == Mode::Help) {
          runtime.log().line(kGpioTestUsage);
          return invocation.error.empty() ? 0 : 1;
        }
        return HardwareSelfTest{ runtime.context() }.run();
      }

      const auto phase = entry == Entrypoint::Setup ? Phase::Elevated : Phase::Unprivileged;
      const auto report = runtime.orchestrator().run(phase, invocation.mode);
      return invocation.error.empty() ? report.exitCode : 1;
    } catch (const std::exception& e) {
      core::Logger::console()->error(e.what());
      return 1;
    }
  }

} // namespace fieldkit::cli
