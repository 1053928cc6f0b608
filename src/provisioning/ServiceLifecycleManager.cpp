/* @file ServiceLifecycleManager.cpp
 * @brief systemd unit rendering, systemctl wrappers and the start/stop smoke test.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <thread>

// fieldkit headers
#include "core/ApplianceConfig.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "io/CommandRunner.hpp"
#include "io/FileOps.hpp"
#include "provisioning/ServiceLifecycleManager.hpp"

using namespace fieldkit::provisioning;

namespace {

  std::string trim(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' '))
      s.pop_back();
    return s;
  }

} // namespace

std::string ServiceUnitSpec::render() const {
  std::ostringstream out;
  out << "[Unit]\n"
      << "Description=" << description << "\n"
      << "After=network.target\n"
      << "Wants=network-online.target\n"
      << "StartLimitIntervalSec=0\n"
      << "StartLimitBurst=" << restart.burst << "\n"
      << "\n"
      << "[Service]\n"
      << "Type=simple\n"
      << "ExecStart=" << command << "\n"
      << "Restart=" << (restart.always ? "always" : "on-failure") << "\n"
      << "RestartSec=" << restart.delay.count() << "\n";
  for (const auto& [key, value] : environment)
    out << "Environment=" << key << "=" << value << "\n";
  if (!workingDirectory.empty())
    out << "WorkingDirectory=" << workingDirectory << "\n";
  out << "KillMode=mixed\n"
      << "KillSignal=SIGTERM\n"
      << "TimeoutStopSec=" << stopTimeout.count() << "\n"
      << "\n"
      << "[Install]\n"
      << "WantedBy=default.target\n";
  return out.str();
}

ServiceUnitSpec ServiceUnitSpec::fromConfig(const core::ApplianceConfig& cfg,
                                            const std::string& home) {
  ServiceUnitSpec spec;
  spec.name = cfg.service.name;
  spec.description = cfg.service.description;
  spec.command = cfg.expand(cfg.service.execStart, home);
  spec.workingDirectory = cfg.expand(cfg.service.workingDirectory, home);
  spec.restart.delay = cfg.service.restartDelay;
  spec.stopTimeout = cfg.service.stopTimeout;
  for (const auto& [key, value] : cfg.service.environment)
    spec.environment.emplace_back(key, cfg.expand(value, home));
  return spec;
}

ServiceLifecycleManager::ServiceLifecycleManager(io::CommandRunner& runner, core::Logger& log,
                                                 UnitScope scope, std::string unitDirectory,
                                                 std::string unitName)
    : runner_{ runner }, log_{ log }, scope_{ scope }, unitDirectory_{ std::move(unitDirectory) },
      name_{ std::move(unitName) } {}

std::string ServiceLifecycleManager::unitPath() const { return unitDirectory_ + "/" + name_; }

bool ServiceLifecycleManager::isDeclared() const { return io::fileExists(unitPath()); }

bool ServiceLifecycleManager::matches(const ServiceUnitSpec& spec) const {
  const auto current = io::readFile(unitPath());
  return current && *current == spec.render();
}

bool ServiceLifecycleManager::declare(const ServiceUnitSpec& spec) {
  if (spec.name != name_)
    throw std::invalid_argument("[ServiceLifecycleManager] spec '" + spec.name +
                                "' does not match managed unit '" + name_ + "'");
  if (matches(spec))
    return false;

  std::filesystem::create_directories(unitDirectory_);
  io::writeFileAtomic(unitPath(), spec.render(), 0644);
  log_.info("Unit descriptor written to " + unitPath());
  return true;
}

std::vector<std::string> ServiceLifecycleManager::systemctl(std::vector<std::string> args) const {
  std::vector<std::string> argv{ "systemctl" };
  if (scope_ == UnitScope::User)
    argv.emplace_back("--user");
  argv.insert(argv.end(), args.begin(), args.end());
  return argv;
}

void ServiceLifecycleManager::reload() { runner_.runChecked(systemctl({ "daemon-reload" })); }

void ServiceLifecycleManager::enableOnBoot() { runner_.runChecked(systemctl({ "enable", name_ })); }

bool ServiceLifecycleManager::isEnabled() {
  const auto result = runner_.run(systemctl({ "is-enabled", name_ }));
  return result.ok() && trim(result.output) == "enabled";
}

void ServiceLifecycleManager::start() { runner_.runChecked(systemctl({ "start", name_ })); }

void ServiceLifecycleManager::stop() { runner_.runChecked(systemctl({ "stop", name_ })); }

void ServiceLifecycleManager::resetFailed() {
  runner_.runChecked(systemctl({ "reset-failed", name_ }));
}

ServiceStatus ServiceLifecycleManager::status() {
  // is-active exits non-zero for anything but "active"; the text is what matters
  const auto state = trim(runner_.run(systemctl({ "is-active", name_ })).output);
  if (state == "active" || state == "reloading")
    return ServiceStatus::Running;
  if (state == "failed" || state == "activating") // activating = stuck in restart loop
    return ServiceStatus::Failed;
  return ServiceStatus::Stopped;
}

std::string ServiceLifecycleManager::recentDiagnostics(int lines) {
  std::vector<std::string> argv{ "journalctl" };
  if (scope_ == UnitScope::User)
    argv.emplace_back("--user");
  argv.insert(argv.end(), { "-u", name_, "--no-pager", "-n", std::to_string(lines) });
  return trim(runner_.run(argv).output);
}

void ServiceLifecycleManager::recover() {
  log_.info("Attempting to fix service issues...");
  const auto reloaded = runner_.run(systemctl({ "daemon-reload" }));
  if (!reloaded.ok())
    log_.warning("daemon-reload failed: " + trim(reloaded.output));
  const auto cleared = runner_.run(systemctl({ "reset-failed", name_ }));
  if (!cleared.ok())
    log_.warning("reset-failed " + name_ + " failed: " + trim(cleared.output));
}

void ServiceLifecycleManager::failSmokeTest(const std::string& why) {
  log_.warning(why + " - checking logs...");
  auto diagnostics = recentDiagnostics();
  if (!diagnostics.empty())
    log_.line(diagnostics);
  recover();
  throw core::ServiceSmokeTestFailure("[ServiceLifecycleManager] " + name_ + ": " + why,
                                      std::move(diagnostics));
}

void ServiceLifecycleManager::smokeTest(std::chrono::milliseconds grace) {
  log_.info("Testing service startup...");
  try {
    start();
  } catch (const core::CommandError& e) {
    failSmokeTest(std::string("service failed to start (") + e.what() + ")");
  }

  std::this_thread::sleep_for(grace);
  const auto observed = status();
  if (observed != ServiceStatus::Running) {
    const auto halted = runner_.run(systemctl({ "stop", name_ }));
    if (!halted.ok())
      log_.warning("stop after failed start returned " + std::to_string(halted.exitCode));
    failSmokeTest(std::string("service is ") + toString(observed) + " after the grace period");
  }
  log_.success("Service started successfully");

  try {
    stop();
  } catch (const core::CommandError& e) {
    failSmokeTest(std::string("service failed to stop (") + e.what() + ")");
  }
  if (status() == ServiceStatus::Running)
    failSmokeTest("service still running after stop");

  log_.success("Service stopped successfully - startup test passed");
}
