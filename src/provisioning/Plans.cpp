/* @file Plans.cpp
 * @brief Step definitions of the elevated and unprivileged plans.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <filesystem>
#include <optional>
#include <sstream>

// fieldkit headers
#include "core/ApplianceConfig.hpp"
#include "core/Errors.hpp"
#include "core/LineSet.hpp"
#include "core/Logger.hpp"
#include "io/CommandRunner.hpp"
#include "io/FileOps.hpp"
#include "provisioning/ExecutionContext.hpp"
#include "provisioning/HardwareTestHarness.hpp"
#include "provisioning/HostProbe.hpp"
#include "provisioning/Plans.hpp"
#include "provisioning/ServiceLifecycleManager.hpp"
#include "provisioning/TransactionalConfigWriter.hpp"

namespace fs = std::filesystem;

namespace fieldkit {
  namespace provisioning {

    namespace {

      using core::TransientStepWarning;
      using Strings = std::vector<std::string>;

      constexpr const char* kSetupCommand = "sudo fieldkit-setup";
      constexpr const char* kInstallCommand = "fieldkit-install";
      constexpr const char* kGpioTestCommand = "fieldkit-gpio-test";

      std::string join(const Strings& items, const char* sep = ", ") {
        std::string out;
        for (const auto& item : items) {
          if (!out.empty())
            out += sep;
          out += item;
        }
        return out;
      }

      bool contains(const Strings& items, const std::string& wanted) {
        return std::find(items.begin(), items.end(), wanted) != items.end();
      }

      std::string trim(std::string s) {
        while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' '))
          s.pop_back();
        return s;
      }

      ProvisioningStep step(std::string id, std::string title, Phase phase, Severity severity,
                            StepKind kind) {
        ProvisioningStep s;
        s.id = std::move(id);
        s.title = std::move(title);
        s.phase = phase;
        s.severity = severity;
        s.kind = kind;
        return s;
      }

      //---account helpers-----------------------------------------------------
      void chownToAccount(ExecutionContext& ctx, const std::string& path, bool recursive) {
        const auto& account = ctx.config.account;
        Strings argv{ "chown" };
        if (recursive)
          argv.emplace_back("-R");
        argv.push_back(account + ":" + account);
        argv.push_back(path);
        ctx.runner.runChecked(argv);
      }

      /// `sudo -u <account>` prefix when root is acting on the account's behalf.
      Strings asAccount(const ExecutionContext& ctx, Strings argv) {
        if (!ctx.isRoot() || ctx.userName == ctx.config.account)
          return argv;
        Strings wrapped{ "sudo", "-u", ctx.config.account };
        wrapped.insert(wrapped.end(), argv.begin(), argv.end());
        return wrapped;
      }

      std::string venvPython(const ExecutionContext& ctx) {
        return ctx.homePath(ctx.config.venvDirectory) + "/bin/python3";
      }

      //---staged project files------------------------------------------------
      struct Staged {
        fs::path source;
        fs::path target;
        bool directory;
      };

      std::vector<Staged> stagedEntries(const ExecutionContext& ctx) {
        std::vector<Staged> out;
        for (const auto& dir : ctx.config.stagedDirectories) {
          const fs::path src = ctx.workPath(dir);
          out.push_back({ src, fs::path(ctx.homePath(src.filename().string())), true });
        }
        for (const auto& file : ctx.config.stagedFiles) {
          const fs::path src = ctx.workPath(file);
          out.push_back({ src, fs::path(ctx.homePath(src.filename().string())), false });
        }
        return out;
      }

      bool sourcePresent(const Staged& e) {
        std::error_code ec;
        return e.directory ? fs::is_directory(e.source, ec) : fs::is_regular_file(e.source, ec);
      }

      bool upToDate(const Staged& e) {
        if (!e.directory)
          return io::sameContent(e.source.string(), e.target.string());

        std::error_code ec;
        if (!fs::is_directory(e.target, ec))
          return false;
        for (auto it = fs::recursive_directory_iterator(e.source);
             it != fs::recursive_directory_iterator(); ++it) {
          if (!it->is_regular_file())
            continue;
          const auto rel = fs::relative(it->path(), e.source);
          if (!io::sameContent(it->path().string(), (e.target / rel).string()))
            return false;
        }
        return true;
      }

      bool samePlace(const Staged& e) {
        std::error_code ec;
        return fs::exists(e.target, ec) && fs::equivalent(e.source, e.target, ec);
      }

      //---interfaces------------------------------------------------------------
      Strings missingInterfaces(const ExecutionContext& ctx) {
        const auto boot = readBootConfig(ctx.config);
        Strings missing;
        for (const auto& iface : ctx.config.interfaces) {
          if (!boot || !hasMarker(*boot, iface.marker))
            missing.push_back(iface.label);
        }
        return missing;
      }

      //---software probe (shared by both plans)---------------------------------
      Strings softwareProblems(ExecutionContext& ctx, bool narrate) {
        Strings problems;
        auto report = [&](bool ok, const std::string& good, const std::string& bad) {
          if (ok) {
            if (narrate)
              ctx.log.success(good);
          } else {
            if (narrate)
              ctx.log.warning(bad);
            problems.push_back(bad);
          }
        };

        report(ctx.runner.hasProgram(ctx.config.cameraTool), "Camera tools available",
               "Camera tools not available");

        const auto python = venvPython(ctx);
        const bool venv = io::fileExists(python);
        report(venv, "Python virtual environment exists", "Python virtual environment not found");

        const auto probe = ctx.runner.run(
            asAccount(ctx, { venv ? python : std::string{ "python3" }, "-c", "import RPi.GPIO" }));
        report(probe.ok(), "GPIO library accessible", "GPIO library not accessible");
        return problems;
      }

      ProvisioningStep softwareCheck(std::string id, std::string title, Phase phase) {
        auto s = step(std::move(id), std::move(title), phase, Severity::Soft, StepKind::Check);
        s.apply = [](ExecutionContext& ctx) {
          const auto problems = softwareProblems(ctx, true);
          if (!problems.empty())
            throw TransientStepWarning(join(problems) + "; re-run " + kSetupCommand);
        };
        s.verify = [](ExecutionContext& ctx) { return softwareProblems(ctx, false).empty(); };
        return s;
      }

      //---shared gates----------------------------------------------------------
      ProvisioningStep hostClass(Phase phase) {
        auto s = step("host-class", "Checking host class", phase, Severity::Fatal, StepKind::Check);
        s.gate = true;
        s.apply = [](ExecutionContext& ctx) { requireHostClass(ctx); };
        return s;
      }

      ProvisioningStep applicationScript(Phase phase, bool chownToOwner) {
        auto s = step("application-script", "Setting up camera script", phase, Severity::Soft,
                      StepKind::Mutation);
        s.satisfied = [](ExecutionContext& ctx) {
          const auto src = ctx.homePath(ctx.config.appScriptSource);
          const auto dst = ctx.homePath(ctx.config.appScript);
          if (!io::fileExists(dst))
            return false;
          const auto perms = fs::status(dst).permissions();
          const bool executable = (perms & fs::perms::owner_exec) != fs::perms::none;
          return executable && (!io::fileExists(src) || io::sameContent(src, dst));
        };
        s.apply = [chownToOwner](ExecutionContext& ctx) {
          const auto src = ctx.homePath(ctx.config.appScriptSource);
          const auto dst = ctx.homePath(ctx.config.appScript);
          if (!io::fileExists(src))
            throw TransientStepWarning("Camera script not found at " + src);
          fs::copy_file(src, dst, fs::copy_options::overwrite_existing);
          fs::permissions(dst,
                          fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec,
                          fs::perm_options::add);
          if (chownToOwner)
            chownToAccount(ctx, dst, false);
          ctx.log.success("Camera script copied and made executable");
        };
        return s;
      }

      //=========================================================================
      // elevated steps
      //=========================================================================
      ProvisioningStep rootContext() {
        auto s = step("privilege-context", "Checking privilege context", Phase::Elevated,
                      Severity::Fatal, StepKind::Check);
        s.gate = true;
        s.apply = [](ExecutionContext& ctx) {
          if (!ctx.isRoot())
            throw core::PreconditionError("This must be run as root (use " +
                                          std::string(kSetupCommand) + ")");
          ctx.log.success("Running as root");
        };
        return s;
      }

      ProvisioningStep applicationAccount() {
        auto s = step("application-account", "Ensuring application account", Phase::Elevated,
                      Severity::Fatal, StepKind::Mutation);
        s.satisfied = [](ExecutionContext& ctx) {
          return ctx.runner.run({ "id", "-u", ctx.config.account }).ok();
        };
        s.apply = [](ExecutionContext& ctx) {
          ctx.runner.runChecked({ "useradd", "-m", "-s", "/bin/bash", ctx.config.account });
          ctx.log.success("Created user " + ctx.config.account);
        };
        s.verify = s.satisfied;
        return s;
      }

      Strings missingPackages(ExecutionContext& ctx) {
        Strings missing;
        for (const auto& pkg : ctx.config.packages) {
          if (!packageInstalled(ctx.runner, pkg))
            missing.push_back(pkg);
        }
        return missing;
      }

      ProvisioningStep systemPackages() {
        auto s = step("system-packages", "Installing required packages", Phase::Elevated,
                      Severity::Fatal, StepKind::Mutation);
        s.satisfied = [](ExecutionContext& ctx) { return missingPackages(ctx).empty(); };
        s.apply = [](ExecutionContext& ctx) {
          const auto missing = missingPackages(ctx);
          ctx.runner.runChecked({ "apt-get", "update" });
          if (ctx.config.upgradeSystem) {
            ctx.log.info("Updating system packages...");
            ctx.runner.runChecked({ "apt-get", "upgrade", "-y" });
          }
          Strings argv{ "apt-get", "install", "-y" };
          argv.insert(argv.end(), missing.begin(), missing.end());
          ctx.runner.runChecked(argv);
          ctx.log.success("Required packages installed: " + join(missing, " "));
        };
        s.verify = s.satisfied;
        return s;
      }

      ProvisioningStep externalRepository(const core::ExternalRepository& repo) {
        auto s = step("external-repository:" + repo.name, "Installing " + repo.name,
                      Phase::Elevated, Severity::Soft, StepKind::Mutation);
        s.satisfied = [package = repo.package](ExecutionContext& ctx) {
          return packageInstalled(ctx.runner, package);
        };
        s.apply = [repo](ExecutionContext& ctx) {
          if (!ctx.runner.hasProgram("curl"))
            throw TransientStepWarning("curl not available; " + repo.name + " not installed");
          ctx.runner.runChecked({ "curl", "-fsSL", "-o", repo.keyringPath, repo.keyringUrl });
          ctx.runner.runChecked({ "curl", "-fsSL", "-o", repo.sourceListPath, repo.sourceListUrl });
          ctx.runner.runChecked({ "apt-get", "update" });
          ctx.runner.runChecked({ "apt-get", "install", "-y", repo.package });
          ctx.log.success(repo.name + " installed");
        };
        s.verify = s.satisfied;
        return s;
      }

      ProvisioningStep projectFiles() {
        auto s = step("project-files", "Copying project files to the account home",
                      Phase::Elevated, Severity::Soft, StepKind::Mutation);
        s.satisfied = [](ExecutionContext& ctx) {
          const auto entries = stagedEntries(ctx);
          return std::all_of(entries.begin(), entries.end(), [](const Staged& e) {
            return sourcePresent(e) && (samePlace(e) || upToDate(e));
          });
        };
        s.apply = [](ExecutionContext& ctx) {
          Strings absent;
          for (const auto& e : stagedEntries(ctx)) {
            if (!sourcePresent(e)) {
              absent.push_back(e.source.filename().string());
              continue;
            }
            if (samePlace(e) || upToDate(e))
              continue;
            if (e.directory)
              fs::copy(e.source, e.target,
                       fs::copy_options::recursive | fs::copy_options::overwrite_existing);
            else
              fs::copy_file(e.source, e.target, fs::copy_options::overwrite_existing);
            chownToAccount(ctx, e.target.string(), e.directory);
            ctx.log.success(e.source.filename().string() + " copied to " +
                            ctx.config.account + " home directory");
          }
          if (!absent.empty())
            throw TransientStepWarning("not found in " + ctx.workingDirectory + ": " +
                                       join(absent));
        };
        return s;
      }

      ProvisioningStep hardwareInterfaces() {
        auto s = step("hardware-interfaces", "Enabling camera and GPIO interfaces",
                      Phase::Elevated, Severity::Soft, StepKind::Mutation);
        s.satisfied = [](ExecutionContext& ctx) { return missingInterfaces(ctx).empty(); };
        s.apply = [](ExecutionContext& ctx) {
          if (!ctx.runner.hasProgram("raspi-config"))
            throw TransientStepWarning("raspi-config not available; interfaces left unchanged");
          const auto missing = missingInterfaces(ctx);
          for (const auto& iface : ctx.config.interfaces) {
            if (!contains(missing, iface.label))
              continue;
            ctx.runner.runChecked({ "raspi-config", "nonint", iface.raspiFunction, "0" });
            ctx.log.success(iface.label + " interface enabled");
          }
          ctx.rebootRequired = true;
          ctx.log.warning("A reboot will be required for these changes to take effect");
        };
        return s;
      }

      ProvisioningStep serviceUnit() {
        auto s = step("service-unit", "Setting up systemd service", Phase::Elevated,
                      Severity::Fatal, StepKind::Mutation);
        s.satisfied = [](ExecutionContext& ctx) {
          return ctx.service().matches(ServiceUnitSpec::fromConfig(ctx.config, ctx.homeDirectory));
        };
        s.apply = [](ExecutionContext& ctx) {
          auto& service = ctx.service();
          service.declare(ServiceUnitSpec::fromConfig(ctx.config, ctx.homeDirectory));
          service.reload();
          ctx.log.success("Systemd service configured");
        };
        s.verify = s.satisfied;
        return s;
      }

      ProvisioningStep userLinger() {
        auto s = step("user-linger", "Enabling user lingering", Phase::Elevated, Severity::Soft,
                      StepKind::Mutation);
        s.satisfied = [](ExecutionContext& ctx) {
          const auto result = ctx.runner.run(
              { "loginctl", "show-user", ctx.config.account, "--property=Linger", "--value" });
          return result.ok() && trim(result.output) == "yes";
        };
        s.apply = [](ExecutionContext& ctx) {
          ctx.runner.runChecked({ "loginctl", "enable-linger", ctx.config.account });
          ctx.log.success("Lingering enabled for " + ctx.config.account);
        };
        return s;
      }

      ProvisioningStep dataDirectory() {
        auto s = step("data-directory", "Creating assets directory for recordings",
                      Phase::Elevated, Severity::Soft, StepKind::Mutation);
        s.satisfied = [](ExecutionContext& ctx) {
          return fs::is_directory(ctx.homePath(ctx.config.dataDirectory));
        };
        s.apply = [](ExecutionContext& ctx) {
          const auto dir = ctx.homePath(ctx.config.dataDirectory);
          fs::create_directories(dir);
          chownToAccount(ctx, dir, false);
          ctx.log.success("Assets directory created");
        };
        s.verify = s.satisfied;
        return s;
      }

      ProvisioningStep pythonEnvironment() {
        auto s = step("python-environment", "Setting up Python virtual environment",
                      Phase::Elevated, Severity::Soft, StepKind::Mutation);
        s.satisfied = [](ExecutionContext& ctx) { return io::fileExists(venvPython(ctx)); };
        s.apply = [](ExecutionContext& ctx) {
          const auto venv = ctx.homePath(ctx.config.venvDirectory);
          const auto pip = venv + "/bin/pip";
          ctx.runner.runChecked(asAccount(ctx, { "python3", "-m", "venv", venv }));
          ctx.runner.runChecked(asAccount(ctx, { pip, "install", "--upgrade", "pip" }));

          const auto requirements = ctx.homePath(ctx.config.requirementsFile);
          if (io::fileExists(requirements)) {
            ctx.log.info("Installing Python requirements...");
            ctx.runner.runChecked(asAccount(ctx, { pip, "install", "-r", requirements }));
          } else {
            ctx.log.info("Installing basic Python packages...");
            Strings argv{ pip, "install" };
            argv.insert(argv.end(), ctx.config.fallbackPythonPackages.begin(),
                        ctx.config.fallbackPythonPackages.end());
            ctx.runner.runChecked(asAccount(ctx, argv));
          }
          ctx.log.success("Python environment set up");
        };
        s.verify = s.satisfied;
        return s;
      }

      ProvisioningStep privilegeGrants() {
        auto s = step("privilege-grants", "Configuring sudo access for GPIO and camera operations",
                      Phase::Elevated, Severity::Fatal, StepKind::Mutation);
        s.satisfied = [](ExecutionContext& ctx) {
          return ctx.grants().missing(ctx.config.grantLines()).empty();
        };
        s.apply = [](ExecutionContext& ctx) {
          ctx.grants().grant(ctx.config.grantLines());
          ctx.log.success("Sudo access configured successfully");
        };
        s.verify = s.satisfied;
        return s;
      }

      ProvisioningStep groupMembership(const core::GroupGrant& grant) {
        auto s = step("group:" + grant.group, "Adding " + grant.account + " to " + grant.group,
                      Phase::Elevated, Severity::Fatal, StepKind::Mutation);
        s.satisfied = [grant](ExecutionContext& ctx) {
          return contains(groupsOf(ctx.runner, grant.account), grant.group);
        };
        s.apply = [grant](ExecutionContext& ctx) {
          ctx.runner.runChecked({ "usermod", "-a", "-G", grant.group, grant.account });
          ctx.log.success("Added " + grant.account + " user to " + grant.group + " group");
        };
        s.verify = s.satisfied;
        return s;
      }

      Strings unlistedGrants(ExecutionContext& ctx, bool narrate) {
        const auto listing =
            ctx.runner.run({ "sudo", "-n", "-l", "-U", ctx.config.account });
        Strings unlisted;
        for (const auto& command : ctx.config.grantedCommands()) {
          const bool listed = listing.ok() && listing.output.find(command) != std::string::npos;
          if (!listed)
            unlisted.push_back(command);
          if (!narrate)
            continue;
          if (listed)
            ctx.log.success("Sudo access to " + command + " verified");
          else
            ctx.log.warning("Sudo access to " + command + " may not be working correctly");
        }
        return unlisted;
      }

      ProvisioningStep grantVerification() {
        auto s = step("grant-verification", "Verifying sudo configuration", Phase::Elevated,
                      Severity::Soft, StepKind::Check);
        s.apply = [](ExecutionContext& ctx) {
          const auto unlisted = unlistedGrants(ctx, true);
          if (!unlisted.empty())
            throw TransientStepWarning("not granted: " + join(unlisted));
        };
        s.verify = [](ExecutionContext& ctx) { return unlistedGrants(ctx, false).empty(); };
        return s;
      }

      ProvisioningStep hardwareSelfTest() {
        auto s = step("hardware-self-test", "Testing GPIO functionality for LED and Button",
                      Phase::Elevated, Severity::Soft, StepKind::Check);
        s.apply = [](ExecutionContext& ctx) {
          const auto& hw = ctx.config.hardware;
          auto& harness = ctx.hardware();
          const auto led = harness.testActuator(hw.ledPin, hw.blinkCycles, hw.blinkOn);
          ctx.hardwareResults.push_back(led);
          const auto button = harness.testSensor(hw.buttonPin, hw.sensorTimeout);
          ctx.hardwareResults.push_back(button);
          ctx.log.info("GPIO testing completed");

          if (led.verdict == Verdict::Deferred || button.verdict == Verdict::Deferred)
            throw core::HardwareDeferred("interfaces become active after the next reboot");
          if (led.verdict == Verdict::Fail || button.verdict == Verdict::Fail) {
            ctx.log.warning("If tests failed, ensure:");
            ctx.log.warning("  1. Hardware is properly connected to GPIO " +
                            std::to_string(hw.ledPin) + " (LED) and GPIO " +
                            std::to_string(hw.buttonPin) + " (Button)");
            ctx.log.warning("  2. System has been rebooted after enabling GPIO interfaces");
            ctx.log.warning("  3. User has proper GPIO permissions");
            throw core::HardwareFault(led.verdict == Verdict::Fail ? led.remediation
                                                                   : button.remediation);
          }
        };
        return s;
      }

      void summarizeGrants(ExecutionContext& ctx, Report& report) {
        const auto& account = ctx.config.account;
        auto& writer = ctx.grants();

        ctx.log.info("Current sudo configuration for " + account + " user:");
        ctx.log.rule();
        try {
          report.capabilities = writer.present(ctx.config.grantLines());
        } catch (const core::TransactionError& e) {
          ctx.log.warning(e.what());
        }
        if (report.capabilities.empty())
          ctx.log.line("No NOPASSWD entries found for " + account + " user");
        for (const auto& line : report.capabilities)
          ctx.log.line(line);

        ctx.log.info("Current group membership for " + account + " user:");
        ctx.log.rule();
        report.groups = groupsOf(ctx.runner, account);
        ctx.log.line(account + " : " + join(report.groups, " "));

        ctx.log.info("Sudoers backup location:");
        ctx.log.rule();
        report.backupLocation = writer.hasBackup() ? writer.backupPath() : std::string{};
        ctx.log.line(report.backupLocation.empty() ? std::string{ "No backup found" }
                                                   : report.backupLocation);
      }

      void elevatedEpilogue(ExecutionContext& ctx, const Report& report) {
        const auto& account = ctx.config.account;
        ctx.log.banner("SYSTEM SETUP COMPLETE");
        ctx.log.line("What was configured:");
        ctx.log.line("  - System packages installed");
        for (const auto& repo : ctx.config.repositories)
          ctx.log.line("  - " + repo.name + " installed via curl");
        ctx.log.line("  - Project files copied to " + account + " home directory");
        ctx.log.line("  - Python virtual environment set up");
        ctx.log.line("  - Camera and GPIO interfaces enabled");
        ctx.log.line("  - Camera script and systemd service configured");
        ctx.log.line("  - Passwordless sudo access: " + join(ctx.config.grantedCommands()));
        ctx.log.line("  - User added to groups: " + join(ctx.config.groups));
        if (!report.backupLocation.empty())
          ctx.log.line("  - Sudoers backup at " + report.backupLocation);
        ctx.log.line("");
        if (report.rebootRequired)
          ctx.log.warning("A reboot is required before the interfaces become active");
        ctx.log.line("Next steps:");
        ctx.log.line(std::string("1. Run user configuration as ") + account + ": " +
                     kInstallCommand);
        ctx.log.line("2. Reboot the Raspberry Pi: sudo reboot");
        ctx.log.line("3. After reboot, test the camera: " + ctx.config.cameraTool +
                     " -o test.jpg");
        ctx.log.line(std::string("4. Test GPIO access: ") + kGpioTestCommand);
        ctx.log.line("5. Start the camera service: systemctl --user start " +
                     ctx.config.service.name);
        ctx.log.line("");
        ctx.log.line("To verify configuration later:");
        ctx.log.line(std::string("  ") + kSetupCommand + " --verify");
        ctx.log.line("To restore original sudoers:");
        ctx.log.line(std::string("  ") + kSetupCommand + " --restore");
        ctx.log.rule();
      }

      //=========================================================================
      // unprivileged steps
      //=========================================================================
      ProvisioningStep accountContext() {
        auto s = step("privilege-context", "Checking privilege context", Phase::Unprivileged,
                      Severity::Fatal, StepKind::Check);
        s.gate = true;
        s.apply = [](ExecutionContext& ctx) {
          if (ctx.isRoot())
            throw core::PreconditionError("This should not be run as root. Please run as " +
                                          ctx.config.account + " user.");
          ctx.log.success("Running as " + ctx.userName + " user");
        };
        return s;
      }

      ProvisioningStep elevatedPhaseMarker() {
        auto s = step("elevated-phase-marker", "Checking system setup", Phase::Unprivileged,
                      Severity::Fatal, StepKind::Check);
        s.apply = [](ExecutionContext& ctx) {
          auto& service = ctx.service();
          if (!service.isDeclared()) {
            ctx.log.error("System setup has not been completed yet!");
            ctx.log.info("Please run the system setup first:");
            ctx.log.line(std::string("  ") + kSetupCommand);
            throw core::PreconditionError(service.unitPath() + " not found");
          }
          ctx.log.success("System setup completed - proceeding with user configuration");
        };
        s.verify = [](ExecutionContext& ctx) { return ctx.service().isDeclared(); };
        return s;
      }

      ProvisioningStep interfaceStatus() {
        auto s = step("interface-status", "Checking interface configuration",
                      Phase::Unprivileged, Severity::Soft, StepKind::Check);
        s.apply = [](ExecutionContext& ctx) {
          const auto missing = missingInterfaces(ctx);
          for (const auto& iface : ctx.config.interfaces) {
            if (contains(missing, iface.label))
              ctx.log.warning(iface.label + " interface not enabled");
            else
              ctx.log.success(iface.label + " interface enabled");
          }
          if (!missing.empty())
            throw TransientStepWarning("not enabled: " + join(missing) + "; run " +
                                       kSetupCommand + " and reboot");
        };
        s.verify = [](ExecutionContext& ctx) { return missingInterfaces(ctx).empty(); };
        return s;
      }

      ProvisioningStep userService() {
        auto s = step("user-service", "Enabling the user service", Phase::Unprivileged,
                      Severity::Fatal, StepKind::Mutation);
        s.satisfied = [](ExecutionContext& ctx) { return ctx.service().isEnabled(); };
        s.apply = [](ExecutionContext& ctx) {
          auto& service = ctx.service();
          fs::create_directories(ctx.homePath(".config/systemd/user"));
          service.reload();
          service.enableOnBoot();
          ctx.log.success("Systemd service enabled for user");
          ctx.log.info("Service will start automatically on boot and restart if it crashes");
        };
        s.verify = s.satisfied;
        return s;
      }

      ProvisioningStep serviceSmokeTest() {
        auto s = step("service-smoke-test", "Verifying service startup", Phase::Unprivileged,
                      Severity::Soft, StepKind::Check);
        s.apply = [](ExecutionContext& ctx) { ctx.service().smokeTest(ctx.config.service.smokeGrace); };
        s.verify = [](ExecutionContext& ctx) {
          return ctx.service().status() != ServiceStatus::Failed;
        };
        return s;
      }

      Strings missingGroups(ExecutionContext& ctx) {
        const auto current = groupsOf(ctx.runner);
        Strings missing;
        for (const auto& group : ctx.config.groups) {
          if (!contains(current, group))
            missing.push_back(group);
        }
        return missing;
      }

      ProvisioningStep groupCheck() {
        auto s = step("group-membership", "Checking user permissions for GPIO and camera access",
                      Phase::Unprivileged, Severity::Soft, StepKind::Check);
        s.apply = [](ExecutionContext& ctx) {
          const auto missing = missingGroups(ctx);
          for (const auto& group : ctx.config.groups) {
            if (contains(missing, group))
              ctx.log.warning("User not in " + group + " group");
            else
              ctx.log.success("User already in " + group + " group");
          }
          ctx.log.warning("You may need to log out and back in for group changes to take effect");
          if (!missing.empty())
            throw TransientStepWarning("not a member of " + join(missing) + "; run " +
                                       kSetupCommand);
        };
        s.verify = [](ExecutionContext& ctx) { return missingGroups(ctx).empty(); };
        return s;
      }

      std::optional<std::string> collaboratorFingerprint(ExecutionContext& ctx) {
        const auto listing = ctx.runner.run({ "gpg", "--batch", "--with-colons", "--fingerprint",
                                              ctx.config.collaboratorIdentity });
        if (!listing.ok())
          return std::nullopt;
        std::istringstream lines(listing.output);
        for (std::string line; std::getline(lines, line);) {
          if (line.rfind("fpr:", 0) != 0)
            continue;
          // fpr:::::::::<FINGERPRINT>:
          std::size_t field = 0, start = 0;
          for (std::size_t i = 0; i <= line.size(); ++i) {
            if (i < line.size() && line[i] != ':')
              continue;
            if (field == 9 && i > start)
              return line.substr(start, i - start);
            ++field;
            start = i + 1;
          }
        }
        return std::nullopt;
      }

      bool ultimatelyTrusted(ExecutionContext& ctx, const std::string& fingerprint) {
        const auto trust = ctx.runner.run({ "gpg", "--batch", "--export-ownertrust" });
        return trust.ok() && trust.output.find(fingerprint + ":6:") != std::string::npos;
      }

      ProvisioningStep collaboratorKey() {
        auto s = step("collaborator-key", "Setting up GPG encryption keys", Phase::Unprivileged,
                      Severity::Soft, StepKind::Mutation);
        s.satisfied = [](ExecutionContext& ctx) {
          const auto fpr = collaboratorFingerprint(ctx);
          return fpr && ultimatelyTrusted(ctx, *fpr);
        };
        s.apply = [](ExecutionContext& ctx) {
          const auto& cfg = ctx.config;
          const auto source = ctx.workPath(cfg.keyFolder + "/" + cfg.collaboratorKeyFile);
          const auto target = ctx.homePath(cfg.collaboratorKeyTarget);
          if (!io::fileExists(source))
            throw TransientStepWarning("Public key file not found in " + cfg.keyFolder + "/");

          if (!io::sameContent(source, target))
            fs::copy_file(source, target, fs::copy_options::overwrite_existing);
          ctx.log.success("Public key copied to home directory");

          ctx.runner.runChecked({ "gpg", "--batch", "--import", target });
          const auto fpr = collaboratorFingerprint(ctx);
          if (!fpr)
            throw TransientStepWarning("Could not find " + cfg.collaboratorIdentity +
                                       " key for trust setup");
          ctx.runner.runChecked({ "gpg", "--batch", "--import-ownertrust" }, *fpr + ":6:\n");
          ctx.log.success("GPG key imported and trusted");
        };
        s.verify = s.satisfied;
        return s;
      }

      std::optional<Strings> accessKeyLines(ExecutionContext& ctx) {
        const auto key =
            io::readFile(ctx.workPath(ctx.config.keyFolder + "/" + ctx.config.accessKeyFile));
        if (!key)
          return std::nullopt;
        return keyEntries(*key);
      }

      ProvisioningStep accessKey() {
        auto s = step("access-key", "Setting up SSH keys", Phase::Unprivileged, Severity::Soft,
                      StepKind::Mutation);
        s.satisfied = [](ExecutionContext& ctx) {
          const auto keys = accessKeyLines(ctx);
          const auto current = io::readFile(ctx.homePath(ctx.config.authorizedKeys));
          return keys && current && core::LineSet::parse(*current).missing(*keys).empty();
        };
        s.apply = [](ExecutionContext& ctx) {
          const auto keys = accessKeyLines(ctx);
          if (!keys)
            throw TransientStepWarning("Public key file not found in " + ctx.config.keyFolder + "/");

          const fs::path authorized = ctx.homePath(ctx.config.authorizedKeys);
          fs::create_directories(authorized.parent_path());
          fs::permissions(authorized.parent_path(), fs::perms::owner_all,
                          fs::perm_options::replace);

          auto lines = core::LineSet::parse(io::readFile(authorized.string()).value_or(""));
          if (lines.merge(*keys).empty()) {
            ctx.log.success("Public key already in authorized_keys");
            return;
          }
          io::writeFileAtomic(authorized.string(), lines.render(), 0600);
          fs::permissions(authorized, fs::perms::owner_read | fs::perms::owner_write,
                          fs::perm_options::replace);
          ctx.log.success("Public key added to authorized_keys for passwordless login");
        };
        s.verify = s.satisfied;
        return s;
      }

      ProvisioningStep workspaceDirectory() {
        auto s = step("workspace-directory", "Checking assets directory", Phase::Unprivileged,
                      Severity::Soft, StepKind::Mutation);
        s.satisfied = [](ExecutionContext& ctx) {
          return fs::is_directory(ctx.homePath(ctx.config.dataDirectory));
        };
        s.apply = [](ExecutionContext& ctx) {
          fs::create_directories(ctx.homePath(ctx.config.dataDirectory));
          ctx.log.success("Assets directory created");
        };
        s.verify = s.satisfied;
        return s;
      }

      void unprivilegedEpilogue(ExecutionContext& ctx, const Report&) {
        const auto& account = ctx.config.account;
        const auto& unit = ctx.config.service.name;
        ctx.log.banner("INSTALLATION COMPLETE");
        ctx.log.line("Next steps:");
        ctx.log.line("1. Log out and log back in for group permissions to take effect:");
        ctx.log.line("   exit");
        ctx.log.line("   ssh " + account + "@<PI_IP>");
        ctx.log.line("2. Reboot the Raspberry Pi:");
        ctx.log.line("   sudo reboot");
        ctx.log.line("3. After reboot, test the camera:");
        ctx.log.line("   " + ctx.config.cameraTool + " -o test.jpg");
        ctx.log.line("4. Test the GPIO wiring:");
        ctx.log.line(std::string("   ") + kGpioTestCommand);
        ctx.log.line("5. Start the camera service:");
        ctx.log.line("   systemctl --user start " + unit);
        ctx.log.line("6. Check service status:");
        ctx.log.line("   systemctl --user status " + unit);
        ctx.log.line("7. View service logs:");
        ctx.log.line("   journalctl --user -u " + unit + " -f");
        ctx.log.rule();

        ctx.log.info("Service Management Commands:");
        ctx.log.rule();
        ctx.log.line("Start service:        systemctl --user start " + unit);
        ctx.log.line("Stop service:         systemctl --user stop " + unit);
        ctx.log.line("Restart service:      systemctl --user restart " + unit);
        ctx.log.line("Check status:         systemctl --user status " + unit);
        ctx.log.line("View logs:            journalctl --user -u " + unit + " -f");
        ctx.log.line("Enable auto-start:    systemctl --user enable " + unit);
        ctx.log.line("Disable auto-start:   systemctl --user disable " + unit);
        ctx.log.rule();
      }

      const char* const kElevatedUsage =
          "Usage: sudo fieldkit-setup [OPTION]\n"
          "\n"
          "Options:\n"
          "  --verify     Verify current sudo configuration\n"
          "  --test-gpio  Test GPIO functionality (LED and Button)\n"
          "  --restore    Restore sudoers from backup\n"
          "  --help       Show this help message\n"
          "\n"
          "Examples:\n"
          "  sudo fieldkit-setup              # Full system setup and sudo configuration\n"
          "  sudo fieldkit-setup --verify     # Verify configuration\n"
          "  sudo fieldkit-setup --test-gpio  # Test GPIO functionality\n"
          "  sudo fieldkit-setup --restore    # Restore from backup\n"
          "\n"
          "Configuration is read from $FIELDKIT_CONFIG or /etc/fieldkit/appliance.json.";

      const char* const kUnprivilegedUsage =
          "Usage: fieldkit-install\n"
          "\n"
          "Run as the application account after `sudo fieldkit-setup` has completed.\n"
          "Enables the user service, imports the collaborator key, registers the\n"
          "access key and prepares the workspace.";

    } // namespace

    Plan elevatedPlan(const core::ApplianceConfig& cfg) {
      Plan plan;
      plan.phase = Phase::Elevated;
      plan.title = "Complete System Setup";
      plan.usage = kElevatedUsage;
      plan.summarize = summarizeGrants;
      plan.epilogue = elevatedEpilogue;

      auto& s = plan.steps;
      s.push_back(hostClass(Phase::Elevated));
      s.push_back(rootContext());
      s.push_back(applicationAccount());
      s.push_back(systemPackages());
      for (const auto& repo : cfg.repositories)
        s.push_back(externalRepository(repo));
      s.push_back(projectFiles());
      s.push_back(hardwareInterfaces());
      s.push_back(applicationScript(Phase::Elevated, true));
      s.push_back(serviceUnit());
      s.push_back(userLinger());
      s.push_back(dataDirectory());
      s.push_back(pythonEnvironment());
      s.push_back(privilegeGrants());
      for (const auto& grant : cfg.groupGrants())
        s.push_back(groupMembership(grant));
      s.push_back(softwareCheck("software-check", "Testing setup", Phase::Elevated));
      s.push_back(grantVerification());
      s.push_back(hardwareSelfTest());
      return plan;
    }

    Plan unprivilegedPlan() {
      Plan plan;
      plan.phase = Phase::Unprivileged;
      plan.title = "Raspberry Pi Camera Setup Installer";
      plan.usage = kUnprivilegedUsage;
      plan.epilogue = unprivilegedEpilogue;

      auto& s = plan.steps;
      s.push_back(hostClass(Phase::Unprivileged));
      s.push_back(accountContext());
      s.push_back(elevatedPhaseMarker());
      s.push_back(interfaceStatus());
      s.push_back(applicationScript(Phase::Unprivileged, false));
      s.push_back(userService());
      s.push_back(serviceSmokeTest());
      s.push_back(groupCheck());
      s.push_back(collaboratorKey());
      s.push_back(accessKey());
      s.push_back(workspaceDirectory());
      s.push_back(softwareCheck("final-sweep", "Testing setup", Phase::Unprivileged));
      return plan;
    }

  } // namespace provisioning
} // namespace fieldkit
