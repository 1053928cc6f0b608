#pragma once
/** @file  ServiceLifecycleManager.hpp
 *  @brief Declare, enable and smoke-test the appliance's systemd unit.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace fieldkit {
  namespace core {
    class Logger;
    struct ApplianceConfig;
  } // namespace core
  namespace io {
    class CommandRunner;
  } // namespace io

  namespace provisioning {

    /// Always restart, fixed delay, no burst limit: nobody is around to intervene.
    struct RestartPolicy {
      bool always{ true };
      std::chrono::seconds delay{ 5 };
      unsigned int burst{ 0 }; ///< 0 = unlimited
    };

    struct ServiceUnitSpec {
      std::string name; ///< e.g. "pycam.service"
      std::string description;
      std::string command;
      RestartPolicy restart{};
      std::vector<std::pair<std::string, std::string>> environment;
      std::string workingDirectory;
      std::chrono::seconds stopTimeout{ 10 };

      /// Unit-file text. Same spec -> same bytes.
      std::string render() const;

      /// Spec for the collaborator recorder, expanded against \p home.
      static ServiceUnitSpec fromConfig(const core::ApplianceConfig& cfg, const std::string& home);
    };

    enum class ServiceStatus : std::uint8_t { Running, Stopped, Failed };

    inline const char* toString(ServiceStatus s) {
      switch (s) {
      case ServiceStatus::Running:
        return "running";
      case ServiceStatus::Stopped:
        return "stopped";
      case ServiceStatus::Failed:
        return "failed";
      default:
        return "unknown";
      }
    }

    /// System = plain `systemctl`; User = `systemctl --user` of the calling account.
    enum class UnitScope : std::uint8_t { System, User };

    /**
 * @class ServiceLifecycleManager
 * @brief Owns one unit name; all systemd calls go through the CommandRunner.
 *
 *  * declare() is idempotent: identical content means no write.
 *  * smokeTest() never leaves the unit running.
 */
    class ServiceLifecycleManager {
    public:
      ServiceLifecycleManager(io::CommandRunner& runner, core::Logger& log, UnitScope scope,
                              std::string unitDirectory, std::string unitName);

      //---declaration-----------------------------------------------------
      /// @returns true if the descriptor was (re)written.
      bool declare(const ServiceUnitSpec& spec);
      bool isDeclared() const;
      bool matches(const ServiceUnitSpec& spec) const;
      std::string unitPath() const;
      const std::string& unitName() const noexcept { return name_; }

      //---lifecycle-------------------------------------------------------
      void reload();
      void enableOnBoot();
      bool isEnabled();
      void start();
      void stop();
      ServiceStatus status();
      void resetFailed();

      /// Last \p lines journal lines for the unit (best effort, never throws on exit code).
      std::string recentDiagnostics(int lines = 10);

      /**
       * start -> wait \p grace -> expect Running -> stop -> expect not Running.
       * On failure: capture diagnostics, reload, clear the failed latch, then
       * throw core::ServiceSmokeTestFailure.
       */
      void smokeTest(std::chrono::milliseconds grace);

    private:
      std::vector<std::string> systemctl(std::vector<std::string> args) const;
      void recover();
      [[noreturn]] void failSmokeTest(const std::string& why);

      io::CommandRunner& runner_;
      core::Logger& log_;
      UnitScope scope_;
      std::string unitDirectory_;
      std::string name_;
    };

  } // namespace provisioning
} // namespace fieldkit
