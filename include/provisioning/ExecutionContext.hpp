#pragma once
/** @file  ExecutionContext.hpp
 *  @brief Everything a provisioning step may touch, passed in explicitly.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <string>
#include <vector>

// fieldkit headers
#include "provisioning/HardwareTestResult.hpp"

namespace fieldkit {
  namespace core {
    class Logger;
    struct ApplianceConfig;
  } // namespace core
  namespace io {
    class CommandRunner;
  } // namespace io

  namespace provisioning {

    class TransactionalConfigWriter;
    class ServiceLifecycleManager;
    class HardwareTestHarness;

    /**
 * @struct ExecutionContext
 * @brief Replaces ambient shell state (cwd, euid, $HOME) with an explicit value.
 *
 *  * Collaborators are non-owning; the entrypoint owns them and outlives the run.
 *  * A phase that has no use for a collaborator leaves it null; asking for it
 *    then is a programming error (std::logic_error).
 */
    struct ExecutionContext {
      ExecutionContext(const core::ApplianceConfig& cfg, io::CommandRunner& cmd,
                       core::Logger& logger);

      const core::ApplianceConfig& config;
      io::CommandRunner& runner;
      core::Logger& log;

      unsigned int effectiveUid{ 0 };
      std::string userName;
      std::string workingDirectory; ///< project checkout the operator ran us from
      std::string homeDirectory;    ///< home of the application account

      TransactionalConfigWriter* grantWriter{ nullptr };
      ServiceLifecycleManager* serviceManager{ nullptr };
      HardwareTestHarness* harness{ nullptr };

      // --- filled in while the plan runs ---
      bool rebootRequired{ false };
      std::vector<HardwareTestResult> hardwareResults;

      TransactionalConfigWriter& grants() const;
      ServiceLifecycleManager& service() const;
      HardwareTestHarness& hardware() const;

      /// \p rel under homeDirectory; absolute paths are returned unchanged.
      std::string homePath(const std::string& rel) const;
      /// \p rel under workingDirectory; absolute paths are returned unchanged.
      std::string workPath(const std::string& rel) const;
      /// config.expand() against this context's home directory.
      std::string expand(const std::string& text) const;

      bool isRoot() const noexcept { return effectiveUid == 0; }

      /// Context of the calling process (geteuid, passwd entry, getcwd).
      static ExecutionContext fromProcess(const core::ApplianceConfig& cfg, io::CommandRunner& cmd,
                                          core::Logger& logger);
    };

  } // namespace provisioning
} // namespace fieldkit
