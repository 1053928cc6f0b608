#pragma once
/** @file  CommandRunner.hpp
 *  @brief Synchronous external-command execution (fork/execvp with captured output).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>
#include <vector>

namespace fieldkit {
  namespace io {

    struct CommandResult {
      int exitCode{ -1 };  ///< 127 = could not exec, 128+N = killed by signal N
      std::string output{}; ///< stdout and stderr, merged

      bool ok() const noexcept { return exitCode == 0; }
    };

    /**
 * @class CommandRunner
 * @brief Seam between provisioning steps and the host OS.
 *
 *  * Every package, account, service and key operation goes through here so
 *    the steps can be exercised against an in-memory fake.
 *  * Blocking: returns once the child has exited.
 */
    class CommandRunner {
    public:
      virtual ~CommandRunner() = default;

      /// Run \p argv (argv[0] looked up on PATH), feeding \p input on stdin.
      virtual CommandResult run(const std::vector<std::string>& argv,
                                const std::string& input = {}) = 0;

      /// True if \p program resolves to an executable on PATH.
      virtual bool hasProgram(const std::string& program) = 0;

      /// `run()` that throws core::CommandError on a non-zero exit.
      std::string runChecked(const std::vector<std::string>& argv, const std::string& input = {});
    };

    /**
 * @class PosixCommandRunner
 * @brief Real implementation: pipe + fork + execvp + waitpid.
 *
 *  * Non-copyable (stateless, but owned by the entrypoint).
 */
    class PosixCommandRunner : public CommandRunner {
    public:
      PosixCommandRunner() = default;
      ~PosixCommandRunner() override = default;

      CommandResult run(const std::vector<std::string>& argv, const std::string& input = {}) override;
      bool hasProgram(const std::string& program) override;

      PosixCommandRunner(const PosixCommandRunner&) = delete;
      PosixCommandRunner& operator=(const PosixCommandRunner&) = delete;
    };

  } // namespace io
} // namespace fieldkit
