#pragma once
/** @file  Errors.hpp
 *  @brief Error taxonomy shared by every provisioning component.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace fieldkit {
  namespace core {

    enum class ErrorKind : std::uint8_t {
      Precondition,
      TransientStep,
      Transaction,
      HardwareDeferred,
      HardwareFault,
      ServiceSmokeTest,
      NoBackup,
      Command,
      Count
    };
    static_assert(static_cast<std::uint8_t>(ErrorKind::Count) == 8,
                  "ErrorKind count changed please update toString and the classifier");

    inline const char* toString(ErrorKind k) {
      switch (k) {
      case ErrorKind::Precondition:
        return "PreconditionError";
      case ErrorKind::TransientStep:
        return "TransientStepWarning";
      case ErrorKind::Transaction:
        return "TransactionError";
      case ErrorKind::HardwareDeferred:
        return "HardwareDeferred";
      case ErrorKind::HardwareFault:
        return "HardwareFault";
      case ErrorKind::ServiceSmokeTest:
        return "ServiceSmokeTestFailure";
      case ErrorKind::NoBackup:
        return "NoBackupError";
      case ErrorKind::Command:
        return "CommandError";
      default:
        return "Unknown";
      }
    }

    /**
 * @class ProvisioningError
 * @brief Root of the taxonomy; the orchestrator classifies on `kind()`.
 */
    class ProvisioningError : public std::runtime_error {
    public:
      ProvisioningError(ErrorKind kind, const std::string& what)
          : std::runtime_error(what), kind_{ kind } {}

      ErrorKind kind() const noexcept { return kind_; }

      /// Aborts the plan whatever the step severity says.
      bool alwaysFatal() const noexcept {
        return kind_ == ErrorKind::Precondition || kind_ == ErrorKind::Transaction;
      }

      /// Logged and skipped whatever the step severity says.
      bool neverFatal() const noexcept {
        return kind_ == ErrorKind::TransientStep || kind_ == ErrorKind::HardwareDeferred ||
               kind_ == ErrorKind::HardwareFault || kind_ == ErrorKind::ServiceSmokeTest;
      }

    private:
      ErrorKind kind_;
    };

    /// Wrong host class, wrong privilege context, missing phase-ordering artifact.
    class PreconditionError : public ProvisioningError {
    public:
      explicit PreconditionError(const std::string& what)
          : ProvisioningError(ErrorKind::Precondition, what) {}
    };

    /// Optional tool or file absent.
    class TransientStepWarning : public ProvisioningError {
    public:
      explicit TransientStepWarning(const std::string& what)
          : ProvisioningError(ErrorKind::TransientStep, what) {}
    };

    /// Privilege-grant resource unreadable or unwritable.
    class TransactionError : public ProvisioningError {
    public:
      explicit TransactionError(const std::string& what)
          : ProvisioningError(ErrorKind::Transaction, what) {}
    };

    class HardwareDeferred : public ProvisioningError {
    public:
      explicit HardwareDeferred(const std::string& what)
          : ProvisioningError(ErrorKind::HardwareDeferred, what) {}
    };

    /// Both privilege contexts failed to drive the pins.
    class HardwareFault : public ProvisioningError {
    public:
      explicit HardwareFault(const std::string& what)
          : ProvisioningError(ErrorKind::HardwareFault, what) {}
    };

    class ServiceSmokeTestFailure : public ProvisioningError {
    public:
      ServiceSmokeTestFailure(const std::string& what, std::string diagnostics)
          : ProvisioningError(ErrorKind::ServiceSmokeTest, what),
            diagnostics_{ std::move(diagnostics) } {}

      const std::string& diagnostics() const noexcept { return diagnostics_; }

    private:
      std::string diagnostics_;
    };

    class NoBackupError : public ProvisioningError {
    public:
      explicit NoBackupError(const std::string& what)
          : ProvisioningError(ErrorKind::NoBackup, what) {}
    };

    /// External command exited non-zero (or could not be started).
    class CommandError : public ProvisioningError {
    public:
      CommandError(std::vector<std::string> argv, int exitCode, std::string output);

      const std::vector<std::string>& argv() const noexcept { return argv_; }
      int exitCode() const noexcept { return exitCode_; }
      const std::string& output() const noexcept { return output_; }

    private:
      std::vector<std::string> argv_;
      int exitCode_;
      std::string output_;
    };

  } // namespace core
} // namespace fieldkit
