#pragma once
/** @file  Types.hpp
 *  @brief Phase / mode / severity vocabulary of a provisioning run.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdint>

namespace fieldkit {
  namespace provisioning {

    /// Elevated steps strictly precede unprivileged steps.
    enum class Phase : std::uint8_t { Elevated, Unprivileged };

    enum class Mode : std::uint8_t { Apply, Verify, Restore, HardwareTest, Help };

    /// Fatal aborts the rest of the phase; Soft is logged and skipped.
    enum class Severity : std::uint8_t { Fatal, Soft };

    /// Mutation steps short-circuit when satisfied; Check steps always probe.
    enum class StepKind : std::uint8_t { Mutation, Check };

    inline const char* toString(Phase p) {
      switch (p) {
      case Phase::Elevated:
        return "elevated";
      case Phase::Unprivileged:
        return "unprivileged";
      default:
        return "unknown";
      }
    }

    inline const char* toString(Mode m) {
      switch (m) {
      case Mode::Apply:
        return "apply";
      case Mode::Verify:
        return "verify";
      case Mode::Restore:
        return "restore";
      case Mode::HardwareTest:
        return "hardware-test";
      case Mode::Help:
        return "help";
      default:
        return "unknown";
      }
    }

  } // namespace provisioning
} // namespace fieldkit
