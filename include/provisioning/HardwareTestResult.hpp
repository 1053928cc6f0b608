#pragma once
/** @file  HardwareTestResult.hpp
 *  @brief Outcome record of one actuator or sensor test (never persisted).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace fieldkit {
  namespace provisioning {

    enum class ComponentKind : std::uint8_t { Actuator, Sensor };

    /// Deferred = interfaces not active yet (reboot pending), distinct from Fail.
    enum class Verdict : std::uint8_t { Pass, Fail, Deferred };

    /// Sensor only. NotDetected is a clean terminal observation, not a fault.
    enum class SensorObservation : std::uint8_t { None, Pressed, NotDetected };

    inline const char* toString(ComponentKind k) {
      return k == ComponentKind::Actuator ? "actuator" : "sensor";
    }

    inline const char* toString(Verdict v) {
      switch (v) {
      case Verdict::Pass:
        return "PASSED";
      case Verdict::Fail:
        return "FAILED";
      case Verdict::Deferred:
        return "DEFERRED";
      default:
        return "UNKNOWN";
      }
    }

    inline const char* toString(SensorObservation o) {
      switch (o) {
      case SensorObservation::Pressed:
        return "pressed";
      case SensorObservation::NotDetected:
        return "not-detected";
      default:
        return "none";
      }
    }

    struct AttemptRecord {
      std::string context; ///< privilege scope name, e.g. "current user", "account mlink"
      bool faulted{ false };
      std::string detail;
    };

    struct HardwareTestResult {
      ComponentKind kind{ ComponentKind::Actuator };
      unsigned int pin{ 0 };
      std::string expected;
      std::string observed;
      Verdict verdict{ Verdict::Fail };
      SensorObservation sensor{ SensorObservation::None };
      std::vector<std::string> transitions; ///< actuator: "Blink 1: LED ON", ...
      std::vector<AttemptRecord> attempts;
      std::string remediation;
    };

    // JSON envelope used to hand a result back from a privilege-dropped child.
    void to_json(nlohmann::json& j, const HardwareTestResult& r);
    void from_json(const nlohmann::json& j, HardwareTestResult& r);

  } // namespace provisioning
} // namespace fieldkit
