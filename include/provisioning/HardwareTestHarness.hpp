#pragma once
/** @file  HardwareTestHarness.hpp
 *  @brief Actuator blink and sensor press tests with a two-context retry.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <functional>
#include <memory>
#include <string>

// fieldkit headers
#include "provisioning/HardwareTestResult.hpp"
#include "provisioning/PrivilegeScope.hpp"

namespace fieldkit {
  namespace core {
    class Logger;
  } // namespace core
  namespace io {
    class GpioChip;
  } // namespace io

  namespace provisioning {

    /**
 * @class HardwareTestHarness
 * @brief Drives one output line and samples one input line.
 *
 *  * Each attempt opens its own chip handle through the factory, so an attempt
 *    running in a forked child never shares a descriptor with the parent.
 *  * A claimed line is released on every exit path (RAII GpioLine).
 *  * Retry only on a raised fault; a sensor timeout is a clean result.
 *  * If the interface gate is closed the test is skipped as Deferred.
 */
    class HardwareTestHarness {
    public:
      using ChipFactory = std::function<std::unique_ptr<io::GpioChip>()>;
      using InterfaceGate = std::function<bool()>;

      HardwareTestHarness(ChipFactory chips, PrivilegeScope& primary, PrivilegeScope& fallback,
                          core::Logger& log, InterfaceGate gate,
                          std::chrono::milliseconds pollInterval = std::chrono::milliseconds{ 100 });

      /// \p cycles on/off pairs of \p onDuration each. Pass = no fault raised.
      HardwareTestResult testActuator(unsigned int pin, int cycles = 5,
                                      std::chrono::milliseconds onDuration =
                                          std::chrono::milliseconds{ 500 });

      /// Pull-up baseline, then poll until the level changes or \p timeout elapses.
      HardwareTestResult testSensor(unsigned int pin,
                                    std::chrono::milliseconds timeout = std::chrono::seconds{ 10 });

      bool interfacesActive() const;

      //---single attempt, no gate, no retry (throws on fault)---------------
      HardwareTestResult blink(unsigned int pin, int cycles, std::chrono::milliseconds onDuration);
      HardwareTestResult watch(unsigned int pin, std::chrono::milliseconds timeout);

    private:
      HardwareTestResult deferred(ComponentKind kind, unsigned int pin, std::string expected);
      HardwareTestResult withRetry(ComponentKind kind, unsigned int pin, const std::string& expected,
                                   const HardwareTest& test);

      ChipFactory chips_;
      PrivilegeScope& primary_;
      PrivilegeScope& fallback_;
      core::Logger& log_;
      InterfaceGate gate_;
      std::chrono::milliseconds poll_;
    };

  } // namespace provisioning
} // namespace fieldkit
