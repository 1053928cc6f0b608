/* @file HardwareTestHarness.cpp
 * @brief Blink / press tests; current-context attempt first, account retry second.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <exception>
#include <thread>

// fieldkit headers
#include "core/Logger.hpp"
#include "io/GpioChip.hpp"
#include "provisioning/HardwareTestHarness.hpp"

using namespace fieldkit::provisioning;
using namespace std::chrono;

namespace {

  const char* levelName(bool high) { return high ? "HIGH (not pressed)" : "LOW (pressed)"; }

} // namespace

HardwareTestHarness::HardwareTestHarness(ChipFactory chips, PrivilegeScope& primary,
                                         PrivilegeScope& fallback, core::Logger& log,
                                         InterfaceGate gate, milliseconds pollInterval)
    : chips_{ std::move(chips) }, primary_{ primary }, fallback_{ fallback }, log_{ log },
      gate_{ std::move(gate) }, poll_{ pollInterval } {}

bool HardwareTestHarness::interfacesActive() const { return !gate_ || gate_(); }

HardwareTestResult HardwareTestHarness::blink(unsigned int pin, int cycles,
                                              milliseconds onDuration) {
  HardwareTestResult r;
  r.kind = ComponentKind::Actuator;
  r.pin = pin;
  r.expected = "LED blinks " + std::to_string(cycles) + " times";

  auto chip = chips_();
  auto line = chip->requestOutput(pin, false);
  log_.line("LED should blink " + std::to_string(cycles) + " times...");

  for (int i = 1; i <= cycles; ++i) {
    line->set(true);
    r.transitions.push_back("Blink " + std::to_string(i) + ": LED ON");
    log_.line(r.transitions.back());
    std::this_thread::sleep_for(onDuration);

    line->set(false);
    r.transitions.push_back("Blink " + std::to_string(i) + ": LED OFF");
    log_.line(r.transitions.back());
    std::this_thread::sleep_for(onDuration);
  }

  r.observed = std::to_string(r.transitions.size()) + " transitions completed";
  r.verdict = Verdict::Pass;
  return r;
}

HardwareTestResult HardwareTestHarness::watch(unsigned int pin, milliseconds timeout) {
  HardwareTestResult r;
  r.kind = ComponentKind::Sensor;
  r.pin = pin;
  r.expected = "level change within " + std::to_string(timeout.count()) + " ms";

  auto chip = chips_();
  auto line = chip->requestInput(pin, io::Bias::PullUp);

  const bool baseline = line->get();
  log_.line(std::string("Initial button state: ") + levelName(baseline));
  if (!baseline)
    log_.warning("Button appears to be pressed initially - check connections");
  log_.line("Press button within " + std::to_string(duration_cast<seconds>(timeout).count()) +
            " seconds to test...");

  // first observed change wins; no debounce
  const auto deadline = steady_clock::now() + timeout;
  for (;;) {
    const bool level = line->get();
    if (level != baseline) {
      r.sensor = SensorObservation::Pressed;
      r.observed = std::string("state changed from ") + (baseline ? "1" : "0") + " to " +
                   (level ? "1" : "0");
      log_.success("Button " + r.observed);
      break;
    }
    const auto now = steady_clock::now();
    if (now >= deadline) {
      r.sensor = SensorObservation::NotDetected;
      r.observed = "no button press detected";
      log_.warning("No button press detected in " +
                   std::to_string(duration_cast<seconds>(timeout).count()) + " seconds");
      log_.line("Possible issues:");
      log_.line("  - Button not connected to GPIO " + std::to_string(pin));
      log_.line("  - Button stuck in pressed state");
      log_.line("  - Wrong GPIO pin assignment");
      break;
    }
    std::this_thread::sleep_for(std::min<steady_clock::duration>(poll_, deadline - now));
  }

  r.verdict = Verdict::Pass; // a timeout is an observation, not a fault
  return r;
}

HardwareTestResult HardwareTestHarness::deferred(ComponentKind kind, unsigned int pin,
                                                 std::string expected) {
  log_.warning("GPIO interfaces may not be enabled yet. A reboot is required after enabling "
               "interfaces.");
  log_.warning("Skipping GPIO test until after reboot.");
  HardwareTestResult r;
  r.kind = kind;
  r.pin = pin;
  r.expected = std::move(expected);
  r.observed = "interfaces not active";
  r.verdict = Verdict::Deferred;
  return r;
}

HardwareTestResult HardwareTestHarness::withRetry(ComponentKind kind, unsigned int pin,
                                                  const std::string& expected,
                                                  const HardwareTest& test) {
  std::vector<AttemptRecord> attempts;
  for (PrivilegeScope* scope : { &primary_, &fallback_ }) {
    log_.info(std::string("Running ") + toString(kind) + " test as " + scope->name() + "...");
    try {
      auto r = scope->run(test);
      attempts.push_back({ scope->name(), false, r.observed });
      r.attempts = std::move(attempts);
      log_.success(std::string(kind == ComponentKind::Actuator ? "LED" : "Button") +
                   " test as " + scope->name() + " completed successfully");
      return r;
    } catch (const std::exception& e) {
      attempts.push_back({ scope->name(), true, e.what() });
      log_.warning(std::string(toString(kind)) + " test as " + scope->name() +
                   " failed: " + e.what());
    }
  }

  HardwareTestResult r;
  r.kind = kind;
  r.pin = pin;
  r.expected = expected;
  r.observed = attempts.back().detail;
  r.verdict = Verdict::Fail;
  r.attempts = std::move(attempts);
  r.remediation = "Check that the hardware is connected to GPIO " + std::to_string(pin) +
                  ", that the system was rebooted after enabling GPIO interfaces, and that the "
                  "account is in the gpio group";
  log_.warning(std::string(kind == ComponentKind::Actuator ? "LED" : "Button") +
               " test failed - check hardware connections and GPIO permissions");
  return r;
}

HardwareTestResult HardwareTestHarness::testActuator(unsigned int pin, int cycles,
                                                     milliseconds onDuration) {
  const auto expected = "LED blinks " + std::to_string(cycles) + " times";
  log_.info("Testing LED on GPIO " + std::to_string(pin) + "...");
  if (!interfacesActive())
    return deferred(ComponentKind::Actuator, pin, expected);
  return withRetry(ComponentKind::Actuator, pin, expected,
                   [this, pin, cycles, onDuration] { return blink(pin, cycles, onDuration); });
}

HardwareTestResult HardwareTestHarness::testSensor(unsigned int pin, milliseconds timeout) {
  const auto expected = "level change within " + std::to_string(timeout.count()) + " ms";
  log_.info("Testing Button on GPIO " + std::to_string(pin) + "...");
  if (!interfacesActive())
    return deferred(ComponentKind::Sensor, pin, expected);
  return withRetry(ComponentKind::Sensor, pin, expected,
                   [this, pin, timeout] { return watch(pin, timeout); });
}
