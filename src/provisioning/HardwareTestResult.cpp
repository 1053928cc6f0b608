/* @file HardwareTestResult.cpp
 * @brief JSON mapping of HardwareTestResult.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include <nlohmann/json.hpp>

#include "provisioning/HardwareTestResult.hpp"

namespace fieldkit {
  namespace provisioning {

    NLOHMANN_JSON_SERIALIZE_ENUM(ComponentKind, {
                                                  { ComponentKind::Actuator, "actuator" },
                                                  { ComponentKind::Sensor, "sensor" },
                                                })

    NLOHMANN_JSON_SERIALIZE_ENUM(Verdict, {
                                            { Verdict::Fail, "fail" },
                                            { Verdict::Pass, "pass" },
                                            { Verdict::Deferred, "deferred" },
                                          })

    NLOHMANN_JSON_SERIALIZE_ENUM(SensorObservation, {
                                                      { SensorObservation::None, nullptr },
                                                      { SensorObservation::Pressed, "pressed" },
                                                      { SensorObservation::NotDetected,
                                                        "not-detected" },
                                                    })

    void to_json(nlohmann::json& j, const AttemptRecord& a) {
      j = nlohmann::json{ { "context", a.context }, { "faulted", a.faulted }, { "detail", a.detail } };
    }

    void from_json(const nlohmann::json& j, AttemptRecord& a) {
      j.at("context").get_to(a.context);
      j.at("faulted").get_to(a.faulted);
      j.at("detail").get_to(a.detail);
    }

    void to_json(nlohmann::json& j, const HardwareTestResult& r) {
      j = nlohmann::json{ { "kind", r.kind },
                          { "pin", r.pin },
                          { "expected", r.expected },
                          { "observed", r.observed },
                          { "verdict", r.verdict },
                          { "sensor", r.sensor },
                          { "transitions", r.transitions },
                          { "attempts", r.attempts },
                          { "remediation", r.remediation } };
    }

    void from_json(const nlohmann::json& j, HardwareTestResult& r) {
      j.at("kind").get_to(r.kind);
      j.at("pin").get_to(r.pin);
      j.at("expected").get_to(r.expected);
      j.at("observed").get_to(r.observed);
      j.at("verdict").get_to(r.verdict);
      j.at("sensor").get_to(r.sensor);
      j.at("transitions").get_to(r.transitions);
      if (auto it = j.find("attempts"); it != j.end())
        it->get_to(r.attempts);
      if (auto it = j.find("remediation"); it != j.end())
        it->get_to(r.remediation);
    }

  } // namespace provisioning
} // namespace fieldkit
