// STL headers
#include <chrono>
#include <memory>

// fieldkit headers
#include "core/ApplianceConfig.hpp"
#include "provisioning/ExecutionContext.hpp"
#include "provisioning/HardwareSelfTest.hpp"
#include "provisioning/HardwareTestHarness.hpp"

#include "CapturedLog.hpp"
#include "FakeCommandRunner.hpp"
#include "FakeGpioChip.hpp"
#include "ScriptedPrivilegeScope.hpp"
#include "TempDir.hpp"

// GTest headers
#include <gtest/gtest.h>

using namespace fieldkit::provisioning;
using namespace fieldkit::test;
using namespace std::chrono_literals;

class SelfTestTest : public ::testing::Test {
protected:
  SelfTestTest() {
    cfg.cpuInfoPath = dir.write("proc/cpuinfo", "Model\t\t: Raspberry Pi 4 Model B Rev 1.4\n");
    cfg.bootConfigPaths = { dir.write("boot/config.txt", "dtparam=i2c_arm=on\n"
                                                         "#dtparam=spi=on\n"
                                                         "enable_uart=1\n") };
    cfg.hardware.blinkCycles = 2;
    cfg.hardware.blinkOn = 1ms;
    cfg.hardware.sensorTimeout = 20ms;
    cfg.hardware.pollInterval = 5ms;
  }

  int runSelfTest() {
    auto script = gpio;
    HardwareTestHarness harness{ [script] { return std::make_unique<FakeGpioChip>(script); },
                                 current,
                                 account,
                                 sink.log,
                                 HardwareTestHarness::InterfaceGate{},
                                 cfg.hardware.pollInterval };
    ExecutionContext ctx{ cfg, runner, sink.log };
    ctx.harness = &harness;

    HardwareSelfTest selfTest{ ctx };
    const int rc = selfTest.run();
    results = selfTest.results();
    return rc;
  }

  TempDir dir;
  fieldkit::core::ApplianceConfig cfg;
  FakeCommandRunner runner;
  CapturedLog sink;
  std::shared_ptr<GpioScript> gpio = std::make_shared<GpioScript>();
  ScriptedPrivilegeScope current{ "current user" };
  ScriptedPrivilegeScope account{ "account mlink" };
  std::vector<HardwareTestResult> results;
};

TEST_F(SelfTestTest, run_CompletesWithBothComponentsPassing) {
  gpio->levels = { true, true, false };

  EXPECT_EQ(runSelfTest(), 0);
  ASSERT_EQ(results.size(), 2u);
  EXPECT_EQ(results[0].kind, ComponentKind::Actuator);
  EXPECT_EQ(results[0].verdict, Verdict::Pass);
  EXPECT_EQ(results[1].kind, ComponentKind::Sensor);
  EXPECT_EQ(results[1].sensor, SensorObservation::Pressed);
  EXPECT_EQ(gpio->releases, gpio->claims);
  EXPECT_TRUE(sink.contains("All tests passed!"));
}

TEST_F(SelfTestTest, run_SensorTimeoutIsNotAFailure) {
  EXPECT_EQ(runSelfTest(), 0);
  ASSERT_EQ(results.size(), 2u);
  EXPECT_EQ(results[1].verdict, Verdict::Pass);
  EXPECT_EQ(results[1].sensor, SensorObservation::NotDetected);
  EXPECT_TRUE(sink.contains("(no button press was observed)"));
}

TEST_F(SelfTestTest, run_FailedComponentsStillExitZero) {
  gpio->refuseRequest = true;

  EXPECT_EQ(runSelfTest(), 0);
  ASSERT_EQ(results.size(), 2u);
  EXPECT_EQ(results[0].verdict, Verdict::Fail);
  EXPECT_EQ(results[1].verdict, Verdict::Fail);
  EXPECT_EQ(current.runs, 2);
  EXPECT_EQ(account.runs, 2);
  EXPECT_TRUE(sink.contains("LED Test: FAILED"));
  EXPECT_TRUE(sink.contains("Troubleshooting tips:"));
}

TEST_F(SelfTestTest, run_ForeignHostExitsOneWithoutTouchingPins) {
  dir.write("proc/cpuinfo", "model name\t: Intel(R) Xeon(R)\n");

  EXPECT_EQ(runSelfTest(), 1);
  EXPECT_TRUE(results.empty());
  EXPECT_EQ(gpio->claims, 0);
  EXPECT_EQ(current.runs, 0);
}

TEST_F(SelfTestTest, run_ReportsInterfaceMarkersIgnoringComments) {
  runSelfTest();

  EXPECT_TRUE(sink.contains("I2C interface enabled"));
  EXPECT_TRUE(sink.contains("Serial interface enabled"));
  EXPECT_TRUE(sink.contains("SPI interface not enabled (spi=on missing)"));
  EXPECT_TRUE(sink.contains("Camera interface not enabled"));
}

TEST_F(SelfTestTest, run_ReportsGpioGroupMembershipOfTheCaller) {
  runSelfTest();
  EXPECT_TRUE(sink.contains("Current user is not in gpio group"));

  runner.groups["root"].insert("gpio");
  runSelfTest();
  EXPECT_TRUE(sink.contains("Current user is in gpio group"));
  EXPECT_TRUE(sink.contains("GPIO readall command works"));
}
