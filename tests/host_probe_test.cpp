// STL headers
#include <string>
#include <vector>

// fieldkit headers
#include "core/ApplianceConfig.hpp"
#include "provisioning/HostProbe.hpp"

#include "FakeCommandRunner.hpp"
#include "TempDir.hpp"

// GTest headers
#include <gtest/gtest.h>

using namespace fieldkit::provisioning;
using Strings = std::vector<std::string>;

TEST(host_probe, marker_on_uncommented_line_is_found) {
  EXPECT_TRUE(hasMarker("# c\ndtparam=i2c_arm=on\n", "i2c_arm=on"));
  EXPECT_TRUE(hasMarker("  dtparam=i2c_arm=on,i2c_arm_baudrate=400000", "i2c_arm=on"));
}

TEST(host_probe, commented_marker_is_ignored) {
  EXPECT_FALSE(hasMarker("#dtparam=i2c_arm=on\n", "i2c_arm=on"));
  EXPECT_FALSE(hasMarker("\t# dtparam=i2c_arm=on\n[all]\n", "i2c_arm=on"));
}

TEST(host_probe, empty_config_has_no_marker) {
  EXPECT_FALSE(hasMarker("", "i2c_arm=on"));
  EXPECT_FALSE(hasMarker("\n\n", "i2c_arm=on"));
}

TEST(host_probe, key_entries_skip_blank_lines) {
  const std::string file = "ssh-ed25519 AAAA1 ops@bench\n"
                           "\n"
                           "   \n"
                           "ssh-rsa AAAA2 field@laptop\n"
                           "ssh-ed25519 AAAA3 spare";
  EXPECT_EQ(keyEntries(file),
            (Strings{ "ssh-ed25519 AAAA1 ops@bench", "ssh-rsa AAAA2 field@laptop",
                      "ssh-ed25519 AAAA3 spare" }));
  EXPECT_TRUE(keyEntries("\n \n").empty());
}

TEST(host_probe, interfaces_gate_reads_first_existing_boot_config) {
  fieldkit::test::TempDir dir;
  fieldkit::core::ApplianceConfig cfg;
  cfg.bootConfigPaths = { dir.path("firmware/config.txt"), dir.path("config.txt") };
  EXPECT_FALSE(interfacesEnabled(cfg));

  dir.write("config.txt", "dtparam=i2c_arm=on\n");
  EXPECT_TRUE(interfacesEnabled(cfg));

  dir.write("firmware/config.txt", "#dtparam=i2c_arm=on\n");
  EXPECT_FALSE(interfacesEnabled(cfg));
}

TEST(host_probe, groups_of_account_and_caller) {
  fieldkit::test::FakeCommandRunner runner;
  runner.users.insert("mlink");
  runner.groups["mlink"] = { "gpio", "video" };

  EXPECT_EQ(groupsOf(runner, "mlink"), (Strings{ "mlink", "gpio", "video" }));
  EXPECT_EQ(groupsOf(runner), (Strings{ "root" }));
  EXPECT_TRUE(groupsOf(runner, "nobody-here").empty());
}
