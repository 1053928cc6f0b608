#pragma once
/** @file  ApplianceConfig.hpp
 *  @brief Every tunable of the provisioning run, with the field defaults.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <string>
#include <utility>
#include <vector>

// nlohmann headers
#include <nlohmann/json_fwd.hpp>

namespace fieldkit {
  namespace core {

    /// (account, group) membership that must exist. Never revoked automatically.
    struct GroupGrant {
      std::string account;
      std::string group;

      bool operator==(const GroupGrant&) const = default;
    };

    /// Third-party apt source installed through a downloaded keyring + list file.
    struct ExternalRepository {
      std::string name;
      std::string package;
      std::string keyringUrl;
      std::string keyringPath;
      std::string sourceListUrl;
      std::string sourceListPath;
    };

    /// One low-level interface switched on through `raspi-config nonint`.
    struct InterfaceToggle {
      std::string label;         ///< e.g. "I2C"
      std::string raspiFunction; ///< e.g. "do_i2c"
      std::string marker;        ///< boot-config line fragment proving it is on
    };

    struct ServiceConfig {
      std::string name{ "pycam.service" };
      std::string description{ "Physical Button Camera Recorder" };
      std::string execStart{ "{home}/venv/bin/python3 {home}/pycam.py" };
      std::string workingDirectory{ "{home}" };
      std::vector<std::pair<std::string, std::string>> environment{
        { "PYTHONUNBUFFERED", "1" },
        { "PYTHONPATH", "{home}/venv/lib/python3.11/site-packages" },
      };
      std::string unitDirectory{ "/etc/systemd/user" };
      std::chrono::seconds restartDelay{ 5 };
      std::chrono::seconds stopTimeout{ 10 };
      std::chrono::milliseconds smokeGrace{ 2000 };
    };

    struct HardwareConfig {
      std::string chip{ "/dev/gpiochip0" };
      unsigned int ledPin{ 17 };    ///< physical pin 11
      unsigned int buttonPin{ 15 }; ///< physical pin 10
      int blinkCycles{ 5 };
      std::chrono::milliseconds blinkOn{ 500 };
      std::chrono::milliseconds sensorTimeout{ 10000 };
      std::chrono::milliseconds pollInterval{ 100 };
    };

    /**
 * @struct ApplianceConfig
 * @brief Parsed form of appliance.json. Missing keys keep the defaults below.
 *
 *  * Relative paths are relative to the account home (see ExecutionContext).
 *  * `{home}` and `{account}` are expanded by `expand()`.
 */
    struct ApplianceConfig {
      // --- account & host ---------------------------------------------------
      std::string account{ "mlink" };
      std::string homeDirectory{ "/home/mlink" };
      std::string hostSignature{ "Raspberry Pi" };
      std::string cpuInfoPath{ "/proc/cpuinfo" };
      std::string auditLog{};

      // --- software ---------------------------------------------------------
      std::vector<std::string> packages{ "python3",        "python3-pip", "python3-venv",
                                         "libcamera-apps", "ffmpeg",      "gnupg",
                                         "python3-rpi.gpio", "git",       "curl",
                                         "wget",           "vsftpd" };
      bool upgradeSystem{ false };
      std::vector<ExternalRepository> repositories{
        { "tailscale", "tailscale",
          "https://pkgs.tailscale.com/stable/debian/bookworm.noarmor.gpg",
          "/usr/share/keyrings/tailscale-archive-keyring.gpg",
          "https://pkgs.tailscale.com/stable/debian/bookworm.tailscale-keyring.list",
          "/etc/apt/sources.list.d/tailscale.list" },
      };
      std::vector<std::string> stagedDirectories{ "rpi_files", "setup" };
      std::vector<std::string> stagedFiles{ "README.md", "test_gpio.sh", "wifi_usb.sh",
                                            "setup_wifi_usb.sh" };
      std::string venvDirectory{ "venv" };
      std::string requirementsFile{ "rpi_files/requirements.txt" };
      std::vector<std::string> fallbackPythonPackages{ "RPi.GPIO", "gpiozero" };
      std::string appScriptSource{ "rpi_files/pycam.py" };
      std::string appScript{ "pycam.py" };
      std::string cameraTool{ "rpicam-still" };
      std::string dataDirectory{ "assets" };

      // --- interfaces -------------------------------------------------------
      std::vector<std::string> bootConfigPaths{ "/boot/firmware/config.txt", "/boot/config.txt" };
      std::string interfaceGateMarker{ "i2c_arm=on" };
      std::vector<InterfaceToggle> interfaces{
        { "Camera", "do_camera", "start_x=1" },
        { "I2C", "do_i2c", "i2c_arm=on" },
        { "SPI", "do_spi", "spi=on" },
        { "Serial", "do_serial", "enable_uart=1" },
      };

      // --- service ----------------------------------------------------------
      ServiceConfig service{};

      // --- privilege grants -------------------------------------------------
      std::string sudoersPath{ "/etc/sudoers" };
      std::string sudoersBackupPath{ "/etc/sudoers.backup" };
      std::string grantComment{ "# Raspberry Pi Camera GPIO and Camera Access" };
      std::string grantTemplate{ "{account} ALL=(ALL) NOPASSWD: {command}" };
      std::vector<std::string> grantCommands{
        "/usr/bin/python3 {home}/pycam.py",
        "/usr/bin/gpio",
        "/usr/bin/raspi-gpio",
        "/usr/bin/libcamera-*",
        "/usr/bin/rpicam-*",
        "/usr/bin/ffmpeg",
      };
      std::vector<std::string> groups{ "gpio", "video", "audio" };

      // --- keys -------------------------------------------------------------
      std::string keyFolder{ "Key_Folder" }; ///< relative to the working directory
      std::string collaboratorKeyFile{ "public.asc" };
      std::string collaboratorKeyTarget{ "mlink_public.asc" };
      std::string collaboratorIdentity{ "mlink@trymlink.com" };
      std::string accessKeyFile{ "mlink_key.pub" };
      std::string authorizedKeys{ ".ssh/authorized_keys" };

      // --- hardware ---------------------------------------------------------
      HardwareConfig hardware{};

      /// Replace `{home}` and `{account}` (home = \p home, or homeDirectory if empty).
      std::string expand(const std::string& text, const std::string& home = {}) const;

      /// Fully formatted privilege-grant lines, in declaration order.
      std::vector<std::string> grantLines() const;

      /// Commands only (expanded); used to verify `sudo -l` output.
      std::vector<std::string> grantedCommands() const;

      std::vector<GroupGrant> groupGrants() const;
    };

    void from_json(const nlohmann::json& j, ApplianceConfig& cfg);

  } // namespace core
} // namespace fieldkit
