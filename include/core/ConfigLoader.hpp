#pragma once
/** @file  ConfigLoader.hpp
 *  @brief Loads run-time configuration (JSON) from the appliance filesystem.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>

#include <nlohmann/json_fwd.hpp>

namespace fieldkit::core {

  struct ApplianceConfig;

  /**
 * @class ConfigLoader
 * @brief Thin helper that reads a JSON file and hands the parsed object to the
 *        caller.
 *
 *  * No caching: every call to `load()` re-reads the file (tiny file).
 *  * Schema mapping lives in ApplianceConfig's `from_json`.
 */
  class ConfigLoader {
  public:
    static constexpr const char* kDefaultPath = "/etc/fieldkit/appliance.json";
    static constexpr const char* kEnvOverride = "FIELDKIT_CONFIG";

    /// @param configPath  Absolute or relative path on the host FS.
    explicit ConfigLoader(std::string configPath);

    /// Parse the file into a nlohmann::json object or throw `std::runtime_error`.
    nlohmann::json load() const;

    /// `load()` mapped onto ApplianceConfig; type errors become `std::runtime_error`.
    ApplianceConfig loadConfig() const;

    /**
     * Resolve the configuration the entrypoints run with:
     * `$FIELDKIT_CONFIG` (must exist), else kDefaultPath if present, else defaults.
     */
    static ApplianceConfig resolve();

    const std::string& path() const noexcept { return path_; }

  private:
    std::string path_;
  };

} // namespace fieldkit::core
