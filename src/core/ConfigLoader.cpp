/* @file ConfigLoader.cpp
 * @brief Reads appliance.json and maps it onto ApplianceConfig.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdlib>
#include <fstream>
#include <stdexcept>

// nlohmann headers
#include <nlohmann/json.hpp>

// fieldkit headers
#include "core/ApplianceConfig.hpp"
#include "core/ConfigLoader.hpp"

using namespace fieldkit::core;

ConfigLoader::ConfigLoader(std::string configPath) : path_{ std::move(configPath) } {}

nlohmann::json ConfigLoader::load() const {
  std::ifstream in(path_);
  if (!in.is_open())
    throw std::runtime_error("[ConfigLoader] cannot open " + path_);

  try {
    return nlohmann::json::parse(in, nullptr, true, true); // comments allowed
  } catch (const nlohmann::json::parse_error& e) {
    throw std::runtime_error("[ConfigLoader] " + path_ + ": " + e.what());
  }
}

ApplianceConfig ConfigLoader::loadConfig() const {
  const auto doc = load();
  if (!doc.is_object())
    throw std::runtime_error("[ConfigLoader] " + path_ + ": top level must be an object");

  try {
    return doc.get<ApplianceConfig>();
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error("[ConfigLoader] " + path_ + ": " + e.what());
  }
}

ApplianceConfig ConfigLoader::resolve() {
  if (const char* env = std::getenv(kEnvOverride); env != nullptr && *env != '\0')
    return ConfigLoader(env).loadConfig();

  std::ifstream probe(kDefaultPath);
  if (probe.good())
    return ConfigLoader(kDefaultPath).loadConfig();

  return ApplianceConfig{};
}
