/* @file HostProbe.cpp
 * @brief cpuinfo, boot config, group and package probes.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <sstream>
#include <system_error>

// fieldkit headers
#include "core/ApplianceConfig.hpp"
#include "core/Errors.hpp"
#include "core/LineSet.hpp"
#include "core/Logger.hpp"
#include "io/CommandRunner.hpp"
#include "io/FileOps.hpp"
#include "provisioning/ExecutionContext.hpp"
#include "provisioning/HostProbe.hpp"

namespace fieldkit {
  namespace provisioning {

    namespace {

      std::optional<std::string> readQuietly(const std::string& path) {
        try {
          return io::readFile(path);
        } catch (const std::system_error&) {
          return std::nullopt; // unreadable counts as absent for a probe
        }
      }

    } // namespace

    void requireHostClass(ExecutionContext& ctx) {
      const auto& signature = ctx.config.hostSignature;
      const auto cpuinfo = readQuietly(ctx.config.cpuInfoPath);
      if (!cpuinfo || cpuinfo->find(signature) == std::string::npos)
        throw core::PreconditionError("This must be run on a " + signature);
      ctx.log.success(signature + " detected");
    }

    std::optional<std::string> readBootConfig(const core::ApplianceConfig& cfg) {
      for (const auto& path : cfg.bootConfigPaths) {
        if (auto content = readQuietly(path))
          return content;
      }
      return std::nullopt;
    }

    bool hasMarker(const std::string& content, const std::string& marker) {
      const auto parsed = core::LineSet::parse(content);
      for (const auto& line : parsed.lines()) {
        const auto first = line.find_first_not_of(" \t");
        if (first == std::string::npos || line[first] == '#')
          continue;
        if (line.find(marker) != std::string::npos)
          return true;
      }
      return false;
    }

    std::vector<std::string> keyEntries(const std::string& content) {
      const auto parsed = core::LineSet::parse(content);
      std::vector<std::string> entries;
      for (const auto& line : parsed.lines()) {
        if (line.find_first_not_of(" \t\r") != std::string::npos)
          entries.push_back(line);
      }
      return entries;
    }

    bool interfacesEnabled(const core::ApplianceConfig& cfg) {
      const auto boot = readBootConfig(cfg);
      return boot && hasMarker(*boot, cfg.interfaceGateMarker);
    }

    std::vector<std::string> groupsOf(io::CommandRunner& runner, const std::string& account) {
      std::vector<std::string> argv{ "id", "-nG" };
      if (!account.empty())
        argv.push_back(account);
      const auto result = runner.run(argv);
      std::vector<std::string> groups;
      if (!result.ok())
        return groups;
      std::istringstream words(result.output);
      for (std::string g; words >> g;)
        groups.push_back(g);
      return groups;
    }

    bool packageInstalled(io::CommandRunner& runner, const std::string& package) {
      const auto result = runner.run({ "dpkg-query", "-W", "-f=${Status}", package });
      return result.ok() && result.output.find("install ok installed") != std::string::npos;
    }

  } // namespace provisioning
} // namespace fieldkit
