#pragma once
/** @file  HostProbe.hpp
 *  @brief Read-only probes of the host shared by the plans and the self-test.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <optional>
#include <string>
#include <vector>

namespace fieldkit {
  namespace core {
    struct ApplianceConfig;
  } // namespace core
  namespace io {
    class CommandRunner;
  } // namespace io

  namespace provisioning {

    struct ExecutionContext;

    /// @throws core::PreconditionError unless cpuinfo carries the host signature.
    void requireHostClass(ExecutionContext& ctx);

    /// Content of the first boot config that exists, or std::nullopt.
    std::optional<std::string> readBootConfig(const core::ApplianceConfig& cfg);

    /// True if an uncommented line of \p content contains \p marker.
    bool hasMarker(const std::string& content, const std::string& marker);

    /// Non-blank lines of a public key file, in file order.
    std::vector<std::string> keyEntries(const std::string& content);

    /// The reboot-gated interface marker is present (hardware tests may run).
    bool interfacesEnabled(const core::ApplianceConfig& cfg);

    /// Supplementary + primary groups of \p account (`id -nG`); empty account = caller.
    std::vector<std::string> groupsOf(io::CommandRunner& runner, const std::string& account = {});

    bool packageInstalled(io::CommandRunner& runner, const std::string& package);

  } // namespace provisioning
} // namespace fieldkit
