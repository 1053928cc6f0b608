/* @file ExecutionContext.cpp
 * @brief Path helpers and process-derived construction of ExecutionContext.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <filesystem>
#include <stdexcept>

// POSIX headers
#include <pwd.h>
#include <unistd.h>

// fieldkit headers
#include "core/ApplianceConfig.hpp"
#include "provisioning/ExecutionContext.hpp"

using namespace fieldkit::provisioning;

namespace {

  std::string joinUnder(const std::string& base, const std::string& rel) {
    if (rel.empty())
      return base;
    if (rel.front() == '/' || base.empty())
      return rel;
    return (std::filesystem::path(base) / rel).string();
  }

} // namespace

ExecutionContext::ExecutionContext(const core::ApplianceConfig& cfg, io::CommandRunner& cmd,
                                   core::Logger& logger)
    : config{ cfg }, runner{ cmd }, log{ logger }, homeDirectory{ cfg.homeDirectory } {}

TransactionalConfigWriter& ExecutionContext::grants() const {
  if (!grantWriter)
    throw std::logic_error("[ExecutionContext] no privilege-grant writer in this phase");
  return *grantWriter;
}

ServiceLifecycleManager& ExecutionContext::service() const {
  if (!serviceManager)
    throw std::logic_error("[ExecutionContext] no service manager in this phase");
  return *serviceManager;
}

HardwareTestHarness& ExecutionContext::hardware() const {
  if (!harness)
    throw std::logic_error("[ExecutionContext] no hardware harness in this phase");
  return *harness;
}

std::string ExecutionContext::homePath(const std::string& rel) const {
  return joinUnder(homeDirectory, rel);
}

std::string ExecutionContext::workPath(const std::string& rel) const {
  return joinUnder(workingDirectory, rel);
}

std::string ExecutionContext::expand(const std::string& text) const {
  return config.expand(text, homeDirectory);
}

ExecutionContext ExecutionContext::fromProcess(const core::ApplianceConfig& cfg,
                                               io::CommandRunner& cmd, core::Logger& logger) {
  ExecutionContext ctx{ cfg, cmd, logger };
  ctx.effectiveUid = ::geteuid();
  if (const passwd* pw = ::getpwuid(ctx.effectiveUid))
    ctx.userName = pw->pw_name;
  else
    ctx.userName = std::to_string(ctx.effectiveUid);

  std::error_code ec;
  const auto cwd = std::filesystem::current_path(ec);
  ctx.workingDirectory = ec ? std::string{ "." } : cwd.string();
  return ctx;
}
