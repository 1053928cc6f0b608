/* @file Errors.cpp
 * @brief CommandError message formatting.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <string>

// fieldkit headers
#include "core/Errors.hpp"

using namespace fieldkit::core;

namespace {

  std::string describe(const std::vector<std::string>& argv, int exitCode) {
    std::string cmd;
    for (const auto& arg : argv) {
      if (!cmd.empty())
        cmd += ' ';
      cmd += arg;
    }
    if (exitCode == 127)
      return "'" + cmd + "' could not be executed";
    return "'" + cmd + "' exited with status " + std::to_string(exitCode);
  }

} // namespace

CommandError::CommandError(std::vector<std::string> argv, int exitCode, std::string output)
    : ProvisioningError(ErrorKind::Command, describe(argv, exitCode)), argv_{ std::move(argv) },
      exitCode_{ exitCode }, output_{ std::move(output) } {}
