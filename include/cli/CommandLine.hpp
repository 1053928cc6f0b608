#pragma once
/** @file  CommandLine.hpp
 *  @brief Flag parsing for the three entrypoints.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>
#include <vector>

#include "provisioning/Types.hpp"

namespace fieldkit {
  namespace cli {

    struct Invocation {
      provisioning::Mode mode{ provisioning::Mode::Apply };
      std::string error; ///< non-empty = reject with exit code 1
    };

    /// Elevated entrypoint: none | --verify | --test-gpio | --restore | --help | -h.
    Invocation parseSetupArgs(const std::vector<std::string>& args);

    /// Entrypoints without options: none | --help | -h.
    Invocation parsePlainArgs(const std::vector<std::string>& args);

    std::vector<std::string> toArgs(int argc, char** argv);

  } // namespace cli
} // namespace fieldkit
