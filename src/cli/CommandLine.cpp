/* @file CommandLine.cpp
 * @brief Entrypoint flag parsing. One option at most, like the field scripts.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include "cli/CommandLine.hpp"

using fieldkit::provisioning::Mode;

namespace fieldkit {
  namespace cli {

    namespace {

      Invocation reject(const std::string& what) {
        Invocation inv;
        inv.mode = Mode::Help;
        inv.error = what;
        return inv;
      }

    } // namespace

    Invocation parseSetupArgs(const std::vector<std::string>& args) {
      if (args.empty())
        return {};
      if (args.size() > 1)
        return reject("Unexpected argument: " + args[1]);

      const auto& flag = args.front();
      Invocation inv;
      if (flag == "--verify")
        inv.mode = Mode::Verify;
      else if (flag == "--test-gpio")
        inv.mode = Mode::HardwareTest;
      else if (flag == "--restore")
        inv.mode = Mode::Restore;
      else if (flag == "--help" || flag == "-h")
        inv.mode = Mode::Help;
      else
        return reject("Unknown option: " + flag);
      return inv;
    }

    Invocation parsePlainArgs(const std::vector<std::string>& args) {
      if (args.empty())
        return {};
      if (args.size() == 1 && (args.front() == "--help" || args.front() == "-h")) {
        Invocation inv;
        inv.mode = Mode::Help;
        return inv;
      }
      return reject("Unknown option: " + args.front());
    }

    std::vector<std::string> toArgs(int argc, char** argv) {
      std::vector<std::string> args;
      for (int i = 1; i < argc; ++i)
        args.emplace_back(argv[i]);
      return args;
    }

  } // namespace cli
} // namespace fieldkit
