#pragma once
/** @file  MockCommandRunner.hpp
 *  @brief gmock CommandRunner for exact command-sequence expectations.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>
#include <vector>

#include <gmock/gmock.h>

#include "io/CommandRunner.hpp"

namespace fieldkit {
  namespace test {

    class MockCommandRunner : public io::CommandRunner {
    public:
      MOCK_METHOD(io::CommandResult, run,
                  (const std::vector<std::string>& argv, const std::string& input), (override));
      MOCK_METHOD(bool, hasProgram, (const std::string& program), (override));
    };

    using Argv = std::vector<std::string>;

  } // namespace test
} // namespace fieldkit
