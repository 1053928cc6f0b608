#pragma once
/** @file  CapturedLog.hpp
 *  @brief core::Logger writing into a string buffer for assertions on narration.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <memory>
#include <sstream>
#include <string>

#include <spdlog/sinks/ostream_sink.h>

#include "core/Logger.hpp"

namespace fieldkit {
  namespace test {

    /**
 * @class CapturedLog
 * @brief Owns the buffer and the logger; `out` must outlive `log` (declaration order).
 */
    class CapturedLog {
    public:
      CapturedLog() : log{ std::make_shared<spdlog::sinks::ostream_sink_mt>(out_, true) } {}

      std::string text() const { return out_.str(); }
      bool contains(const std::string& needle) const {
        return out_.str().find(needle) != std::string::npos;
      }

    private:
      std::ostringstream out_;

    public:
      core::Logger log;
    };

  } // namespace test
} // namespace fieldkit
