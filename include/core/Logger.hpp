#pragma once
/** @file  Logger.hpp
 *  @brief Operator-facing status logger (console + optional audit file).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <memory>
#include <string>
#include <string_view>

#include <spdlog/common.h>

namespace spdlog {
  class logger;
} // namespace spdlog

namespace fieldkit {
  namespace core {

    enum class Status { Info, Success, Warning, Error };

    inline const char* toString(Status s) {
      switch (s) {
      case Status::Info:
        return "INFO";
      case Status::Success:
        return "SUCCESS";
      case Status::Warning:
        return "WARNING";
      case Status::Error:
        return "ERROR";
      default:
        return "UNKNOWN";
      }
    }

    /**
 * @class Logger
 * @brief Prints `[TAG] message` lines through spdlog.
 *
 *  * Console sink carries the bare message (pattern `%v`); the tag is coloured
 *    only when `colour` is set (TTY).
 *  * Audit sink, when present, gets a timestamped uncoloured copy of every line.
 *  * Safe to use from a forked child: sinks are plain fd writers.
 */
    class Logger {

    public:
      Logger(spdlog::sink_ptr console, spdlog::sink_ptr audit = nullptr, bool colour = false);
      ~Logger();

      /// Stdout logger; colour follows isatty(stdout). Empty path = no audit file.
      static std::unique_ptr<Logger> console(const std::string& auditPath = {});

      // --- public API ---
      void status(Status s, std::string_view message);
      void info(std::string_view message) { status(Status::Info, message); }
      void success(std::string_view message) { status(Status::Success, message); }
      void warning(std::string_view message) { status(Status::Warning, message); }
      void error(std::string_view message) { status(Status::Error, message); }

      void line(std::string_view text); ///< untagged narration
      void banner(std::string_view title, std::string_view subtitle = {});
      void rule(std::string_view title = {}); ///< `title` followed by a ==== separator

      void flush();

      Logger(const Logger&) = delete;
      Logger& operator=(const Logger&) = delete;

    private:
      void emit(spdlog::level::level_enum lvl, std::string_view coloured, std::string_view plain);

      std::shared_ptr<spdlog::logger> console_;
      std::shared_ptr<spdlog::logger> audit_;
      bool colour_{ false };
    };

  } // namespace core
} // namespace fieldkit
