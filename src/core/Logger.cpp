/* @file Logger.cpp
 * @brief spdlog-backed status logger with INFO/SUCCESS/WARNING/ERROR tags.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <string>

// Linux headers
#include <unistd.h> // isatty()

// spdlog headers
#include <spdlog/logger.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>

// fieldkit headers
#include "core/Logger.hpp"

using namespace fieldkit::core;

namespace {

  constexpr const char* kReset = "\033[0m";

  const char* colourFor(Status s) {
    switch (s) {
    case Status::Info:
      return "\033[0;34m";
    case Status::Success:
      return "\033[0;32m";
    case Status::Warning:
      return "\033[1;33m";
    case Status::Error:
      return "\033[0;31m";
    default:
      return kReset;
    }
  }

  spdlog::level::level_enum levelFor(Status s) {
    switch (s) {
    case Status::Warning:
      return spdlog::level::warn;
    case Status::Error:
      return spdlog::level::err;
    default:
      return spdlog::level::info;
    }
  }

} // namespace

Logger::Logger(spdlog::sink_ptr console, spdlog::sink_ptr audit, bool colour) : colour_{ colour } {
  console_ = std::make_shared<spdlog::logger>("fieldkit", std::move(console));
  console_->set_pattern("%v");
  console_->set_level(spdlog::level::trace);
  console_->flush_on(spdlog::level::trace);

  if (audit) {
    audit_ = std::make_shared<spdlog::logger>("fieldkit-audit", std::move(audit));
    audit_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] %v");
    audit_->set_level(spdlog::level::trace);
    audit_->flush_on(spdlog::level::info);
  }
}

Logger::~Logger() { flush(); }

std::unique_ptr<Logger> Logger::console(const std::string& auditPath) {
  spdlog::sink_ptr out = std::make_shared<spdlog::sinks::stdout_sink_mt>();
  spdlog::sink_ptr file;
  if (!auditPath.empty())
    file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(auditPath, false);
  return std::make_unique<Logger>(std::move(out), std::move(file), ::isatty(STDOUT_FILENO) == 1);
}

void Logger::status(Status s, std::string_view message) {
  const std::string tag = std::string("[") + toString(s) + "]";
  const std::string plain = tag + " " + std::string(message);
  if (!colour_) {
    emit(levelFor(s), plain, plain);
    return;
  }
  const std::string coloured = colourFor(s) + tag + kReset + " " + std::string(message);
  emit(levelFor(s), coloured, plain);
}

void Logger::line(std::string_view text) { emit(spdlog::level::info, text, text); }

void Logger::banner(std::string_view title, std::string_view subtitle) {
  static constexpr std::string_view kRule = "==========================================";
  line(kRule);
  line(std::string("    ") + std::string(title));
  if (!subtitle.empty())
    line(std::string("  ") + std::string(subtitle));
  line(kRule);
  line("");
}

void Logger::rule(std::string_view title) {
  if (!title.empty())
    line(title);
  line("==========================================");
}

void Logger::flush() {
  if (console_)
    console_->flush();
  if (audit_)
    audit_->flush();
}

void Logger::emit(spdlog::level::level_enum lvl, std::string_view coloured,
                  std::string_view plain) {
  console_->log(lvl, "{}", coloured);
  if (audit_)
    audit_->log(lvl, "{}", plain);
}
