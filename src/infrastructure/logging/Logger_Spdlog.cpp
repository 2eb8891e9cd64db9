#include "infrastructure/logging/Logger_Spdlog.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/async.h>
#include <spdlog/async_logger.h>

#include <boost/filesystem.hpp>
#include <vector>
#include <chrono>

namespace fs = boost::filesystem;
using hookline::proxy::application::ports::LogLevel;

namespace hookline::proxy::infrastructure::logging {

// -------------------------------------------------------------------------------------------------
// map_level
//  - Converts our app-level enum (ports::LogLevel) to spdlog's native level enum.
// -------------------------------------------------------------------------------------------------
spdlog::level::level_enum Logger_Spdlog::map_level(LogLevel l) {
  switch (l) {
    case LogLevel::trace:    return spdlog::level::trace;
    case LogLevel::debug:    return spdlog::level::debug;
    case LogLevel::info:     return spdlog::level::info;
    case LogLevel::warn:     return spdlog::level::warn;
    case LogLevel::err:      return spdlog::level::err;
    case LogLevel::critical: return spdlog::level::critical;
    case LogLevel::off:      return spdlog::level::off;
  }
  return spdlog::level::info;
}

// -------------------------------------------------------------------------------------------------
// configure_console_colors_
//  - Per-level colors on the console sink only (ANSI escapes).
// -------------------------------------------------------------------------------------------------
static void configure_console_colors_(const std::shared_ptr<spdlog::sinks::ansicolor_stderr_sink_mt>& sink) {
  const std::string BGRAY   = "\x1b[90m"; // bright black (gray)
  const std::string CYAN    = "\x1b[36m";
  const std::string GREEN   = "\x1b[32m";
  const std::string YELLOW  = "\x1b[33m";
  const std::string RED     = "\x1b[31m";
  const std::string MAGENTA = "\x1b[35m";

  sink->set_color(spdlog::level::trace,    BGRAY);
  sink->set_color(spdlog::level::debug,    CYAN);
  sink->set_color(spdlog::level::info,     GREEN);
  sink->set_color(spdlog::level::warn,     YELLOW);
  sink->set_color(spdlog::level::err,      RED);
  sink->set_color(spdlog::level::critical, MAGENTA);
}

// -------------------------------------------------------------------------------------------------
// init(settings)
//  - Rotating file sinks for the "app" and "wire" channels, each optional (saveLog /
//    saveTrafficLog).
//  - Optional colored console sink if settings.showConsole is true. It writes to stderr:
//    stdout belongs to the protocol.
//  - Async loggers so the forwarding threads never wait on disk.
// -------------------------------------------------------------------------------------------------
void Logger_Spdlog::init(const hookline::proxy::domain::Settings& s) {
  const fs::path dir      = s.logsDir.empty() ? fs::path{"logs"} : fs::path{s.logsDir};
  const fs::path appPath  = dir / (s.appLogFilename.empty()     ? "proxy_app.log"     : s.appLogFilename);
  const fs::path wirePath = dir / (s.trafficLogFilename.empty() ? "proxy_traffic.log" : s.trafficLogFilename);

  if (s.saveLog || s.saveTrafficLog) {
    boost::system::error_code ec;
    fs::create_directories(dir, ec);
  }

  // Re-init safety: drop old named loggers if they exist
  if (auto prev = spdlog::get("app"))  spdlog::drop(prev->name());
  if (auto prev = spdlog::get("wire")) spdlog::drop(prev->name());
  app_.reset();
  wire_.reset();

  std::vector<spdlog::sink_ptr> app_sinks;
  std::vector<spdlog::sink_ptr> wire_sinks;

  // File sinks, no colors
  if (s.saveLog) {
    auto app_file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(appPath.string(), 5 * 1024 * 1024, 3);
    app_file->set_level(spdlog::level::trace);
    app_sinks.push_back(app_file);
  }
  if (s.saveTrafficLog) {
    auto wire_file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(wirePath.string(), 5 * 1024 * 1024, 3);
    wire_file->set_level(spdlog::level::trace);
    wire_sinks.push_back(wire_file);
  }

  // Optional console sink, colored by level
  if (s.showConsole) {
    auto console_sink = std::make_shared<spdlog::sinks::ansicolor_stderr_sink_mt>();
    configure_console_colors_(console_sink);
    console_sink->set_level(spdlog::level::debug); // tune console verbosity
    app_sinks.push_back(console_sink);
    wire_sinks.push_back(console_sink);
  }

  // Async logging: the router threads only enqueue
  const size_t qsize   = 8192;
  const size_t workers = 1;

  if (!spdlog::thread_pool()) spdlog::init_thread_pool(qsize, workers);
  app_  = std::make_shared<spdlog::async_logger>("app",  app_sinks.begin(),  app_sinks.end(),
             spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  wire_ = std::make_shared<spdlog::async_logger>("wire", wire_sinks.begin(), wire_sinks.end(),
             spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::register_logger(app_);
  spdlog::register_logger(wire_);

  // Unified pattern: ONLY console renders colors between %^ and %$.
  const char* pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] %^[%l]%$ %v";
  app_->set_pattern(pattern);
  wire_->set_pattern(pattern);

  app_->set_level(spdlog::level::trace);
  wire_->set_level(spdlog::level::trace);

  // Flush policy
  app_->flush_on(spdlog::level::err);
  wire_->flush_on(spdlog::level::err);
  spdlog::flush_every(std::chrono::seconds(2));
}

// -------------------------------------------------------------------------------------------------
// app(level, msg)
//  - Lifecycle, anomalies and failures.
// -------------------------------------------------------------------------------------------------
void Logger_Spdlog::app(LogLevel level, const std::string& msg) {
  if (app_) app_->log(map_level(level), msg);
}

// -------------------------------------------------------------------------------------------------
// wire(level, msg)
//  - Per-message traffic.
// -------------------------------------------------------------------------------------------------
void Logger_Spdlog::wire(LogLevel level, std::string_view msg) {
  if (wire_) wire_->log(map_level(level), msg);
}

// -------------------------------------------------------------------------------------------------
// set_level(level)
//  - Adjusts the level of both loggers at runtime (trace/debug/info/...).
// -------------------------------------------------------------------------------------------------
void Logger_Spdlog::set_level(LogLevel level) {
  auto lv = map_level(level);
  if (app_)  app_->set_level(lv);
  if (wire_) wire_->set_level(lv);
}

void Logger_Spdlog::flush() {
  if (app_)  app_->flush();
  if (wire_) wire_->flush();
}

} // namespace hookline::proxy::infrastructure::logging
