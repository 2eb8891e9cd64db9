#include <gtest/gtest.h>

#include <boost/filesystem.hpp>

#include "application/ports/ILogger.hpp"
#include "domain/Settings.hpp"
#include "infrastructure/logging/Logger_Spdlog.hpp"

using hookline::proxy::application::ports::LogLevel;
using hookline::proxy::domain::Settings;
using hookline::proxy::infrastructure::logging::Logger_Spdlog;
namespace fs = boost::filesystem;

static fs::path tmp_dir(const std::string& name)
{
  auto dir = fs::temp_directory_path() / ("hookline-proxy-logs-" + name);
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

TEST(LoggerSpdlog, CreatesFilesAndIsIdempotent) {
  Settings s;
  auto dir = tmp_dir("smoke");
  s.logsDir = dir.string();
  s.appLogFilename = "app.log";
  s.trafficLogFilename = "traffic.log";
  s.showConsole = false;
  s.saveLog = true;
  s.saveTrafficLog = true;

  Logger_Spdlog log;
  EXPECT_NO_THROW(log.init(s));
  EXPECT_NO_THROW(log.app(LogLevel::info, "hello app"));
  EXPECT_NO_THROW(log.wire(LogLevel::trace, "C->S {\"jsonrpc\":\"2.0\"}"));
  log.flush();

  EXPECT_TRUE(fs::exists(dir / "app.log"));
  EXPECT_TRUE(fs::exists(dir / "traffic.log"));

  EXPECT_NO_THROW(log.init(s));
}

TEST(LoggerSpdlog, DisabledFilesAreNotCreated) {
  Settings s;
  auto dir = tmp_dir("off");
  s.logsDir = dir.string();
  s.appLogFilename = "app.log";
  s.trafficLogFilename = "traffic.log";
  s.showConsole = false;
  s.saveLog = true;
  s.saveTrafficLog = false;

  Logger_Spdlog log;
  log.init(s);
  log.wire(LogLevel::info, "dropped");
  log.set_level(LogLevel::warn);
  log.app(LogLevel::warn, "kept");
  log.flush();

  EXPECT_TRUE(fs::exists(dir / "app.log"));
  EXPECT_FALSE(fs::exists(dir / "traffic.log"));
}

TEST(LoggerSpdlog, LoggingBeforeInitIsANoOp) {
  Logger_Spdlog log;
  EXPECT_NO_THROW(log.app(LogLevel::err, "nobody listens"));
  EXPECT_NO_THROW(log.flush());
}
