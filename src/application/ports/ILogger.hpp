#pragma once

#include <string>
#include <string_view>

#include "domain/Settings.hpp"

namespace hookline::proxy::application::ports
{

enum class LogLevel
{
  trace,
  debug,
  info,
  warn,
  err,
  critical,
  off
};

// Two channels: "app" for lifecycle and anomalies, "wire" for per-message traffic.
struct ILogger
{
  virtual ~ILogger() = default;
  virtual void init(const hookline::proxy::domain::Settings& s) = 0;
  virtual void app(LogLevel level, const std::string& msg) = 0;
  virtual void wire(LogLevel level, std::string_view msg) = 0;
};

}  // namespace hookline::proxy::application::ports
