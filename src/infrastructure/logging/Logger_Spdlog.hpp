#pragma once
#include <spdlog/spdlog.h>

#include <memory>
#include <string>
#include <string_view>

#include "application/ports/ILogger.hpp"
#include "domain/Settings.hpp"

namespace hookline::proxy::infrastructure::logging
{

class Logger_Spdlog final : public hookline::proxy::application::ports::ILogger
{
 public:
  void init(const hookline::proxy::domain::Settings& s) override;

  void app(hookline::proxy::application::ports::LogLevel level, const std::string& msg) override;

  void wire(hookline::proxy::application::ports::LogLevel level, std::string_view msg) override;

  void set_level(hookline::proxy::application::ports::LogLevel level);

  void flush();

 private:
  std::shared_ptr<spdlog::logger> app_;
  std::shared_ptr<spdlog::logger> wire_;

  // Helpers
  static spdlog::level::level_enum map_level(hookline::proxy::application::ports::LogLevel l);
};

}  // namespace hookline::proxy::infrastructure::logging
