#pragma once
#include <string>
#include <sstream>
#include <vector>
#include "application/ports/IConfigProvider.hpp"
#include "application/ports/ILogger.hpp"
#include "domain/Settings.hpp"

namespace hookline::proxy::application::services {

// Loads (or creates) the config file, brings up logging and logs what was read.
struct Bootstrap {
  ports::IConfigProvider& cfg;
  ports::ILogger&         log;

  static inline const char* b2s(bool b) { return b ? "true" : "false"; }

  static inline std::string join(const std::vector<std::string>& v, const char* sep) {
    std::ostringstream oss;
    for (size_t i = 0; i < v.size(); ++i) {
      if (i) oss << sep;
      oss << v[i];
    }
    return oss.str();
  }

  domain::Settings run(const std::string& configPath) {
    auto s = cfg.load_or_create(configPath);
    log.init(s);

    using ports::LogLevel;

    log.app(LogLevel::info, "hookline-proxy started");
    log.app(LogLevel::info, std::string("Config file: ") + s.configPath);

    if (!s.server.command.empty())
      log.app(LogLevel::info, "Server: " + s.server.command +
                              (s.server.args.empty() ? "" : " " + join(s.server.args, " ")));

    std::ostringstream flags;
    flags << "Console: " << b2s(s.showConsole)
          << " | saveLog: " << b2s(s.saveLog)
          << " | saveTrafficLog: " << b2s(s.saveTrafficLog)
          << " | logTraffic: " << b2s(s.proxy.logTraffic);
    log.app(LogLevel::info, flags.str());

    std::ostringstream timing;
    timing << "Pending timeout: " << s.proxy.pendingTimeoutMs << " ms"
           << " | shutdown grace: " << s.server.shutdownGraceMs << " ms";
    log.app(LogLevel::info, timing.str());

    if (!s.proxy.traceMethods.empty())
      log.app(LogLevel::info, "Tracing: " + join(s.proxy.traceMethods, ", "));

    return s;
  }
};

} // namespace hookline::proxy::application::services
