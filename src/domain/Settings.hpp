#pragma once

#include <string>
#include <vector>

namespace hookline::proxy::domain
{

struct Settings
{
  struct Server
  {
    std::string command;
    std::vector<std::string> args;
    int shutdownGraceMs{3000};
  } server;

  struct Proxy
  {
    int pendingTimeoutMs{300000};  // 0 = never evict
    bool logTraffic{false};
    std::vector<std::string> traceMethods;
  } proxy;

  // Console / Logs
  bool showConsole{false};
  bool saveLog{true};
  bool saveTrafficLog{true};
  std::string logsDir{"logs"};
  std::string appLogFilename{"proxy_app.log"};
  std::string trafficLogFilename{"proxy_traffic.log"};
  std::string configPath{"hookline-proxy.toml"};
};

}  // namespace hookline::proxy::domain
