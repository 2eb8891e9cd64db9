#include "infrastructure/config/Config_Toml.hpp"

#include <boost/filesystem/operations.hpp>
#include <boost/filesystem/path.hpp>
#include <cstdint>
#include <exception>
#include <fstream>
#include <limits>
#include <sstream>
#include <toml++/toml.hpp>
#include <vector>

using hookline::proxy::domain::Settings;
namespace fs = boost::filesystem;

namespace hookline::proxy::infrastructure::config
{

namespace
{
constexpr const char* kDefaultLogsDir = "logs";
constexpr const char* kDefaultAppLog = "proxy_app.log";
constexpr const char* kDefaultTrafficLog = "proxy_traffic.log";
constexpr int kDefaultPendingTimeoutMs = 300000;
constexpr int kDefaultShutdownGraceMs = 3000;

static std::string quote_list(const std::vector<std::string>& v)
{
  std::ostringstream oss;
  for (size_t i = 0; i < v.size(); ++i)
  {
    if (i) oss << ", ";
    oss << '"' << v[i] << '"';
  }
  return oss.str();
}

static std::vector<std::string> read_strings(const toml::array* arr)
{
  std::vector<std::string> out;
  if (!arr) return out;
  for (auto& e : *arr)
  {
    if (auto s = e.value<std::string>()) out.push_back(*s);
  }
  return out;
}

static int clamp_ms(int64_t v)
{
  if (v < 0) return 0;
  if (v > std::numeric_limits<int>::max()) return std::numeric_limits<int>::max();
  return static_cast<int>(v);
}
}  // namespace

void Config_Toml::write_default(const fs::path& path, Settings& s)
{
  if (path.has_parent_path()) fs::create_directories(path.parent_path());
  std::ofstream out(path.string());

  // Header
  out << "# hookline-proxy.toml - auto-generated initial configuration\n"
         "# Edit as needed and restart the proxy\n\n";

  // [server]
  out << "[server]\n";
  out << "# Language server to spawn; overridden by arguments after '--'\n";
  out << "command         = \"" << s.server.command << "\"\n";
  out << "args            = [" << quote_list(s.server.args) << "]\n";
  out << "shutdownGraceMs = " << kDefaultShutdownGraceMs << "\n\n";

  // [proxy]
  out << "[proxy]\n";
  out << "# Pending requests older than this are forgotten (0 = keep until answered)\n";
  out << "pendingTimeoutMs = " << kDefaultPendingTimeoutMs << "\n";
  out << "logTraffic       = false\n";
  out << "# Methods that get window/logMessage notifications with round-trip timings\n";
  out << "traceMethods     = []\n\n";

  // [logging]
  out << "[logging]\n";
  out << "showConsole        = " << (s.showConsole ? "true" : "false") << "\n";
  out << "saveLog            = " << (s.saveLog ? "true" : "false") << "\n";
  out << "saveTrafficLog     = " << (s.saveTrafficLog ? "true" : "false") << "\n";
  out << "logsDir            = \"" << kDefaultLogsDir << "\"\n";
  out << "appLogFilename     = \"" << kDefaultAppLog << "\"\n";
  out << "trafficLogFilename = \"" << kDefaultTrafficLog << "\"\n";

  out.close();

  // mirror defaults back to Settings
  s.server.shutdownGraceMs = kDefaultShutdownGraceMs;
  s.proxy.pendingTimeoutMs = kDefaultPendingTimeoutMs;
  s.logsDir = kDefaultLogsDir;
  s.appLogFilename = kDefaultAppLog;
  s.trafficLogFilename = kDefaultTrafficLog;
}

Settings Config_Toml::load_or_create(const std::string& configPath)
{
  Settings s;
  s.configPath = configPath;
  const fs::path path{configPath};

  if (!fs::exists(path))
  {
    write_default(path, s);
    return s;
  }

  toml::table tbl;
  try
  {
    tbl = toml::parse_file(path.string());
  }
  catch (const std::exception&)
  {
    // if parsing fails, recreate with defaults
    write_default(path, s);
    return s;
  }

  // ---------------------------
  // [server]
  // ---------------------------
  if (auto srv = tbl["server"].as_table())
  {
    if (auto v = (*srv)["command"].value<std::string>()) s.server.command = *v;
    if (auto arr = (*srv)["args"].as_array()) s.server.args = read_strings(arr);
    if (auto v = (*srv)["shutdownGraceMs"].value<int64_t>()) s.server.shutdownGraceMs = clamp_ms(*v);
  }

  // ---------------------------
  // [proxy]
  // ---------------------------
  if (auto px = tbl["proxy"].as_table())
  {
    if (auto v = (*px)["pendingTimeoutMs"].value<int64_t>()) s.proxy.pendingTimeoutMs = clamp_ms(*v);
    if (auto v = (*px)["logTraffic"].value<bool>()) s.proxy.logTraffic = *v;
    if (auto arr = (*px)["traceMethods"].as_array()) s.proxy.traceMethods = read_strings(arr);
  }

  // ---------------------------
  // [logging]
  // ---------------------------
  if (auto log = tbl["logging"].as_table())
  {
    if (auto v = (*log)["showConsole"].value<bool>()) s.showConsole = *v;
    if (auto v = (*log)["saveLog"].value<bool>()) s.saveLog = *v;
    if (auto v = (*log)["saveTrafficLog"].value<bool>()) s.saveTrafficLog = *v;
    if (auto v = (*log)["logsDir"].value<std::string>()) s.logsDir = *v;
    if (auto v = (*log)["appLogFilename"].value<std::string>()) s.appLogFilename = *v;
    if (auto v = (*log)["trafficLogFilename"].value<std::string>()) s.trafficLogFilename = *v;
  }

  if (s.logsDir.empty()) s.logsDir = kDefaultLogsDir;
  if (s.appLogFilename.empty()) s.appLogFilename = kDefaultAppLog;
  if (s.trafficLogFilename.empty()) s.trafficLogFilename = kDefaultTrafficLog;

  return s;
}

}  // namespace hookline::proxy::infrastructure::config
