#include "infrastructure/config/Config_Toml.hpp"
#include "domain/Settings.hpp"
#include <filesystem>
#include <gtest/gtest.h>
#include <fstream>
#include <limits>
#include <sstream>

using hookline::proxy::infrastructure::config::Config_Toml;
using hookline::proxy::domain::Settings;
namespace fs = std::filesystem;

static fs::path tmp_file(const std::string& name) {
  auto dir = fs::temp_directory_path() / "hookline-proxy-tests";
  fs::create_directories(dir);
  return dir / name;
}

TEST(ConfigToml, CreatesWithDefaultsWhenMissing) {
  auto cfg = tmp_file("missing.toml");
  if (fs::exists(cfg)) fs::remove(cfg);

  Config_Toml impl;
  Settings s = impl.load_or_create(cfg.string());

  EXPECT_TRUE(fs::exists(cfg));
  EXPECT_TRUE(s.server.command.empty());
  EXPECT_EQ(s.server.shutdownGraceMs, 3000);
  EXPECT_EQ(s.proxy.pendingTimeoutMs, 300000);
  EXPECT_FALSE(s.proxy.logTraffic);
  EXPECT_FALSE(s.appLogFilename.empty());
  EXPECT_FALSE(s.trafficLogFilename.empty());
  EXPECT_FALSE(s.logsDir.empty());
  EXPECT_EQ(s.configPath, cfg.string());

  // The generated file must read back to the same values.
  Settings again = impl.load_or_create(cfg.string());
  EXPECT_EQ(again.proxy.pendingTimeoutMs, s.proxy.pendingTimeoutMs);
  EXPECT_EQ(again.logsDir, s.logsDir);
}

TEST(ConfigToml, ReadsCustomValues) {
  auto cfg = tmp_file("custom.toml");
  {
    std::ofstream out(cfg.string());
    out << "[server]\ncommand=\"clangd\"\nargs=[\"--background-index\",\"-j=4\"]\nshutdownGraceMs=500\n"
           "\n[proxy]\npendingTimeoutMs=0\nlogTraffic=true\ntraceMethods=[\"textDocument/hover\"]\n"
           "\n[logging]\nshowConsole=true\nsaveLog=false\nsaveTrafficLog=false\n"
           "logsDir=\"logs-x\"\nappLogFilename=\"a.log\"\ntrafficLogFilename=\"t.log\"\n";
  }

  Config_Toml impl;
  Settings s = impl.load_or_create(cfg.string());

  EXPECT_EQ(s.server.command, "clangd");
  ASSERT_EQ(s.server.args.size(), 2u);
  EXPECT_EQ(s.server.args[0], "--background-index");
  EXPECT_EQ(s.server.args[1], "-j=4");
  EXPECT_EQ(s.server.shutdownGraceMs, 500);
  EXPECT_EQ(s.proxy.pendingTimeoutMs, 0);
  EXPECT_TRUE(s.proxy.logTraffic);
  ASSERT_EQ(s.proxy.traceMethods.size(), 1u);
  EXPECT_EQ(s.proxy.traceMethods[0], "textDocument/hover");
  EXPECT_TRUE(s.showConsole);
  EXPECT_FALSE(s.saveLog);
  EXPECT_FALSE(s.saveTrafficLog);
  EXPECT_EQ(s.logsDir, "logs-x");
  EXPECT_EQ(s.appLogFilename, "a.log");
  EXPECT_EQ(s.trafficLogFilename, "t.log");
}

TEST(ConfigToml, FallbackWhenSectionMissing) {
  auto cfg = tmp_file("no-logging.toml");
  {
    std::ofstream out(cfg.string());
    out << "[server]\ncommand=\"pylsp\"\n";
  }

  Config_Toml impl;
  Settings s = impl.load_or_create(cfg.string());

  EXPECT_EQ(s.server.command, "pylsp");
  EXPECT_TRUE(s.server.args.empty());
  EXPECT_FALSE(s.logsDir.empty());
  EXPECT_FALSE(s.appLogFilename.empty());
  EXPECT_FALSE(s.trafficLogFilename.empty());
}

TEST(ConfigToml, NegativeDurationsClampToZero) {
  auto cfg = tmp_file("negative.toml");
  {
    std::ofstream out(cfg.string());
    out << "[server]\nshutdownGraceMs=-5\n[proxy]\npendingTimeoutMs=-1\n";
  }

  Config_Toml impl;
  Settings s = impl.load_or_create(cfg.string());
  EXPECT_EQ(s.server.shutdownGraceMs, 0);
  EXPECT_EQ(s.proxy.pendingTimeoutMs, 0);
}

TEST(ConfigToml, HugeDurationsClampToIntMax) {
  auto cfg = tmp_file("huge.toml");
  {
    std::ofstream out(cfg.string());
    out << "[server]\nshutdownGraceMs=99999999999\n[proxy]\npendingTimeoutMs=4294967296\n";
  }

  Config_Toml impl;
  Settings s = impl.load_or_create(cfg.string());
  EXPECT_EQ(s.server.shutdownGraceMs, std::numeric_limits<int>::max());
  EXPECT_EQ(s.proxy.pendingTimeoutMs, std::numeric_limits<int>::max());
}

TEST(ConfigToml, UnparsableFileIsRecreated) {
  auto cfg = tmp_file("broken.toml");
  {
    std::ofstream out(cfg.string());
    out << "[server\ncommand = = \n";
  }

  Config_Toml impl;
  Settings s = impl.load_or_create(cfg.string());
  EXPECT_EQ(s.proxy.pendingTimeoutMs, 300000);

  std::ifstream in(cfg.string());
  std::stringstream body;
  body << in.rdbuf();
  EXPECT_NE(body.str().find("[proxy]"), std::string::npos);
}
