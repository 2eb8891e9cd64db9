#include <unistd.h>

#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "adapters/inbound/cli/Session.hpp"
#include "adapters/inbound/cli/SignalWatcher.hpp"
#include "application/hooks/TraceHook.hpp"
#include "application/services/Bootstrap.hpp"
#include "application/services/Proxy.hpp"
#include "infrastructure/codec/FrameCodec_ContentLength.hpp"
#include "infrastructure/config/Config_Toml.hpp"
#include "infrastructure/logging/Logger_Spdlog.hpp"
#include "infrastructure/process/ProcessSupervisor_Boost.hpp"
#include "infrastructure/stream/FdStream_Asio.hpp"

namespace app_srv = hookline::proxy::application::services;
namespace infra = hookline::proxy::infrastructure;
namespace cli = hookline::proxy::adapters::cli;
using hookline::proxy::application::ports::LogLevel;

static void usage(std::ostream& os)
{
  os << "usage: hookline-proxy [--config <file>] [-- <server-command> [args...]]\n"
        "  Speaks LSP on stdin/stdout and forwards to the spawned language server.\n"
        "  Without '--', [server].command from the config file is used.\n";
}

static int run(int argc, char** argv)
{
  std::string configPath{"hookline-proxy.toml"};
  std::vector<std::string> command;

  for (int i = 1; i < argc; ++i)
  {
    const std::string a = argv[i];
    if (a == "--config" && i + 1 < argc)
    {
      configPath = argv[++i];
    }
    else if (a == "--")
    {
      command.assign(argv + i + 1, argv + argc);
      break;
    }
    else if (a == "-h" || a == "--help")
    {
      usage(std::cout);
      return 0;
    }
    else
    {
      std::cerr << "hookline-proxy: unknown argument '" << a << "'\n";
      usage(std::cerr);
      return 2;
    }
  }

  infra::config::Config_Toml cfg_impl;
  infra::logging::Logger_Spdlog log_impl;

  app_srv::Bootstrap boot{cfg_impl, log_impl};
  auto settings = boot.run(configPath);

  if (!command.empty())
  {
    settings.server.command = command.front();
    settings.server.args.assign(command.begin() + 1, command.end());
  }
  if (settings.server.command.empty())
  {
    std::cerr << "hookline-proxy: no language server command (set [server].command in "
              << configPath << " or pass it after '--')\n";
    return 2;
  }

  infra::process::ProcessSupervisor_Boost supervisor{log_impl};
  infra::codec::FrameCodec_ContentLength codec;
  app_srv::Proxy proxy{supervisor, codec, log_impl, settings};

  if (!settings.proxy.traceMethods.empty())
  {
    auto trace = std::make_shared<hookline::proxy::application::hooks::TraceHook>();
    for (const auto& m : settings.proxy.traceMethods) proxy.register_hook(m, trace);
  }

  infra::stream::FdReader_Asio client_in{STDIN_FILENO, infra::stream::FdOwnership::borrowed,
                                         log_impl, "client stdin"};
  infra::stream::FdWriter_Asio client_out{STDOUT_FILENO, infra::stream::FdOwnership::borrowed,
                                          log_impl, "client stdout"};

  int rc = 0;
  {
    // SIGINT / SIGTERM end the session cleanly
    cli::SignalWatcher signals(
        [&](int signo)
        {
          log_impl.app(LogLevel::info, "Signal " + std::to_string(signo) + " received; stopping");
          proxy.stop();
        });
    rc = cli::run_session(proxy, settings, client_in, client_out, log_impl, std::cerr);
  }
  log_impl.flush();
  return rc;
}

int main(int argc, char** argv)
{
  try
  {
    return run(argc, argv);
  }
  catch (const std::exception& e)
  {
    std::cerr << "hookline-proxy: " << e.what() << "\n";
    return 1;
  }
}
