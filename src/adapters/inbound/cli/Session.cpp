#include "adapters/inbound/cli/Session.hpp"

#include <exception>
#include <string>

#include "domain/ProxyError.hpp"

using hookline::proxy::application::ports::LogLevel;

namespace hookline::proxy::adapters::cli
{

int exit_code(const application::services::SessionOutcome& outcome)
{
  if (!outcome.exit) return 0;
  return outcome.exit->signaled ? 128 + outcome.exit->code : outcome.exit->code;
}

int run_session(application::services::Proxy& proxy, const domain::Settings& settings,
                application::ports::IByteSource& client_in, application::ports::IByteSink& client_out,
                application::ports::ILogger& log, std::ostream& err)
{
  try
  {
    return exit_code(proxy.spawn(settings.server.command, settings.server.args, client_in, client_out));
  }
  catch (const domain::ProxyError& e)
  {
    log.app(LogLevel::critical, e.what());
    err << "hookline-proxy: " << e.what() << "\n";
  }
  catch (const std::exception& e)
  {
    log.app(LogLevel::critical, std::string("Unexpected error: ") + e.what());
    err << "hookline-proxy: unexpected error: " << e.what() << "\n";
  }
  return 1;
}

}  // namespace hookline::proxy::adapters::cli
