#pragma once

#include <ostream>

#include "application/ports/IByteStream.hpp"
#include "application/ports/ILogger.hpp"
#include "application/services/Proxy.hpp"
#include "domain/Settings.hpp"

namespace hookline::proxy::adapters::cli
{

// Process exit code for a finished session: the server's own code, 128 + signal
// when it was killed, 0 when no status was collected.
int exit_code(const application::services::SessionOutcome& outcome);

// Runs one session over the given editor streams. Any exception escaping the
// proxy is logged, echoed to `err` and mapped to exit code 1.
int run_session(application::services::Proxy& proxy, const domain::Settings& settings,
                application::ports::IByteSource& client_in, application::ports::IByteSink& client_out,
                application::ports::ILogger& log, std::ostream& err);

}  // namespace hookline::proxy::adapters::cli
