#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "application/ports/IByteStream.hpp"
#include "application/ports/IFrameCodec.hpp"
#include "application/ports/IHook.hpp"
#include "application/ports/ILogger.hpp"
#include "application/ports/IProcessSupervisor.hpp"
#include "application/services/HookRegistry.hpp"
#include "application/services/PendingRequestTable.hpp"
#include "application/services/ShutdownLatch.hpp"
#include "domain/Settings.hpp"

namespace hookline::proxy::application::services
{

struct SessionOutcome
{
  ShutdownReason reason{ShutdownReason::client_closed};
  std::optional<ports::ExitStatus> exit;
};

// Entry point: spawns the language server and shuttles traffic between it and
// the editor until either side goes away.
class Proxy
{
 public:
  Proxy(ports::IProcessSupervisor& supervisor, ports::IFrameCodec& codec, ports::ILogger& logger,
        const domain::Settings& s)
      : supervisor_(supervisor),
        codec_(codec),
        log_(logger),
        cfg_(s),
        pending_(std::chrono::milliseconds(s.proxy.pendingTimeoutMs))
  {
  }

  // Hooks are fixed once a session is running; throws std::logic_error then.
  void register_hook(const std::string& method, ports::HookPtr hook);

  // Blocks until the session ends. Throws ProxyError(ProcessSpawnFailure) before
  // any traffic flows, or rethrows the first fatal error of either loop.
  SessionOutcome spawn(const std::string& command, const std::vector<std::string>& args,
                       ports::IByteSource& client_reader, ports::IByteSink& client_writer);

  // Asks a running session to end. No-op when idle.
  void stop();

  const HookRegistry& hooks() const { return hooks_; }
  const PendingRequestTable& pending() const { return pending_; }

 private:
  class SessionSlot;

  ports::IProcessSupervisor& supervisor_;
  ports::IFrameCodec& codec_;
  ports::ILogger& log_;
  const domain::Settings& cfg_;

  HookRegistry hooks_;
  PendingRequestTable pending_;

  std::mutex mu_;
  std::shared_ptr<ShutdownLatch> active_;
};

}  // namespace hookline::proxy::application::services
