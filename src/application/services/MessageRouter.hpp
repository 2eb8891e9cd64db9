#pragma once

#include <string>
#include <vector>

#include "application/ports/IHook.hpp"
#include "application/ports/ILogger.hpp"
#include "application/ports/IMessageStream.hpp"
#include "application/services/HookRegistry.hpp"
#include "application/services/PendingRequestTable.hpp"
#include "domain/protocol/Message.hpp"

namespace hookline::proxy::application::services
{

// The two forwarding loops. Each pump handles its source strictly in arrival
// order and forwards only after the hook has returned, so a slow hook throttles
// its own direction and nothing else. The pending table is the only state the
// two pumps share.
class MessageRouter
{
 public:
  enum class LoopExit
  {
    source_closed,
    destination_closed
  };

  MessageRouter(const HookRegistry& hooks, PendingRequestTable& pending, ports::ILogger& log,
                bool log_traffic = false)
      : hooks_(hooks), pending_(pending), log_(log), log_traffic_(log_traffic)
  {
  }

  // Editor -> server. `client_out` receives hook notifications and synthesized
  // error responses. Throws ProxyError(MalformedMessage).
  LoopExit pump_client_to_server(ports::IMessageSource& client_in, ports::IMessageSink& server_out,
                                 ports::IMessageSink& client_out);

  // Server -> editor. Throws ProxyError(MalformedMessage).
  LoopExit pump_server_to_client(ports::IMessageSource& server_in, ports::IMessageSink& client_out);

  // Single-message steps. Return false when a destination is closed.
  bool route_from_client(const ports::Value& raw, ports::IMessageSink& server_out,
                         ports::IMessageSink& client_out);
  bool route_from_server(const ports::Value& raw, ports::IMessageSink& client_out);

 private:
  bool handle_client_request(const ports::Value& raw, domain::protocol::Request req,
                             ports::IMessageSink& server_out, ports::IMessageSink& client_out);
  bool handle_server_response(const ports::Value& raw, domain::protocol::Response res,
                              ports::IMessageSink& client_out);

  ports::HookResult invoke(ports::IHook& hook, ports::HookStage stage,
                           domain::protocol::Message message) const;

  bool deliver_notifications(const std::vector<domain::protocol::Message>& notifications,
                             const std::string& method, ports::IMessageSink& client_out);

  void remember(const domain::protocol::RequestId& id, const std::string& method);

  void traffic(const char* direction, const ports::Value& raw);

  const HookRegistry& hooks_;
  PendingRequestTable& pending_;
  ports::ILogger& log_;
  const bool log_traffic_;
};

}  // namespace hookline::proxy::application::services
