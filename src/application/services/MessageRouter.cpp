#include "application/services/MessageRouter.hpp"

#include <exception>
#include <utility>

using hookline::proxy::application::ports::HookError;
using hookline::proxy::application::ports::HookOutput;
using hookline::proxy::application::ports::HookResult;
using hookline::proxy::application::ports::HookStage;
using hookline::proxy::application::ports::LogLevel;
using hookline::proxy::application::ports::Value;

namespace proto = hookline::proxy::domain::protocol;

namespace hookline::proxy::application::services
{

namespace
{
constexpr const char* kClientToServer = "C->S";
constexpr const char* kServerToClient = "S->C";
constexpr const char* kRewrittenToServer = "C->S (hook)";
constexpr const char* kRewrittenToClient = "S->C (hook)";
constexpr const char* kInjected = "S->C (notify)";

std::string describe(const proto::Message& m)
{
  if (const auto* r = std::get_if<proto::Request>(&m))
    return "request " + r->method + " id=" + proto::to_string(r->id);
  if (const auto* r = std::get_if<proto::Response>(&m))
    return std::string(r->error ? "error response" : "response") +
           " id=" + (r->id ? proto::to_string(*r->id) : std::string("null"));
  return "notification " + std::get<proto::Notification>(m).method;
}
}  // namespace

// -------------------------------------------------------------------------------------------------
// pumps
//  - Read until end of input; every message is routed before the next one is read.
// -------------------------------------------------------------------------------------------------
MessageRouter::LoopExit MessageRouter::pump_client_to_server(ports::IMessageSource& client_in,
                                                             ports::IMessageSink& server_out,
                                                             ports::IMessageSink& client_out)
{
  while (auto raw = client_in.next())
  {
    if (!route_from_client(*raw, server_out, client_out)) return LoopExit::destination_closed;
  }
  return LoopExit::source_closed;
}

MessageRouter::LoopExit MessageRouter::pump_server_to_client(ports::IMessageSource& server_in,
                                                             ports::IMessageSink& client_out)
{
  while (auto raw = server_in.next())
  {
    if (!route_from_server(*raw, client_out)) return LoopExit::destination_closed;
  }
  return LoopExit::source_closed;
}

// -------------------------------------------------------------------------------------------------
// route_from_client
//  - Requests go through their hook (if any) and are recorded before they leave.
//  - Notifications and responses (answers to server requests) pass untouched.
// -------------------------------------------------------------------------------------------------
bool MessageRouter::route_from_client(const Value& raw, ports::IMessageSink& server_out,
                                      ports::IMessageSink& client_out)
{
  proto::Message msg = proto::classify(raw);
  traffic(kClientToServer, raw);

  if (auto* req = std::get_if<proto::Request>(&msg))
    return handle_client_request(raw, std::move(*req), server_out, client_out);

  if (proto::is_response(msg))
    log_.wire(LogLevel::debug, std::string("C->S client ") + describe(msg) + " forwarded as-is");

  return server_out.send(raw);
}

bool MessageRouter::handle_client_request(const Value& raw, proto::Request req,
                                          ports::IMessageSink& server_out,
                                          ports::IMessageSink& client_out)
{
  auto hook = hooks_.lookup(req.method);
  if (!hook)
  {
    remember(req.id, req.method);
    if (server_out.send(raw)) return true;
    pending_.forget(req.id);
    return false;
  }

  const proto::RequestId original_id = req.id;
  const std::string method = req.method;

  HookResult result = invoke(*hook, HookStage::request, std::move(req));

  if (auto* out = std::get_if<HookOutput>(&result); out && !proto::is_request(out->message))
  {
    result = HookError{HookStage::request, std::string("request hook returned a ") +
                                               proto::kind_name(out->message)};
  }

  if (const auto* err = std::get_if<HookError>(&result))
  {
    log_.app(LogLevel::err, "HookFailure: " + method + " id=" + proto::to_string(original_id) +
                                " (request): " + err->cause + "; answering client with an error");

    Value data = {{"method", method}, {"stage", ports::to_string(err->stage)}};
    auto reply = proto::make_error_response(original_id, proto::kInternalError,
                                            "Request hook for '" + method + "' failed: " + err->cause,
                                            std::move(data));
    return client_out.send(proto::encode(reply));
  }

  auto& out = std::get<HookOutput>(result);

  // The client sees the side effects before the request is in flight.
  if (!deliver_notifications(out.notifications, method, client_out)) return false;

  const auto& forwarded = std::get<proto::Request>(out.message);
  remember(forwarded.id, method);

  Value encoded = proto::encode(out.message);
  traffic(kRewrittenToServer, encoded);
  if (server_out.send(encoded)) return true;

  pending_.forget(forwarded.id);
  return false;
}

// -------------------------------------------------------------------------------------------------
// route_from_server
//  - Responses are correlated through the pending table; everything else passes.
// -------------------------------------------------------------------------------------------------
bool MessageRouter::route_from_server(const Value& raw, ports::IMessageSink& client_out)
{
  proto::Message msg = proto::classify(raw);
  traffic(kServerToClient, raw);

  if (auto* res = std::get_if<proto::Response>(&msg))
    return handle_server_response(raw, std::move(*res), client_out);

  return client_out.send(raw);
}

bool MessageRouter::handle_server_response(const Value& raw, proto::Response res,
                                           ports::IMessageSink& client_out)
{
  if (!res.id)
  {
    log_.app(LogLevel::warn, "UnmatchedResponse: response with null id forwarded unmodified");
    return client_out.send(raw);
  }

  const proto::RequestId id = *res.id;
  auto method = pending_.resolve(id);
  if (!method)
  {
    log_.app(LogLevel::warn,
             "UnmatchedResponse: id=" + proto::to_string(id) + " has no pending request; forwarded unmodified");
    return client_out.send(raw);
  }

  auto hook = hooks_.lookup(*method);
  if (!hook) return client_out.send(raw);

  HookResult result = invoke(*hook, HookStage::response, std::move(res));

  if (auto* out = std::get_if<HookOutput>(&result))
  {
    const auto* rewritten = std::get_if<proto::Response>(&out->message);
    if (!rewritten)
      result = HookError{HookStage::response, std::string("response hook returned a ") +
                                                  proto::kind_name(out->message)};
    else if (!rewritten->id || *rewritten->id != id)
      result = HookError{HookStage::response, "response hook changed the response id"};
  }

  if (const auto* err = std::get_if<HookError>(&result))
  {
    log_.app(LogLevel::err, "HookFailure: " + *method + " id=" + proto::to_string(id) +
                                " (response): " + err->cause + "; forwarding original response");
    return client_out.send(raw);
  }

  auto& out = std::get<HookOutput>(result);

  Value encoded = proto::encode(out.message);
  traffic(kRewrittenToClient, encoded);
  if (!client_out.send(encoded)) return false;

  // Mirror of the request path: the response first, then what it triggered.
  return deliver_notifications(out.notifications, *method, client_out);
}

// -------------------------------------------------------------------------------------------------
// helpers
// -------------------------------------------------------------------------------------------------
HookResult MessageRouter::invoke(ports::IHook& hook, HookStage stage, proto::Message message) const
{
  try
  {
    if (stage == HookStage::request) return hook.on_request(std::move(message));
    return hook.on_response(std::move(message));
  }
  catch (const std::exception& e)
  {
    return HookError{stage, e.what()};
  }
}

bool MessageRouter::deliver_notifications(const std::vector<proto::Message>& notifications,
                                          const std::string& method,
                                          ports::IMessageSink& client_out)
{
  for (const auto& n : notifications)
  {
    if (!proto::is_notification(n))
    {
      log_.app(LogLevel::err, "Hook for " + method + " emitted a " + proto::kind_name(n) +
                                  " where a notification was expected; skipped");
      continue;
    }

    Value encoded = proto::encode(n);
    traffic(kInjected, encoded);
    if (!client_out.send(encoded)) return false;
  }
  return true;
}

void MessageRouter::remember(const proto::RequestId& id, const std::string& method)
{
  for (const auto& e : pending_.evict_expired())
  {
    log_.app(LogLevel::warn, "Evicted pending request " + e.method + " id=" + proto::to_string(e.id) +
                                 " (no response within " +
                                 std::to_string(pending_.timeout().count()) + " ms)");
  }

  if (pending_.record(id, method) == PendingRequestTable::RecordStatus::replaced)
  {
    log_.app(LogLevel::warn, "DuplicateInFlightId: id=" + proto::to_string(id) +
                                 " already pending; now tracking " + method);
  }
}

void MessageRouter::traffic(const char* direction, const Value& raw)
{
  if (!log_traffic_) return;
  // Hooks may put invalid UTF-8 in strings; the trace substitutes U+FFFD.
  log_.wire(LogLevel::trace, std::string(direction) + " " +
                                 raw.dump(-1, ' ', false, Value::error_handler_t::replace));
}

}  // namespace hookline::proxy::application::services
