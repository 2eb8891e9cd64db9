#pragma once

#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "domain/protocol/Message.hpp"

namespace hookline::proxy::application::ports
{

using domain::protocol::Message;

enum class HookStage
{
  request,
  response
};

inline const char* to_string(HookStage s) { return s == HookStage::request ? "request" : "response"; }

// What a hook hands back: the message to keep forwarding plus notifications
// for the client, delivered in order.
struct HookOutput
{
  Message message;
  std::vector<Message> notifications;

  explicit HookOutput(Message m) : message(std::move(m)) {}

  HookOutput& with_notification(Message n)
  {
    notifications.push_back(std::move(n));
    return *this;
  }
};

struct HookError
{
  HookStage stage;
  std::string cause;
};

using HookResult = std::variant<HookOutput, HookError>;

// Method-scoped interceptor. Unimplemented stages pass the message through.
// Instances are shared between both forwarding loops; any internal state is
// the hook's own to synchronize.
struct IHook
{
  virtual ~IHook() = default;

  virtual HookResult on_request(Message message) { return HookOutput{std::move(message)}; }
  virtual HookResult on_response(Message message) { return HookOutput{std::move(message)}; }
};

using HookPtr = std::shared_ptr<IHook>;

}  // namespace hookline::proxy::application::ports
