#pragma once

#include <optional>

#include "domain/protocol/Message.hpp"

namespace hookline::proxy::application::ports
{

using domain::protocol::Value;

// Decoded JSON-RPC traffic in one direction.
struct IMessageSource
{
  virtual ~IMessageSource() = default;

  // nullopt once the stream has ended or was cancelled.
  // Throws ProxyError(MalformedMessage) when framing or JSON is broken.
  virtual std::optional<Value> next() = 0;

  virtual void cancel() = 0;
};

struct IMessageSink
{
  virtual ~IMessageSink() = default;

  // False when the destination is closed; the message is dropped.
  virtual bool send(const Value& message) = 0;

  virtual void close() = 0;
};

}  // namespace hookline::proxy::application::ports
