#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>

namespace hookline::proxy::domain::protocol
{

using Value = nlohmann::json;

// JSON-RPC id: integer or string. Opaque to the proxy.
using RequestId = std::variant<std::int64_t, std::string>;

// ---- JSON-RPC error codes used by the proxy ----
inline constexpr std::int64_t kInternalError = -32603;

struct ResponseError
{
  std::int64_t code{0};
  std::string message;
  std::optional<Value> data;
};

struct Request
{
  RequestId id;
  std::string method;
  std::optional<Value> params;
};

// Exactly one of result/error is set. A null id (parse-error reply) is nullopt.
struct Response
{
  std::optional<RequestId> id;
  std::optional<Value> result;
  std::optional<ResponseError> error;
};

struct Notification
{
  std::string method;
  std::optional<Value> params;
};

using Message = std::variant<Request, Response, Notification>;

// Classifies a decoded JSON value. Throws ProxyError(MalformedMessage) when the
// value is none of the three shapes.
Message classify(const Value& raw);

// Encodes back to a JSON-RPC 2.0 object.
Value encode(const Message& m);

std::string to_string(const RequestId& id);
const char* kind_name(const Message& m);

// ---- Builders ----
Notification make_notification(std::string method, std::optional<Value> params = std::nullopt);
Response make_error_response(const RequestId& id, std::int64_t code, std::string message,
                             std::optional<Value> data = std::nullopt);

inline bool is_request(const Message& m) { return std::holds_alternative<Request>(m); }
inline bool is_response(const Message& m) { return std::holds_alternative<Response>(m); }
inline bool is_notification(const Message& m) { return std::holds_alternative<Notification>(m); }

}  // namespace hookline::proxy::domain::protocol
