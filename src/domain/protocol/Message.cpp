#include "domain/protocol/Message.hpp"

#include "domain/ProxyError.hpp"

#include <cstdint>
#include <limits>

namespace hookline::proxy::domain::protocol
{

namespace
{
[[noreturn]] void malformed(const std::string& why)
{
  throw ProxyError(ErrorKind::MalformedMessage, why);
}

// Unsigned values above INT64_MAX would wrap.
bool fits_int64(const Value& v)
{
  return !v.is_number_unsigned() ||
         v.get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
}

RequestId parse_id(const Value& v)
{
  if (v.is_number_integer())
  {
    if (!fits_int64(v)) malformed("id " + v.dump() + " is out of range");
    return v.get<std::int64_t>();
  }
  if (v.is_string()) return v.get<std::string>();
  malformed("id must be a string or an integer, got " + std::string(v.type_name()));
}

std::optional<Value> optional_member(const Value& obj, const char* key)
{
  auto it = obj.find(key);
  if (it == obj.end()) return std::nullopt;
  return *it;
}

ResponseError parse_error(const Value& v)
{
  if (!v.is_object()) malformed("error must be an object");

  auto code = v.find("code");
  auto message = v.find("message");
  if (code == v.end() || !code->is_number_integer() || !fits_int64(*code))
    malformed("error.code must be an integer");
  if (message == v.end() || !message->is_string()) malformed("error.message must be a string");

  ResponseError e;
  e.code = code->get<std::int64_t>();
  e.message = message->get<std::string>();
  e.data = optional_member(v, "data");
  return e;
}

Value id_value(const RequestId& id)
{
  if (const auto* n = std::get_if<std::int64_t>(&id)) return *n;
  return std::get<std::string>(id);
}
}  // namespace

// -------------------------------------------------------------------------------------------------
// classify(raw)
//  - method + id          -> Request
//  - method, no id        -> Notification
//  - id, no method        -> Response (exactly one of result / error)
//  - anything else        -> MalformedMessage
// -------------------------------------------------------------------------------------------------
Message classify(const Value& raw)
{
  if (!raw.is_object()) malformed("message must be a JSON object");

  const auto id = raw.find("id");
  const auto method = raw.find("method");
  const bool has_id = id != raw.end();
  const bool has_result = raw.contains("result");
  const bool has_error = raw.contains("error");

  if (method != raw.end())
  {
    if (!method->is_string()) malformed("method must be a string");
    if (has_result || has_error) malformed("a message with a method cannot carry result/error");

    if (!has_id) return Notification{method->get<std::string>(), optional_member(raw, "params")};
    if (id->is_null()) malformed("request id must not be null");

    return Request{parse_id(*id), method->get<std::string>(), optional_member(raw, "params")};
  }

  if (!has_id) malformed("message has neither id nor method");
  if (has_result == has_error) malformed("response must carry exactly one of result or error");

  Response r;
  if (!id->is_null()) r.id = parse_id(*id);
  if (has_result)
    r.result = raw.at("result");
  else
    r.error = parse_error(raw.at("error"));
  return r;
}

Value encode(const Message& m)
{
  Value obj = Value::object();
  obj["jsonrpc"] = "2.0";

  if (const auto* req = std::get_if<Request>(&m))
  {
    obj["id"] = id_value(req->id);
    obj["method"] = req->method;
    if (req->params) obj["params"] = *req->params;
  }
  else if (const auto* res = std::get_if<Response>(&m))
  {
    obj["id"] = res->id ? id_value(*res->id) : Value(nullptr);
    if (res->error)
    {
      Value err = Value::object();
      err["code"] = res->error->code;
      err["message"] = res->error->message;
      if (res->error->data) err["data"] = *res->error->data;
      obj["error"] = std::move(err);
    }
    else
    {
      obj["result"] = res->result ? *res->result : Value(nullptr);
    }
  }
  else
  {
    const auto& n = std::get<Notification>(m);
    obj["method"] = n.method;
    if (n.params) obj["params"] = *n.params;
  }
  return obj;
}

std::string to_string(const RequestId& id)
{
  if (const auto* n = std::get_if<std::int64_t>(&id)) return std::to_string(*n);
  return "\"" + std::get<std::string>(id) + "\"";
}

const char* kind_name(const Message& m)
{
  if (is_request(m)) return "request";
  if (is_response(m)) return "response";
  return "notification";
}

Notification make_notification(std::string method, std::optional<Value> params)
{
  return Notification{std::move(method), std::move(params)};
}

Response make_error_response(const RequestId& id, std::int64_t code, std::string message,
                             std::optional<Value> data)
{
  Response r;
  r.id = id;
  r.error = ResponseError{code, std::move(message), std::move(data)};
  return r;
}

}  // namespace hookline::proxy::domain::protocol
