#include "application/hooks/TraceHook.hpp"

#include <utility>

namespace proto = hookline::proxy::domain::protocol;

namespace hookline::proxy::application::hooks
{

ports::HookResult TraceHook::on_request(ports::Message message)
{
  const auto* req = std::get_if<proto::Request>(&message);
  if (!req) return ports::HookOutput{std::move(message)};

  const std::string text = "[hookline] -> " + req->method + " #" + proto::to_string(req->id);
  {
    std::lock_guard<std::mutex> lk(mu_);
    // Requests that never got an answer must not pile up forever.
    if (started_.size() >= kMaxTracked) started_.clear();
    started_[req->id] = Started{req->method, Clock::now()};
  }

  ports::HookOutput out{std::move(message)};
  out.with_notification(log_message(text));
  return out;
}

ports::HookResult TraceHook::on_response(ports::Message message)
{
  const auto* res = std::get_if<proto::Response>(&message);
  if (!res || !res->id) return ports::HookOutput{std::move(message)};

  Started s;
  {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = started_.find(*res->id);
    if (it == started_.end()) return ports::HookOutput{std::move(message)};
    s = std::move(it->second);
    started_.erase(it);
  }

  const auto ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - s.at).count();
  std::string text = "[hookline] <- " + s.method + " #" + proto::to_string(*res->id) + " in " +
                     std::to_string(ms) + " ms";
  if (res->error) text += " (error " + std::to_string(res->error->code) + ": " + res->error->message + ")";

  ports::HookOutput out{std::move(message)};
  out.with_notification(log_message(text));
  return out;
}

std::size_t TraceHook::tracked() const
{
  std::lock_guard<std::mutex> lk(mu_);
  return started_.size();
}

ports::Message TraceHook::log_message(const std::string& text)
{
  return proto::make_notification("window/logMessage",
                                  proto::Value{{"type", kLogMessageType}, {"message", text}});
}

}  // namespace hookline::proxy::application::hooks
