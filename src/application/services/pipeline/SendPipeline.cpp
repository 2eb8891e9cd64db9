#include "application/services/pipeline/SendPipeline.hpp"

#include <nlohmann/json.hpp>
#include <span>

using hookline::proxy::application::ports::LogLevel;
using hookline::proxy::application::ports::Value;

namespace hookline::proxy::application::services::pipeline
{

bool SendPipeline::send(const Value& message)
{
  const std::string body = message.dump(-1, ' ', false, Value::error_handler_t::replace);
  const auto frame = codec_.encode(std::as_bytes(std::span<const char>(body.data(), body.size())));

  std::lock_guard<std::mutex> lk(mu_);
  if (closed_) return false;

  if (!sink_.write(frame))
  {
    if (!closed_.exchange(true))
      log_.app(LogLevel::debug, label_ + " stream closed; dropping outbound message");
    return false;
  }
  return true;
}

// Does not wait for an in-progress send; closing the sink interrupts it.
void SendPipeline::close()
{
  if (closed_.exchange(true)) return;
  sink_.close();
}

}  // namespace hookline::proxy::application::services::pipeline
