#include "application/services/pipeline/RecvPipeline.hpp"

#include <nlohmann/json.hpp>

#include "domain/ProxyError.hpp"

using hookline::proxy::application::ports::LogLevel;
using hookline::proxy::application::ports::Value;
using hookline::proxy::domain::ErrorKind;
using hookline::proxy::domain::ProxyError;

namespace hookline::proxy::application::services::pipeline
{

std::optional<Value> RecvPipeline::next()
{
  for (;;)
  {
    if (cancelled_) return std::nullopt;

    if (!frames_.empty())
    {
      auto body = std::move(frames_.front());
      frames_.pop_front();
      return parse(body);
    }

    std::vector<std::vector<std::byte>> out;
    const std::size_t consumed = codec_.feed(buffer_, out);
    buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(consumed));
    if (!out.empty())
    {
      for (auto& f : out) frames_.push_back(std::move(f));
      continue;
    }

    const std::size_t n = source_.read_some(chunk_);
    if (n == 0)
    {
      if (!buffer_.empty() && !cancelled_)
      {
        log_.app(LogLevel::warn, label_ + " stream ended inside a frame (" +
                                     std::to_string(buffer_.size()) + " bytes discarded)");
      }
      return std::nullopt;
    }
    buffer_.insert(buffer_.end(), chunk_.begin(), chunk_.begin() + static_cast<std::ptrdiff_t>(n));
  }
}

void RecvPipeline::cancel()
{
  cancelled_ = true;
  source_.cancel();
}

Value RecvPipeline::parse(const std::vector<std::byte>& body) const
{
  const auto* first = reinterpret_cast<const char*>(body.data());
  try
  {
    return Value::parse(first, first + body.size());
  }
  catch (const nlohmann::json::parse_error& e)
  {
    throw ProxyError(ErrorKind::MalformedMessage, label_ + ": invalid JSON payload: " + e.what());
  }
}

}  // namespace hookline::proxy::application::services::pipeline
