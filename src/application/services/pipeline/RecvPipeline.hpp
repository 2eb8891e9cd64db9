#pragma once
#include <array>
#include <atomic>
#include <cstddef>
#include <deque>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "application/ports/IByteStream.hpp"
#include "application/ports/IFrameCodec.hpp"
#include "application/ports/ILogger.hpp"
#include "application/ports/IMessageStream.hpp"

namespace hookline::proxy::application::services::pipeline
{

// bytes -> frames -> JSON. One instance per inbound stream, used by one thread
// (cancel() excepted).
class RecvPipeline final : public hookline::proxy::application::ports::IMessageSource
{
 public:
  RecvPipeline(hookline::proxy::application::ports::IByteSource& source,
               hookline::proxy::application::ports::IFrameCodec& codec,
               hookline::proxy::application::ports::ILogger& log, std::string label)
      : source_(source), codec_(codec), log_(log), label_(std::move(label))
  {
  }

  std::optional<hookline::proxy::application::ports::Value> next() override;
  void cancel() override;

 private:
  hookline::proxy::application::ports::Value parse(const std::vector<std::byte>& body) const;

  hookline::proxy::application::ports::IByteSource& source_;
  hookline::proxy::application::ports::IFrameCodec& codec_;
  hookline::proxy::application::ports::ILogger& log_;
  const std::string label_;

  std::atomic<bool> cancelled_{false};
  std::vector<std::byte> buffer_;
  std::deque<std::vector<std::byte>> frames_;
  std::array<std::byte, 16 * 1024> chunk_{};
};

}  // namespace hookline::proxy::application::services::pipeline
