#pragma once
#include <atomic>
#include <mutex>
#include <string>
#include <utility>

#include "application/ports/IByteStream.hpp"
#include "application/ports/IFrameCodec.hpp"
#include "application/ports/ILogger.hpp"
#include "application/ports/IMessageStream.hpp"

namespace hookline::proxy::application::services::pipeline
{

// JSON -> frame -> bytes. Safe to share between threads; each frame is written
// whole before the next one starts. close() may be called while a send blocks.
class SendPipeline final : public hookline::proxy::application::ports::IMessageSink
{
 public:
  SendPipeline(hookline::proxy::application::ports::IByteSink& sink,
               hookline::proxy::application::ports::IFrameCodec& codec,
               hookline::proxy::application::ports::ILogger& log, std::string label)
      : sink_(sink), codec_(codec), log_(log), label_(std::move(label))
  {
  }

  bool send(const hookline::proxy::application::ports::Value& message) override;
  void close() override;

 private:
  hookline::proxy::application::ports::IByteSink& sink_;
  hookline::proxy::application::ports::IFrameCodec& codec_;
  hookline::proxy::application::ports::ILogger& log_;
  const std::string label_;

  std::mutex mu_;
  std::atomic<bool> closed_{false};
};

}  // namespace hookline::proxy::application::services::pipeline
