#pragma once

#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>

#include "application/ports/IHook.hpp"

namespace hookline::proxy::application::hooks
{

// Reports traced requests to the editor as window/logMessage notifications:
// one when the request goes out, one with the round-trip time when it returns.
// A single instance may be registered for several methods.
class TraceHook final : public ports::IHook
{
 public:
  using Clock = std::chrono::steady_clock;

  static constexpr int kLogMessageType = 4;  // LSP MessageType.Log
  static constexpr std::size_t kMaxTracked = 4096;

  ports::HookResult on_request(ports::Message message) override;
  ports::HookResult on_response(ports::Message message) override;

  std::size_t tracked() const;

 private:
  struct Started
  {
    std::string method;
    Clock::time_point at;
  };

  static ports::Message log_message(const std::string& text);

  mutable std::mutex mu_;
  std::unordered_map<domain::protocol::RequestId, Started> started_;
};

}  // namespace hookline::proxy::application::hooks
