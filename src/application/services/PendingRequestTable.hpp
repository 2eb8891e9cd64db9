#pragma once

#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "domain/protocol/Message.hpp"

namespace hookline::proxy::application::services
{

using domain::protocol::RequestId;

// Correlates server-bound request ids with the method that produced them.
// Shared by both forwarding loops; every operation takes the lock once and
// performs no I/O while holding it.
class PendingRequestTable
{
 public:
  using Clock = std::chrono::steady_clock;

  enum class RecordStatus
  {
    inserted,
    replaced  // id was already in flight; newer mapping kept
  };

  struct Entry
  {
    RequestId id;
    std::string method;
    Clock::time_point recorded_at;
  };

  // timeout == 0 disables eviction.
  explicit PendingRequestTable(std::chrono::milliseconds timeout = std::chrono::milliseconds{0})
      : timeout_(timeout)
  {
  }

  RecordStatus record(const RequestId& id, std::string method, Clock::time_point now = Clock::now());

  // Removes and returns the originating method.
  std::optional<std::string> resolve(const RequestId& id);

  // Drops an entry whose request never made it to the server.
  bool forget(const RequestId& id);

  // Removes entries recorded more than `timeout` before `now`.
  std::vector<Entry> evict_expired(Clock::time_point now = Clock::now());

  // Drops everything; returns how many entries were still pending.
  std::size_t clear();

  std::size_t size() const;
  std::chrono::milliseconds timeout() const { return timeout_; }

 private:
  struct Slot
  {
    std::string method;
    Clock::time_point recorded_at;
  };

  const std::chrono::milliseconds timeout_;
  mutable std::mutex mu_;
  std::unordered_map<RequestId, Slot> entries_;
};

}  // namespace hookline::proxy::application::services
