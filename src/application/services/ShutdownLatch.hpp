#pragma once

#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <utility>

namespace hookline::proxy::application::services
{

enum class ShutdownReason
{
  client_closed,
  server_closed,
  process_exited,
  stop_requested,
  fatal_error
};

inline const char* to_string(ShutdownReason r)
{
  switch (r)
  {
    case ShutdownReason::client_closed:  return "client closed";
    case ShutdownReason::server_closed:  return "server closed";
    case ShutdownReason::process_exited: return "process exited";
    case ShutdownReason::stop_requested: return "stop requested";
    case ShutdownReason::fatal_error:    return "fatal error";
  }
  return "unknown";
}

// One-shot session stop. The first fire() records the reason and runs the
// armed action; later fires are no-ops. Safe to call from any thread.
// The action runs without the latch lock held, so it may block on I/O while
// other threads query or fire the latch.
class ShutdownLatch
{
 public:
  using Action = std::function<void(ShutdownReason)>;

  // If the latch already fired, the action runs immediately.
  void arm(Action action)
  {
    std::unique_lock<std::mutex> lk(mu_);
    action_ = std::move(action);
    if (reason_ && action_) run_locked(lk, *reason_);
  }

  void fire(ShutdownReason reason)
  {
    std::unique_lock<std::mutex> lk(mu_);
    if (reason_) return;
    reason_ = reason;
    cv_.notify_all();
    if (action_) run_locked(lk, reason);
  }

  // Blocks until the first fire().
  ShutdownReason wait()
  {
    std::unique_lock<std::mutex> lk(mu_);
    cv_.wait(lk, [this] { return reason_.has_value(); });
    return *reason_;
  }

  // After disarm() returns no action is running or will run.
  void disarm()
  {
    std::unique_lock<std::mutex> lk(mu_);
    action_ = nullptr;
    cv_.wait(lk, [this] { return !running_; });
  }

  std::optional<ShutdownReason> reason() const
  {
    std::lock_guard<std::mutex> lk(mu_);
    return reason_;
  }

 private:
  // Runs the action at most once, unlocked; `lk` is held again on return.
  void run_locked(std::unique_lock<std::mutex>& lk, ShutdownReason reason)
  {
    if (ran_) return;
    ran_ = true;
    running_ = true;
    Action action = action_;
    lk.unlock();
    action(reason);
    lk.lock();
    running_ = false;
    cv_.notify_all();
  }

  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::optional<ShutdownReason> reason_;
  Action action_;
  bool ran_{false};
  bool running_{false};
};

}  // namespace hookline::proxy::application::services
