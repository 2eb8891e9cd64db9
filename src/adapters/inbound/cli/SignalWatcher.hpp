#pragma once

#include <utility>  // boost 1.74 asio/awaitable.hpp uses std::exchange without including it
#include <boost/asio.hpp>
#include <csignal>
#include <functional>
#include <thread>

namespace hookline::proxy::adapters::cli
{

// Delivers SIGINT/SIGTERM to a callback on its own io thread for as long as it
// lives. The destructor stops and joins that thread on every exit path.
class SignalWatcher
{
 public:
  using Handler = std::function<void(int signo)>;

  explicit SignalWatcher(Handler on_signal);
  ~SignalWatcher();

  SignalWatcher(const SignalWatcher&) = delete;
  SignalWatcher& operator=(const SignalWatcher&) = delete;

 private:
  void arm();

  Handler on_signal_;
  boost::asio::io_context io_;
  boost::asio::signal_set signals_{io_, SIGINT, SIGTERM};
  std::thread thread_;
};

}  // namespace hookline::proxy::adapters::cli
