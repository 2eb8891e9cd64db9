#include "adapters/inbound/cli/SignalWatcher.hpp"

#include <csignal>
#include <utility>

namespace hookline::proxy::adapters::cli
{

SignalWatcher::SignalWatcher(Handler on_signal) : on_signal_(std::move(on_signal))
{
  arm();
  thread_ = std::thread([this] { io_.run(); });
}

SignalWatcher::~SignalWatcher()
{
  io_.stop();
  if (thread_.joinable()) thread_.join();
}

void SignalWatcher::arm()
{
  signals_.async_wait(
      [this](const boost::system::error_code& ec, int signo)
      {
        if (ec) return;
        on_signal_(signo);
        arm();
      });
}

}  // namespace hookline::proxy::adapters::cli
