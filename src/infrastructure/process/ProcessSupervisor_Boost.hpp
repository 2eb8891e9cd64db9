#pragma once

#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "application/ports/ILogger.hpp"
#include "application/ports/IProcessSupervisor.hpp"

namespace boost
{
namespace process
{
class child;
}
}  // namespace boost

namespace hookline::proxy::infrastructure::process
{

class ProcessSupervisor_Boost final : public hookline::proxy::application::ports::IProcessSupervisor
{
 public:
  explicit ProcessSupervisor_Boost(hookline::proxy::application::ports::ILogger& log);
  ~ProcessSupervisor_Boost() override;

  ProcessSupervisor_Boost(const ProcessSupervisor_Boost&) = delete;
  ProcessSupervisor_Boost& operator=(const ProcessSupervisor_Boost&) = delete;

  void on_exit(std::function<void(const hookline::proxy::application::ports::ExitStatus&)> cb) override;

  hookline::proxy::application::ports::ChildStreams spawn(
      const std::string& command, const std::vector<std::string>& args) override;

  std::optional<hookline::proxy::application::ports::ExitStatus> wait_for(
      std::chrono::milliseconds timeout) override;
  hookline::proxy::application::ports::ExitStatus wait() override;
  void terminate() override;
  bool running() const override;

 private:
  void monitor();

  hookline::proxy::application::ports::ILogger& log_;

  mutable std::mutex mu_;
  std::condition_variable exited_cv_;
  std::function<void(const hookline::proxy::application::ports::ExitStatus&)> on_exit_;
  std::optional<hookline::proxy::application::ports::ExitStatus> status_;

  std::unique_ptr<boost::process::child> child_;
  int pid_{-1};
  std::thread monitor_thread_;
};

}  // namespace hookline::proxy::infrastructure::process
