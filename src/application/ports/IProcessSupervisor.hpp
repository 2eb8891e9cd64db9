#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "application/ports/IByteStream.hpp"

namespace hookline::proxy::application::ports
{

struct ExitStatus
{
  int code{0};
  bool signaled{false};  // code holds the signal number when true
};

struct ChildStreams
{
  std::unique_ptr<IByteSink> input;     // child's stdin
  std::unique_ptr<IByteSource> output;  // child's stdout
};

// Owns the language server process. One child per instance.
struct IProcessSupervisor
{
  virtual ~IProcessSupervisor() = default;

  // Invoked once from the monitor thread when the child exits. Set before spawn().
  virtual void on_exit(std::function<void(const ExitStatus&)> cb) = 0;

  // Throws ProxyError(ProcessSpawnFailure).
  virtual ChildStreams spawn(const std::string& command, const std::vector<std::string>& args) = 0;

  virtual std::optional<ExitStatus> wait_for(std::chrono::milliseconds timeout) = 0;
  virtual ExitStatus wait() = 0;
  virtual void terminate() = 0;
  virtual bool running() const = 0;
};

}  // namespace hookline::proxy::application::ports
