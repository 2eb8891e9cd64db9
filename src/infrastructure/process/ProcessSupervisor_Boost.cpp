#include "infrastructure/process/ProcessSupervisor_Boost.hpp"

#include <signal.h>
#include <sys/wait.h>

#include <boost/filesystem/path.hpp>
#include <boost/process/args.hpp>
#include <boost/process/child.hpp>
#include <boost/process/exe.hpp>
#include <boost/process/io.hpp>
#include <boost/process/pipe.hpp>
#include <boost/process/search_path.hpp>
#include <cerrno>
#include <csignal>
#include <system_error>

#include "domain/ProxyError.hpp"
#include "infrastructure/stream/FdStream_Asio.hpp"

namespace bp = boost::process;
namespace fs = boost::filesystem;

using hookline::proxy::application::ports::ChildStreams;
using hookline::proxy::application::ports::ExitStatus;
using hookline::proxy::application::ports::LogLevel;
using hookline::proxy::domain::ErrorKind;
using hookline::proxy::domain::ProxyError;
using hookline::proxy::infrastructure::stream::FdOwnership;
using hookline::proxy::infrastructure::stream::FdReader_Asio;
using hookline::proxy::infrastructure::stream::FdWriter_Asio;

namespace hookline::proxy::infrastructure::process
{

ProcessSupervisor_Boost::ProcessSupervisor_Boost(application::ports::ILogger& log) : log_(log) {}

ProcessSupervisor_Boost::~ProcessSupervisor_Boost()
{
  if (running()) terminate();
  if (monitor_thread_.joinable()) monitor_thread_.join();
}

void ProcessSupervisor_Boost::on_exit(std::function<void(const ExitStatus&)> cb)
{
  std::lock_guard<std::mutex> lk(mu_);
  on_exit_ = std::move(cb);
}

// -------------------------------------------------------------------------------------------------
// spawn(command, args)
//  - Bare names are looked up on PATH; anything with a '/' is used as-is.
//  - stdin/stdout become pipes owned by the returned streams; stderr is inherited so the
//    server's own diagnostics reach the editor's log.
// -------------------------------------------------------------------------------------------------
ChildStreams ProcessSupervisor_Boost::spawn(const std::string& command,
                                            const std::vector<std::string>& args)
{
  std::lock_guard<std::mutex> lk(mu_);
  if (child_) throw ProxyError(ErrorKind::ProcessSpawnFailure, "server already spawned");
  if (command.empty()) throw ProxyError(ErrorKind::ProcessSpawnFailure, "no server command given");

  fs::path exe{command};
  if (command.find('/') == std::string::npos) exe = bp::search_path(command);
  if (exe.empty())
    throw ProxyError(ErrorKind::ProcessSpawnFailure, "'" + command + "' not found on PATH");

  // A dead child must surface as EPIPE on write, not kill the proxy.
  std::signal(SIGPIPE, SIG_IGN);

  bp::pipe to_child;
  bp::pipe from_child;
  std::error_code ec;
  auto child = std::make_unique<bp::child>(bp::exe = exe, bp::args = args, bp::std_in < to_child,
                                           bp::std_out > from_child, ec);
  if (ec)
    throw ProxyError(ErrorKind::ProcessSpawnFailure,
                     "cannot start '" + exe.string() + "': " + ec.message());

  // Take over the parent-side ends; the child-side ends were closed on launch.
  const int in_fd = to_child.native_sink();
  const int out_fd = from_child.native_source();
  to_child.assign_sink(-1);
  from_child.assign_source(-1);

  child_ = std::move(child);
  pid_ = child_->id();
  status_.reset();
  monitor_thread_ = std::thread([this] { monitor(); });

  log_.app(LogLevel::debug, "Spawned " + exe.string() + " (pid " + std::to_string(pid_) + ")");

  ChildStreams streams;
  streams.input = std::make_unique<FdWriter_Asio>(in_fd, FdOwnership::owned, log_, "server stdin");
  streams.output =
      std::make_unique<FdReader_Asio>(out_fd, FdOwnership::owned, log_, "server stdout");
  return streams;
}

void ProcessSupervisor_Boost::monitor()
{
  std::error_code ec;
  child_->wait(ec);

  ExitStatus st;
  if (ec)
  {
    log_.app(LogLevel::err, "Waiting for language server failed: " + ec.message());
    st.code = -1;
  }
  else
  {
    const int native = child_->native_exit_code();
    if (WIFSIGNALED(native))
    {
      st.signaled = true;
      st.code = WTERMSIG(native);
    }
    else
    {
      st.code = WEXITSTATUS(native);
    }
  }

  std::function<void(const ExitStatus&)> cb;
  {
    std::lock_guard<std::mutex> lk(mu_);
    cb = on_exit_;
  }
  if (cb) cb(st);

  {
    std::lock_guard<std::mutex> lk(mu_);
    status_ = st;
  }
  exited_cv_.notify_all();
}

std::optional<ExitStatus> ProcessSupervisor_Boost::wait_for(std::chrono::milliseconds timeout)
{
  std::unique_lock<std::mutex> lk(mu_);
  if (!child_) return std::nullopt;
  exited_cv_.wait_for(lk, timeout, [this] { return status_.has_value(); });
  return status_;
}

ExitStatus ProcessSupervisor_Boost::wait()
{
  std::unique_lock<std::mutex> lk(mu_);
  if (!child_) throw ProxyError(ErrorKind::ProcessExit, "no server process to wait for");
  exited_cv_.wait(lk, [this] { return status_.has_value(); });
  return *status_;
}

void ProcessSupervisor_Boost::terminate()
{
  std::lock_guard<std::mutex> lk(mu_);
  if (!child_ || status_ || pid_ <= 0) return;

  // The monitor thread reaps; we only deliver the signal.
  if (::kill(pid_, SIGKILL) != 0)
    log_.app(LogLevel::warn, "kill(" + std::to_string(pid_) + ") failed: " +
                                 std::system_category().message(errno));
}

bool ProcessSupervisor_Boost::running() const
{
  std::lock_guard<std::mutex> lk(mu_);
  return child_ && !status_;
}

}  // namespace hookline::proxy::infrastructure::process
