#include "application/services/Proxy.hpp"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <sstream>
#include <stdexcept>
#include <thread>

#include "application/services/MessageRouter.hpp"
#include "application/services/pipeline/RecvPipeline.hpp"
#include "application/services/pipeline/SendPipeline.hpp"

using hookline::proxy::application::ports::LogLevel;

namespace hookline::proxy::application::services
{

namespace
{
std::string describe_exit(const ports::ExitStatus& st)
{
  if (st.signaled) return "killed by signal " + std::to_string(st.code);
  return "exited with code " + std::to_string(st.code);
}

std::string join_command(const std::string& command, const std::vector<std::string>& args)
{
  std::ostringstream oss;
  oss << command;
  for (const auto& a : args) oss << ' ' << a;
  return oss.str();
}
}  // namespace

// Marks the proxy busy for the lifetime of one spawn() call.
class Proxy::SessionSlot
{
 public:
  explicit SessionSlot(Proxy& p) : p_(p), latch_(std::make_shared<ShutdownLatch>())
  {
    std::lock_guard<std::mutex> lk(p_.mu_);
    if (p_.active_) throw std::logic_error("a proxy session is already running");
    p_.active_ = latch_;
  }

  ~SessionSlot()
  {
    latch_->disarm();
    p_.supervisor_.on_exit(nullptr);
    std::lock_guard<std::mutex> lk(p_.mu_);
    p_.active_.reset();
  }

  SessionSlot(const SessionSlot&) = delete;
  SessionSlot& operator=(const SessionSlot&) = delete;

  const std::shared_ptr<ShutdownLatch>& latch() const { return latch_; }

 private:
  Proxy& p_;
  std::shared_ptr<ShutdownLatch> latch_;
};

void Proxy::register_hook(const std::string& method, ports::HookPtr hook)
{
  std::lock_guard<std::mutex> lk(mu_);
  if (active_) throw std::logic_error("hooks cannot change while a session is running");
  hooks_.register_hook(method, std::move(hook));
}

void Proxy::stop()
{
  std::shared_ptr<ShutdownLatch> latch;
  {
    std::lock_guard<std::mutex> lk(mu_);
    latch = active_;
  }
  if (latch) latch->fire(ShutdownReason::stop_requested);
}

// -------------------------------------------------------------------------------------------------
// spawn
//  - Starts the server, then runs client->server and server->client on their own threads.
//  - Whatever ends first fires the latch: client input stops, the server's stdin is closed.
//    Server output keeps draining only when the process exited on its own (bounded by
//    shutdownGraceMs), so its last words still reach the editor.
//  - Then waits for the process, killing it after the grace period, and only then joins
//    the loops.
// -------------------------------------------------------------------------------------------------
SessionOutcome Proxy::spawn(const std::string& command, const std::vector<std::string>& args,
                            ports::IByteSource& client_reader, ports::IByteSink& client_writer)
{
  SessionSlot slot(*this);
  const auto latch = slot.latch();
  const auto grace = std::chrono::milliseconds(std::max(0, cfg_.server.shutdownGraceMs));

  supervisor_.on_exit(
      [this, latch](const ports::ExitStatus& st)
      {
        log_.app(st.code == 0 && !st.signaled ? LogLevel::info : LogLevel::warn,
                 "Language server " + describe_exit(st));
        latch->fire(ShutdownReason::process_exited);
      });

  ports::ChildStreams child = supervisor_.spawn(command, args);
  log_.app(LogLevel::info, "Language server started: " + join_command(command, args) + " (" +
                               std::to_string(hooks_.size()) + " hook(s) registered)");

  std::exception_ptr first_error;
  std::optional<ports::ExitStatus> status;
  {
    pipeline::RecvPipeline client_in(client_reader, codec_, log_, "client");
    pipeline::SendPipeline client_out(client_writer, codec_, log_, "client");
    pipeline::RecvPipeline server_in(*child.output, codec_, log_, "server");
    pipeline::SendPipeline server_out(*child.input, codec_, log_, "server");

    latch->arm(
        [&](ShutdownReason reason)
        {
          client_in.cancel();
          server_out.close();
          if (reason != ShutdownReason::process_exited) server_in.cancel();
        });

    MessageRouter router(hooks_, pending_, log_, cfg_.proxy.logTraffic);
    std::mutex err_mu;

    auto run_loop = [&](const char* name, auto pump, ShutdownReason on_source_end,
                        ShutdownReason on_destination_end)
    {
      ShutdownReason reason = ShutdownReason::fatal_error;
      try
      {
        const auto exit = pump();
        reason = exit == MessageRouter::LoopExit::source_closed ? on_source_end : on_destination_end;
        log_.app(LogLevel::debug, std::string(name) + " loop ended (" + to_string(reason) + ")");
      }
      catch (const std::exception& e)
      {
        log_.app(LogLevel::critical, std::string(name) + " loop failed: " + e.what());
        std::lock_guard<std::mutex> lk(err_mu);
        if (!first_error) first_error = std::current_exception();
      }
      latch->fire(reason);
    };

    std::mutex done_mu;
    std::condition_variable done_cv;
    bool server_loop_done = false;

    std::thread to_server(
        [&]
        {
          run_loop(
              "client->server",
              [&] { return router.pump_client_to_server(client_in, server_out, client_out); },
              ShutdownReason::client_closed, ShutdownReason::server_closed);
        });

    std::thread to_client(
        [&]
        {
          run_loop(
              "server->client", [&] { return router.pump_server_to_client(server_in, client_out); },
              ShutdownReason::server_closed, ShutdownReason::client_closed);
          {
            std::lock_guard<std::mutex> lk(done_mu);
            server_loop_done = true;
          }
          done_cv.notify_all();
        });

    // Nothing below waits on a loop until the process is gone: a loop may be stuck
    // in a hook or in a write the server never drains.
    latch->wait();
    {
      std::unique_lock<std::mutex> lk(done_mu);
      if (!done_cv.wait_for(lk, grace, [&] { return server_loop_done; }))
      {
        log_.app(LogLevel::warn, "Server output still open after shutdown; abandoning it");
        lk.unlock();
        server_in.cancel();
        client_out.close();
      }
    }

    server_out.close();
    status = supervisor_.wait_for(grace);
    if (!status)
    {
      log_.app(LogLevel::warn, "Language server still running " + std::to_string(grace.count()) +
                                   " ms after shutdown; terminating");
      supervisor_.terminate();
      status = supervisor_.wait();
    }

    to_server.join();
    to_client.join();

    latch->disarm();
  }

  if (const std::size_t unanswered = pending_.clear())
    log_.app(LogLevel::info, std::to_string(unanswered) + " request(s) never answered");

  if (first_error) std::rethrow_exception(first_error);

  const auto reason = latch->reason().value_or(ShutdownReason::client_closed);
  log_.app(LogLevel::info, std::string("Session ended: ") + to_string(reason));
  return SessionOutcome{reason, status};
}

}  // namespace hookline::proxy::application::services
