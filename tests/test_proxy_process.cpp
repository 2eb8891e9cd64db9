#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>

#include "TestDoubles.hpp"
#include "application/services/Proxy.hpp"
#include "application/services/pipeline/RecvPipeline.hpp"
#include "domain/ProxyError.hpp"
#include "domain/Settings.hpp"
#include "infrastructure/codec/FrameCodec_ContentLength.hpp"
#include "infrastructure/process/ProcessSupervisor_Boost.hpp"

namespace tst = hookline::proxy::tests;
using hookline::proxy::application::services::Proxy;
using hookline::proxy::application::services::SessionOutcome;
using hookline::proxy::application::services::ShutdownReason;
using hookline::proxy::application::services::pipeline::RecvPipeline;
using hookline::proxy::domain::ErrorKind;
using hookline::proxy::domain::ProxyError;
using hookline::proxy::domain::Settings;
using hookline::proxy::infrastructure::codec::FrameCodec_ContentLength;
using hookline::proxy::infrastructure::process::ProcessSupervisor_Boost;
using tst::Value;
using namespace std::chrono_literals;

namespace
{

// Real child processes behind the proxy; the editor side stays in memory.
struct ChildProcess : ::testing::Test
{
  Settings settings = []
  {
    Settings s;
    s.server.shutdownGraceMs = 300;
    return s;
  }();
  tst::CapturingLogger log;
  ProcessSupervisor_Boost supervisor{log};
  FrameCodec_ContentLength codec;
  Proxy proxy{supervisor, codec, log, settings};

  std::shared_ptr<tst::BytePipe> editor_out = std::make_shared<tst::BytePipe>();
  std::shared_ptr<tst::BytePipe> editor_in = std::make_shared<tst::BytePipe>();
  tst::PipeReader proxy_reads{editor_out};
  tst::PipeWriter proxy_writes{editor_in};

  std::future<SessionOutcome> start(const std::string& command, std::vector<std::string> args)
  {
    return std::async(std::launch::async, [this, command, args]
                      { return proxy.spawn(command, args, proxy_reads, proxy_writes); });
  }
};

ErrorKind spawn_error(ChildProcess& t, const std::string& command)
{
  try
  {
    t.start(command, {}).get();
  }
  catch (const ProxyError& e)
  {
    return e.kind();
  }
  ADD_FAILURE() << command << " was spawned";
  return ErrorKind::StreamClosed;
}

}  // namespace

TEST_F(ChildProcess, CatEchoesTrafficBackToEditor) {
  auto fut = start("cat", {});

  const Value req{{"jsonrpc", "2.0"}, {"id", 1}, {"method", "textDocument/hover"}};
  editor_out->push(tst::frame(req));

  tst::PipeReader editor_reader(editor_in);
  RecvPipeline editor(editor_reader, codec, log, "editor");
  auto echoed = editor.next();
  ASSERT_TRUE(echoed.has_value());
  EXPECT_EQ(*echoed, req);

  editor_out->close();
  const SessionOutcome outcome = fut.get();
  EXPECT_EQ(outcome.reason, ShutdownReason::client_closed);
  ASSERT_TRUE(outcome.exit.has_value());
  EXPECT_EQ(outcome.exit->code, 0);
  EXPECT_FALSE(outcome.exit->signaled);
}

TEST_F(ChildProcess, ExitCodeIsReported) {
  const SessionOutcome outcome = start("/bin/sh", {"-c", "exit 3"}).get();

  // Output EOF and the exit notification race; either ends the session.
  EXPECT_TRUE(outcome.reason == ShutdownReason::process_exited ||
              outcome.reason == ShutdownReason::server_closed);
  ASSERT_TRUE(outcome.exit.has_value());
  EXPECT_EQ(outcome.exit->code, 3);
  EXPECT_FALSE(outcome.exit->signaled);
}

TEST_F(ChildProcess, SignalDeathIsReported) {
  const SessionOutcome outcome = start("/bin/sh", {"-c", "kill -9 $$"}).get();
  ASSERT_TRUE(outcome.exit.has_value());
  EXPECT_TRUE(outcome.exit->signaled);
  EXPECT_EQ(outcome.exit->code, 9);
}

TEST_F(ChildProcess, StopKillsServerThatIgnoresEof) {
  auto fut = start("sleep", {"30"});
  while (!supervisor.running()) std::this_thread::sleep_for(1ms);

  const auto t0 = std::chrono::steady_clock::now();
  proxy.stop();
  const SessionOutcome outcome = fut.get();

  EXPECT_EQ(outcome.reason, ShutdownReason::stop_requested);
  ASSERT_TRUE(outcome.exit.has_value());
  EXPECT_TRUE(outcome.exit->signaled);
  EXPECT_LT(std::chrono::steady_clock::now() - t0, 10s);
  EXPECT_TRUE(log.app_contains("terminating"));
}

TEST_F(ChildProcess, StopWhileServerNeverReadsLargeRequest) {
  auto fut = start("sleep", {"30"});
  while (!supervisor.running()) std::this_thread::sleep_for(1ms);

  // Larger than any pipe buffer: the client->server write stays blocked.
  const Value req{{"jsonrpc", "2.0"},
                  {"id", 1},
                  {"method", "workspace/executeCommand"},
                  {"params", {{"blob", std::string(1 << 20, 'x')}}}};
  editor_out->push(tst::frame(req));
  while (proxy.pending().size() == 0) std::this_thread::sleep_for(1ms);
  std::this_thread::sleep_for(100ms);

  auto stopped = std::async(std::launch::async, [this] { proxy.stop(); });
  ASSERT_EQ(stopped.wait_for(2s), std::future_status::ready);
  ASSERT_EQ(fut.wait_for(10s), std::future_status::ready);

  const SessionOutcome outcome = fut.get();
  EXPECT_EQ(outcome.reason, ShutdownReason::stop_requested);
  ASSERT_TRUE(outcome.exit.has_value());
  EXPECT_TRUE(outcome.exit->signaled);
}

TEST_F(ChildProcess, MissingCommandOnPath) {
  EXPECT_EQ(spawn_error(*this, "hookline-no-such-language-server"), ErrorKind::ProcessSpawnFailure);
  EXPECT_EQ(proxy.pending().size(), 0u);
}

TEST_F(ChildProcess, MissingExecutablePath) {
  EXPECT_EQ(spawn_error(*this, "/nonexistent/hookline-server"), ErrorKind::ProcessSpawnFailure);
}
