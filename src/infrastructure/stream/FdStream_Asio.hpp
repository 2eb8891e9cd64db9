#pragma once

#include <atomic>
#include <utility>  // boost 1.74 asio/awaitable.hpp uses std::exchange without including it
#include <boost/asio.hpp>
#include <cstddef>
#include <mutex>
#include <span>
#include <string>

#include "application/ports/IByteStream.hpp"
#include "application/ports/ILogger.hpp"

namespace hookline::proxy::infrastructure::stream
{

// Whether the wrapper closes the descriptor on destruction (pipes to the child)
// or leaves it alone (the proxy's own stdin/stdout).
enum class FdOwnership
{
  owned,
  borrowed
};

// Blocking reads on a POSIX descriptor that another thread can interrupt.
// Each read drives a private io_context until the read completes; cancel()
// posts a descriptor cancel into that context.
class FdReader_Asio final : public hookline::proxy::application::ports::IByteSource
{
 public:
  FdReader_Asio(int fd, FdOwnership ownership, hookline::proxy::application::ports::ILogger& log,
                std::string label);
  ~FdReader_Asio() override;

  FdReader_Asio(const FdReader_Asio&) = delete;
  FdReader_Asio& operator=(const FdReader_Asio&) = delete;

  std::size_t read_some(std::span<std::byte> buf) override;
  void cancel() override;

 private:
  boost::asio::io_context io_;
  boost::asio::posix::stream_descriptor in_{io_};
  const FdOwnership ownership_;
  hookline::proxy::application::ports::ILogger& log_;
  const std::string label_;
  std::atomic<bool> closing_{false};
};

// Blocking writes that close() can interrupt from another thread. Callers
// serialize write() (see SendPipeline); close() needs no coordination.
class FdWriter_Asio final : public hookline::proxy::application::ports::IByteSink
{
 public:
  FdWriter_Asio(int fd, FdOwnership ownership, hookline::proxy::application::ports::ILogger& log,
                std::string label);
  ~FdWriter_Asio() override;

  FdWriter_Asio(const FdWriter_Asio&) = delete;
  FdWriter_Asio& operator=(const FdWriter_Asio&) = delete;

  bool write(std::span<const std::byte> bytes) override;
  void close() override;

 private:
  void release_fd();

  boost::asio::io_context io_;
  boost::asio::posix::stream_descriptor out_{io_};
  const FdOwnership ownership_;
  hookline::proxy::application::ports::ILogger& log_;
  const std::string label_;

  std::mutex mu_;
  std::atomic<bool> closing_{false};
  bool writing_{false};
  bool released_{false};
};

}  // namespace hookline::proxy::infrastructure::stream
