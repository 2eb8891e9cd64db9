#include "infrastructure/stream/FdStream_Asio.hpp"

#include <utility>

using hookline::proxy::application::ports::LogLevel;

namespace hookline::proxy::infrastructure::stream
{

// -------------------- FdReader_Asio --------------------
FdReader_Asio::FdReader_Asio(int fd, FdOwnership ownership,
                             application::ports::ILogger& log, std::string label)
    : ownership_(ownership), log_(log), label_(std::move(label))
{
  in_.assign(fd);
}

FdReader_Asio::~FdReader_Asio()
{
  boost::system::error_code ec;
  if (ownership_ == FdOwnership::borrowed)
    in_.release();
  else
    in_.close(ec);
}

std::size_t FdReader_Asio::read_some(std::span<std::byte> buf)
{
  if (closing_ || buf.empty()) return 0;

  boost::system::error_code result;
  std::size_t got = 0;
  bool done = false;

  in_.async_read_some(boost::asio::buffer(buf.data(), buf.size()),
                      [&](const boost::system::error_code& ec, std::size_t n)
                      {
                        result = ec;
                        got = n;
                        done = true;
                      });

  io_.restart();
  while (!done && io_.run_one() > 0)
  {
  }

  if (!done)
  {
    // The handler references this frame; it must run before we return.
    boost::system::error_code ec;
    in_.cancel(ec);
    io_.restart();
    while (!done && io_.run_one() > 0)
    {
    }
    return 0;
  }

  if (result)
  {
    if (result != boost::asio::error::eof && result != boost::asio::error::operation_aborted)
      log_.app(LogLevel::warn, label_ + " read failed: " + result.message());
    return 0;
  }
  return got;
}

void FdReader_Asio::cancel()
{
  closing_ = true;
  boost::asio::post(io_,
                    [this]
                    {
                      boost::system::error_code ec;
                      in_.cancel(ec);
                    });
}

// -------------------- FdWriter_Asio --------------------
FdWriter_Asio::FdWriter_Asio(int fd, FdOwnership ownership,
                             application::ports::ILogger& log, std::string label)
    : ownership_(ownership), log_(log), label_(std::move(label))
{
  out_.assign(fd);
}

FdWriter_Asio::~FdWriter_Asio()
{
  std::lock_guard<std::mutex> lk(mu_);
  release_fd();
}

// -------------------------------------------------------------------------------------------------
// write(bytes)
//  - async_write driven on this thread until it completes.
//  - A close() from another thread cancels the pending operation; the completion condition
//    stops the composed write from issuing further chunks once closing.
// -------------------------------------------------------------------------------------------------
bool FdWriter_Asio::write(std::span<const std::byte> bytes)
{
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (closing_) return false;
    writing_ = true;
  }

  boost::system::error_code result;
  std::size_t written = 0;
  bool done = false;

  boost::asio::async_write(
      out_, boost::asio::buffer(bytes.data(), bytes.size()),
      [this](const boost::system::error_code& ec, std::size_t) -> std::size_t
      {
        if (ec || closing_) return 0;
        return 64 * 1024;
      },
      [&](const boost::system::error_code& ec, std::size_t n)
      {
        result = ec;
        written = n;
        done = true;
      });

  io_.restart();
  while (!done && io_.run_one() > 0)
  {
  }

  std::lock_guard<std::mutex> lk(mu_);
  writing_ = false;
  if (closing_) release_fd();

  if (!done || result)
  {
    if (result && result != boost::asio::error::operation_aborted)
      log_.app(LogLevel::debug, label_ + " write failed: " + result.message());
    return false;
  }
  return written == bytes.size();
}

// -------------------------------------------------------------------------------------------------
// close()
//  - Idle writer: the descriptor goes away right here, which is what lets the peer see end of
//    input.
//  - Writer blocked in write(): a cancel is posted into its io_context; write() releases the
//    descriptor once the operation unwinds.
// -------------------------------------------------------------------------------------------------
void FdWriter_Asio::close()
{
  std::lock_guard<std::mutex> lk(mu_);
  if (closing_.exchange(true)) return;

  if (!writing_)
  {
    release_fd();
    return;
  }

  boost::asio::post(io_,
                    [this]
                    {
                      boost::system::error_code ec;
                      out_.cancel(ec);
                    });
}

// Caller holds mu_.
void FdWriter_Asio::release_fd()
{
  if (released_) return;
  released_ = true;

  boost::system::error_code ec;
  if (ownership_ == FdOwnership::borrowed)
    out_.release();
  else
    out_.close(ec);
}

}  // namespace hookline::proxy::infrastructure::stream
