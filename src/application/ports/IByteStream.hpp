#pragma once

#include <cstddef>
#include <span>

namespace hookline::proxy::application::ports
{

struct IByteSource
{
  virtual ~IByteSource() = default;

  // Blocks until data is available. Returns 0 on end of input, on I/O error,
  // or after cancel().
  virtual std::size_t read_some(std::span<std::byte> buf) = 0;

  // Thread-safe. Unblocks a pending read_some and makes later reads return 0.
  virtual void cancel() = 0;
};

struct IByteSink
{
  virtual ~IByteSink() = default;

  // Writes everything or returns false (peer gone, closed).
  virtual bool write(std::span<const std::byte> bytes) = 0;

  virtual void close() = 0;
};

}  // namespace hookline::proxy::application::ports
