#pragma once
#include <vector>
#include <span>
#include <cstddef>

namespace hookline::proxy::application::ports {

  // Stateless framing: the caller owns the receive buffer.
  struct IFrameCodec {
    virtual ~IFrameCodec() = default;

    // Extracts every complete frame body from the front of `buffered` into `out`
    // and returns how many bytes were consumed. Throws ProxyError(MalformedMessage)
    // on a broken header.
    virtual std::size_t feed(std::span<const std::byte> buffered,
                            std::vector<std::vector<std::byte>>& out) = 0;

    virtual std::vector<std::byte> encode(std::span<const std::byte> payload) = 0;
  };

} // namespace hookline::proxy::application::ports
