#pragma once
#include <cstddef>
#include <span>
#include <vector>

#include "application/ports/IFrameCodec.hpp"

namespace hookline::proxy::infrastructure::codec
{

// LSP base protocol framing:
//   Content-Length: <n>\r\n
//   [other headers]\r\n
//   \r\n
//   <n bytes of body>
class FrameCodec_ContentLength : public hookline::proxy::application::ports::IFrameCodec
{
 public:
  // Upper bound for a single body; larger announcements are treated as corrupt framing.
  static constexpr std::size_t kMaxBody = 256u * 1024u * 1024u;

  std::size_t feed(std::span<const std::byte> buffered,
                   std::vector<std::vector<std::byte>>& out) override;

  std::vector<std::byte> encode(std::span<const std::byte> payload) override;
};

}  // namespace hookline::proxy::infrastructure::codec
