#include "infrastructure/codec/FrameCodec_ContentLength.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <string_view>

#include "domain/ProxyError.hpp"

using hookline::proxy::domain::ErrorKind;
using hookline::proxy::domain::ProxyError;

namespace hookline::proxy::infrastructure::codec
{

namespace
{
constexpr std::string_view kHeaderEnd = "\r\n\r\n";
constexpr std::string_view kContentLength = "content-length";
constexpr std::size_t kMaxHeader = 8 * 1024;

std::string_view trim(std::string_view s)
{
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
  return s;
}

bool iequals(std::string_view a, std::string_view b)
{
  return a.size() == b.size() &&
         std::equal(a.begin(), a.end(), b.begin(),
                    [](char x, char y)
                    {
                      return std::tolower(static_cast<unsigned char>(x)) ==
                             std::tolower(static_cast<unsigned char>(y));
                    });
}

[[noreturn]] void bad_header(const std::string& why)
{
  throw ProxyError(ErrorKind::MalformedMessage, "framing: " + why);
}

// Parses the header block (without the terminating blank line).
std::size_t parse_content_length(std::string_view headers)
{
  std::optional<std::size_t> length;

  while (!headers.empty())
  {
    const auto eol = headers.find("\r\n");
    const std::string_view line = headers.substr(0, eol);
    headers = (eol == std::string_view::npos) ? std::string_view{} : headers.substr(eol + 2);

    const auto colon = line.find(':');
    if (colon == std::string_view::npos) bad_header("header line without ':'");

    if (!iequals(trim(line.substr(0, colon)), kContentLength)) continue;  // e.g. Content-Type

    const std::string_view value = trim(line.substr(colon + 1));
    if (value.empty() || !std::all_of(value.begin(), value.end(),
                                      [](char c) { return std::isdigit(static_cast<unsigned char>(c)); }))
      bad_header("invalid Content-Length value '" + std::string(value) + "'");
    if (value.size() > 12) bad_header("Content-Length too large");

    length = static_cast<std::size_t>(std::stoull(std::string(value)));
  }

  if (!length) bad_header("missing Content-Length header");
  return *length;
}
}  // namespace

std::size_t FrameCodec_ContentLength::feed(std::span<const std::byte> buffered,
                                           std::vector<std::vector<std::byte>>& out)
{
  const std::string_view text(reinterpret_cast<const char*>(buffered.data()), buffered.size());
  std::size_t pos = 0;

  for (;;)
  {
    const auto header_end = text.find(kHeaderEnd, pos);
    if (header_end == std::string_view::npos)
    {
      if (text.size() - pos > kMaxHeader) bad_header("header block exceeds limit");
      break;
    }

    const std::size_t length = parse_content_length(text.substr(pos, header_end - pos));
    if (length > kMaxBody) bad_header("Content-Length " + std::to_string(length) + " exceeds limit");

    const std::size_t body_start = header_end + kHeaderEnd.size();
    if (text.size() - body_start < length) break;  // wait for more bytes

    out.emplace_back(buffered.begin() + static_cast<std::ptrdiff_t>(body_start),
                     buffered.begin() + static_cast<std::ptrdiff_t>(body_start + length));
    pos = body_start + length;
  }

  return pos;
}

std::vector<std::byte> FrameCodec_ContentLength::encode(std::span<const std::byte> payload)
{
  const std::string header = "Content-Length: " + std::to_string(payload.size()) + "\r\n\r\n";

  std::vector<std::byte> frame;
  frame.reserve(header.size() + payload.size());
  const auto* h = reinterpret_cast<const std::byte*>(header.data());
  frame.insert(frame.end(), h, h + header.size());
  frame.insert(frame.end(), payload.begin(), payload.end());
  return frame;
}

}  // namespace hookline::proxy::infrastructure::codec
