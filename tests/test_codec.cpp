#include <gtest/gtest.h>

#include <span>
#include <string>
#include <vector>

#include "domain/ProxyError.hpp"
#include "infrastructure/codec/FrameCodec_ContentLength.hpp"

using hookline::proxy::domain::ErrorKind;
using hookline::proxy::domain::ProxyError;
using hookline::proxy::infrastructure::codec::FrameCodec_ContentLength;

static std::vector<std::byte> bytes(const std::string& s)
{
  const auto* p = reinterpret_cast<const std::byte*>(s.data());
  return {p, p + s.size()};
}

static std::string text(const std::vector<std::byte>& b)
{
  return {reinterpret_cast<const char*>(b.data()), b.size()};
}

TEST(FrameCodec, EncodesContentLengthHeader) {
  FrameCodec_ContentLength codec;
  auto frame = codec.encode(bytes(R"({"a":1})"));
  EXPECT_EQ(text(frame), "Content-Length: 7\r\n\r\n{\"a\":1}");
}

TEST(FrameCodec, ExtractsSeveralFramesAndKeepsRemainder) {
  FrameCodec_ContentLength codec;
  const std::string input = "Content-Length: 2\r\n\r\n{}Content-Length: 4\r\n\r\nnullContent-Len";
  const auto buf = bytes(input);

  std::vector<std::vector<std::byte>> out;
  const std::size_t consumed = codec.feed(buf, out);

  ASSERT_EQ(out.size(), 2u);
  EXPECT_EQ(text(out[0]), "{}");
  EXPECT_EQ(text(out[1]), "null");
  EXPECT_EQ(input.substr(consumed), "Content-Len");
}

TEST(FrameCodec, WaitsForCompleteBody) {
  FrameCodec_ContentLength codec;
  const auto buf = bytes("Content-Length: 10\r\n\r\n{\"x\":");
  std::vector<std::vector<std::byte>> out;
  EXPECT_EQ(codec.feed(buf, out), 0u);
  EXPECT_TRUE(out.empty());
}

TEST(FrameCodec, IgnoresOtherHeadersAndCase) {
  FrameCodec_ContentLength codec;
  const auto buf =
      bytes("content-type: application/vscode-jsonrpc; charset=utf-8\r\nCONTENT-LENGTH:  3 \r\n\r\n123");
  std::vector<std::vector<std::byte>> out;
  codec.feed(buf, out);
  ASSERT_EQ(out.size(), 1u);
  EXPECT_EQ(text(out[0]), "123");
}

TEST(FrameCodec, LengthCountsBytesNotCharacters) {
  FrameCodec_ContentLength codec;
  const std::string body = "\"\xc3\xa9t\xc3\xa9\"";  // "été"
  const auto buf = bytes("Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body);
  std::vector<std::vector<std::byte>> out;
  codec.feed(buf, out);
  ASSERT_EQ(out.size(), 1u);
  EXPECT_EQ(text(out[0]), body);
}

TEST(FrameCodec, RejectsBrokenHeaders) {
  FrameCodec_ContentLength codec;
  std::vector<std::vector<std::byte>> out;

  for (const char* bad : {"Content-Type: x\r\n\r\n{}", "Content-Length: abc\r\n\r\n{}",
                          "garbage\r\n\r\n{}", "Content-Length: 999999999999\r\n\r\n"})
  {
    const auto buf = bytes(bad);
    try
    {
      codec.feed(buf, out);
      ADD_FAILURE() << "accepted: " << bad;
    }
    catch (const ProxyError& e)
    {
      EXPECT_EQ(e.kind(), ErrorKind::MalformedMessage);
    }
  }
}

TEST(FrameCodec, RejectsEndlessHeader) {
  FrameCodec_ContentLength codec;
  const auto buf = bytes(std::string(9000, 'x'));
  std::vector<std::vector<std::byte>> out;
  EXPECT_THROW(codec.feed(buf, out), ProxyError);
}
