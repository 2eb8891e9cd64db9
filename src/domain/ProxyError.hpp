#pragma once

#include <stdexcept>
#include <string>

namespace hookline::proxy::domain
{

enum class ErrorKind
{
  MalformedMessage,
  UnmatchedResponse,
  DuplicateInFlightId,
  HookFailure,
  StreamClosed,
  ProcessExit,
  ProcessSpawnFailure
};

inline const char* to_string(ErrorKind k)
{
  switch (k)
  {
    case ErrorKind::MalformedMessage:    return "MalformedMessage";
    case ErrorKind::UnmatchedResponse:   return "UnmatchedResponse";
    case ErrorKind::DuplicateInFlightId: return "DuplicateInFlightId";
    case ErrorKind::HookFailure:         return "HookFailure";
    case ErrorKind::StreamClosed:        return "StreamClosed";
    case ErrorKind::ProcessExit:         return "ProcessExit";
    case ErrorKind::ProcessSpawnFailure: return "ProcessSpawnFailure";
  }
  return "Unknown";
}

// Fatal conditions that end a forwarding loop or the spawn call.
class ProxyError : public std::runtime_error
{
 public:
  ProxyError(ErrorKind kind, const std::string& what)
      : std::runtime_error(std::string(to_string(kind)) + ": " + what), kind_(kind)
  {
  }

  ErrorKind kind() const noexcept { return kind_; }

 private:
  ErrorKind kind_;
};

}  // namespace hookline::proxy::domain
