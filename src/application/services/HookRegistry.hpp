#pragma once

#include <string>
#include <unordered_map>

#include "application/ports/IHook.hpp"

namespace hookline::proxy::application::services
{

// method -> hook. Filled before a session starts, read-only while it runs.
class HookRegistry
{
 public:
  // Last registration for a method wins.
  void register_hook(const std::string& method, ports::HookPtr hook);

  // nullptr means "forward unmodified".
  ports::HookPtr lookup(const std::string& method) const;

  std::size_t size() const { return hooks_.size(); }
  bool empty() const { return hooks_.empty(); }

 private:
  std::unordered_map<std::string, ports::HookPtr> hooks_;
};

}  // namespace hookline::proxy::application::services
