#include "application/services/HookRegistry.hpp"

#include <utility>

namespace hookline::proxy::application::services
{

void HookRegistry::register_hook(const std::string& method, ports::HookPtr hook)
{
  if (!hook)
  {
    hooks_.erase(method);
    return;
  }
  hooks_[method] = std::move(hook);
}

ports::HookPtr HookRegistry::lookup(const std::string& method) const
{
  auto it = hooks_.find(method);
  if (it == hooks_.end()) return nullptr;
  return it->second;
}

}  // namespace hookline::proxy::application::services
