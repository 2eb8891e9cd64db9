#pragma once

#include <functional>
#include <utility>

#include "application/ports/IHook.hpp"

namespace hookline::proxy::application::hooks
{

// Hook assembled from callbacks; an empty callback keeps the identity default.
struct FunctionHook final : public ports::IHook
{
  using Handler = std::function<ports::HookResult(ports::Message)>;

  Handler request;
  Handler response;

  FunctionHook() = default;
  FunctionHook(Handler on_req, Handler on_res)
      : request(std::move(on_req)), response(std::move(on_res))
  {
  }

  ports::HookResult on_request(ports::Message message) override
  {
    if (request) return request(std::move(message));
    return IHook::on_request(std::move(message));
  }

  ports::HookResult on_response(ports::Message message) override
  {
    if (response) return response(std::move(message));
    return IHook::on_response(std::move(message));
  }
};

}  // namespace hookline::proxy::application::hooks
