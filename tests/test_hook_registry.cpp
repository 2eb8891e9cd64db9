#include <gtest/gtest.h>

#include <memory>

#include "application/hooks/FunctionHook.hpp"
#include "application/services/HookRegistry.hpp"

using hookline::proxy::application::hooks::FunctionHook;
using hookline::proxy::application::services::HookRegistry;

TEST(HookRegistry, LookupOfUnknownMethodIsNull) {
  HookRegistry reg;
  EXPECT_TRUE(reg.empty());
  EXPECT_EQ(reg.lookup("textDocument/hover"), nullptr);
}

TEST(HookRegistry, LastRegistrationWins) {
  HookRegistry reg;
  auto first = std::make_shared<FunctionHook>();
  auto second = std::make_shared<FunctionHook>();

  reg.register_hook("textDocument/hover", first);
  reg.register_hook("textDocument/hover", second);

  EXPECT_EQ(reg.size(), 1u);
  EXPECT_EQ(reg.lookup("textDocument/hover"), second);
}

TEST(HookRegistry, MethodsAreExactMatch) {
  HookRegistry reg;
  reg.register_hook("textDocument/hover", std::make_shared<FunctionHook>());

  EXPECT_EQ(reg.lookup("textDocument/Hover"), nullptr);
  EXPECT_EQ(reg.lookup("textDocument/"), nullptr);
}

TEST(HookRegistry, NullHookRemovesMethod) {
  HookRegistry reg;
  reg.register_hook("a", std::make_shared<FunctionHook>());
  reg.register_hook("a", nullptr);
  EXPECT_TRUE(reg.empty());
}
