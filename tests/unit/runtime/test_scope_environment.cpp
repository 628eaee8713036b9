#include <gtest/gtest.h>

#include <future>

#include "stencil/runtime/builtin_tools.hpp"
#include "stencil/runtime/environment.hpp"
#include "stencil/runtime/scope.hpp"

namespace stencil
{

TEST(RuntimeScope, LookupWalksParents)
{
  Scope root;
  root.bind("title", "outer");
  root.bind("site", "blog");

  Scope child(&root);
  child.bind("title", "inner");

  ASSERT_NE(child.lookup("title"), nullptr);
  EXPECT_EQ(*child.lookup("title"), Value("inner"));
  ASSERT_NE(child.lookup("site"), nullptr);
  EXPECT_EQ(*child.lookup("site"), Value("blog"));
  EXPECT_EQ(child.find_local("site"), nullptr);
  EXPECT_EQ(child.lookup("nope"), nullptr);

  // The parent frame is untouched by shadowing.
  EXPECT_EQ(*root.lookup("title"), Value("outer"));
  EXPECT_EQ(child.parent(), &root);
}

TEST(RuntimeScope, RebindReplacesInSameFrame)
{
  Scope s;
  s.bind("x", 1);
  s.bind("x", 2);
  EXPECT_EQ(s.size(), 1U);
  EXPECT_EQ(*s.lookup("x"), Value(2));
}

TEST(RuntimeEnvironment, ToolsAndGlobals)
{
  auto env = EnvironmentBuilder()
               .add_tool("echo", [](const ToolArgs & args) -> Value { return args.at(0); })
               .add_global("site", "Blog")
               .add_globals(Value{{"year", 2024}, {"site", "Override"}})
               .add_globals(Value::array({1, 2}))
               .build();

  EXPECT_EQ(env->tool_count(), 1U);
  EXPECT_EQ(env->global_count(), 2U);
  ASSERT_NE(env->find_global("site"), nullptr);
  EXPECT_EQ(*env->find_global("site"), Value("Override"));
  EXPECT_EQ(env->find_global("missing"), nullptr);
  EXPECT_EQ(env->find_tool("Echo"), nullptr);

  const Tool * echo = env->find_tool("echo");
  ASSERT_NE(echo, nullptr);
  const ToolResult result = (*echo)({Value("ping")});
  ASSERT_TRUE(result.is_ready());
  EXPECT_EQ(result.value(), Value("ping"));
}

TEST(RuntimeEnvironment, AsyncToolYieldsPendingResult)
{
  auto env = EnvironmentBuilder()
               .add_async_tool(
                 "later",
                 [](const ToolArgs &) {
                   std::promise<Value> p;
                   p.set_value(Value(5));
                   return p.get_future().share();
                 })
               .build();

  const ToolResult result = (*env->find_tool("later"))({});
  ASSERT_TRUE(result.is_pending());
  EXPECT_EQ(result.future().get(), Value(5));
}

TEST(RuntimeBuiltinTools, RegistersStandardSet)
{
  EnvironmentBuilder builder;
  register_builtin_tools(builder);
  auto env = builder.build();

  const auto call = [&](const char * name, ToolArgs args) {
    const Tool * tool = env->find_tool(name);
    EXPECT_NE(tool, nullptr) << name;
    return tool != nullptr ? (*tool)(args).value() : missing();
  };

  EXPECT_EQ(call("upper", {Value("abc")}), Value("ABC"));
  EXPECT_EQ(call("lower", {Value("AbC")}), Value("abc"));
  EXPECT_EQ(call("length", {Value("abcd")}), Value(4));
  EXPECT_EQ(call("length", {Value::array({1, 2, 3})}), Value(3));
  EXPECT_EQ(call("length", {Value(7)}), Value(0));
  EXPECT_EQ(call("json", {Value{{"b", 1}, {"a", true}}}), Value(R"({"a":true,"b":1})"));
  EXPECT_EQ(call("json", {}), Value("undefined"));
  EXPECT_EQ(call("join", {Value::array({"a", 1, true})}), Value("a,1,true"));
  EXPECT_EQ(call("join", {Value::array({"x", "y"}), Value(" | ")}), Value("x | y"));
}

}  // namespace stencil
