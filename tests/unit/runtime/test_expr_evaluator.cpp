// test_expr_evaluator.cpp - Unit tests for expression evaluation
//
#include <gtest/gtest.h>

#include <cmath>
#include <cstdint>
#include <future>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "stencil/basic/casting.hpp"
#include "stencil/runtime/expr_evaluator.hpp"
#include "stencil/runtime/render_error.hpp"
#include "stencil/test_support/render_helpers.hpp"

namespace stencil
{

class ExprEvaluatorTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    env_ = EnvironmentBuilder()
             .add_tool(
               "concat",
               [this](const ToolArgs & args) -> Value {
                 calls_.push_back("concat");
                 std::string out;
                 for (const auto & a : args) out += to_text(a);
                 return out;
               })
             .add_tool(
               "mark",
               [this](const ToolArgs & args) -> Value {
                 calls_.push_back(to_text(args.at(0)));
                 return args.at(0);
               })
             .add_tool(
               "boom", [](const ToolArgs &) -> Value { throw std::runtime_error("kaboom"); })
             .add_async_tool(
               "deferred",
               [](const ToolArgs & args) {
                 std::promise<Value> p;
                 p.set_value(args.empty() ? missing() : args[0]);
                 return p.get_future().share();
               })
             .add_global("site", Value{{"name", "Blog"}, {"menus", {{"main", {"Home", "About"}}}}})
             .build();

    scope_.bind("n", 3);
    scope_.bind("name", "Ada");
    scope_.bind("empty", "");
    scope_.bind("post", Value{{"title", "Hi"}, {"tags", {"c++", "json"}}});
  }

  Value eval(const std::string & expr)
  {
    auto unit = test_support::parse("\n$(" + expr + ")", "pages.test");
    EXPECT_FALSE(unit->has_errors()) << expr;
    units_.push_back(unit);

    const auto * print = cast<PrintStmt>(unit->root->body[unit->root->body.size() - 1]);
    ExprEvaluator evaluator(*env_, *unit);
    return evaluator.evaluate(print->value, scope_);
  }

  std::shared_ptr<const Environment> env_;
  Scope scope_;
  std::vector<std::string> calls_;
  std::vector<std::shared_ptr<ParsedComponent>> units_;
};

TEST_F(ExprEvaluatorTest, Literals)
{
  EXPECT_EQ(eval("42"), Value(42));
  EXPECT_EQ(eval("2.5"), Value(2.5));
  EXPECT_EQ(eval("'x'"), Value("x"));
  EXPECT_EQ(eval("true"), Value(true));
  EXPECT_TRUE(eval("null").is_null());
  EXPECT_TRUE(is_missing(eval("undefined")));
}

TEST_F(ExprEvaluatorTest, LocalsAndGlobals)
{
  EXPECT_EQ(eval("name"), Value("Ada"));
  EXPECT_TRUE(is_missing(eval("nobody")));
  EXPECT_EQ(eval("@site.name"), Value("Blog"));
  EXPECT_TRUE(is_missing(eval("@nothing")));
  // Locals and globals live in separate namespaces.
  EXPECT_TRUE(is_missing(eval("site")));
}

TEST_F(ExprEvaluatorTest, MemberAndIndexChains)
{
  EXPECT_EQ(eval("post.title"), Value("Hi"));
  EXPECT_EQ(eval("post.tags[1]"), Value("json"));
  EXPECT_EQ(eval("post.tags.length"), Value(2));
  EXPECT_EQ(eval("post['title']"), Value("Hi"));
  EXPECT_EQ(eval("@site.menus['main'][0]"), Value("Home"));
  EXPECT_TRUE(is_missing(eval("post.author.name")));
  EXPECT_TRUE(is_missing(eval("nobody.field")));
}

TEST_F(ExprEvaluatorTest, Comparisons)
{
  EXPECT_EQ(eval("n === 3"), Value(true));
  EXPECT_EQ(eval("n === '3'"), Value(false));
  EXPECT_EQ(eval("n == '3'"), Value(true));
  EXPECT_EQ(eval("n !== 3"), Value(false));
  EXPECT_EQ(eval("n != 4"), Value(true));
  EXPECT_EQ(eval("n < 4 && n >= 3"), Value(true));
  EXPECT_EQ(eval("nobody == null"), Value(true));
  EXPECT_EQ(eval("nobody === null"), Value(false));
  EXPECT_EQ(eval("nobody === undefined"), Value(true));
}

TEST_F(ExprEvaluatorTest, LogicalOperatorsReturnDecidingOperand)
{
  EXPECT_EQ(eval("empty || 'fallback'"), Value("fallback"));
  EXPECT_EQ(eval("name || 'fallback'"), Value("Ada"));
  EXPECT_EQ(eval("name && n"), Value(3));
  EXPECT_EQ(eval("empty && n"), Value(""));
  EXPECT_EQ(eval("!empty"), Value(true));
  EXPECT_EQ(eval("!!name"), Value(true));
}

TEST_F(ExprEvaluatorTest, ShortCircuitSkipsRightOperand)
{
  (void)eval("name || mark('rhs')");
  (void)eval("empty && mark('rhs')");
  EXPECT_TRUE(calls_.empty());

  (void)eval("empty || mark('rhs')");
  EXPECT_EQ(calls_, std::vector<std::string>{"rhs"});
}

TEST_F(ExprEvaluatorTest, UnaryMinus)
{
  EXPECT_EQ(eval("-n"), Value(-3));
  EXPECT_EQ(eval("-2.5"), Value(-2.5));
  EXPECT_EQ(eval("-'4'"), Value(-4.0));
  EXPECT_TRUE(std::isnan(eval("-name").get<double>()));
}

TEST_F(ExprEvaluatorTest, UnaryMinusOfLargeUnsigned)
{
  scope_.bind("huge", Value(std::numeric_limits<uint64_t>::max()));

  const Value negated = eval("-huge");
  ASSERT_TRUE(negated.is_number_float());
  EXPECT_DOUBLE_EQ(negated.get<double>(), -18446744073709551615.0);
  EXPECT_EQ(eval("huge > 0"), Value(true));
  EXPECT_EQ(eval("-huge < 0"), Value(true));
}

TEST_F(ExprEvaluatorTest, GroupingChangesPrecedence)
{
  EXPECT_EQ(eval("(empty || name) && 'ok'"), Value("ok"));
  EXPECT_EQ(eval("!(n === 3)"), Value(false));
}

TEST_F(ExprEvaluatorTest, ToolArgumentsEvaluateLeftToRight)
{
  EXPECT_EQ(eval("concat(mark('a'), mark('b'), mark('c'))"), Value("abc"));
  EXPECT_EQ(calls_, (std::vector<std::string>{"a", "b", "c", "concat"}));
}

TEST_F(ExprEvaluatorTest, DeferredToolResultIsAwaited)
{
  EXPECT_EQ(eval("deferred(post.title)"), Value("Hi"));
  EXPECT_TRUE(is_missing(eval("deferred()")));
}

TEST_F(ExprEvaluatorTest, UnknownToolIsReferenceError)
{
  try {
    (void)eval("nope(1)");
    FAIL() << "expected RenderError";
  } catch (const RenderError & e) {
    EXPECT_EQ(e.kind(), ErrorKind::Reference);
    EXPECT_EQ(e.detail(), "unknown tool 'nope'");
    EXPECT_EQ(e.component(), "pages.test");
    EXPECT_EQ(e.line(), 2U);
  }
}

TEST_F(ExprEvaluatorTest, ToolNamesAreCaseSensitive)
{
  EXPECT_THROW((void)eval("Concat('a')"), RenderError);
}

TEST_F(ExprEvaluatorTest, ThrowingToolIsToolError)
{
  try {
    (void)eval("boom()");
    FAIL() << "expected RenderError";
  } catch (const RenderError & e) {
    EXPECT_EQ(e.kind(), ErrorKind::Tool);
    EXPECT_EQ(e.detail(), "tool 'boom' failed: kaboom");
    EXPECT_EQ(std::string(e.what()), "ToolError: tool 'boom' failed: kaboom (pages.test:2)");
  }
}

}  // namespace stencil
