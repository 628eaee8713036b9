// test_parser.cpp - Unit tests for statement and expression parsing
//
#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "stencil/ast/ast.hpp"
#include "stencil/basic/casting.hpp"
#include "stencil/test_support/render_helpers.hpp"

namespace stencil
{

namespace
{

bool has_code(const ParsedComponent & unit, const std::string & code)
{
  const auto codes = test_support::error_codes(unit);
  return std::find(codes.begin(), codes.end(), code) != codes.end();
}

const Expr * short_print_value(const ParsedComponent & unit)
{
  EXPECT_EQ(unit.root->body.size(), 1U);
  const auto * print = dyn_cast<PrintStmt>(unit.root->body[0]);
  EXPECT_NE(print, nullptr);
  return print != nullptr ? print->value : nullptr;
}

}  // namespace

// ============================================================================
// Statements
// ============================================================================

TEST(SyntaxParser, TextAndShortPrint)
{
  auto unit = test_support::parse("a$(x)b");
  ASSERT_FALSE(unit->has_errors());
  ASSERT_EQ(unit->root->body.size(), 3U);

  const auto * head = dyn_cast<TextStmt>(unit->root->body[0]);
  ASSERT_NE(head, nullptr);
  EXPECT_EQ(head->text, "a");

  const auto * print = dyn_cast<PrintStmt>(unit->root->body[1]);
  ASSERT_NE(print, nullptr);
  EXPECT_TRUE(print->shortForm);
  const auto * ref = dyn_cast<LocalRefExpr>(print->value);
  ASSERT_NE(ref, nullptr);
  EXPECT_EQ(ref->name, "x");

  EXPECT_TRUE(isa<TextStmt>(unit->root->body[2]));
}

TEST(SyntaxParser, PrintAndLogTakeOneArgument)
{
  auto unit = test_support::parse("$print(user.name)$log('hi')");
  ASSERT_FALSE(unit->has_errors());
  ASSERT_EQ(unit->root->body.size(), 2U);

  const auto * print = dyn_cast<PrintStmt>(unit->root->body[0]);
  ASSERT_NE(print, nullptr);
  EXPECT_FALSE(print->shortForm);
  const auto * member = dyn_cast<MemberExpr>(print->value);
  ASSERT_NE(member, nullptr);
  EXPECT_EQ(member->member, "name");

  const auto * log = dyn_cast<LogStmt>(unit->root->body[1]);
  ASSERT_NE(log, nullptr);
  EXPECT_TRUE(isa<StringLiteralExpr>(log->value));
}

TEST(SyntaxParser, LogWithSeveralArgumentsIsAnError)
{
  auto unit = test_support::parse("$log(a, b)");
  EXPECT_TRUE(has_code(*unit, "E0104"));
}

TEST(SyntaxParser, PrintWithoutArgumentsIsAnError)
{
  auto unit = test_support::parse("$print()");
  EXPECT_TRUE(has_code(*unit, "E0104"));
}

TEST(SyntaxParser, KeywordWithoutArgumentListIsAnError)
{
  auto unit = test_support::parse("$print x");
  EXPECT_TRUE(has_code(*unit, "E0101"));
}

TEST(SyntaxParser, IfChain)
{
  auto unit = test_support::parse("$if(a)A$elseif(b)B$elseif(c)C$else D$endif!");
  ASSERT_FALSE(unit->has_errors());
  ASSERT_EQ(unit->root->body.size(), 2U);

  const auto * stmt = dyn_cast<IfStmt>(unit->root->body[0]);
  ASSERT_NE(stmt, nullptr);
  ASSERT_EQ(stmt->branches.size(), 3U);
  EXPECT_TRUE(stmt->hasElse);
  ASSERT_EQ(stmt->elseBody.size(), 1U);
  EXPECT_EQ(cast<TextStmt>(stmt->elseBody[0])->text, " D");

  const auto * second = stmt->branches[1];
  EXPECT_EQ(cast<LocalRefExpr>(second->condition)->name, "b");
  ASSERT_EQ(second->body.size(), 1U);
  EXPECT_EQ(cast<TextStmt>(second->body[0])->text, "B");
}

TEST(SyntaxParser, IfWithoutElse)
{
  auto unit = test_support::parse("$if(a)yes$endif");
  ASSERT_FALSE(unit->has_errors());
  const auto * stmt = cast<IfStmt>(unit->root->body[0]);
  EXPECT_FALSE(stmt->hasElse);
  EXPECT_EQ(stmt->branches.size(), 1U);
}

TEST(SyntaxParser, ElseIfAfterElseIsAnOrderError)
{
  auto unit = test_support::parse("$if(a)A$else B$elseif(c)C$endif");
  EXPECT_TRUE(has_code(*unit, "E0103"));
}

TEST(SyntaxParser, DuplicateElseIsAnOrderError)
{
  auto unit = test_support::parse("$if(a)A$else B$else C$endif");
  EXPECT_TRUE(has_code(*unit, "E0103"));
}

TEST(SyntaxParser, StrayElseIsAnOrderError)
{
  auto unit = test_support::parse("text $else more");
  EXPECT_TRUE(has_code(*unit, "E0103"));
}

TEST(SyntaxParser, MissingEndIfIsABlockError)
{
  auto unit = test_support::parse("$if(a)\nnever closed\n");
  ASSERT_TRUE(unit->has_errors());
  EXPECT_EQ(unit->diags.first_error()->code, "E0102");
}

TEST(SyntaxParser, MismatchedTerminatorIsABlockError)
{
  auto unit = test_support::parse("$foreach(i, xs) body $endif");
  ASSERT_TRUE(unit->has_errors());
  EXPECT_EQ(unit->diags.first_error()->code, "E0102");
}

TEST(SyntaxParser, StrayEndForeachIsABlockError)
{
  auto unit = test_support::parse("$endforeach");
  EXPECT_TRUE(has_code(*unit, "E0102"));
}

TEST(SyntaxParser, ForeachTwoArgumentForm)
{
  auto unit = test_support::parse("$foreach(post, posts)$(post.title)$endforeach");
  ASSERT_FALSE(unit->has_errors());

  const auto * loop = dyn_cast<ForeachStmt>(unit->root->body[0]);
  ASSERT_NE(loop, nullptr);
  EXPECT_EQ(loop->itemName, "post");
  EXPECT_FALSE(loop->indexName.has_value());
  EXPECT_EQ(cast<LocalRefExpr>(loop->collection)->name, "posts");
  EXPECT_EQ(loop->body.size(), 1U);
}

TEST(SyntaxParser, ForeachThreeArgumentFormBindsIndex)
{
  auto unit = test_support::parse("$foreach(item, i, @menu.items)x$endforeach");
  ASSERT_FALSE(unit->has_errors());

  const auto * loop = cast<ForeachStmt>(unit->root->body[0]);
  EXPECT_EQ(loop->itemName, "item");
  ASSERT_TRUE(loop->indexName.has_value());
  EXPECT_EQ(*loop->indexName, "i");
  EXPECT_TRUE(isa<MemberExpr>(loop->collection));
}

TEST(SyntaxParser, ForeachWrongArgumentCount)
{
  auto unit = test_support::parse("$foreach(items)x$endforeach");
  EXPECT_TRUE(has_code(*unit, "E0104"));
}

TEST(SyntaxParser, ForeachLoopVariableMustBeAName)
{
  auto unit = test_support::parse("$foreach('a', xs)x$endforeach");
  EXPECT_TRUE(has_code(*unit, "E0101"));
}

TEST(SyntaxParser, RenderWithBindingsAndReplacements)
{
  auto unit = test_support::parse(
    "$render('ui.card', title=post.title, n=1)\n"
    "  $replace('body')<p>$(text)</p>$endreplace\n"
    "  $replace('footer')F$endreplace\n"
    "$endrender");
  ASSERT_FALSE(unit->has_errors());
  ASSERT_EQ(unit->root->body.size(), 1U);

  const auto * render = dyn_cast<RenderStmt>(unit->root->body[0]);
  ASSERT_NE(render, nullptr);
  EXPECT_EQ(cast<StringLiteralExpr>(render->target)->value, "ui.card");

  ASSERT_EQ(render->bindings.size(), 2U);
  EXPECT_EQ(render->bindings[0]->name, "title");
  EXPECT_TRUE(isa<MemberExpr>(render->bindings[0]->value));
  EXPECT_EQ(render->bindings[1]->name, "n");

  ASSERT_EQ(render->replacements.size(), 2U);
  EXPECT_EQ(render->replacements[0]->name, "body");
  EXPECT_EQ(render->replacements[0]->body.size(), 3U);
  EXPECT_EQ(render->replacements[1]->name, "footer");
}

TEST(SyntaxParser, RenderRequiresEndRender)
{
  auto unit = test_support::parse("$render('a')");
  EXPECT_TRUE(has_code(*unit, "E0102"));
}

TEST(SyntaxParser, ContentBetweenRenderAndEndRenderIsRejected)
{
  auto unit = test_support::parse("$render('a') stray $(x) $endrender");
  EXPECT_TRUE(has_code(*unit, "E0202"));
}

TEST(SyntaxParser, DuplicateReplaceNameIsRejected)
{
  auto unit = test_support::parse(
    "$render('a')$replace('x')1$endreplace$replace('x')2$endreplace$endrender");
  EXPECT_TRUE(has_code(*unit, "E0202"));
}

TEST(SyntaxParser, PlaceInsideReplaceIsACompositionError)
{
  auto unit = test_support::parse(
    "$render('a')$replace('x')$place('y')$endreplace$endrender");
  ASSERT_TRUE(unit->has_errors());
  EXPECT_EQ(unit->diags.first_error()->code, "E0201");
}

TEST(SyntaxParser, ReplaceOutsideRenderIsRejected)
{
  auto unit = test_support::parse("$replace('x')body$endreplace");
  EXPECT_TRUE(has_code(*unit, "E0101"));
}

TEST(SyntaxParser, PlaceAndIncludeTakeStaticNames)
{
  auto unit = test_support::parse("$place('main')$include('partials.raw')");
  ASSERT_FALSE(unit->has_errors());
  EXPECT_EQ(cast<PlaceStmt>(unit->root->body[0])->name, "main");
  EXPECT_EQ(cast<IncludeStmt>(unit->root->body[1])->componentName, "partials.raw");

  auto dynamic = test_support::parse("$include(name)");
  EXPECT_TRUE(has_code(*dynamic, "E0101"));
}

TEST(SyntaxParser, UnterminatedArgumentListReportsOpenerLine)
{
  auto unit = test_support::parse("line1\n$print(a");
  ASSERT_TRUE(unit->has_errors());
  const Diagnostic * err = unit->diags.first_error();
  EXPECT_EQ(err->code, "E0001");
  EXPECT_EQ(unit->source.line_of(err->primary_range().get_begin()), 2U);
}

// ============================================================================
// Expressions
// ============================================================================

TEST(SyntaxParser, LogicalPrecedence)
{
  auto unit = test_support::parse("$(a || b && c)");
  ASSERT_FALSE(unit->has_errors());

  const auto * bin = dyn_cast<BinaryExpr>(short_print_value(*unit));
  ASSERT_NE(bin, nullptr);
  EXPECT_EQ(bin->op, BinaryOp::Or);
  const auto * rhs = dyn_cast<BinaryExpr>(bin->rhs);
  ASSERT_NE(rhs, nullptr);
  EXPECT_EQ(rhs->op, BinaryOp::And);
}

TEST(SyntaxParser, ComparisonBindsTighterThanLogical)
{
  auto unit = test_support::parse("$(a < 3 && b !== 'x')");
  ASSERT_FALSE(unit->has_errors());

  const auto * bin = cast<BinaryExpr>(short_print_value(*unit));
  EXPECT_EQ(bin->op, BinaryOp::And);
  EXPECT_EQ(cast<BinaryExpr>(bin->lhs)->op, BinaryOp::Lt);
  EXPECT_EQ(cast<BinaryExpr>(bin->rhs)->op, BinaryOp::StrictNe);
}

TEST(SyntaxParser, UnaryNotAppliesBeforeEquality)
{
  auto unit = test_support::parse("$(!a == b)");
  ASSERT_FALSE(unit->has_errors());

  const auto * bin = cast<BinaryExpr>(short_print_value(*unit));
  EXPECT_EQ(bin->op, BinaryOp::LooseEq);
  const auto * lhs = dyn_cast<UnaryExpr>(bin->lhs);
  ASSERT_NE(lhs, nullptr);
  EXPECT_EQ(lhs->op, UnaryOp::Not);
}

TEST(SyntaxParser, PostfixChains)
{
  auto unit = test_support::parse("$(@site.menus['main'][0].label)");
  ASSERT_FALSE(unit->has_errors());

  const auto * label = dyn_cast<MemberExpr>(short_print_value(*unit));
  ASSERT_NE(label, nullptr);
  EXPECT_EQ(label->member, "label");

  const auto * first = dyn_cast<IndexExpr>(label->base);
  ASSERT_NE(first, nullptr);
  EXPECT_EQ(cast<IntLiteralExpr>(first->index)->value, 0);

  const auto * keyed = dyn_cast<IndexExpr>(first->base);
  ASSERT_NE(keyed, nullptr);
  EXPECT_EQ(cast<StringLiteralExpr>(keyed->index)->value, "main");

  const auto * menus = cast<MemberExpr>(keyed->base);
  EXPECT_EQ(cast<GlobalRefExpr>(menus->base)->name, "site");
}

TEST(SyntaxParser, ToolCallArguments)
{
  auto unit = test_support::parse("$(format(a, 'x', now()))");
  ASSERT_FALSE(unit->has_errors());

  const auto * call = dyn_cast<ToolCallExpr>(short_print_value(*unit));
  ASSERT_NE(call, nullptr);
  EXPECT_EQ(call->name, "format");
  ASSERT_EQ(call->args.size(), 3U);
  const auto * inner = dyn_cast<ToolCallExpr>(call->args[2]);
  ASSERT_NE(inner, nullptr);
  EXPECT_EQ(inner->args.size(), 0U);
}

TEST(SyntaxParser, Literals)
{
  auto unit = test_support::parse("$print(true)$print(false)$print(null)$print(undefined)$print(2.5)");
  ASSERT_FALSE(unit->has_errors());
  ASSERT_EQ(unit->root->body.size(), 5U);

  EXPECT_TRUE(cast<BoolLiteralExpr>(cast<PrintStmt>(unit->root->body[0])->value)->value);
  EXPECT_FALSE(cast<BoolLiteralExpr>(cast<PrintStmt>(unit->root->body[1])->value)->value);
  EXPECT_TRUE(isa<NullLiteralExpr>(cast<PrintStmt>(unit->root->body[2])->value));
  EXPECT_TRUE(isa<UndefinedLiteralExpr>(cast<PrintStmt>(unit->root->body[3])->value));
  EXPECT_DOUBLE_EQ(cast<FloatLiteralExpr>(cast<PrintStmt>(unit->root->body[4])->value)->value, 2.5);
}

TEST(SyntaxParser, StringEscapes)
{
  auto unit = test_support::parse(R"($('a\nb\t\'c\'\\'))");
  ASSERT_FALSE(unit->has_errors());
  EXPECT_EQ(cast<StringLiteralExpr>(short_print_value(*unit))->value, "a\nb\t'c'\\");
}

TEST(SyntaxParser, GroupingAndNegation)
{
  auto unit = test_support::parse("$(-(a))");
  ASSERT_FALSE(unit->has_errors());

  const auto * neg = dyn_cast<UnaryExpr>(short_print_value(*unit));
  ASSERT_NE(neg, nullptr);
  EXPECT_EQ(neg->op, UnaryOp::Neg);
  EXPECT_TRUE(isa<GroupExpr>(neg->operand));
}

TEST(SyntaxParser, MissingOperandIsReported)
{
  auto unit = test_support::parse("$(a ==)");
  EXPECT_TRUE(has_code(*unit, "E0101"));
}

}  // namespace stencil
