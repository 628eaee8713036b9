#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "stencil/basic/diagnostic.hpp"
#include "stencil/basic/diagnostic_printer.hpp"
#include "stencil/test_support/render_helpers.hpp"

namespace stencil
{

TEST(BasicDiagnosticBag, BuilderRegistersOnDestruction)
{
  DiagnosticBag bag;
  {
    auto builder = bag.report_error(SourceRange(0, 3), "bad thing", "here");
    builder.with_code(diag_code::k_unexpected_token).with_help("try again");
    EXPECT_TRUE(bag.empty());
  }

  ASSERT_EQ(bag.size(), 1U);
  const Diagnostic & d = *bag.begin();
  EXPECT_EQ(d.code, "E0101");
  EXPECT_EQ(d.message, "bad thing");
  ASSERT_TRUE(d.help_message.has_value());
  EXPECT_EQ(*d.help_message, "try again");
  EXPECT_EQ(d.primary_range(), SourceRange(0, 3));
}

TEST(BasicDiagnosticBag, FirstErrorSkipsWarnings)
{
  DiagnosticBag bag;
  bag.report_warning(SourceRange(0, 1), "just a warning");
  bag.report_error(SourceRange(1, 2), "first").with_code(diag_code::k_block_mismatch);
  bag.report_error(SourceRange(2, 3), "second");

  EXPECT_TRUE(bag.has_errors());
  EXPECT_EQ(bag.errors().size(), 2U);
  ASSERT_NE(bag.first_error(), nullptr);
  EXPECT_EQ(bag.first_error()->message, "first");
}

TEST(BasicDiagnosticBag, WarningsAloneAreNotErrors)
{
  DiagnosticBag bag;
  bag.report_warning(SourceRange(0, 1), "w");
  EXPECT_FALSE(bag.has_errors());
  EXPECT_EQ(bag.first_error(), nullptr);
}

TEST(BasicDiagnosticPrinter, PrintsCodeLocationAndSourceLine)
{
  auto unit = test_support::parse("$if(a)\nx\n$endforeach\n", "layouts.main");
  ASSERT_TRUE(unit->has_errors());

  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print_all(unit->diags, unit->source);

  const std::string text = out.str();
  EXPECT_NE(text.find("error[E0102]"), std::string::npos) << text;
  EXPECT_NE(text.find("  --> layouts.main:3:1"), std::string::npos) << text;
  EXPECT_NE(text.find("    3 | $endforeach"), std::string::npos) << text;
  EXPECT_NE(text.find("^"), std::string::npos) << text;
}

TEST(BasicDiagnosticPrinter, PrintsHelpMessage)
{
  SourceFile source("t", "hello\n");
  DiagnosticBag bag;
  bag.report_error(SourceRange(0, 5), "oops", "this").with_code("E0001").with_help("fix it");

  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print_all(bag, source);

  const std::string text = out.str();
  EXPECT_NE(text.find("error[E0001]: oops"), std::string::npos) << text;
  EXPECT_NE(text.find("^^^^^ this"), std::string::npos) << text;
  EXPECT_NE(text.find("= help: fix it"), std::string::npos) << text;
}

}  // namespace stencil
