#include <gtest/gtest.h>

#include "stencil/basic/source_manager.hpp"

using stencil::SourceFile;
using stencil::SourceLocation;
using stencil::SourceRange;

TEST(BasicSourceFile, LineColumnIsOneIndexed)
{
  SourceFile file("pages.home", "ab\ncd\n\nef");

  EXPECT_EQ(file.line_count(), 4U);

  auto lc = file.get_line_column(0);
  EXPECT_EQ(lc.line, 1U);
  EXPECT_EQ(lc.column, 1U);

  lc = file.get_line_column(4);
  EXPECT_EQ(lc.line, 2U);
  EXPECT_EQ(lc.column, 2U);

  lc = file.get_line_column(7);
  EXPECT_EQ(lc.line, 4U);
  EXPECT_EQ(lc.column, 1U);
}

TEST(BasicSourceFile, LineOfInvalidLocationIsZero)
{
  SourceFile file("x", "one\ntwo");
  EXPECT_EQ(file.line_of(SourceLocation()), 0U);
  EXPECT_EQ(file.line_of(SourceLocation(4)), 2U);
}

TEST(BasicSourceFile, GetLineStripsLineEndings)
{
  SourceFile file("x", "first\r\nsecond\nthird");

  EXPECT_EQ(file.get_line(0), "first");
  EXPECT_EQ(file.get_line(1), "second");
  EXPECT_EQ(file.get_line(2), "third");
  EXPECT_EQ(file.get_line(3), "");
}

TEST(BasicSourceFile, SliceClampsToContent)
{
  SourceFile file("x", "hello world");

  EXPECT_EQ(file.get_slice(SourceRange(6, 11)), "world");
  EXPECT_EQ(file.get_slice(SourceRange(6, 100)), "world");
  EXPECT_EQ(file.get_slice(SourceRange()), "");
}

TEST(BasicSourceFile, FullRangeSpansLines)
{
  SourceFile file("x", "a\nbcd\ne");
  const auto fr = file.get_full_range(SourceRange(3, 7));

  EXPECT_EQ(fr.start_line, 2U);
  EXPECT_EQ(fr.start_column, 2U);
  EXPECT_EQ(fr.end_line, 3U);
  EXPECT_EQ(fr.end_column, 2U);
}

TEST(BasicSourceRange, JoinAndContains)
{
  const SourceRange a(2, 5);
  const SourceRange b(8, 12);
  const auto joined = stencil::join_ranges(a, b);

  EXPECT_EQ(joined.get_begin().offset(), 2U);
  EXPECT_EQ(joined.get_end().offset(), 12U);
  EXPECT_EQ(joined.size(), 10U);
  EXPECT_TRUE(joined.contains(SourceLocation(11)));
  EXPECT_FALSE(joined.contains(SourceLocation(12)));
  EXPECT_EQ(stencil::join_ranges(SourceRange(), b), b);
}
