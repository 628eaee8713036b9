#include <gtest/gtest.h>

#include <cmath>
#include <cstdint>
#include <limits>

#include "stencil/runtime/value.hpp"

namespace stencil
{

TEST(RuntimeValue, FalsyValues)
{
  EXPECT_FALSE(is_truthy(missing()));
  EXPECT_FALSE(is_truthy(Value(nullptr)));
  EXPECT_FALSE(is_truthy(Value(false)));
  EXPECT_FALSE(is_truthy(Value(0)));
  EXPECT_FALSE(is_truthy(Value(0.0)));
  EXPECT_FALSE(is_truthy(Value(std::numeric_limits<double>::quiet_NaN())));
  EXPECT_FALSE(is_truthy(Value("")));
}

TEST(RuntimeValue, TruthyValues)
{
  EXPECT_TRUE(is_truthy(Value(1)));
  EXPECT_TRUE(is_truthy(Value(-0.5)));
  EXPECT_TRUE(is_truthy(Value("a")));
  EXPECT_TRUE(is_truthy(Value("0")));
  EXPECT_TRUE(is_truthy(Value(true)));
  EXPECT_TRUE(is_truthy(Value::object()));
  EXPECT_TRUE(is_truthy(Value::array()));
}

TEST(RuntimeValue, TextOfScalars)
{
  EXPECT_EQ(to_text(missing()), "undefined");
  EXPECT_EQ(to_text(Value(nullptr)), "null");
  EXPECT_EQ(to_text(Value(true)), "true");
  EXPECT_EQ(to_text(Value(false)), "false");
  EXPECT_EQ(to_text(Value(42)), "42");
  EXPECT_EQ(to_text(Value(-7)), "-7");
  EXPECT_EQ(to_text(Value(2.0)), "2");
  EXPECT_EQ(to_text(Value(2.5)), "2.5");
  EXPECT_EQ(to_text(Value("hi")), "hi");
  EXPECT_EQ(to_text(Value(std::numeric_limits<double>::quiet_NaN())), "NaN");
  EXPECT_EQ(to_text(Value(std::numeric_limits<double>::infinity())), "Infinity");
}

TEST(RuntimeValue, TextOfContainersIsCompactJsonWithSortedKeys)
{
  Value obj = Value::object();
  obj["b"] = 1;
  obj["a"] = "x";
  EXPECT_EQ(to_text(obj), R"({"a":"x","b":1})");
  EXPECT_EQ(to_text(Value::array({1, "two", nullptr})), R"([1,"two",null])");
}

TEST(RuntimeValue, ToNumber)
{
  EXPECT_EQ(to_number(Value(nullptr)), 0.0);
  EXPECT_EQ(to_number(Value(true)), 1.0);
  EXPECT_EQ(to_number(Value(" 12 ")), 12.0);
  EXPECT_EQ(to_number(Value("")), 0.0);
  EXPECT_FALSE(to_number(Value("12px")).has_value());
  EXPECT_FALSE(to_number(missing()).has_value());
  EXPECT_FALSE(to_number(Value::array()).has_value());
}

TEST(RuntimeValue, LooseEquality)
{
  EXPECT_TRUE(loose_equals(Value(nullptr), missing()));
  EXPECT_TRUE(loose_equals(Value(1), Value("1")));
  EXPECT_TRUE(loose_equals(Value(1), Value(1.0)));
  EXPECT_TRUE(loose_equals(Value(true), Value(1)));
  EXPECT_FALSE(loose_equals(Value(0), Value(nullptr)));
  EXPECT_FALSE(loose_equals(Value("a"), Value("b")));
}

TEST(RuntimeValue, StrictEquality)
{
  EXPECT_TRUE(strict_equals(Value(1), Value(1.0)));
  EXPECT_FALSE(strict_equals(Value(1), Value("1")));
  EXPECT_FALSE(strict_equals(Value(nullptr), missing()));
  EXPECT_TRUE(strict_equals(missing(), missing()));
  EXPECT_TRUE(strict_equals(Value("a"), Value("a")));
}

TEST(RuntimeValue, Comparison)
{
  EXPECT_TRUE(compare_values(BinaryOp::Lt, Value(1), Value(2)));
  EXPECT_TRUE(compare_values(BinaryOp::Ge, Value(2.5), Value(2)));
  EXPECT_TRUE(compare_values(BinaryOp::Lt, Value("apple"), Value("banana")));
  EXPECT_TRUE(compare_values(BinaryOp::Le, Value("3"), Value(3)));
  EXPECT_FALSE(compare_values(BinaryOp::Lt, missing(), Value(1)));
  EXPECT_FALSE(compare_values(BinaryOp::Gt, Value("x"), Value(1)));
}

TEST(RuntimeValue, ComparisonOfLargeUnsignedNumbers)
{
  const Value big(std::numeric_limits<uint64_t>::max());
  ASSERT_TRUE(big.is_number_unsigned());

  EXPECT_TRUE(compare_values(BinaryOp::Gt, big, Value(0)));
  EXPECT_FALSE(compare_values(BinaryOp::Lt, big, Value(0)));
  EXPECT_TRUE(compare_values(BinaryOp::Gt, big, Value(-1)));
  EXPECT_TRUE(compare_values(BinaryOp::Lt, Value(uint64_t{1}), big));
  EXPECT_TRUE(compare_values(BinaryOp::Ge, big, big));
}

TEST(RuntimeValue, MemberAccess)
{
  const Value post = {{"title", "Hi"}, {"tags", {"a", "b"}}};

  EXPECT_EQ(member_of(post, "title"), Value("Hi"));
  EXPECT_TRUE(is_missing(member_of(post, "missing")));
  EXPECT_EQ(member_of(post["tags"], "length"), Value(2));
  EXPECT_EQ(member_of(Value("héllo"), "length"), Value(6));
  EXPECT_TRUE(is_missing(member_of(missing(), "x")));
  EXPECT_TRUE(is_missing(member_of(Value(nullptr), "x")));
}

TEST(RuntimeValue, IndexAccess)
{
  const Value list = Value::array({"a", "b"});
  const Value map = {{"k", 1}, {"0", "zero"}};

  EXPECT_EQ(index_of(list, Value(1)), Value("b"));
  EXPECT_TRUE(is_missing(index_of(list, Value(2))));
  EXPECT_TRUE(is_missing(index_of(list, Value(-1))));
  EXPECT_TRUE(is_missing(index_of(list, Value(0.5))));
  EXPECT_EQ(index_of(map, Value("k")), Value(1));
  EXPECT_EQ(index_of(map, Value(0)), Value("zero"));
  EXPECT_EQ(index_of(Value("xyz"), Value(2)), Value("z"));
}

TEST(RuntimeValue, IndexBeyondSizeRangeIsMissing)
{
  const Value list = Value::array({1, 2, 3});

  EXPECT_TRUE(is_missing(index_of(list, Value(1e300))));
  EXPECT_TRUE(is_missing(index_of(list, Value(18446744073709551616.0))));
  EXPECT_TRUE(is_missing(index_of(list, Value(std::numeric_limits<double>::infinity()))));
  EXPECT_TRUE(is_missing(index_of(list, Value(std::numeric_limits<uint64_t>::max()))));
  EXPECT_TRUE(is_missing(index_of(list, Value(3.0))));
  EXPECT_EQ(index_of(list, Value(2.0)), Value(3));

  EXPECT_TRUE(is_missing(index_of(Value("xyz"), Value(1e300))));
  EXPECT_TRUE(is_missing(index_of(Value("xyz"), Value(std::numeric_limits<double>::infinity()))));
}

TEST(RuntimeValue, TypeNames)
{
  EXPECT_EQ(type_name(missing()), "undefined");
  EXPECT_EQ(type_name(Value(nullptr)), "null");
  EXPECT_EQ(type_name(Value(3)), "number");
  EXPECT_EQ(type_name(Value(3.5)), "number");
  EXPECT_EQ(type_name(Value("s")), "string");
  EXPECT_EQ(type_name(Value::array()), "array");
  EXPECT_EQ(type_name(Value::object()), "object");
}

}  // namespace stencil
