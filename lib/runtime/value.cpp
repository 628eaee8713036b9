// stencil/runtime/value.cpp - Value semantics
//
#include "stencil/runtime/value.hpp"

#include <fmt/core.h>

#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdlib>

namespace stencil
{

namespace
{

/// Largest magnitude at which every integral double is exactly an int64.
constexpr double k_max_exact_integral = 9007199254740992.0;  // 2^53

std::string number_to_text(double d)
{
  if (std::isnan(d)) {
    return "NaN";
  }
  if (std::isinf(d)) {
    return d > 0 ? "Infinity" : "-Infinity";
  }
  if (std::floor(d) == d && std::fabs(d) <= k_max_exact_integral) {
    return fmt::format("{}", static_cast<int64_t>(d));
  }
  return fmt::format("{}", d);
}

std::optional<double> string_to_number(const std::string & s)
{
  size_t begin = 0;
  size_t end = s.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(s[begin])) != 0) ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1])) != 0) --end;

  if (begin == end) {
    return 0.0;
  }

  const std::string trimmed = s.substr(begin, end - begin);
  char * parse_end = nullptr;
  const double d = std::strtod(trimmed.c_str(), &parse_end);
  if (parse_end != trimmed.c_str() + trimmed.size()) {
    return std::nullopt;
  }
  return d;
}

bool is_null_like(const Value & v) noexcept { return is_missing(v) || v.is_null(); }

}  // namespace

// ============================================================================
// Conversions
// ============================================================================

bool is_truthy(const Value & v) noexcept
{
  switch (v.type()) {
    case Value::value_t::discarded:
    case Value::value_t::null:
      return false;
    case Value::value_t::boolean:
      return v.get<bool>();
    case Value::value_t::number_integer:
      return v.get<int64_t>() != 0;
    case Value::value_t::number_unsigned:
      return v.get<uint64_t>() != 0;
    case Value::value_t::number_float: {
      const double d = v.get<double>();
      return d != 0.0 && !std::isnan(d);
    }
    case Value::value_t::string:
      return !v.get_ref<const std::string &>().empty();
    default:
      return true;
  }
}

std::string to_text(const Value & v)
{
  switch (v.type()) {
    case Value::value_t::discarded:
      return "undefined";
    case Value::value_t::null:
      return "null";
    case Value::value_t::boolean:
      return v.get<bool>() ? "true" : "false";
    case Value::value_t::number_integer:
      return fmt::format("{}", v.get<int64_t>());
    case Value::value_t::number_unsigned:
      return fmt::format("{}", v.get<uint64_t>());
    case Value::value_t::number_float:
      return number_to_text(v.get<double>());
    case Value::value_t::string:
      return v.get<std::string>();
    default:
      // Objects keep their keys sorted (std::map), so this is canonical.
      return v.dump(-1, ' ', false, Value::error_handler_t::replace);
  }
}

std::optional<double> to_number(const Value & v)
{
  switch (v.type()) {
    case Value::value_t::null:
      return 0.0;
    case Value::value_t::boolean:
      return v.get<bool>() ? 1.0 : 0.0;
    case Value::value_t::number_integer:
    case Value::value_t::number_unsigned:
    case Value::value_t::number_float:
      return v.get<double>();
    case Value::value_t::string:
      return string_to_number(v.get_ref<const std::string &>());
    default:
      return std::nullopt;
  }
}

std::string_view type_name(const Value & v) noexcept
{
  switch (v.type()) {
    case Value::value_t::discarded:
      return "undefined";
    case Value::value_t::null:
      return "null";
    case Value::value_t::boolean:
      return "boolean";
    case Value::value_t::number_integer:
    case Value::value_t::number_unsigned:
    case Value::value_t::number_float:
      return "number";
    case Value::value_t::string:
      return "string";
    case Value::value_t::array:
      return "array";
    case Value::value_t::object:
      return "object";
    case Value::value_t::binary:
      return "binary";
  }
  return "unknown";
}

// ============================================================================
// Operators
// ============================================================================

bool loose_equals(const Value & a, const Value & b)
{
  if (is_null_like(a) || is_null_like(b)) {
    return is_null_like(a) && is_null_like(b);
  }

  if (a.is_boolean() && !b.is_boolean()) {
    return loose_equals(Value(a.get<bool>() ? 1 : 0), b);
  }
  if (b.is_boolean() && !a.is_boolean()) {
    return loose_equals(a, Value(b.get<bool>() ? 1 : 0));
  }

  if (a.is_number() && b.is_number()) {
    return a.get<double>() == b.get<double>();
  }
  if (a.is_number() && b.is_string()) {
    const auto nb = to_number(b);
    return nb && a.get<double>() == *nb;
  }
  if (a.is_string() && b.is_number()) {
    const auto na = to_number(a);
    return na && *na == b.get<double>();
  }

  return a == b;
}

bool strict_equals(const Value & a, const Value & b)
{
  if (is_missing(a) || is_missing(b)) {
    return is_missing(a) && is_missing(b);
  }
  if (a.is_number() && b.is_number()) {
    return a.get<double>() == b.get<double>();
  }
  if (a.type() != b.type()) {
    return false;
  }
  return a == b;
}

bool compare_values(BinaryOp op, const Value & a, const Value & b)
{
  const auto apply = [op](const auto & lhs, const auto & rhs) {
    switch (op) {
      case BinaryOp::Lt:
        return lhs < rhs;
      case BinaryOp::Le:
        return lhs <= rhs;
      case BinaryOp::Gt:
        return lhs > rhs;
      case BinaryOp::Ge:
        return lhs >= rhs;
      default:
        return false;
    }
  };

  if (a.is_string() && b.is_string()) {
    return apply(a.get_ref<const std::string &>(), b.get_ref<const std::string &>());
  }
  if (a.is_number_unsigned() && b.is_number_unsigned()) {
    return apply(a.get<uint64_t>(), b.get<uint64_t>());
  }
  if (a.is_number_integer() && !a.is_number_unsigned() && b.is_number_integer() &&
      !b.is_number_unsigned()) {
    return apply(a.get<int64_t>(), b.get<int64_t>());
  }

  const auto na = to_number(a);
  const auto nb = to_number(b);
  if (!na || !nb) {
    return false;
  }
  // NaN compares false under every operator.
  return apply(*na, *nb);
}

// ============================================================================
// Access
// ============================================================================

Value member_of(const Value & base, std::string_view name)
{
  if (base.is_object()) {
    const auto it = base.find(std::string(name));
    if (it != base.end()) {
      return *it;
    }
    return missing();
  }
  if (name == "length") {
    if (base.is_array()) {
      return base.size();
    }
    if (base.is_string()) {
      return base.get_ref<const std::string &>().size();
    }
  }
  return missing();
}

Value index_of(const Value & base, const Value & index)
{
  if (index.is_string()) {
    return member_of(base, index.get_ref<const std::string &>());
  }
  if (!index.is_number()) {
    return missing();
  }

  const double d = index.get<double>();
  if (std::floor(d) != d) {
    return missing();
  }

  if (base.is_object()) {
    return member_of(base, to_text(index));
  }
  if (d < 0) {
    return missing();
  }

  // Bounds are checked in the double domain; the cast is only valid below the size.
  if (base.is_array()) {
    if (d >= static_cast<double>(base.size())) {
      return missing();
    }
    return base[static_cast<size_t>(d)];
  }
  if (base.is_string()) {
    const auto & s = base.get_ref<const std::string &>();
    if (d >= static_cast<double>(s.size())) {
      return missing();
    }
    return Value(std::string(1, s[static_cast<size_t>(d)]));
  }
  return missing();
}

}  // namespace stencil
