// stencil/basic/casting.hpp - LLVM-style RTTI casting utilities
//
// Works with any class hierarchy that implements a static `classof`.
//
// Usage:
//   if (isa<IfStmt>(node)) { ... }
//   auto* stmt = cast<IfStmt>(node);                 // asserts on failure
//   if (auto* call = dyn_cast<ToolCallExpr>(e)) { ... }  // nullptr on failure
//
#pragma once

#include <cassert>
#include <type_traits>

namespace stencil
{

namespace detail
{

template <typename T, typename From, typename = void>
struct HasClassof : std::false_type
{
};

template <typename T, typename From>
struct HasClassof<T, From, std::void_t<decltype(T::classof(std::declval<const From *>()))>>
: std::true_type
{
};

template <typename T, typename From>
inline constexpr bool has_classof_v = HasClassof<T, From>::value;

}  // namespace detail

/// Check if a node is of type T (false for nullptr).
template <typename T, typename From>
[[nodiscard]] inline bool isa(const From * node) noexcept
{
  static_assert(detail::has_classof_v<T, From>, "Target type must have a classof() static method");
  return node != nullptr && T::classof(node);
}

template <typename T, typename From>
[[nodiscard]] inline bool isa(From * node) noexcept
{
  return isa<T>(static_cast<const From *>(node));
}

/// Unchecked downcast; the node must be non-null and of type T.
template <typename T, typename From>
[[nodiscard]] inline T * cast(From * node) noexcept
{
  assert(node != nullptr && "cast<T>() called with nullptr");
  assert(isa<T>(node) && "Invalid cast");
  return static_cast<T *>(node);
}

template <typename T, typename From>
[[nodiscard]] inline const T * cast(const From * node) noexcept
{
  assert(node != nullptr && "cast<T>() called with nullptr");
  assert(isa<T>(node) && "Invalid cast");
  return static_cast<const T *>(node);
}

/// Checked downcast; returns nullptr when the node is null or not a T.
template <typename T, typename From>
[[nodiscard]] inline T * dyn_cast(From * node) noexcept
{
  return isa<T>(node) ? static_cast<T *>(node) : nullptr;
}

template <typename T, typename From>
[[nodiscard]] inline const T * dyn_cast(const From * node) noexcept
{
  return isa<T>(node) ? static_cast<const T *>(node) : nullptr;
}

}  // namespace stencil
