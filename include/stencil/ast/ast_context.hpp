// stencil/ast/ast_context.hpp - AST arena allocator and string pool
//
// AstContext owns every node and interned string of one parsed component.
// Memory comes from a std::pmr::monotonic_buffer_resource and is released
// all at once when the context is destroyed.
//
#pragma once

#include <cstddef>
#include <cstring>
#include <gsl/span>
#include <memory>
#include <memory_resource>
#include <string_view>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <vector>

namespace stencil
{

class AstNode;

// ============================================================================
// AstContext - PMR Arena Allocator and String Pool
// ============================================================================

/**
 * Arena that owns all AST nodes and interned strings of a component.
 *
 * Nodes are never freed individually. They stay valid for as long as the
 * context is alive, which in practice is the lifetime of the cached
 * ParsedComponent.
 *
 * Example:
 * @code
 *   AstContext ctx;
 *   auto* name = ctx.intern("title");
 *   auto* ref = ctx.create<LocalRefExpr>(name, range);
 * @endcode
 */
class AstContext
{
public:
  /// Default initial buffer size (16KB); templates are small
  static constexpr size_t k_default_buffer_size = size_t{16} * size_t{1024};

  explicit AstContext(size_t initialBufferSize = k_default_buffer_size)
  : arena_(initialBufferSize), stringPool_(&arena_)
  {
  }

  ~AstContext() = default;

  AstContext(const AstContext &) = delete;
  AstContext & operator=(const AstContext &) = delete;
  AstContext(AstContext &&) = delete;
  AstContext & operator=(AstContext &&) = delete;

  // ===========================================================================
  // Node Creation
  // ===========================================================================

  /**
   * Construct a node of type T in the arena.
   *
   * @return Non-owning pointer, valid until the context is destroyed
   */
  template <typename T, typename... Args>
  T * create(Args &&... args)
  {
    static_assert(std::is_base_of_v<AstNode, T>, "T must derive from AstNode");
    static_assert(
      std::is_trivially_destructible_v<T>,
      "AST Node must be trivially destructible to be managed by Arena! "
      "Use std::string_view instead of std::string, gsl::span instead of std::vector.");

    void * const mem = arena_.allocate(sizeof(T), alignof(T));
    return new (mem) T(std::forward<Args>(args)...);
  }

  // ===========================================================================
  // String Interning
  // ===========================================================================

  /// Intern a string; equal inputs return views of the same storage.
  [[nodiscard]] std::string_view intern(std::string_view s)
  {
    auto it = stringPool_.find(s);
    if (it != stringPool_.end()) {
      return *it;
    }
    if (s.empty()) {
      return *stringPool_.insert(std::string_view{}).first;
    }

    char * const ptr = static_cast<char *>(arena_.allocate(s.size(), 1));
    std::memcpy(ptr, s.data(), s.size());

    const std::string_view stored_view(ptr, s.size());
    stringPool_.insert(stored_view);
    return stored_view;
  }

  [[nodiscard]] bool is_interned(std::string_view s) const
  {
    return stringPool_.find(s) != stringPool_.end();
  }

  [[nodiscard]] size_t get_string_count() const noexcept { return stringPool_.size(); }

  // ===========================================================================
  // Array Allocation
  // ===========================================================================

  /// Allocate a value-initialized array (nullptr for pointer elements).
  template <typename T>
  [[nodiscard]] gsl::span<T> allocate_array(size_t size)
  {
    if (size == 0) return {};
    T * const ptr = static_cast<T *>(
      arena_.allocate(sizeof(T) * size, alignof(T)));  // NOLINT(bugprone-sizeof-expression)
    std::uninitialized_value_construct_n(ptr, size);
    return gsl::span<T>(ptr, size);
  }

  /// Copy a temporary child list built by the parser into the arena.
  template <typename T>
  [[nodiscard]] gsl::span<T> copy_to_arena(const std::vector<T> & vec)
  {
    auto span = allocate_array<T>(vec.size());
    std::copy(vec.begin(), vec.end(), span.begin());
    return span;
  }

private:
  std::pmr::monotonic_buffer_resource arena_;
  std::pmr::unordered_set<std::string_view> stringPool_;
};

}  // namespace stencil
