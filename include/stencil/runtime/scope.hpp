// stencil/runtime/scope.hpp - Lexical binding frames
//
// Frames live on the C++ stack of the renderer: the root frame of a
// component render, one frame per loop iteration. A frame only reads its
// parent, so a shadowing binding disappears together with its frame and the
// outer binding becomes visible again.
//
#pragma once

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <utility>

#include "stencil/runtime/value.hpp"

namespace stencil
{

class Scope
{
public:
  explicit Scope(const Scope * parent = nullptr) : parent_(parent) {}

  Scope(const Scope &) = delete;
  Scope & operator=(const Scope &) = delete;

  /// Bind (or rebind) a name in this frame only.
  void bind(std::string name, Value value) { bindings_[std::move(name)] = std::move(value); }

  /// Binding in this frame only.
  [[nodiscard]] const Value * find_local(std::string_view name) const
  {
    const auto it = bindings_.find(name);
    return it != bindings_.end() ? &it->second : nullptr;
  }

  /// Innermost binding visible from this frame, or nullptr.
  [[nodiscard]] const Value * lookup(std::string_view name) const
  {
    for (const Scope * s = this; s != nullptr; s = s->parent_) {
      if (const Value * v = s->find_local(name)) {
        return v;
      }
    }
    return nullptr;
  }

  [[nodiscard]] const Scope * parent() const noexcept { return parent_; }
  [[nodiscard]] size_t size() const noexcept { return bindings_.size(); }

private:
  const Scope * parent_;
  std::map<std::string, Value, std::less<>> bindings_;
};

}  // namespace stencil
