// stencil/syntax/frontend.hpp - High-level parse pipeline entry point
#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <utility>

#include "stencil/ast/ast.hpp"
#include "stencil/ast/ast_context.hpp"
#include "stencil/basic/diagnostic.hpp"
#include "stencil/basic/source_manager.hpp"

namespace stencil
{

/**
 * Everything produced by parsing one component.
 *
 * The tree points into `ast`, so a ParsedComponent is always heap
 * allocated and shared (it is immutable once parsing finished, which makes
 * it safe to hand to concurrent renders).
 */
struct ParsedComponent
{
  ParsedComponent(std::string name, std::string text) : source(std::move(name), std::move(text)) {}

  ParsedComponent(const ParsedComponent &) = delete;
  ParsedComponent & operator=(const ParsedComponent &) = delete;

  SourceFile source;
  AstContext ast;
  DiagnosticBag diags;
  Component * root = nullptr;

  [[nodiscard]] const std::string & name() const noexcept { return source.name(); }
  [[nodiscard]] bool has_errors() const { return diags.has_errors(); }

  /// 1-based line of a node (0 when unknown).
  [[nodiscard]] uint32_t line_of(const AstNode * node) const noexcept
  {
    return node != nullptr ? source.line_of(node->get_range().get_begin()) : 0;
  }
};

// Parse pipeline:
// template text -> lexer (token stream) -> recursive-descent parser (AST) -> diagnostics
[[nodiscard]] std::shared_ptr<ParsedComponent> parse_component(std::string name, std::string text);

}  // namespace stencil
