// stencil/ast/ast_utils.cpp - Structural queries over a component tree
//
#include "stencil/ast/ast_utils.hpp"

#include <algorithm>
#include <utility>

#include "stencil/ast/visitor.hpp"

namespace stencil
{

namespace
{

void push_unique(std::vector<std::string_view> & out, std::string_view name)
{
  if (std::find(out.begin(), out.end(), name) == out.end()) {
    out.push_back(name);
  }
}

class PlaceholderCollector : public RecursiveAstVisitor<PlaceholderCollector, const AstNode *>
{
public:
  std::vector<std::string_view> names;

  bool visit_place_stmt(const PlaceStmt * node)
  {
    push_unique(names, node->name);
    return true;
  }

  // Replace bodies belong to the callee's placeholders, not ours.
  bool visit_replace_block(const ReplaceBlock * /*node*/) { return true; }
};

class ToolCallCollector : public RecursiveAstVisitor<ToolCallCollector, const AstNode *>
{
  using Base = RecursiveAstVisitor<ToolCallCollector, const AstNode *>;

public:
  std::vector<std::string_view> names;

  bool visit_tool_call_expr(const ToolCallExpr * node)
  {
    push_unique(names, node->name);
    return Base::visit_tool_call_expr(node);
  }
};

class DependencyCollector : public RecursiveAstVisitor<DependencyCollector, const AstNode *>
{
  using Base = RecursiveAstVisitor<DependencyCollector, const AstNode *>;

public:
  std::vector<std::string_view> names;

  bool visit_include_stmt(const IncludeStmt * node)
  {
    push_unique(names, node->componentName);
    return true;
  }

  bool visit_render_stmt(const RenderStmt * node)
  {
    if (const auto * lit = dyn_cast<StringLiteralExpr>(node->target)) {
      push_unique(names, lit->value);
    }
    return Base::visit_render_stmt(node);
  }
};

}  // namespace

std::vector<std::string_view> collect_placeholders(const Component * component)
{
  PlaceholderCollector collector;
  collector.visit(component);
  return std::move(collector.names);
}

std::vector<std::string_view> collect_tool_calls(const Component * component)
{
  ToolCallCollector collector;
  collector.visit(component);
  return std::move(collector.names);
}

std::vector<std::string_view> collect_static_dependencies(const Component * component)
{
  DependencyCollector collector;
  collector.visit(component);
  return std::move(collector.names);
}

}  // namespace stencil
