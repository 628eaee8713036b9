// stencil/ast/json_visitor.cpp - JSON serialization implementation
//
#include "stencil/ast/json_visitor.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

#include "stencil/ast/ast.hpp"
#include "stencil/ast/ast_enums.hpp"
#include "stencil/basic/casting.hpp"
#include "stencil/basic/source_manager.hpp"

namespace stencil
{
namespace
{

using nlohmann::json;

// ============================================================================
// Helper functions
// ============================================================================

json j_range(SourceRange r)
{
  if (r.is_invalid()) {
    return json{{"start", nullptr}, {"end", nullptr}};
  }
  return json{{"start", r.get_begin().offset()}, {"end", r.get_end().offset()}};
}

json j_header(const AstNode * n)
{
  return json{{"type", std::string(to_string(n->get_kind()))}, {"range", j_range(n->get_range())}};
}

json j_expr(const Expr * e);
json j_stmt(const Stmt * s);

json j_body(Body body)
{
  json arr = json::array();
  for (const auto * s : body) arr.push_back(j_stmt(s));
  return arr;
}

// ============================================================================
// Expression serialization
// ============================================================================

json j_expr(const Expr * e)
{
  if (!e) return json{{"type", "MissingExpr"}, {"range", j_range({})}};

  json j = j_header(e);

  switch (e->get_kind()) {
    case NodeKind::NullLiteral:
    case NodeKind::UndefinedLiteral:
    case NodeKind::MissingExpr:
      break;
    case NodeKind::BoolLiteral:
      j["value"] = cast<BoolLiteralExpr>(e)->value;
      break;
    case NodeKind::IntLiteral:
      j["value"] = cast<IntLiteralExpr>(e)->value;
      break;
    case NodeKind::FloatLiteral:
      j["value"] = cast<FloatLiteralExpr>(e)->value;
      break;
    case NodeKind::StringLiteral:
      j["value"] = std::string(cast<StringLiteralExpr>(e)->value);
      break;
    case NodeKind::LocalRef:
      j["name"] = std::string(cast<LocalRefExpr>(e)->name);
      break;
    case NodeKind::GlobalRef:
      j["name"] = std::string(cast<GlobalRefExpr>(e)->name);
      break;
    case NodeKind::MemberExpr: {
      const auto * m = cast<MemberExpr>(e);
      j["base"] = j_expr(m->base);
      j["member"] = std::string(m->member);
      break;
    }
    case NodeKind::IndexExpr: {
      const auto * ix = cast<IndexExpr>(e);
      j["base"] = j_expr(ix->base);
      j["index"] = j_expr(ix->index);
      break;
    }
    case NodeKind::ToolCall: {
      const auto * call = cast<ToolCallExpr>(e);
      json args = json::array();
      for (const auto * a : call->args) args.push_back(j_expr(a));
      j["name"] = std::string(call->name);
      j["args"] = std::move(args);
      break;
    }
    case NodeKind::BinaryExpr: {
      const auto * b = cast<BinaryExpr>(e);
      j["op"] = std::string(to_string(b->op));
      j["lhs"] = j_expr(b->lhs);
      j["rhs"] = j_expr(b->rhs);
      break;
    }
    case NodeKind::UnaryExpr: {
      const auto * u = cast<UnaryExpr>(e);
      j["op"] = std::string(to_string(u->op));
      j["operand"] = j_expr(u->operand);
      break;
    }
    case NodeKind::GroupExpr:
      j["inner"] = j_expr(cast<GroupExpr>(e)->inner);
      break;
    default:
      j["type"] = "UnknownExpr";
      break;
  }
  return j;
}

// ============================================================================
// Supporting node serialization
// ============================================================================

json j_if_branch(const IfBranch * b)
{
  json j = j_header(b);
  j["condition"] = j_expr(b->condition);
  j["body"] = j_body(b->body);
  return j;
}

json j_binding(const RenderBinding * b)
{
  json j = j_header(b);
  j["name"] = std::string(b->name);
  j["value"] = j_expr(b->value);
  return j;
}

json j_replace(const ReplaceBlock * r)
{
  json j = j_header(r);
  j["name"] = std::string(r->name);
  j["body"] = j_body(r->body);
  return j;
}

// ============================================================================
// Statement serialization
// ============================================================================

json j_stmt(const Stmt * s)
{
  if (!s) return json{{"type", "MissingStmt"}, {"range", j_range({})}};

  json j = j_header(s);

  switch (s->get_kind()) {
    case NodeKind::Text:
      j["text"] = std::string(cast<TextStmt>(s)->text);
      break;
    case NodeKind::Print: {
      const auto * p = cast<PrintStmt>(s);
      j["value"] = j_expr(p->value);
      j["shortForm"] = p->shortForm;
      break;
    }
    case NodeKind::Log:
      j["value"] = j_expr(cast<LogStmt>(s)->value);
      break;
    case NodeKind::If: {
      const auto * i = cast<IfStmt>(s);
      json branches = json::array();
      for (const auto * b : i->branches) branches.push_back(j_if_branch(b));
      j["branches"] = std::move(branches);
      j["else"] = i->hasElse ? j_body(i->elseBody) : json(nullptr);
      break;
    }
    case NodeKind::Foreach: {
      const auto * f = cast<ForeachStmt>(s);
      j["item"] = std::string(f->itemName);
      j["index"] = f->indexName ? json(std::string(*f->indexName)) : json(nullptr);
      j["collection"] = j_expr(f->collection);
      j["body"] = j_body(f->body);
      break;
    }
    case NodeKind::Render: {
      const auto * r = cast<RenderStmt>(s);
      json bindings = json::array();
      for (const auto * b : r->bindings) bindings.push_back(j_binding(b));
      json replacements = json::array();
      for (const auto * rb : r->replacements) replacements.push_back(j_replace(rb));
      j["target"] = j_expr(r->target);
      j["bindings"] = std::move(bindings);
      j["replacements"] = std::move(replacements);
      break;
    }
    case NodeKind::Include:
      j["component"] = std::string(cast<IncludeStmt>(s)->componentName);
      break;
    case NodeKind::Place:
      j["name"] = std::string(cast<PlaceStmt>(s)->name);
      break;
    default:
      j["type"] = "UnknownStmt";
      break;
  }
  return j;
}

}  // namespace

// ============================================================================
// Public API
// ============================================================================

nlohmann::json to_json(const AstNode * node)
{
  if (!node) return nlohmann::json{{"type", "null"}, {"range", j_range({})}};

  if (isa<Component>(node)) {
    return to_json(cast<Component>(node));
  }
  if (isa<Stmt>(node)) {
    return j_stmt(cast<Stmt>(node));
  }
  if (isa<Expr>(node)) {
    return j_expr(cast<Expr>(node));
  }
  if (isa<IfBranch>(node)) {
    return j_if_branch(cast<IfBranch>(node));
  }
  if (isa<RenderBinding>(node)) {
    return j_binding(cast<RenderBinding>(node));
  }
  if (isa<ReplaceBlock>(node)) {
    return j_replace(cast<ReplaceBlock>(node));
  }

  return nlohmann::json{{"type", "UnknownNode"}, {"range", j_range(node->get_range())}};
}

nlohmann::json to_json(const Component * component)
{
  if (!component) {
    return nlohmann::json{
      {"type", "Component"}, {"name", ""}, {"range", j_range({})}, {"body", json::array()}};
  }

  return nlohmann::json{
    {"type", "Component"},
    {"name", std::string(component->name)},
    {"range", j_range(component->get_range())},
    {"body", j_body(component->body)}};
}

}  // namespace stencil
