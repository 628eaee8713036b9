#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "stencil/ast/ast.hpp"
#include "stencil/ast/ast_context.hpp"
#include "stencil/basic/diagnostic.hpp"
#include "stencil/basic/source_manager.hpp"
#include "stencil/syntax/keywords.hpp"
#include "stencil/syntax/token.hpp"

namespace stencil::syntax
{

/**
 * Recursive-descent parser for one component.
 *
 * Never throws: structural problems are recorded in the DiagnosticBag and
 * the parser recovers so that later errors can still be reported. Callers
 * must check DiagnosticBag::has_errors() before using the tree.
 */
class Parser
{
public:
  Parser(
    AstContext & ast, const SourceFile & source, DiagnosticBag & diags, std::vector<Token> tokens)
  : ast_(ast), source_(source), diags_(diags), tokens_(std::move(tokens))
  {
  }

  [[nodiscard]] Component * parse_component(std::string_view name);

private:
  struct ArgList
  {
    std::vector<Expr *> positional;
    std::vector<RenderBinding *> named;
    SourceRange range;
    bool present = false;  // `(` was found after the keyword
  };

  // Token helpers
  [[nodiscard]] const Token & cur(size_t lookahead = 0) const;
  [[nodiscard]] bool at(TokenKind k) const;
  [[nodiscard]] bool at_eof() const;
  [[nodiscard]] std::optional<Keyword> at_keyword() const;
  [[nodiscard]] bool at_keyword(Keyword k) const;

  const Token & advance();
  bool match(TokenKind k);
  [[nodiscard]] SourceRange prev_range() const;

  void error_at(SourceRange range, std::string_view code, std::string msg);
  void report_bad_token(const Token & t);

  // Block structure
  [[nodiscard]] bool closes_open_block(Keyword k) const;
  void report_stray_terminator(const Token & t, Keyword k);
  void expect_terminator(Keyword end, const Token & opener);

  // Statements
  [[nodiscard]] Body parse_body();
  [[nodiscard]] Stmt * parse_stmt();
  [[nodiscard]] Stmt * parse_keyword_stmt();
  [[nodiscard]] PrintStmt * parse_short_print();
  [[nodiscard]] Stmt * parse_print_or_log(const Token & opener, Keyword kw);
  [[nodiscard]] IfStmt * parse_if(const Token & opener);
  [[nodiscard]] ForeachStmt * parse_foreach(const Token & opener);
  [[nodiscard]] RenderStmt * parse_render(const Token & opener);
  [[nodiscard]] ReplaceBlock * parse_replace(const Token & opener);
  [[nodiscard]] Stmt * parse_name_stmt(const Token & opener, Keyword kw);

  // Argument lists
  [[nodiscard]] ArgList parse_arg_list(const Token & opener, bool allow_bindings);
  void skip_to_stmt_close();
  [[nodiscard]] Expr * single_arg(const ArgList & args, const Token & opener);
  [[nodiscard]] std::optional<std::string_view> static_name_arg(
    const ArgList & args, const Token & opener);
  [[nodiscard]] std::optional<std::string_view> loop_name_arg(Expr * e);

  // Expressions
  [[nodiscard]] Expr * parse_expr();
  [[nodiscard]] Expr * parse_or();
  [[nodiscard]] Expr * parse_and();
  [[nodiscard]] Expr * parse_equality();
  [[nodiscard]] Expr * parse_relational();
  [[nodiscard]] Expr * parse_unary();
  [[nodiscard]] Expr * parse_postfix();
  [[nodiscard]] Expr * parse_primary();
  [[nodiscard]] Expr * parse_tool_call(const Token & name_tok);

  AstContext & ast_;
  const SourceFile & source_;
  DiagnosticBag & diags_;
  std::vector<Token> tokens_;
  size_t idx_ = 0;

  std::vector<Keyword> open_blocks_;  // opener keyword of every enclosing block
  int replace_depth_ = 0;
};

}  // namespace stencil::syntax
