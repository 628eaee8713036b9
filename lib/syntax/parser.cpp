#include "stencil/syntax/parser.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <string>

namespace stencil::syntax
{
namespace
{

std::string_view keyword_name(Keyword k)
{
  for (const auto & info : k_statement_keywords) {
    if (info.keyword == k) {
      return info.spelling;
    }
  }
  return "";
}

std::string quoted(Keyword k) { return "`$" + std::string(keyword_name(k)) + "`"; }

Keyword terminator_of(Keyword opener)
{
  switch (opener) {
    case Keyword::If:
      return Keyword::EndIf;
    case Keyword::Foreach:
      return Keyword::EndForeach;
    case Keyword::Render:
      return Keyword::EndRender;
    case Keyword::Replace:
      return Keyword::EndReplace;
    default:
      return opener;
  }
}

bool is_blank(std::string_view text)
{
  return std::all_of(text.begin(), text.end(), [](char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
  });
}

std::string unescape_string(std::string_view raw)
{
  std::string out;
  out.reserve(raw.size());

  for (size_t i = 0; i < raw.size(); ++i) {
    const char c = raw[i];
    if (c != '\\' || i + 1 >= raw.size()) {
      out.push_back(c);
      continue;
    }

    const char esc = raw[++i];
    switch (esc) {
      case 'n':
        out.push_back('\n');
        break;
      case 't':
        out.push_back('\t');
        break;
      case 'r':
        out.push_back('\r');
        break;
      default:
        // \\ \' \" and any other escaped character stand for themselves
        out.push_back(esc);
        break;
    }
  }
  return out;
}

}  // namespace

// ============================================================================
// Token helpers
// ============================================================================

const Token & Parser::cur(size_t lookahead) const
{
  const size_t i = idx_ + lookahead;
  if (i >= tokens_.size()) {
    return tokens_.back();
  }
  return tokens_[i];
}

bool Parser::at(TokenKind k) const { return cur().kind == k; }

bool Parser::at_eof() const { return at(TokenKind::Eof); }

std::optional<Keyword> Parser::at_keyword() const
{
  if (!at(TokenKind::StmtOpen)) {
    return std::nullopt;
  }
  const KeywordInfo * info = find_keyword(cur().text);
  if (info == nullptr) {
    return std::nullopt;
  }
  return info->keyword;
}

bool Parser::at_keyword(Keyword k) const
{
  const auto kw = at_keyword();
  return kw && *kw == k;
}

const Token & Parser::advance()
{
  const Token & t = cur();
  if (!at_eof()) {
    ++idx_;
  }
  return t;
}

bool Parser::match(TokenKind k)
{
  if (at(k)) {
    advance();
    return true;
  }
  return false;
}

SourceRange Parser::prev_range() const
{
  return idx_ > 0 ? tokens_[idx_ - 1].range : cur().range;
}

void Parser::error_at(SourceRange range, std::string_view code, std::string msg)
{
  diags_.report_error(range, std::move(msg)).with_code(code);
}

void Parser::report_bad_token(const Token & t)
{
  if (t.kind == TokenKind::Unterminated) {
    diags_.report_error(t.range, "unterminated argument list", "opened here")
      .with_code(diag_code::k_lexical)
      .with_help("add the closing `)`");
    return;
  }
  if (!t.text.empty() && (t.text.front() == '"' || t.text.front() == '\'')) {
    error_at(t.range, diag_code::k_lexical, "unterminated string literal");
    return;
  }
  error_at(t.range, diag_code::k_lexical, "unexpected character `" + std::string(t.text) + "`");
}

// ============================================================================
// Block structure
// ============================================================================

bool Parser::closes_open_block(Keyword k) const
{
  for (auto it = open_blocks_.rbegin(); it != open_blocks_.rend(); ++it) {
    if ((k == Keyword::ElseIf || k == Keyword::Else) && *it == Keyword::If) {
      return true;
    }
    if (terminator_of(*it) == k) {
      return true;
    }
  }
  return false;
}

void Parser::report_stray_terminator(const Token & t, Keyword k)
{
  if (k == Keyword::ElseIf || k == Keyword::Else) {
    error_at(t.range, diag_code::k_if_chain_order, quoted(k) + " without a matching `$if`");
    return;
  }
  error_at(t.range, diag_code::k_block_mismatch, "unexpected " + quoted(k) + " with no open block");
}

void Parser::expect_terminator(Keyword end, const Token & opener)
{
  if (at_keyword(end)) {
    advance();
    return;
  }

  const Token & t = cur();
  const std::string found = at_eof() ? std::string("end of template") : "`$" + std::string(t.text) + "`";
  diags_.report_error(t.range, "expected " + quoted(end) + ", found " + found)
    .with_code(diag_code::k_block_mismatch)
    .with_secondary_label(opener.range, "block opened here");
}

// ============================================================================
// Component / bodies
// ============================================================================

Component * Parser::parse_component(std::string_view name)
{
  const Body body = parse_body();
  const auto end = static_cast<uint32_t>(source_.size());
  return ast_.create<Component>(ast_.intern(name), body, SourceRange(0, end));
}

Body Parser::parse_body()
{
  std::vector<Stmt *> stmts;

  while (!at_eof()) {
    if (const auto kw = at_keyword(); kw && is_block_terminator(*kw)) {
      if (closes_open_block(*kw)) {
        break;
      }
      report_stray_terminator(cur(), *kw);
      advance();
      continue;
    }
    if (Stmt * s = parse_stmt()) {
      stmts.push_back(s);
    }
  }

  return ast_.copy_to_arena(stmts);
}

Stmt * Parser::parse_stmt()
{
  const Token & t = cur();

  switch (t.kind) {
    case TokenKind::Text:
      advance();
      return ast_.create<TextStmt>(ast_.intern(t.text), t.range);
    case TokenKind::ShortPrintOpen:
      return parse_short_print();
    case TokenKind::StmtOpen:
      return parse_keyword_stmt();
    case TokenKind::Unterminated:
    case TokenKind::Unknown:
      report_bad_token(t);
      advance();
      return nullptr;
    default:
      error_at(t.range, diag_code::k_unexpected_token, "unexpected `" + std::string(t.text) + "`");
      advance();
      return nullptr;
  }
}

Stmt * Parser::parse_keyword_stmt()
{
  const Token opener = advance();
  const KeywordInfo * info = find_keyword(opener.text);
  if (info == nullptr) {
    error_at(opener.range, diag_code::k_unexpected_token, "unknown statement");
    return nullptr;
  }

  switch (info->keyword) {
    case Keyword::Print:
    case Keyword::Log:
      return parse_print_or_log(opener, info->keyword);
    case Keyword::If:
      return parse_if(opener);
    case Keyword::Foreach:
      return parse_foreach(opener);
    case Keyword::Render:
      return parse_render(opener);
    case Keyword::Place:
    case Keyword::Include:
      return parse_name_stmt(opener, info->keyword);
    case Keyword::Replace: {
      error_at(
        opener.range, diag_code::k_unexpected_token,
        "`$replace` is only allowed directly inside `$render`");
      (void)parse_replace(opener);
      return nullptr;
    }
    case Keyword::ElseIf:
    case Keyword::Else:
    case Keyword::EndIf:
    case Keyword::EndForeach:
    case Keyword::EndRender:
    case Keyword::EndReplace:
      report_stray_terminator(opener, info->keyword);
      return nullptr;
  }
  return nullptr;
}

// ============================================================================
// Statements
// ============================================================================

PrintStmt * Parser::parse_short_print()
{
  const Token opener = advance();  // `$(`
  const ArgList args = parse_arg_list(opener, false);

  Expr * value = nullptr;
  if (args.positional.size() != 1) {
    error_at(
      args.range, diag_code::k_argument_count,
      "`$(...)` takes exactly one expression, found " + std::to_string(args.positional.size()));
    value = args.positional.empty() ? ast_.create<MissingExpr>(opener.range)
                                    : args.positional.front();
  } else {
    value = args.positional.front();
  }

  return ast_.create<PrintStmt>(value, true, join_ranges(opener.range, args.range));
}

Stmt * Parser::parse_print_or_log(const Token & opener, Keyword kw)
{
  const ArgList args = parse_arg_list(opener, false);
  Expr * value = single_arg(args, opener);
  const SourceRange range = join_ranges(opener.range, args.range);

  if (kw == Keyword::Log) {
    return ast_.create<LogStmt>(value, range);
  }
  return ast_.create<PrintStmt>(value, false, range);
}

IfStmt * Parser::parse_if(const Token & opener)
{
  const ArgList args = parse_arg_list(opener, false);
  Expr * cond = single_arg(args, opener);

  std::vector<IfBranch *> branches;
  Body else_body;
  bool has_else = false;

  open_blocks_.push_back(Keyword::If);

  const SourceRange head = join_ranges(opener.range, args.range);
  const Body first = parse_body();
  branches.push_back(ast_.create<IfBranch>(cond, first, join_ranges(head, prev_range())));

  while (true) {
    const auto kw = at_keyword();
    if (kw == Keyword::ElseIf) {
      const Token tok = advance();
      const ArgList a = parse_arg_list(tok, false);
      Expr * c = single_arg(a, tok);
      if (has_else) {
        error_at(tok.range, diag_code::k_if_chain_order, "`$elseif` cannot follow `$else`");
      }
      const Body b = parse_body();
      if (!has_else) {
        branches.push_back(ast_.create<IfBranch>(c, b, join_ranges(tok.range, prev_range())));
      }
      continue;
    }
    if (kw == Keyword::Else) {
      const Token tok = advance();
      if (has_else) {
        error_at(tok.range, diag_code::k_if_chain_order, "duplicate `$else` in `$if` chain");
      }
      const Body b = parse_body();
      if (!has_else) {
        else_body = b;
        has_else = true;
      }
      continue;
    }
    break;
  }

  open_blocks_.pop_back();
  expect_terminator(Keyword::EndIf, opener);

  return ast_.create<IfStmt>(
    ast_.copy_to_arena(branches), else_body, has_else, join_ranges(opener.range, prev_range()));
}

ForeachStmt * Parser::parse_foreach(const Token & opener)
{
  const ArgList args = parse_arg_list(opener, false);
  const size_t n = args.positional.size();

  if (args.present && n != 2 && n != 3) {
    error_at(
      args.range, diag_code::k_argument_count,
      "`$foreach` takes (item, collection) or (item, index, collection), found " +
        std::to_string(n) + " arguments");
  }

  std::optional<std::string_view> item;
  std::optional<std::string_view> index;
  Expr * collection = nullptr;

  if (n >= 1) {
    item = loop_name_arg(args.positional[0]);
  }
  if (n == 3) {
    index = loop_name_arg(args.positional[1]);
  }
  collection = (n >= 2) ? args.positional.back() : ast_.create<MissingExpr>(args.range);

  open_blocks_.push_back(Keyword::Foreach);
  const Body body = parse_body();
  open_blocks_.pop_back();
  expect_terminator(Keyword::EndForeach, opener);

  return ast_.create<ForeachStmt>(
    item.value_or(std::string_view{}), index, collection, body,
    join_ranges(opener.range, prev_range()));
}

RenderStmt * Parser::parse_render(const Token & opener)
{
  const ArgList args = parse_arg_list(opener, true);
  if (args.present && args.positional.size() != 1) {
    error_at(
      args.range, diag_code::k_argument_count,
      "`$render` takes a component name followed by `name=value` bindings");
  }
  Expr * target = args.positional.empty() ? ast_.create<MissingExpr>(opener.range)
                                          : args.positional.front();

  std::vector<ReplaceBlock *> replacements;
  open_blocks_.push_back(Keyword::Render);

  while (!at_eof()) {
    const Token & t = cur();

    if (t.kind == TokenKind::Text) {
      if (!is_blank(t.text)) {
        error_at(
          t.range, diag_code::k_render_body,
          "only `$replace` blocks may appear between `$render` and `$endrender`");
      }
      advance();
      continue;
    }

    const auto kw = at_keyword();
    if (kw == Keyword::Replace) {
      const Token tok = advance();
      ReplaceBlock * block = parse_replace(tok);
      const bool duplicate =
        std::any_of(replacements.begin(), replacements.end(), [&](const ReplaceBlock * r) {
          return r->name == block->name;
        });
      if (duplicate) {
        error_at(
          block->get_range(), diag_code::k_render_body,
          "duplicate `$replace('" + std::string(block->name) + "')`");
      } else {
        replacements.push_back(block);
      }
      continue;
    }

    if (kw && is_block_terminator(*kw)) {
      if (closes_open_block(*kw)) {
        break;
      }
      report_stray_terminator(t, *kw);
      advance();
      continue;
    }

    error_at(
      t.range, diag_code::k_render_body,
      "only `$replace` blocks may appear between `$render` and `$endrender`");
    (void)parse_stmt();
  }

  open_blocks_.pop_back();
  expect_terminator(Keyword::EndRender, opener);

  return ast_.create<RenderStmt>(
    target, ast_.copy_to_arena(args.named), ast_.copy_to_arena(replacements),
    join_ranges(opener.range, prev_range()));
}

ReplaceBlock * Parser::parse_replace(const Token & opener)
{
  const ArgList args = parse_arg_list(opener, false);
  const auto name = static_name_arg(args, opener);

  open_blocks_.push_back(Keyword::Replace);
  ++replace_depth_;
  const Body body = parse_body();
  --replace_depth_;
  open_blocks_.pop_back();
  expect_terminator(Keyword::EndReplace, opener);

  return ast_.create<ReplaceBlock>(
    name.value_or(std::string_view{}), body, join_ranges(opener.range, prev_range()));
}

Stmt * Parser::parse_name_stmt(const Token & opener, Keyword kw)
{
  const ArgList args = parse_arg_list(opener, false);
  const auto name = static_name_arg(args, opener);
  const SourceRange range = join_ranges(opener.range, args.range);

  if (kw == Keyword::Include) {
    return ast_.create<IncludeStmt>(name.value_or(std::string_view{}), range);
  }

  if (replace_depth_ > 0) {
    diags_.report_error(range, "`$place` cannot appear inside a `$replace` body")
      .with_code(diag_code::k_place_in_replace)
      .with_help("replacements fill placeholders; they cannot declare new ones");
  }
  return ast_.create<PlaceStmt>(name.value_or(std::string_view{}), range);
}

// ============================================================================
// Argument lists
// ============================================================================

Parser::ArgList Parser::parse_arg_list(const Token & opener, bool allow_bindings)
{
  ArgList args;
  args.range = opener.range;

  if (opener.kind == TokenKind::StmtOpen && !match(TokenKind::ArgsOpen)) {
    error_at(
      opener.range, diag_code::k_unexpected_token,
      "expected `(` after `$" + std::string(opener.text) + "`");
    return args;
  }
  args.present = true;

  if (!at(TokenKind::StmtClose) && !at(TokenKind::Unterminated)) {
    while (true) {
      if (allow_bindings && at(TokenKind::Identifier) && cur(1).kind == TokenKind::Assign) {
        const Token name_tok = advance();
        advance();  // '='
        Expr * value = parse_expr();
        args.named.push_back(ast_.create<RenderBinding>(
          ast_.intern(name_tok.text), value, join_ranges(name_tok.range, value->get_range())));
      } else {
        Expr * e = parse_expr();
        if (!args.named.empty()) {
          error_at(
            e->get_range(), diag_code::k_unexpected_token,
            "positional argument after a `name=value` binding");
        }
        args.positional.push_back(e);
      }
      if (!match(TokenKind::Comma)) {
        break;
      }
    }
  }

  if (match(TokenKind::StmtClose)) {
    args.range = join_ranges(opener.range, prev_range());
    return args;
  }

  if (at(TokenKind::Unterminated)) {
    report_bad_token(cur());
    advance();
  } else {
    error_at(cur().range, diag_code::k_unexpected_token, "expected `,` or `)` in argument list");
    skip_to_stmt_close();
  }
  args.range = join_ranges(opener.range, prev_range());
  return args;
}

void Parser::skip_to_stmt_close()
{
  while (!at_eof()) {
    if (match(TokenKind::StmtClose)) {
      return;
    }
    if (at(TokenKind::Unterminated)) {
      report_bad_token(cur());
      advance();
      return;
    }
    if (at(TokenKind::Text) || at(TokenKind::StmtOpen) || at(TokenKind::ShortPrintOpen)) {
      return;
    }
    advance();
  }
}

Expr * Parser::single_arg(const ArgList & args, const Token & opener)
{
  if (!args.present) {
    return ast_.create<MissingExpr>(opener.range);
  }
  if (args.positional.size() != 1) {
    error_at(
      args.range, diag_code::k_argument_count,
      "`$" + std::string(opener.text) + "` takes exactly one argument, found " +
        std::to_string(args.positional.size()));
  }
  if (args.positional.empty()) {
    return ast_.create<MissingExpr>(args.range);
  }
  return args.positional.front();
}

std::optional<std::string_view> Parser::static_name_arg(const ArgList & args, const Token & opener)
{
  if (!args.present) {
    return std::nullopt;
  }
  if (args.positional.size() != 1) {
    error_at(
      args.range, diag_code::k_argument_count,
      "`$" + std::string(opener.text) + "` takes exactly one name argument");
    return std::nullopt;
  }
  if (const auto * lit = dyn_cast<StringLiteralExpr>(args.positional.front())) {
    return lit->value;
  }
  error_at(
    args.positional.front()->get_range(), diag_code::k_unexpected_token,
    "`$" + std::string(opener.text) + "` expects a quoted name");
  return std::nullopt;
}

std::optional<std::string_view> Parser::loop_name_arg(Expr * e)
{
  if (const auto * ref = dyn_cast<LocalRefExpr>(e)) {
    return ref->name;
  }
  error_at(e->get_range(), diag_code::k_unexpected_token, "loop variable must be a plain name");
  return std::nullopt;
}

// ============================================================================
// Expressions
// ============================================================================

Expr * Parser::parse_expr() { return parse_or(); }

Expr * Parser::parse_or()
{
  Expr * lhs = parse_and();
  while (match(TokenKind::OrOr)) {
    Expr * rhs = parse_and();
    lhs = ast_.create<BinaryExpr>(
      lhs, BinaryOp::Or, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Expr * Parser::parse_and()
{
  Expr * lhs = parse_equality();
  while (match(TokenKind::AndAnd)) {
    Expr * rhs = parse_equality();
    lhs = ast_.create<BinaryExpr>(
      lhs, BinaryOp::And, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Expr * Parser::parse_equality()
{
  Expr * lhs = parse_relational();
  while (true) {
    BinaryOp op = BinaryOp::LooseEq;
    switch (cur().kind) {
      case TokenKind::EqEqEq:
        op = BinaryOp::StrictEq;
        break;
      case TokenKind::EqEq:
        op = BinaryOp::LooseEq;
        break;
      case TokenKind::NeEq:
        op = BinaryOp::StrictNe;
        break;
      case TokenKind::Ne:
        op = BinaryOp::LooseNe;
        break;
      default:
        return lhs;
    }
    advance();
    Expr * rhs = parse_relational();
    lhs = ast_.create<BinaryExpr>(lhs, op, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
}

Expr * Parser::parse_relational()
{
  Expr * lhs = parse_unary();
  while (true) {
    BinaryOp op = BinaryOp::Lt;
    switch (cur().kind) {
      case TokenKind::Lt:
        op = BinaryOp::Lt;
        break;
      case TokenKind::Le:
        op = BinaryOp::Le;
        break;
      case TokenKind::Gt:
        op = BinaryOp::Gt;
        break;
      case TokenKind::Ge:
        op = BinaryOp::Ge;
        break;
      default:
        return lhs;
    }
    advance();
    Expr * rhs = parse_unary();
    lhs = ast_.create<BinaryExpr>(lhs, op, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
}

Expr * Parser::parse_unary()
{
  if (match(TokenKind::Bang)) {
    const SourceRange op = prev_range();
    Expr * e = parse_unary();
    return ast_.create<UnaryExpr>(UnaryOp::Not, e, join_ranges(op, e->get_range()));
  }
  if (match(TokenKind::Minus)) {
    const SourceRange op = prev_range();
    Expr * e = parse_unary();
    return ast_.create<UnaryExpr>(UnaryOp::Neg, e, join_ranges(op, e->get_range()));
  }
  return parse_postfix();
}

Expr * Parser::parse_postfix()
{
  Expr * e = parse_primary();

  while (true) {
    if (match(TokenKind::Dot)) {
      const Token & m = cur();
      if (m.kind != TokenKind::Identifier) {
        error_at(m.range, diag_code::k_unexpected_token, "expected member name after `.`");
        break;
      }
      advance();
      e = ast_.create<MemberExpr>(e, ast_.intern(m.text), join_ranges(e->get_range(), m.range));
      continue;
    }
    if (match(TokenKind::LBracket)) {
      Expr * idx = parse_expr();
      if (!match(TokenKind::RBracket)) {
        error_at(cur().range, diag_code::k_unexpected_token, "expected `]` after index expression");
      }
      e = ast_.create<IndexExpr>(e, idx, join_ranges(e->get_range(), prev_range()));
      continue;
    }
    break;
  }

  return e;
}

Expr * Parser::parse_primary()
{
  const Token & t = cur();

  switch (t.kind) {
    case TokenKind::IntLiteral: {
      advance();
      int64_t v = 0;
      const auto res = std::from_chars(t.text.data(), t.text.data() + t.text.size(), v);
      if (res.ec != std::errc{}) {
        error_at(t.range, diag_code::k_lexical, "integer literal out of range");
      }
      return ast_.create<IntLiteralExpr>(v, t.range);
    }
    case TokenKind::FloatLiteral: {
      advance();
      const std::string tmp(t.text);
      return ast_.create<FloatLiteralExpr>(std::strtod(tmp.c_str(), nullptr), t.range);
    }
    case TokenKind::StringLiteral:
      advance();
      return ast_.create<StringLiteralExpr>(ast_.intern(unescape_string(t.text)), t.range);
    case TokenKind::At: {
      advance();
      const Token & name = cur();
      if (name.kind != TokenKind::Identifier) {
        error_at(name.range, diag_code::k_unexpected_token, "expected global name after `@`");
        return ast_.create<MissingExpr>(t.range);
      }
      advance();
      return ast_.create<GlobalRefExpr>(ast_.intern(name.text), join_ranges(t.range, name.range));
    }
    case TokenKind::LParen: {
      advance();
      Expr * inner = parse_expr();
      if (!match(TokenKind::RParen)) {
        error_at(cur().range, diag_code::k_unexpected_token, "expected `)` after expression");
      }
      return ast_.create<GroupExpr>(inner, join_ranges(t.range, prev_range()));
    }
    case TokenKind::Identifier:
      advance();
      if (t.text == "true") return ast_.create<BoolLiteralExpr>(true, t.range);
      if (t.text == "false") return ast_.create<BoolLiteralExpr>(false, t.range);
      if (t.text == "null") return ast_.create<NullLiteralExpr>(t.range);
      if (t.text == "undefined") return ast_.create<UndefinedLiteralExpr>(t.range);
      if (at(TokenKind::LParen)) {
        return parse_tool_call(t);
      }
      return ast_.create<LocalRefExpr>(ast_.intern(t.text), t.range);
    case TokenKind::Unterminated:
      // Reported by the enclosing argument list.
      return ast_.create<MissingExpr>(t.range);
    case TokenKind::Unknown:
      report_bad_token(t);
      advance();
      return ast_.create<MissingExpr>(t.range);
    default:
      break;
  }

  error_at(t.range, diag_code::k_unexpected_token, "expected expression");

  // Leave list delimiters for the caller so one bad token does not swallow the statement.
  if (
    t.kind != TokenKind::StmtClose && t.kind != TokenKind::Comma && t.kind != TokenKind::RParen &&
    t.kind != TokenKind::RBracket) {
    advance();
  }
  return ast_.create<MissingExpr>(t.range);
}

Expr * Parser::parse_tool_call(const Token & name_tok)
{
  advance();  // '('

  std::vector<Expr *> args;
  if (!at(TokenKind::RParen)) {
    do {
      args.push_back(parse_expr());
    } while (match(TokenKind::Comma));
  }

  if (!match(TokenKind::RParen)) {
    error_at(
      cur().range, diag_code::k_unexpected_token,
      "expected `)` to close call to `" + std::string(name_tok.text) + "`");
  }

  return ast_.create<ToolCallExpr>(
    ast_.intern(name_tok.text), ast_.copy_to_arena(args), join_ranges(name_tok.range, prev_range()));
}

}  // namespace stencil::syntax
