#pragma once

#include <cstdint>
#include <string_view>

#include "stencil/basic/source_manager.hpp"

namespace stencil::syntax
{

enum class TokenKind : uint8_t {
  Eof,
  Unknown,       // stray character or malformed literal inside an argument list
  Unterminated,  // argument list never closed; range starts at the opener

  // Template mode
  Text,            // literal text run, emitted verbatim
  StmtOpen,        // `$keyword`; text is the keyword without `$`
  ShortPrintOpen,  // `$(`
  ArgsOpen,        // `(` directly after a statement keyword
  StmtClose,       // `)` closing the argument list at depth zero

  // Argument mode
  Identifier,
  IntLiteral,
  FloatLiteral,
  StringLiteral,  // token.text is the raw interior (escapes not yet resolved)

  LParen,
  RParen,
  LBracket,
  RBracket,
  Comma,
  Dot,
  At,

  Bang,
  Minus,
  Assign,  // = (render bindings)

  AndAnd,
  OrOr,

  EqEqEq,
  EqEq,
  NeEq,
  Ne,
  Lt,
  Le,
  Gt,
  Ge,
};

struct Token
{
  TokenKind kind = TokenKind::Unknown;
  SourceRange range;      // byte range in the component text (including quotes for strings)
  std::string_view text;  // slice view (for StringLiteral: interior)
  uint32_t line = 0;      // 1-based line of the first byte

  [[nodiscard]] uint32_t begin() const noexcept { return range.get_begin().offset(); }
  [[nodiscard]] uint32_t end() const noexcept { return range.get_end().offset(); }
};

[[nodiscard]] constexpr std::string_view to_string(TokenKind k) noexcept
{
  switch (k) {
    case TokenKind::Eof:
      return "<eof>";
    case TokenKind::Unknown:
      return "<unknown>";
    case TokenKind::Unterminated:
      return "<unterminated>";
    case TokenKind::Text:
      return "text";
    case TokenKind::StmtOpen:
      return "statement";
    case TokenKind::ShortPrintOpen:
      return "$(";
    case TokenKind::ArgsOpen:
      return "(";
    case TokenKind::StmtClose:
      return ")";
    case TokenKind::Identifier:
      return "identifier";
    case TokenKind::IntLiteral:
      return "int";
    case TokenKind::FloatLiteral:
      return "float";
    case TokenKind::StringLiteral:
      return "string";
    case TokenKind::LParen:
      return "(";
    case TokenKind::RParen:
      return ")";
    case TokenKind::LBracket:
      return "[";
    case TokenKind::RBracket:
      return "]";
    case TokenKind::Comma:
      return ",";
    case TokenKind::Dot:
      return ".";
    case TokenKind::At:
      return "@";
    case TokenKind::Bang:
      return "!";
    case TokenKind::Minus:
      return "-";
    case TokenKind::Assign:
      return "=";
    case TokenKind::AndAnd:
      return "&&";
    case TokenKind::OrOr:
      return "||";
    case TokenKind::EqEqEq:
      return "===";
    case TokenKind::EqEq:
      return "==";
    case TokenKind::NeEq:
      return "!==";
    case TokenKind::Ne:
      return "!=";
    case TokenKind::Lt:
      return "<";
    case TokenKind::Le:
      return "<=";
    case TokenKind::Gt:
      return ">";
    case TokenKind::Ge:
      return ">=";
  }
  return "";
}

}  // namespace stencil::syntax
