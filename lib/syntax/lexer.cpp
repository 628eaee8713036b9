#include "stencil/syntax/lexer.hpp"

#include <cctype>

#include "stencil/syntax/keywords.hpp"

namespace stencil::syntax
{
namespace
{

bool is_ident_start(unsigned char c) { return (std::isalpha(c) != 0) || c == '_'; }
bool is_ident_continue(unsigned char c) { return (std::isalnum(c) != 0) || c == '_'; }

}  // namespace

bool Lexer::starts_with(std::string_view s) const noexcept
{
  return src_.size() >= pos_ + s.size() && src_.substr(pos_, s.size()) == s;
}

void Lexer::advance(size_t n) noexcept
{
  for (size_t i = 0; i < n && pos_ < src_.size(); ++i) {
    if (src_[pos_] == '\n') {
      ++line_;
    }
    ++pos_;
  }
}

void Lexer::skip_whitespace()
{
  while (!eof()) {
    const auto c = static_cast<unsigned char>(peek());
    if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
      advance(1);
      continue;
    }
    break;
  }
}

std::vector<Token> Lexer::lex_all()
{
  std::vector<Token> out;
  lex_template(out);

  Token t;
  t.kind = TokenKind::Eof;
  const auto at = static_cast<uint32_t>(src_.size());
  t.range = SourceRange(at, at);
  t.line = line_;
  out.push_back(t);
  return out;
}

size_t Lexer::opener_length_at(size_t pos) const noexcept
{
  if (pos >= src_.size() || src_[pos] != '$') {
    return 0;
  }
  if (pos + 1 < src_.size() && src_[pos + 1] == '(') {
    return 2;
  }

  size_t end = pos + 1;
  if (end >= src_.size() || !is_ident_start(static_cast<unsigned char>(src_[end]))) {
    return 0;
  }
  while (end < src_.size() && is_ident_continue(static_cast<unsigned char>(src_[end]))) {
    ++end;
  }
  const std::string_view word = src_.substr(pos + 1, end - pos - 1);
  return find_keyword(word) != nullptr ? (end - pos) : 0;
}

// ============================================================================
// Template mode
// ============================================================================

void Lexer::lex_template(std::vector<Token> & out)
{
  auto text_start = static_cast<uint32_t>(pos_);
  uint32_t text_line = line_;

  const auto flush_text = [&]() {
    const auto here = static_cast<uint32_t>(pos_);
    if (here > text_start) {
      out.push_back(
        make_token(TokenKind::Text, text_start, text_line, src_.substr(text_start, here - text_start)));
    }
  };

  while (!eof()) {
    const size_t opener_len = (peek() == '$') ? opener_length_at(pos_) : 0;
    if (opener_len == 0) {
      advance(1);
      continue;
    }

    flush_text();

    const auto start = static_cast<uint32_t>(pos_);
    const uint32_t start_line = line_;

    if (peek(1) == '(') {
      advance(2);
      const Token opener = make_token(TokenKind::ShortPrintOpen, start, start_line, "$(");
      out.push_back(opener);
      lex_arguments(out, opener);
    } else {
      const std::string_view word = src_.substr(pos_ + 1, opener_len - 1);
      advance(opener_len);
      const Token opener = make_token(TokenKind::StmtOpen, start, start_line, word);
      out.push_back(opener);

      const KeywordInfo * info = find_keyword(word);
      if (info != nullptr && info->takesArgs && peek() == '(') {
        const auto paren = static_cast<uint32_t>(pos_);
        const uint32_t paren_line = line_;
        advance(1);
        out.push_back(make_token(TokenKind::ArgsOpen, paren, paren_line, "("));
        lex_arguments(out, opener);
      }
    }

    text_start = static_cast<uint32_t>(pos_);
    text_line = line_;
  }

  flush_text();
}

// ============================================================================
// Argument mode
// ============================================================================

void Lexer::lex_arguments(std::vector<Token> & out, const Token & opener)
{
  int depth = 0;

  while (true) {
    skip_whitespace();

    if (eof()) {
      Token t;
      t.kind = TokenKind::Unterminated;
      t.range = SourceRange(opener.begin(), static_cast<uint32_t>(pos_));
      t.text = src_.substr(opener.begin(), opener.end() - opener.begin());
      t.line = opener.line;
      out.push_back(t);
      return;
    }

    const auto start = static_cast<uint32_t>(pos_);
    const uint32_t start_line = line_;

    if (peek() == '(') {
      advance(1);
      ++depth;
      out.push_back(make_token(TokenKind::LParen, start, start_line, "("));
      continue;
    }
    if (peek() == ')') {
      advance(1);
      if (depth == 0) {
        out.push_back(make_token(TokenKind::StmtClose, start, start_line, ")"));
        return;
      }
      --depth;
      out.push_back(make_token(TokenKind::RParen, start, start_line, ")"));
      continue;
    }

    out.push_back(next_arg_token());
  }
}

Token Lexer::next_arg_token()
{
  const auto c = static_cast<unsigned char>(peek());

  if (is_ident_start(c)) {
    return lex_identifier();
  }
  if (std::isdigit(c) != 0) {
    return lex_number();
  }
  if (c == '"' || c == '\'') {
    return lex_string();
  }

  const auto start = static_cast<uint32_t>(pos_);
  const uint32_t start_line = line_;

  // Longest match first
  if (starts_with("===")) {
    advance(3);
    return make_token(TokenKind::EqEqEq, start, start_line, "===");
  }
  if (starts_with("!==")) {
    advance(3);
    return make_token(TokenKind::NeEq, start, start_line, "!==");
  }
  if (starts_with("==")) {
    advance(2);
    return make_token(TokenKind::EqEq, start, start_line, "==");
  }
  if (starts_with("!=")) {
    advance(2);
    return make_token(TokenKind::Ne, start, start_line, "!=");
  }
  if (starts_with("<=")) {
    advance(2);
    return make_token(TokenKind::Le, start, start_line, "<=");
  }
  if (starts_with(">=")) {
    advance(2);
    return make_token(TokenKind::Ge, start, start_line, ">=");
  }
  if (starts_with("&&")) {
    advance(2);
    return make_token(TokenKind::AndAnd, start, start_line, "&&");
  }
  if (starts_with("||")) {
    advance(2);
    return make_token(TokenKind::OrOr, start, start_line, "||");
  }

  TokenKind kind = TokenKind::Unknown;
  switch (peek()) {
    case '[':
      kind = TokenKind::LBracket;
      break;
    case ']':
      kind = TokenKind::RBracket;
      break;
    case ',':
      kind = TokenKind::Comma;
      break;
    case '.':
      kind = TokenKind::Dot;
      break;
    case '@':
      kind = TokenKind::At;
      break;
    case '!':
      kind = TokenKind::Bang;
      break;
    case '-':
      kind = TokenKind::Minus;
      break;
    case '=':
      kind = TokenKind::Assign;
      break;
    case '<':
      kind = TokenKind::Lt;
      break;
    case '>':
      kind = TokenKind::Gt;
      break;
    default:
      break;
  }

  advance(1);
  return make_token(kind, start, start_line, src_.substr(start, 1));
}

Token Lexer::lex_identifier()
{
  const auto start = static_cast<uint32_t>(pos_);
  const uint32_t start_line = line_;
  advance(1);
  while (!eof() && is_ident_continue(static_cast<unsigned char>(peek()))) {
    advance(1);
  }
  const auto end = static_cast<uint32_t>(pos_);
  return make_token(TokenKind::Identifier, start, start_line, src_.substr(start, end - start));
}

Token Lexer::lex_number()
{
  const auto start = static_cast<uint32_t>(pos_);
  const uint32_t start_line = line_;

  while (!eof() && std::isdigit(static_cast<unsigned char>(peek())) != 0) {
    advance(1);
  }

  bool is_float = false;

  // Fractional part
  if (!eof() && peek() == '.' && std::isdigit(static_cast<unsigned char>(peek(1))) != 0) {
    is_float = true;
    advance(1);
    while (!eof() && std::isdigit(static_cast<unsigned char>(peek())) != 0) {
      advance(1);
    }
  }

  // Exponent
  if (!eof() && (peek() == 'e' || peek() == 'E')) {
    const char sign = peek(1);
    const size_t digit_at = (sign == '+' || sign == '-') ? 2 : 1;
    if (std::isdigit(static_cast<unsigned char>(peek(digit_at))) != 0) {
      is_float = true;
      advance(digit_at);
      while (!eof() && std::isdigit(static_cast<unsigned char>(peek())) != 0) {
        advance(1);
      }
    }
  }

  const auto end = static_cast<uint32_t>(pos_);
  return make_token(
    is_float ? TokenKind::FloatLiteral : TokenKind::IntLiteral, start, start_line,
    src_.substr(start, end - start));
}

Token Lexer::lex_string()
{
  const auto start = static_cast<uint32_t>(pos_);
  const uint32_t start_line = line_;
  const char quote = peek();
  advance(1);

  const auto payload_start = static_cast<uint32_t>(pos_);

  while (!eof() && peek() != quote) {
    if (peek() == '\\') {
      advance(1);
      if (eof()) {
        break;
      }
    }
    advance(1);
  }

  if (eof()) {
    // Unterminated string: keep the opening quote in the text for the diagnostic.
    const auto end = static_cast<uint32_t>(pos_);
    return make_token(TokenKind::Unknown, start, start_line, src_.substr(start, end - start));
  }

  const auto payload_end = static_cast<uint32_t>(pos_);
  advance(1);  // closing quote
  return make_token(
    TokenKind::StringLiteral, start, start_line,
    src_.substr(payload_start, payload_end - payload_start));
}

}  // namespace stencil::syntax
