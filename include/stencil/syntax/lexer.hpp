#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "stencil/syntax/token.hpp"

namespace stencil::syntax
{

/**
 * Two-mode lexer for template text.
 *
 * In template mode everything is literal text except `$(` and `$keyword`.
 * After an opener with arguments the lexer switches to argument mode and
 * produces expression tokens until the matching `)` at depth zero.
 */
class Lexer
{
public:
  explicit Lexer(std::string_view src) : src_(src) {}

  [[nodiscard]] std::vector<Token> lex_all();

private:
  void lex_template(std::vector<Token> & out);
  void lex_arguments(std::vector<Token> & out, const Token & opener);

  /// Length of a recognized opener at pos_ (0 when `$` is literal text).
  [[nodiscard]] size_t opener_length_at(size_t pos) const noexcept;

  [[nodiscard]] Token next_arg_token();

  [[nodiscard]] bool eof() const noexcept { return pos_ >= src_.size(); }
  [[nodiscard]] char peek(size_t lookahead = 0) const noexcept
  {
    const size_t i = pos_ + lookahead;
    return (i < src_.size()) ? src_[i] : '\0';
  }
  [[nodiscard]] bool starts_with(std::string_view s) const noexcept;

  void advance(size_t n = 1) noexcept;

  void skip_whitespace();

  [[nodiscard]] Token lex_identifier();
  [[nodiscard]] Token lex_number();
  [[nodiscard]] Token lex_string();

  [[nodiscard]] Token make_token(
    TokenKind kind, uint32_t start, uint32_t start_line, std::string_view text) const noexcept
  {
    Token t;
    t.kind = kind;
    t.range = SourceRange(start, static_cast<uint32_t>(pos_));
    t.text = text;
    t.line = start_line;
    return t;
  }

  std::string_view src_;
  size_t pos_ = 0;
  uint32_t line_ = 1;
};

}  // namespace stencil::syntax
