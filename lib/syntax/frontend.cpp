// stencil/syntax/frontend.cpp - High-level parse pipeline
#include "stencil/syntax/frontend.hpp"

#include <utility>

#include "stencil/syntax/lexer.hpp"
#include "stencil/syntax/parser.hpp"

namespace stencil
{

std::shared_ptr<ParsedComponent> parse_component(std::string name, std::string text)
{
  auto unit = std::make_shared<ParsedComponent>(std::move(name), std::move(text));

  syntax::Lexer lexer(unit->source.content());
  syntax::Parser parser(unit->ast, unit->source, unit->diags, lexer.lex_all());
  unit->root = parser.parse_component(unit->source.name());

  return unit;
}

}  // namespace stencil
