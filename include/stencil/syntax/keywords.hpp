#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace stencil::syntax
{

enum class Keyword : uint8_t {
  Print,
  Log,
  If,
  ElseIf,
  Else,
  EndIf,
  Foreach,
  EndForeach,
  Render,
  EndRender,
  Replace,
  EndReplace,
  Place,
  Include,
};

struct KeywordInfo
{
  std::string_view spelling;
  Keyword keyword;
  bool takesArgs;
};

inline constexpr std::array<KeywordInfo, 14> k_statement_keywords = {{
  {"print", Keyword::Print, true},
  {"log", Keyword::Log, true},
  {"if", Keyword::If, true},
  {"elseif", Keyword::ElseIf, true},
  {"else", Keyword::Else, false},
  {"endif", Keyword::EndIf, false},
  {"foreach", Keyword::Foreach, true},
  {"endforeach", Keyword::EndForeach, false},
  {"render", Keyword::Render, true},
  {"endrender", Keyword::EndRender, false},
  {"replace", Keyword::Replace, true},
  {"endreplace", Keyword::EndReplace, false},
  {"place", Keyword::Place, true},
  {"include", Keyword::Include, true},
}};

[[nodiscard]] constexpr const KeywordInfo * find_keyword(std::string_view word) noexcept
{
  for (const auto & info : k_statement_keywords) {
    if (info.spelling == word) {
      return &info;
    }
  }
  return nullptr;
}

/// Keywords that close a block (or continue an if-chain).
[[nodiscard]] constexpr bool is_block_terminator(Keyword k) noexcept
{
  switch (k) {
    case Keyword::ElseIf:
    case Keyword::Else:
    case Keyword::EndIf:
    case Keyword::EndForeach:
    case Keyword::EndRender:
    case Keyword::EndReplace:
      return true;
    default:
      return false;
  }
}

}  // namespace stencil::syntax
