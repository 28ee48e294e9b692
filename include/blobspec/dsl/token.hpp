#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace blobspec::dsl {

enum class TokenType : std::uint8_t {
  // Literals
  Keyword,        // :name（value 不含冒号）
  Integer,        // 123, -4, 0x1F
  String,         // "..."（分隔符集合）

  // Punctuation
  LBracket,       // [
  RBracket,       // ]

  // Special
  Eof,
  Error,
};

struct Token {
  TokenType type{TokenType::Error};
  std::string value{};
  std::uint32_t line{1};
  std::uint32_t column{1};

  [[nodiscard]] bool is(TokenType t) const noexcept { return type == t; }
};

[[nodiscard]] constexpr std::string_view token_type_name(TokenType t) noexcept {
  switch (t) {
    case TokenType::Keyword: return "Keyword";
    case TokenType::Integer: return "Integer";
    case TokenType::String: return "String";
    case TokenType::LBracket: return "[";
    case TokenType::RBracket: return "]";
    case TokenType::Eof: return "EOF";
    case TokenType::Error: return "Error";
  }
  return "Unknown";
}

}  // namespace blobspec::dsl
