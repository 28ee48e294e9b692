#pragma once

#include "blobspec/dsl/token.hpp"

#include <string_view>
#include <system_error>
#include <vector>

namespace blobspec::dsl {

enum class lexer_errc : int {
  ok = 0,
  unterminated_string = 1,
  invalid_character = 2,
  empty_keyword = 3,
};

const std::error_category& lexer_error_category() noexcept;
std::error_code make_error_code(lexer_errc e) noexcept;

struct LexerResult {
  std::vector<Token> tokens;
  std::error_code ec;
  std::uint32_t error_line{0};
  std::uint32_t error_column{0};
  std::string error_message;
};

/**
 * @brief spec 文本词法分析器
 *
 * 支持:
 * - 关键字: :magic, :uint32, :c-string, :prefixed-string
 * - 整数: 123, -4, 0x1F
 * - 字符串: "..."（支持 \n \t \r \\ \" \0 转义）
 * - 方括号: [ ]
 * - 逗号视为空白，';' 起始行注释
 */
class Lexer {
 public:
  explicit Lexer(std::string_view source) noexcept;

  [[nodiscard]] LexerResult tokenize() noexcept;

 private:
  [[nodiscard]] bool at_end() const noexcept;
  [[nodiscard]] char peek() const noexcept;
  [[nodiscard]] char peek_next() const noexcept;
  char advance() noexcept;
  void skip_whitespace_and_comments() noexcept;

  Token scan_token() noexcept;
  Token scan_keyword() noexcept;
  Token scan_string() noexcept;
  Token scan_number() noexcept;

  Token make_token(TokenType type) const noexcept;
  Token make_token(TokenType type, std::string value) const noexcept;
  Token make_error(lexer_errc kind, std::string_view message) noexcept;

  std::string_view source_;
  std::size_t current_{0};
  std::size_t token_start_{0};
  std::uint32_t line_{1};
  std::uint32_t column_{1};
  std::uint32_t token_line_{1};
  std::uint32_t token_column_{1};
  lexer_errc last_error_kind_{lexer_errc::invalid_character};
};

}  // 命名空间 blobspec::dsl

namespace std {
template <>
struct is_error_code_enum<blobspec::dsl::lexer_errc> : true_type {};
}  // 命名空间 std
