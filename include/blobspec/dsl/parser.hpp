#pragma once

#include "blobspec/dsl/token.hpp"
#include "blobspec/frame/type_spec.hpp"

#include <optional>
#include <string_view>
#include <system_error>
#include <vector>

namespace blobspec::dsl {

enum class parser_errc : int {
    ok = 0,
    unexpected_token = 1,
    expected_spec = 2,
    expected_key = 3,
    expected_descriptor = 4,
    expected_type_tag = 5,
    invalid_integer = 6,
    unclosed_vector = 7,
};

const std::error_category &parser_error_category() noexcept;
std::error_code make_error_code(parser_errc e) noexcept;

struct ParseResult {
    frame::Spec spec;
    std::error_code ec;
    std::uint32_t error_line{0};
    std::uint32_t error_column{0};
    std::string error_message;
};

/**
 * @brief spec 文本语法分析器（递归下降）
 *
 * 文法：
 *   spec       := '[' (key descriptor)* ']'
 *   key        := keyword                       ; :skip 映射为 frame::skip_field
 *   descriptor := keyword | integer | type
 *   type       := '[' keyword param* ']'
 *   param      := integer | keyword | string | type | spec
 *
 * 说明：
 * - 参数位置的关键字是类型（TypeSpec），字符串是分隔符集合（Delimiters）；
 * - 方括号参数在类型位置解析为嵌套类型，即 sequence 的第 1 个参数、prefixed 的前 2 个参数、
 *   prefixed-string 的第 1 个参数，例如 [:sequence [:string 2]]、[:prefixed [:string] :uint16]；
 *   其余位置（如 struct 的参数）解析为嵌套 spec；
 * - 只做语法检查；键值配对与 skip 后必须为整数等结构约束由 Decoder::decode_blob 负责。
 */
class Parser {
public:
    explicit Parser(std::vector<Token> tokens) noexcept;

    [[nodiscard]] ParseResult parse() noexcept;

private:
    [[nodiscard]] bool at_end() const noexcept;
    [[nodiscard]] const Token &peek() const noexcept;
    [[nodiscard]] const Token &previous() const noexcept;
    const Token &advance() noexcept;
    bool check(TokenType type) const noexcept;
    bool match(TokenType type) noexcept;

    // 解析规则（调用前已消耗 '['）
    std::optional<frame::Spec> parse_spec_body() noexcept;
    std::optional<frame::TypeSpec> parse_type_body() noexcept;
    std::optional<std::int64_t> parse_integer(const Token &token) noexcept;

    // 错误处理
    void error_at(parser_errc code,
                  const Token &token,
                  std::string_view message) noexcept;

    std::vector<Token> tokens_;
    std::size_t current_{0};

    std::error_code ec_;
    std::uint32_t error_line_{0};
    std::uint32_t error_column_{0};
    std::string error_message_;
    bool had_error_{false};
};

/**
 * @brief 词法 + 语法分析一步完成。词法错误以 lexer_errc 报告。
 */
[[nodiscard]] ParseResult parse_spec(std::string_view text) noexcept;

} // namespace blobspec::dsl

namespace std {
template <>
struct is_error_code_enum<blobspec::dsl::parser_errc> : true_type {};
} // namespace std
