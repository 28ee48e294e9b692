#include "blobspec/dsl/parser.hpp"

#include "blobspec/dsl/lexer.hpp"
#include "blobspec/frame/decoder.hpp"

#include <charconv>
#include <limits>
#include <string>

namespace blobspec::dsl {

namespace {

class ParserErrorCategory : public std::error_category {
public:
    [[nodiscard]] const char *name() const noexcept override {
        return "blobspec.dsl.parser";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<parser_errc>(ev)) {
        case parser_errc::ok:
            return "success";
        case parser_errc::unexpected_token:
            return "unexpected token";
        case parser_errc::expected_spec:
            return "expected '[' to start a spec";
        case parser_errc::expected_key:
            return "expected field name keyword";
        case parser_errc::expected_descriptor:
            return "expected type descriptor";
        case parser_errc::expected_type_tag:
            return "expected type tag keyword";
        case parser_errc::invalid_integer:
            return "invalid integer literal";
        case parser_errc::unclosed_vector:
            return "unclosed '['";
        }
        return "unknown parser error";
    }
};

const ParserErrorCategory kParserErrorCategory{};

// 该位置的方括号参数是嵌套类型 [:tag param*]，其余位置是嵌套 spec。
// sequence 的元素类型、prefixed 的数据/前缀类型、prefixed-string 的前缀类型。
[[nodiscard]] bool is_type_param_slot(std::string_view tag, std::size_t index) noexcept {
    const auto builtin = frame::builtin_type(tag);
    if (!builtin) {
        return false;
    }
    switch (*builtin) {
    case frame::BuiltinType::sequence:
    case frame::BuiltinType::prefixed_string:
        return index == 0;
    case frame::BuiltinType::prefixed:
        return index <= 1;
    default:
        return false;
    }
}

constexpr std::string_view kSkipKeyword = "skip";

[[nodiscard]] std::optional<std::uint64_t>
parse_uint64_literal(std::string_view text) noexcept {
    if (text.empty() || text.front() == '-') {
        return std::nullopt;
    }

    int base = 10;
    if (text.size() > 2 && text[0] == '0' &&
        (text[1] == 'x' || text[1] == 'X')) {
        base = 16;
        text.remove_prefix(2);
    }
    if (text.empty()) {
        return std::nullopt;
    }

    std::uint64_t value = 0;
    auto [ptr, ec] =
        std::from_chars(text.data(), text.data() + text.size(), value, base);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

[[nodiscard]] std::optional<std::int64_t>
parse_int64_literal(std::string_view text) noexcept {
    bool negative = false;
    if (!text.empty() && text.front() == '-') {
        negative = true;
        text.remove_prefix(1);
    }

    const auto mag = parse_uint64_literal(text);
    if (!mag.has_value()) {
        return std::nullopt;
    }

    const auto magnitude = *mag;
    const auto max = static_cast<std::uint64_t>(
        std::numeric_limits<std::int64_t>::max());
    if (!negative) {
        if (magnitude > max) {
            return std::nullopt;
        }
        return static_cast<std::int64_t>(magnitude);
    }
    if (magnitude > max + 1u) {
        return std::nullopt;
    }
    if (magnitude == max + 1u) {
        return std::numeric_limits<std::int64_t>::min();
    }
    return -static_cast<std::int64_t>(magnitude);
}

} // namespace

const std::error_category &parser_error_category() noexcept {
    return kParserErrorCategory;
}

std::error_code make_error_code(parser_errc e) noexcept {
    return {static_cast<int>(e), kParserErrorCategory};
}

Parser::Parser(std::vector<Token> tokens) noexcept
    : tokens_(std::move(tokens)) {
    if (tokens_.empty() || !tokens_.back().is(TokenType::Eof)) {
        tokens_.push_back(Token{TokenType::Eof, {}, 0, 0});
    }
}

ParseResult Parser::parse() noexcept {
    ParseResult result;

    if (!match(TokenType::LBracket)) {
        error_at(parser_errc::expected_spec, peek(), "spec must start with '['");
    } else {
        auto spec = parse_spec_body();
        if (spec.has_value() && !at_end()) {
            error_at(parser_errc::unexpected_token, peek(),
                     "unexpected trailing input after spec");
        }
        if (spec.has_value() && !had_error_) {
            result.spec = std::move(*spec);
        }
    }

    result.ec = ec_;
    result.error_line = error_line_;
    result.error_column = error_column_;
    result.error_message = std::move(error_message_);
    return result;
}

bool Parser::at_end() const noexcept { return peek().type == TokenType::Eof; }

const Token &Parser::peek() const noexcept { return tokens_[current_]; }

const Token &Parser::previous() const noexcept { return tokens_[current_ - 1]; }

const Token &Parser::advance() noexcept {
    if (!at_end())
        ++current_;
    return previous();
}

bool Parser::check(TokenType type) const noexcept {
    return peek().type == type;
}

bool Parser::match(TokenType type) noexcept {
    if (check(type)) {
        advance();
        return true;
    }
    return false;
}

std::optional<frame::Spec> Parser::parse_spec_body() noexcept {
    frame::Spec spec;
    bool key_position = true;

    while (!check(TokenType::RBracket)) {
        if (at_end()) {
            error_at(parser_errc::unclosed_vector, peek(),
                     "expected ']' to close spec");
            return std::nullopt;
        }

        if (key_position) {
            // 键：只能是关键字，:skip 为跳过指令
            if (!check(TokenType::Keyword)) {
                error_at(parser_errc::expected_key, peek(),
                         "expected field name, got " +
                             std::string(token_type_name(peek().type)));
                return std::nullopt;
            }
            const auto &key = advance();
            if (key.value == kSkipKeyword) {
                spec.emplace_back(frame::skip_field);
            } else {
                spec.emplace_back(key.value);
            }
        } else if (check(TokenType::Keyword)) {
            spec.emplace_back(advance().value);
        } else if (check(TokenType::Integer)) {
            auto v = parse_integer(advance());
            if (!v) {
                return std::nullopt;
            }
            spec.emplace_back(*v);
        } else if (match(TokenType::LBracket)) {
            auto type = parse_type_body();
            if (!type) {
                return std::nullopt;
            }
            spec.emplace_back(std::move(*type));
        } else {
            error_at(parser_errc::expected_descriptor, peek(),
                     "expected type descriptor, got " +
                         std::string(token_type_name(peek().type)));
            return std::nullopt;
        }

        key_position = !key_position;
    }

    advance(); // ]
    return spec;
}

std::optional<frame::TypeSpec> Parser::parse_type_body() noexcept {
    if (!check(TokenType::Keyword)) {
        error_at(parser_errc::expected_type_tag, peek(),
                 "descriptor vector must start with a type keyword");
        return std::nullopt;
    }

    frame::TypeSpec type;
    type.tag = advance().value;

    while (!check(TokenType::RBracket)) {
        if (at_end()) {
            error_at(parser_errc::unclosed_vector, peek(),
                     "expected ']' to close descriptor");
            return std::nullopt;
        }

        if (check(TokenType::Integer)) {
            auto v = parse_integer(advance());
            if (!v) {
                return std::nullopt;
            }
            type.params.emplace_back(*v);
        } else if (check(TokenType::Keyword)) {
            type.params.emplace_back(advance().value);
        } else if (check(TokenType::String)) {
            type.params.emplace_back(frame::Delimiters{advance().value});
        } else if (match(TokenType::LBracket)) {
            if (is_type_param_slot(type.tag, type.params.size())) {
                auto nested = parse_type_body();
                if (!nested) {
                    return std::nullopt;
                }
                type.params.emplace_back(std::move(*nested));
                continue;
            }
            auto nested = parse_spec_body();
            if (!nested) {
                return std::nullopt;
            }
            type.params.emplace_back(std::move(*nested));
        } else {
            error_at(parser_errc::unexpected_token, peek(),
                     "unexpected " + std::string(token_type_name(peek().type)) +
                         " in descriptor");
            return std::nullopt;
        }
    }

    advance(); // ]
    return type;
}

std::optional<std::int64_t> Parser::parse_integer(const Token &token) noexcept {
    auto v = parse_int64_literal(token.value);
    if (!v) {
        error_at(parser_errc::invalid_integer, token,
                 "invalid integer literal: " + token.value);
    }
    return v;
}

void Parser::error_at(parser_errc code,
                      const Token &token,
                      std::string_view message) noexcept {
    if (had_error_) {
        return;
    }
    had_error_ = true;
    ec_ = make_error_code(code);
    error_line_ = token.line;
    error_column_ = token.column;
    error_message_ = std::string(message);
}

ParseResult parse_spec(std::string_view text) noexcept {
    Lexer lexer(text);
    auto lexed = lexer.tokenize();
    if (lexed.ec) {
        ParseResult result;
        result.ec = lexed.ec;
        result.error_line = lexed.error_line;
        result.error_column = lexed.error_column;
        result.error_message = std::move(lexed.error_message);
        return result;
    }

    Parser parser(std::move(lexed.tokens));
    return parser.parse();
}

} // namespace blobspec::dsl
