#include "blobspec/dsl/lexer.hpp"

#include <cctype>

namespace blobspec::dsl {

namespace {

class LexerErrorCategory : public std::error_category {
 public:
  [[nodiscard]] const char* name() const noexcept override { return "blobspec.dsl.lexer"; }

  [[nodiscard]] std::string message(int ev) const override {
    switch (static_cast<lexer_errc>(ev)) {
      case lexer_errc::ok: return "success";
      case lexer_errc::unterminated_string: return "unterminated string literal";
      case lexer_errc::invalid_character: return "invalid character";
      case lexer_errc::empty_keyword: return "empty keyword";
    }
    return "unknown lexer error";
  }
};

const LexerErrorCategory kLexerErrorCategory{};

// 关键字允许的字符：与 EDN 关键字基本一致（不含 ':'、'['、']'、'"'、';'）。
[[nodiscard]] bool is_keyword_char(char c) noexcept {
  if (std::isalnum(static_cast<unsigned char>(c))) {
    return true;
  }
  switch (c) {
    case '-':
    case '_':
    case '?':
    case '!':
    case '.':
    case '*':
    case '+':
    case '/':
    case '<':
    case '>':
    case '=':
      return true;
    default:
      return false;
  }
}

}  // namespace

const std::error_category& lexer_error_category() noexcept {
  return kLexerErrorCategory;
}

std::error_code make_error_code(lexer_errc e) noexcept {
  return {static_cast<int>(e), kLexerErrorCategory};
}

Lexer::Lexer(std::string_view source) noexcept : source_(source) {}

LexerResult Lexer::tokenize() noexcept {
  LexerResult result;

  for (;;) {
    skip_whitespace_and_comments();
    if (at_end()) {
      break;
    }

    token_start_ = current_;
    token_line_ = line_;
    token_column_ = column_;

    Token token = scan_token();
    if (token.type == TokenType::Error) {
      result.ec = make_error_code(last_error_kind_);
      result.error_line = token.line;
      result.error_column = token.column;
      result.error_message = token.value;
      return result;
    }

    result.tokens.push_back(std::move(token));
  }

  token_start_ = current_;
  token_line_ = line_;
  token_column_ = column_;
  result.tokens.push_back(make_token(TokenType::Eof));
  return result;
}

bool Lexer::at_end() const noexcept {
  return current_ >= source_.size();
}

char Lexer::peek() const noexcept {
  if (at_end()) return '\0';
  return source_[current_];
}

char Lexer::peek_next() const noexcept {
  if (current_ + 1 >= source_.size()) return '\0';
  return source_[current_ + 1];
}

char Lexer::advance() noexcept {
  char c = source_[current_++];
  if (c == '\n') {
    ++line_;
    column_ = 1;
  } else {
    ++column_;
  }
  return c;
}

void Lexer::skip_whitespace_and_comments() noexcept {
  while (!at_end()) {
    const char c = peek();
    if (c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == ',') {
      advance();
      continue;
    }
    if (c == ';') {
      // 行注释：; ...
      while (!at_end() && peek() != '\n') {
        advance();
      }
      continue;
    }
    break;
  }
}

Token Lexer::scan_token() noexcept {
  const char c = peek();

  switch (c) {
    case '[':
      advance();
      return make_token(TokenType::LBracket);
    case ']':
      advance();
      return make_token(TokenType::RBracket);
    case ':':
      return scan_keyword();
    case '"':
      return scan_string();
    default:
      break;
  }

  if (std::isdigit(static_cast<unsigned char>(c)) ||
      (c == '-' && std::isdigit(static_cast<unsigned char>(peek_next())))) {
    return scan_number();
  }

  advance();
  return make_error(lexer_errc::invalid_character, std::string("unexpected character: ") + c);
}

Token Lexer::scan_keyword() noexcept {
  advance();  // :
  const std::size_t start = current_;
  while (!at_end() && is_keyword_char(peek())) {
    advance();
  }
  if (current_ == start) {
    return make_error(lexer_errc::empty_keyword, "expected keyword name after ':'");
  }
  return make_token(TokenType::Keyword, std::string(source_.substr(start, current_ - start)));
}

Token Lexer::scan_string() noexcept {
  advance();  // 起始引号
  std::string value;
  while (!at_end() && peek() != '"') {
    if (peek() == '\\' && peek_next() != '\0') {
      advance();  // 反斜杠
      const char escaped = advance();
      switch (escaped) {
        case 'n': value += '\n'; break;
        case 't': value += '\t'; break;
        case 'r': value += '\r'; break;
        case '0': value += '\0'; break;
        case '\\': value += '\\'; break;
        case '"': value += '"'; break;
        default: value += escaped; break;
      }
    } else {
      value += advance();
    }
  }

  if (at_end()) {
    return make_error(lexer_errc::unterminated_string, "unterminated string");
  }

  advance();  // 结束引号
  return make_token(TokenType::String, std::move(value));
}

// 只做切分，数值范围检查交给 parser。
Token Lexer::scan_number() noexcept {
  const std::size_t start = current_;

  if (peek() == '-') {
    advance();
  }

  if (peek() == '0' && (peek_next() == 'x' || peek_next() == 'X')) {
    advance();  // 0
    advance();  // x
    while (!at_end() && std::isxdigit(static_cast<unsigned char>(peek()))) {
      advance();
    }
  } else {
    while (!at_end() && std::isdigit(static_cast<unsigned char>(peek()))) {
      advance();
    }
  }

  return make_token(TokenType::Integer, std::string(source_.substr(start, current_ - start)));
}

Token Lexer::make_token(TokenType type) const noexcept {
  return Token{type, std::string(source_.substr(token_start_, current_ - token_start_)),
               token_line_, token_column_};
}

Token Lexer::make_token(TokenType type, std::string value) const noexcept {
  return Token{type, std::move(value), token_line_, token_column_};
}

Token Lexer::make_error(lexer_errc kind, std::string_view message) noexcept {
  last_error_kind_ = kind;
  return Token{TokenType::Error, std::string(message), token_line_, token_column_};
}

}  // namespace blobspec::dsl
