#include <yeb/ebnf_lexer.hpp>

#include <algorithm>
#include <cctype>

namespace yeb {

  namespace {

    constexpr std::size_t max_excerpt = 16;

    bool
    is_name_start(char c) {
      return std::isalpha(static_cast<unsigned char>(c)) || c == '_' ||
             c == '.';
    }

    bool
    is_name_char(char c) {
      return std::isalnum(static_cast<unsigned char>(c)) || c == '_' ||
             c == '.';
    }

    class lexer {
    public:
      explicit lexer(std::string_view source) : src_(source) {}

      std::vector<token>
      run() {
        std::vector<token> out;
        for (;;) {
          auto t = next();
          auto kind = t.kind;
          out.push_back(std::move(t));
          if (kind == token_kind::end || kind == token_kind::error) break;
        }
        return out;
      }

    private:
      std::string_view src_;
      std::size_t pos_ = 0;

      token
      make(token_kind kind, std::size_t start) const {
        return {kind, std::string(src_.substr(start, pos_ - start)), start};
      }

      token
      fault(std::size_t start) const {
        auto len = std::min(max_excerpt, src_.size() - start);
        auto stop = src_.find_first_of(" \t\r\n", start);
        if (stop != std::string_view::npos && stop > start)
          len = std::min(len, stop - start);
        if (len == 0) len = std::min<std::size_t>(1, src_.size() - start);
        return {token_kind::error, std::string(src_.substr(start, len)),
                start};
      }

      // Returns false on an unterminated block comment.
      bool
      skip_whitespace_and_comments() {
        while (pos_ < src_.size()) {
          char c = src_[pos_];
          if (std::isspace(static_cast<unsigned char>(c))) {
            ++pos_;
            continue;
          }
          if (src_.compare(pos_, 2, "//") == 0) {
            while (pos_ < src_.size() && src_[pos_] != '\n')
              ++pos_;
            continue;
          }
          if (src_.compare(pos_, 2, "/*") == 0) {
            auto close = src_.find("*/", pos_ + 2);
            if (close == std::string_view::npos) return false;
            pos_ = close + 2;
            continue;
          }
          break;
        }
        return true;
      }

      token
      next() {
        auto comment_start = pos_;
        if (!skip_whitespace_and_comments()) {
          // Point at the opening of the unterminated comment.
          auto open = src_.find("/*", comment_start);
          return fault(open == std::string_view::npos ? comment_start : open);
        }
        if (pos_ >= src_.size()) return {token_kind::end, "", pos_};

        auto start = pos_;
        char c = src_[pos_];

        if (is_name_start(c)) {
          while (pos_ < src_.size() && is_name_char(src_[pos_]))
            ++pos_;
          return make(token_kind::identifier, start);
        }

        if (c == '\'' || c == '"') return read_quoted(c, token_kind::literal);
        if (c == '[') return read_quoted(']', token_kind::char_class);

        if (src_.compare(pos_, 3, "::=") == 0) {
          pos_ += 3;
          return make(token_kind::define, start);
        }

        ++pos_;
        switch (c) {
          case '|':
            return make(token_kind::pipe, start);
          case '(':
            return make(token_kind::lparen, start);
          case ')':
            return make(token_kind::rparen, start);
          case ';':
            return make(token_kind::semicolon, start);
          case '?':
            return make(token_kind::question, start);
          case '*':
            return make(token_kind::star, start);
          case '+':
            return make(token_kind::plus, start);
          default:
            break;
        }
        return fault(start);
      }

      // Reads from the opening delimiter at pos_ through `close`. Backslash
      // escapes the next character; a line break or end of input before the
      // closing delimiter is a fault.
      token
      read_quoted(char close, token_kind kind) {
        auto start = pos_++;
        while (pos_ < src_.size()) {
          char c = src_[pos_];
          if (c == '\n' || c == '\r') break;
          if (c == '\\') {
            pos_ += 2;
            continue;
          }
          ++pos_;
          if (c == close) return make(kind, start);
        }
        return fault(start);
      }
    };

  } // namespace

  std::string_view
  to_string(token_kind kind) {
    switch (kind) {
      case token_kind::identifier:
        return "identifier";
      case token_kind::define:
        return "'::='";
      case token_kind::pipe:
        return "'|'";
      case token_kind::lparen:
        return "'('";
      case token_kind::rparen:
        return "')'";
      case token_kind::semicolon:
        return "';'";
      case token_kind::question:
        return "'?'";
      case token_kind::star:
        return "'*'";
      case token_kind::plus:
        return "'+'";
      case token_kind::literal:
        return "literal";
      case token_kind::char_class:
        return "character class";
      case token_kind::end:
        return "end of input";
      case token_kind::error:
        return "invalid input";
    }
    return "token";
  }

  std::vector<token>
  tokenize_ebnf(std::string_view source) {
    return lexer(source).run();
  }

} // namespace yeb
