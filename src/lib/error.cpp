#include <yeb/error.hpp>

namespace yeb {

  namespace {

    std::string
    format(const std::string& message, const source_location& where) {
      if (where.line == 0) return message;
      return std::to_string(where.line) + ":" + std::to_string(where.column) +
             ": " + message;
    }

  } // namespace

  std::string_view
  to_string(error_kind kind) {
    switch (kind) {
      case error_kind::lexical:
        return "lexical error";
      case error_kind::syntax:
        return "syntax error";
      case error_kind::grammar:
        return "grammar error";
      case error_kind::resource:
        return "resource error";
      case error_kind::config:
        return "configuration error";
    }
    return "error";
  }

  source_location
  locate(std::string_view text, std::size_t offset) {
    source_location loc;
    loc.offset = offset;
    loc.line = 1;
    loc.column = 1;
    for (std::size_t i = 0; i < offset && i < text.size(); ++i) {
      if (text[i] == '\n') {
        ++loc.line;
        loc.column = 1;
      } else {
        ++loc.column;
      }
    }
    return loc;
  }

  error::error(error_kind kind, const std::string& message,
               source_location where)
      : std::runtime_error(format(message, where)), kind_(kind),
        where_(where), detail_(message) {}

} // namespace yeb
