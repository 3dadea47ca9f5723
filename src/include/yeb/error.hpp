#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace yeb {

  enum class error_kind { lexical, syntax, grammar, resource, config };

  std::string_view
  to_string(error_kind kind);

  // Byte offset into a resource, with 1-based line and column. A zero line
  // means the position is unknown.
  struct source_location {
    std::size_t offset = 0;
    int line = 0;
    int column = 0;
  };

  source_location
  locate(std::string_view text, std::size_t offset);

  class error : public std::runtime_error {
  public:
    error(error_kind kind, const std::string& message,
          source_location where = {});

    error_kind
    kind() const {
      return kind_;
    }

    const source_location&
    where() const {
      return where_;
    }

    // Message without the location prefix carried by what().
    const std::string&
    detail() const {
      return detail_;
    }

  private:
    error_kind kind_;
    source_location where_;
    std::string detail_;
  };

} // namespace yeb
