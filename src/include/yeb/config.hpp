#pragma once

#include <yeb/converter.hpp>

#include <nlohmann/json.hpp>

#include <string_view>

namespace yeb {

  // Reads converter settings from a JSON object. Recognized keys:
  //
  //   "max-alternatives"  unsigned  trivial alternation width
  //   "max-sequence"      unsigned  trivial sequence length
  //   "inline"            bool      substitute trivial definitions
  //   "drop-inlined"      bool      omit definitions left unreferenced
  //
  // Absent keys keep their defaults. Throws yeb::error (config kind) for
  // anything else.
  converter_options
  load_options(const nlohmann::json& config);

  // Parses `text` as JSON, then as above.
  converter_options
  parse_options(std::string_view text);

} // namespace yeb
