#pragma once

#include <yeb/converter.hpp>
#include <yeb/error.hpp>

#include <functional>
#include <string>
#include <vector>

namespace yeb {

  // Returns the full text of a named resource. May throw; any exception is
  // reported as a resource failure.
  using resource_reader = std::function<std::string(const std::string&)>;

  // Receives one output line at a time, without the line terminator.
  using line_writer = std::function<void(const std::string&)>;

  struct run_result {
    bool ok = true;
    error_kind kind = error_kind::resource;
    // Name of the resource the failure belongs to; empty on success.
    std::string resource;
    std::string message;
    std::vector<dependency_graph::component> components;
    std::vector<std::string> inlined;
  };

  // Reads the YACC grammar and the supplementary definitions, converts, and
  // writes one line per definition followed by an empty line. An empty
  // `supplement` name or "-" means there is no supplementary resource.
  //
  // Never throws; failures come back in the result and stop processing.
  run_result
  run(const std::string& grammar, const std::string& supplement,
      const resource_reader& read, const line_writer& write,
      const converter_options& options = {});

} // namespace yeb
