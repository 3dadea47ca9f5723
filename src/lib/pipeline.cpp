#include <yeb/pipeline.hpp>

#include <yeb/ebnf_parser.hpp>
#include <yeb/ebnf_writer.hpp>
#include <yeb/yacc_parser.hpp>

#include <exception>
#include <utility>

namespace yeb {

  namespace {

    run_result
    failed(error_kind kind, const std::string& resource,
           const std::string& message) {
      run_result r;
      r.ok = false;
      r.kind = kind;
      r.resource = resource;
      r.message = message;
      return r;
    }

    std::string
    fetch(const resource_reader& read, const std::string& name) {
      try {
        return read(name);
      } catch (const error&) {
        throw;
      } catch (const std::exception& ex) {
        throw error(error_kind::resource, ex.what());
      }
    }

  } // namespace

  run_result
  run(const std::string& grammar, const std::string& supplement,
      const resource_reader& read, const line_writer& write,
      const converter_options& options) {
    // Name of the resource being worked on, for failure reports.
    std::string current = grammar;
    try {
      auto grammar_text = fetch(read, grammar);
      auto g = yacc_parser().parse(grammar_text);

      ebnf::definition_map extra;
      if (!supplement.empty() && supplement != "-") {
        current = supplement;
        auto supplement_text = fetch(read, supplement);
        extra = ebnf_parser().parse(supplement_text);
      }

      current = grammar;
      auto result = converter(options).convert(g, extra);

      current.clear();
      for (const auto& d : result.definitions)
        write(to_line(d));
      write("");

      run_result r;
      r.components = std::move(result.components);
      r.inlined = std::move(result.inlined);
      return r;
    } catch (const error& ex) {
      return failed(ex.kind(), current, ex.what());
    } catch (const std::exception& ex) {
      return failed(error_kind::resource, current, ex.what());
    }
  }

} // namespace yeb
