#include <yeb/config.hpp>
#include <yeb/converter.hpp>
#include <yeb/error.hpp>
#include <yeb/pipeline.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

static constexpr int exit_success = 0;
static constexpr int exit_usage = 1;
static constexpr int exit_io = 2;
static constexpr int exit_parse = 3;

struct cli_options {
  std::vector<std::string> inputs;
  std::string output_file;
  std::string config_file;
  bool verbose = false;
  bool show_help = false;
  bool show_version = false;
};

static void
print_usage(std::ostream& os) {
  os << "Usage: yeb [options] <grammar.y> <supplement.ebnf>\n"
     << "\n"
     << "Converts the rules section of a YACC grammar to EBNF. Pass \"\" or -\n"
     << "as the supplement when there are no extra definitions.\n"
     << "\n"
     << "Options:\n"
     << "  -o <file>         Output file (default: standard output)\n"
     << "  -c <file>         JSON configuration file\n"
     << "  -v, --verbose     Report dependency order and inlined names\n"
     << "  -h, --help        Show this help message\n"
     << "  --version         Show version information\n";
}

static void
print_version(std::ostream& os) {
  os << "yeb " << YEB_VERSION << "\n";
}

static cli_options
parse_args(int argc, char* argv[]) {
  cli_options opts;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      opts.show_help = true;
      return opts;
    }

    if (arg == "--version") {
      opts.show_version = true;
      return opts;
    }

    if (arg == "-v" || arg == "--verbose") {
      opts.verbose = true;
      continue;
    }

    if (arg == "-o") {
      if (i + 1 >= argc) {
        std::cerr << "yeb: -o requires an argument\n";
        std::exit(exit_usage);
      }
      opts.output_file = argv[++i];
      continue;
    }

    if (arg == "-c") {
      if (i + 1 >= argc) {
        std::cerr << "yeb: -c requires an argument\n";
        std::exit(exit_usage);
      }
      opts.config_file = argv[++i];
      continue;
    }

    // "-" alone names the absent supplement.
    if (arg.size() > 1 && arg[0] == '-') {
      std::cerr << "yeb: unknown option: " << arg << "\n";
      std::exit(exit_usage);
    }

    opts.inputs.push_back(arg);
  }

  return opts;
}

static std::string
read_file(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) throw std::runtime_error("cannot open file: " + path);
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

static int
exit_code(yeb::error_kind kind) {
  switch (kind) {
    case yeb::error_kind::config:
      return exit_usage;
    case yeb::error_kind::resource:
      return exit_io;
    default:
      return exit_parse;
  }
}

static void
report(std::ostream& os, const yeb::run_result& result) {
  for (const auto& component : result.components) {
    os << "yeb: component:";
    for (const auto& name : component)
      os << " " << name;
    os << "\n";
  }
  if (!result.inlined.empty()) {
    os << "yeb: inlined:";
    for (const auto& name : result.inlined)
      os << " " << name;
    os << "\n";
  }
}

static int
run(const cli_options& opts) {
  yeb::converter_options options;
  if (!opts.config_file.empty()) {
    std::string text;
    try {
      text = read_file(opts.config_file);
    } catch (const std::exception& e) {
      std::cerr << "yeb: " << e.what() << "\n";
      return exit_io;
    }
    try {
      options = yeb::parse_options(text);
    } catch (const yeb::error& e) {
      std::cerr << "yeb: error in configuration " << opts.config_file << ": "
                << e.what() << "\n";
      return exit_code(e.kind());
    }
  }

  std::ofstream file;
  if (!opts.output_file.empty()) {
    file.open(opts.output_file);
    if (!file) {
      std::cerr << "yeb: cannot write file: " << opts.output_file << "\n";
      return exit_io;
    }
  }
  std::ostream& out = opts.output_file.empty() ? std::cout : file;

  auto result = yeb::run(
      opts.inputs[0], opts.inputs[1], read_file,
      [&out](const std::string& line) { out << line << "\n"; }, options);

  if (!result.ok) {
    std::cerr << "yeb: " << yeb::to_string(result.kind);
    if (!result.resource.empty()) std::cerr << " in " << result.resource;
    std::cerr << ": " << result.message << "\n";
    return exit_code(result.kind);
  }

  if (opts.verbose) report(std::cerr, result);

  out.flush();
  if (!out) {
    std::cerr << "yeb: error writing output\n";
    return exit_io;
  }
  return exit_success;
}

int
main(int argc, char* argv[]) {
  cli_options opts = parse_args(argc, argv);

  if (opts.show_help) {
    print_usage(std::cerr);
    return exit_success;
  }

  if (opts.show_version) {
    print_version(std::cerr);
    return exit_success;
  }

  if (opts.inputs.size() != 2) {
    std::cerr << "yeb: expected a grammar and a supplement, got "
              << opts.inputs.size() << " input(s)\n";
    print_usage(std::cerr);
    return exit_usage;
  }

  return run(opts);
}
