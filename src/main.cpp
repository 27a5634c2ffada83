#include <asciidoc/core/config.h>
#include <asciidoc/core/diagnostics.h>
#include <asciidoc/core/parse_error.h>
#include <asciidoc/html/html_converter.h>
#include <asciidoc/parser/parser.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace {

constexpr const char kProgramName[] = "asciidoc2html";

void print_usage(std::ostream& stream) {
  stream << "usage: " << kProgramName
         << " <input.adoc> [output.html] [--fragment] [--compact]"
            " [--strict-includes] [--verbose]\n";
}

bool is_help_flag(const char* input) {
  if (input == nullptr) {
    return false;
  }

  const std::string_view text(input);
  return text == "-h" || text == "--help";
}

bool is_version_flag(const char* input) {
  if (input == nullptr) {
    return false;
  }

  const std::string_view text(input);
  return text == "-V" || text == "--version";
}

bool starts_with(std::string_view value, std::string_view prefix) {
  return value.size() >= prefix.size() &&
         value.compare(0, prefix.size(), prefix) == 0;
}

std::string default_output_path(const std::string& input_path) {
  std::filesystem::path path(input_path);
  path.replace_extension(".html");
  return path.string();
}

struct CliOptions {
  std::string input_path;
  std::string output_path;
  bool fragment = false;
  bool compact = false;
  bool strict_includes = false;
  bool verbose = false;
};

}  // namespace

int main(int argc, char** argv) {
  if (argc == 2 && is_help_flag(argv[1])) {
    print_usage(std::cout);
    return 0;
  }
  if (argc == 2 && is_version_flag(argv[1])) {
    std::cout << asciidoc::core::config::kVersionString << "\n";
    return 0;
  }

  if (argc < 2) {
    print_usage(std::cerr);
    return 1;
  }

  CliOptions cli;
  std::vector<const char*> positional_args;
  positional_args.reserve(static_cast<std::size_t>(argc));

  for (int index = 1; index < argc; ++index) {
    const std::string_view argument(argv[index] != nullptr ? argv[index] : "");
    if (argument == "--fragment") {
      cli.fragment = true;
    } else if (argument == "--compact") {
      cli.compact = true;
    } else if (argument == "--strict-includes") {
      cli.strict_includes = true;
    } else if (argument == "--verbose") {
      cli.verbose = true;
    } else if (starts_with(argument, "--")) {
      std::cerr << "Unknown option: '" << argument << "'\n";
      print_usage(std::cerr);
      return 1;
    } else {
      positional_args.push_back(argv[index]);
    }
  }

  if (positional_args.empty() || positional_args.size() > 2) {
    print_usage(std::cerr);
    return 1;
  }

  cli.input_path = positional_args[0];
  cli.output_path = positional_args.size() == 2 ? std::string(positional_args[1])
                                                : default_output_path(cli.input_path);

  asciidoc::parser::Parser parser;
  parser.diagnostics().set_min_severity(cli.verbose ? asciidoc::core::Severity::Info
                                                    : asciidoc::core::Severity::Warning);
  parser.diagnostics().add_observer([](const asciidoc::core::DiagnosticEvent& event) {
    std::cerr << asciidoc::core::format_diagnostic(event) << "\n";
  });

  asciidoc::parser::ParserOptions parser_options;
  parser_options.strict_includes = cli.strict_includes;

  std::unique_ptr<asciidoc::dom::Document> document;
  try {
    document = parser.parse_file(cli.input_path, parser_options);
  } catch (const asciidoc::core::ParseError& error) {
    std::cerr << cli.input_path;
    if (error.line() > 0) {
      std::cerr << ":" << error.line() << ":" << error.column();
    }
    std::cerr << ": error: " << error.message() << "\n";

    if (cli.verbose) {
      asciidoc::core::FailureTraceCollector collector;
      asciidoc::core::SourceLocation location;
      location.file = cli.input_path;
      location.line = error.line();
      location.column = error.column();
      asciidoc::core::FailureTrace trace =
          collector.capture(parser.diagnostics(), "parser", "parse_file", error.message(), location);
      trace.add_snapshot("input", cli.input_path);
      trace.add_snapshot("strict_includes", cli.strict_includes ? "true" : "false");
      std::cerr << trace.format();
    }
    return 1;
  }

  asciidoc::html::HtmlOptions html_options;
  html_options.standalone = !cli.fragment;
  html_options.pretty_print = !cli.compact;
  asciidoc::html::HtmlConverter converter(html_options);
  const std::string html = converter.convert(*document);

  std::ofstream out(cli.output_path, std::ios::binary);
  if (!out) {
    std::cerr << "Unable to open output file: " << cli.output_path << "\n";
    return 1;
  }
  out << html;
  if (!out) {
    std::cerr << "Unable to write output file: " << cli.output_path << "\n";
    return 1;
  }

  std::cout << "Wrote " << cli.output_path << "\n";
  return 0;
}
