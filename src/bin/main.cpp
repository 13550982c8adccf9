#include <rbgen/decl_model.hpp>
#include <rbgen/diagnostic.hpp>
#include <rbgen/emission_sink.hpp>
#include <rbgen/generation_config.hpp>
#include <rbgen/generator.hpp>
#include <rbgen/xml_tree.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

static constexpr int exit_success = 0;
static constexpr int exit_usage = 1;
static constexpr int exit_io = 2;
static constexpr int exit_parse = 3;
static constexpr int exit_codegen = 4;

struct cli_options {
  std::vector<std::string> model_files;
  std::string output_dir = ".";
  std::string config_file;
  std::vector<std::pair<std::string, std::string>> overrides;
  bool show_help = false;
  bool show_version = false;
  bool list_outputs = false;
  bool verbose = false;
};

static void
print_usage(std::ostream& os) {
  os << "Usage: rbgen [options] <model.xml> [model2.xml ...]\n"
     << "\n"
     << "Options:\n"
     << "  -o <dir>          Output directory (default: current directory)\n"
     << "  -c <file>         Generation config file\n"
     << "  -D <name=value>   Override a config option\n"
     << "  --list-outputs    Print generated type names and exit\n"
     << "  -v, --verbose     Also print notes\n"
     << "  -h, --help        Show this help message\n"
     << "  --version         Show version information\n";
}

static void
print_version(std::ostream& os) {
  os << "rbgen " << RBGEN_VERSION << "\n";
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

    if (arg == "--list-outputs") {
      opts.list_outputs = true;
      continue;
    }

    if (arg == "-v" || arg == "--verbose") {
      opts.verbose = true;
      continue;
    }

    if (arg == "-o") {
      if (i + 1 >= argc) {
        std::cerr << "rbgen: -o requires an argument\n";
        std::exit(exit_usage);
      }
      opts.output_dir = argv[++i];
      continue;
    }

    if (arg == "-c") {
      if (i + 1 >= argc) {
        std::cerr << "rbgen: -c requires an argument\n";
        std::exit(exit_usage);
      }
      opts.config_file = argv[++i];
      continue;
    }

    if (arg == "-D") {
      if (i + 1 >= argc) {
        std::cerr << "rbgen: -D requires an argument\n";
        std::exit(exit_usage);
      }
      std::string option = argv[++i];
      auto eq = option.find('=');
      if (eq == std::string::npos) {
        std::cerr << "rbgen: -D argument must be name=value\n";
        std::exit(exit_usage);
      }
      opts.overrides.emplace_back(option.substr(0, eq), option.substr(eq + 1));
      continue;
    }

    if (arg[0] == '-') {
      std::cerr << "rbgen: unknown option: " << arg << "\n";
      std::exit(exit_usage);
    }

    opts.model_files.push_back(arg);
  }

  return opts;
}

static std::string
read_file(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    std::cerr << "rbgen: cannot open file: " << path << "\n";
    std::exit(exit_io);
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

static int
run(const cli_options& opts) {
  // Load all model files into one symbol table
  rbgen::decl_model model;
  for (const auto& file : opts.model_files) {
    std::string xml = read_file(file);
    try {
      model.merge(rbgen::decl_model::load(rbgen::parse_xml(xml)));
    } catch (const std::exception& e) {
      std::cerr << "rbgen: error loading model " << file << ": " << e.what()
                << "\n";
      return exit_parse;
    }
  }

  // Check the configuration once up front
  std::string config_xml;
  if (!opts.config_file.empty()) config_xml = read_file(opts.config_file);

  rbgen::config_loader configs;
  try {
    configs = rbgen::config_loader(std::move(config_xml), opts.overrides);
  } catch (const std::exception& e) {
    std::cerr << "rbgen: error loading config";
    if (!opts.config_file.empty()) std::cerr << " " << opts.config_file;
    std::cerr << ": " << e.what() << "\n";
    return exit_parse;
  }

  rbgen::ostream_reporter reporter(std::cerr, opts.verbose);

  // --list-outputs: run the round into memory and print what it produced
  if (opts.list_outputs) {
    rbgen::memory_sink sink;
    rbgen::generator(model, configs, sink, reporter).process_round();
    for (const auto& [name, text] : sink.files())
      std::cout << name << "\n";
    return reporter.error_count() == 0 ? exit_success : exit_codegen;
  }

  std::error_code ec;
  fs::create_directories(opts.output_dir, ec);
  if (ec) {
    std::cerr << "rbgen: cannot create output directory " << opts.output_dir
              << ": " << ec.message() << "\n";
    return exit_io;
  }

  rbgen::directory_sink sink(opts.output_dir);
  rbgen::generator(model, configs, sink, reporter).process_round();

  if (reporter.error_count() != 0) {
    std::cerr << "rbgen: " << reporter.error_count() << " error(s)\n";
    return exit_codegen;
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

  if (opts.model_files.empty()) {
    std::cerr << "rbgen: no input files\n";
    print_usage(std::cerr);
    return exit_usage;
  }

  try {
    return run(opts);
  } catch (const std::logic_error& e) {
    std::cerr << "rbgen: internal error: " << e.what() << "\n";
    return exit_codegen;
  }
}
