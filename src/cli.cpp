#include "cli.hpp"
#include "config.hpp"
#include <cstdlib>
#include <iostream>
#include <stdexcept>

static const char* USAGE =
"notegrep serve                               JSON commands on stdin, one per line\n"
"notegrep save <project> <text|-> [--id ID]\n"
"notegrep search <project> \"query\" [-k N] [--threshold X]\n"
"notegrep classify <text|->\n"
"notegrep tags <text|-> [--max-tags N]\n"
"notegrep cont <project> <text|->\n"
"notegrep similar <id> [-k N]\n"
"notegrep load <project>\n"
"notegrep history <project>\n"
"notegrep stats <project>\n"
"common: [--config file.json] [--sqlite path] [--embed-model path] [--dim N] [--log-level L]\n";

static void usage_exit() { std::cerr << USAGE; std::exit(1); }

Args parse_cli(int argc, char** argv) {
  Args a;
  if (argc < 2) usage_exit();

  // the config file sits under explicit flags, so load it first
  for (int j = 2; j + 1 < argc; ++j) {
    if (std::string(argv[j]) == "--config") a.config_path = argv[j + 1];
  }
  if (!a.config_path.empty()) {
    try {
      apply_config_file(a.config_path, a);
    } catch (const std::runtime_error& e) {
      std::cerr << e.what() << "\n";
      std::exit(1);
    }
  }

  a.mode = argv[1];
  int i = 2;
  auto positional = [&](std::string& dst) {
    if (i >= argc || std::string(argv[i]).rfind("--", 0) == 0) usage_exit();
    dst = argv[i++];
  };
  if (a.mode == "serve") {
  } else if (a.mode == "save" || a.mode == "search" || a.mode == "cont") {
    positional(a.project);
    positional(a.text);
  } else if (a.mode == "classify" || a.mode == "tags") {
    positional(a.text);
  } else if (a.mode == "similar") {
    positional(a.id);
  } else if (a.mode == "load" || a.mode == "history" || a.mode == "stats") {
    positional(a.project);
  } else {
    usage_exit();
  }

  while (i < argc) {
    std::string f = argv[i++];
    auto next = [&](std::string& dst){
      if (i >= argc) { std::cerr << "Missing value after " << f << "\n"; std::exit(1); }
      dst = argv[i++];
    };
    try {
      if (f == "--config") { std::string ignored; next(ignored); }
      else if (f == "--sqlite") next(a.sqlite_path);
      else if (f == "--embed-model") next(a.embed_model);
      else if (f == "--log-level") next(a.log_level);
      else if (f == "--id") next(a.id);
      else if (f == "--dim") { std::string v; next(v); a.dim = std::stoi(v); }
      else if (f == "-k") { std::string v; next(v); a.k = std::stoi(v); }
      else if (f == "--threshold") { std::string v; next(v); a.threshold = std::stod(v); }
      else if (f == "--max-tags") { std::string v; next(v); a.max_tags = std::stoi(v); }
      else { std::cerr << "Unknown flag: " << f << "\n"; std::exit(1); }
    } catch (const std::logic_error&) {
      // std::stoi / std::stod: invalid_argument or out_of_range
      std::cerr << "Bad number after " << f << "\n";
      std::exit(1);
    }
  }

  try {
    validate_args(a);
  } catch (const std::runtime_error& e) {
    std::cerr << e.what() << "\n";
    std::exit(1);
  }
  return a;
}
