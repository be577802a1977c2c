#pragma once
#include <string>

struct Args {
  std::string mode;          // serve | save | search | similar | classify | tags | cont | load | history | stats
  std::string project;
  std::string text;          // content, query or note; "-" reads stdin
  std::string id;
  std::string config_path;
  std::string sqlite_path = "./index/knowledge.sqlite";
  std::string embed_model = "./models/embed.gguf";
  std::string log_level   = "info";
  int dim = 384;
  int k = 5;
  double threshold = 0.0;
  int max_tags = 5;
};

// Defaults, then --config file, then the remaining flags.
Args parse_cli(int argc, char** argv);
