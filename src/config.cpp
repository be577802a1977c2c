#include "config.hpp"
#include "log.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

void apply_config_text(const std::string& json_text, Args& a) {
  json j;
  try {
    j = json::parse(json_text);
  } catch (const json::parse_error& e) {
    throw std::runtime_error(std::string("config: ") + e.what());
  }
  if (!j.is_object()) throw std::runtime_error("config: top level must be an object");

  try {
    for (auto it = j.begin(); it != j.end(); ++it) {
      const std::string& key = it.key();
      if (key == "db_path")          a.sqlite_path = it->get<std::string>();
      else if (key == "embed_model") a.embed_model = it->get<std::string>();
      else if (key == "log_level")   a.log_level = it->get<std::string>();
      else if (key == "dim")         a.dim = it->get<int>();
      else if (key == "k")           a.k = it->get<int>();
      else if (key == "threshold")   a.threshold = it->get<double>();
      else if (key == "max_tags")    a.max_tags = it->get<int>();
      else log_warn("config", "ignoring unknown key '" + key + "'");
    }
  } catch (const json::type_error& e) {
    throw std::runtime_error(std::string("config: ") + e.what());
  }
  validate_args(a);
}

void apply_config_file(const std::string& path, Args& a) {
  std::ifstream in(path);
  if (!in) throw std::runtime_error("config: cannot open " + path);
  std::ostringstream ss; ss << in.rdbuf();
  apply_config_text(ss.str(), a);
}

void validate_args(const Args& a) {
  if (a.dim <= 0) throw std::runtime_error("config: dim must be positive");
  if (a.k < 0) throw std::runtime_error("config: k must be >= 0");
  if (a.threshold < 0.0 || a.threshold > 1.0) throw std::runtime_error("config: threshold must be in [0,1]");
  if (a.max_tags < 0) throw std::runtime_error("config: max_tags must be >= 0");
  try {
    parse_log_level(a.log_level);
  } catch (const std::invalid_argument& e) {
    throw std::runtime_error(std::string("config: ") + e.what());
  }
}
