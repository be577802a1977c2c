#pragma once
#include "cli.hpp"
#include <string>

// Overlays a JSON object onto args. Recognised keys: db_path, embed_model,
// dim, k, threshold, max_tags, log_level. Throws std::runtime_error on
// malformed JSON, wrong value types or out-of-range values.
void apply_config_text(const std::string& json_text, Args& args);
void apply_config_file(const std::string& path, Args& args);

// Range checks shared by the config file and command line.
void validate_args(const Args& args);
