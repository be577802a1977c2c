#pragma once
#include <string>
#include <vector>

// One row of the category table. Patterns are RE2 syntax, matched
// case-insensitively; indicators are literal substrings, also case-insensitive.
struct CategorySpec {
  std::string name;
  std::vector<std::string> patterns;
  std::vector<std::string> indicators;
  double weight;
  std::string description;
};

struct KnowledgeTypeScore {
  std::string type;
  int pattern_matches = 0;
  int total_patterns = 0;
  int indicator_matches = 0;
  int total_indicators = 0;
  double weighted_score = 0.0;   // 0 when nothing matched
};

struct Classification {
  std::string type;
  double confidence = 0.0;
};

struct Analysis {
  std::string primary_type;
  double confidence = 0.0;
  std::string description;
  std::vector<KnowledgeTypeScore> scores;   // table order
  size_t content_length = 0;
  size_t line_count = 0;
};

constexpr const char* kDefaultKnowledgeType = "implementation";
constexpr double kDefaultConfidence = 0.5;

// Declaration order doubles as tie-break order.
const std::vector<CategorySpec>& category_table();

std::vector<KnowledgeTypeScore> score_categories(const std::string& text,
                                                 const std::vector<CategorySpec>& table);

// Highest weighted score wins, earlier category on ties; no signal at all
// gives kDefaultKnowledgeType with kDefaultConfidence.
Classification classify(const std::string& text,
                        const std::vector<CategorySpec>& table = category_table());

Analysis analyze(const std::string& text,
                 const std::vector<CategorySpec>& table = category_table());

std::vector<std::string> knowledge_types();
std::string describe(const std::string& type);
