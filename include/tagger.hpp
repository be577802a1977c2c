#pragma once
#include <string>
#include <utility>
#include <vector>

struct Tag {
  std::string text;
  double confidence;
};

// Fixed confidences per strategy.
constexpr double kPatternTagConfidence  = 0.8;
constexpr double kFileTagConfidence     = 0.7;
constexpr double kVersionTagConfidence  = 0.6;
constexpr double kCompoundTagConfidence = 0.6;
constexpr double kAcronymTagConfidence  = 0.5;
constexpr double kFrequentTagConfidence = 0.5;

// Individual strategies; generate_tags pools them.
std::vector<Tag> pattern_tags(const std::string& text);
std::vector<Tag> token_shape_tags(const std::string& text);
std::vector<Tag> frequency_tags(const std::string& text);
std::vector<Tag> compound_tags(const std::string& text);

// Merged by tag text (max confidence wins), confidence descending, at most
// max_tags entries. Throws std::invalid_argument for negative max_tags.
std::vector<Tag> generate_tags(const std::string& text, int max_tags = 5);

// Plain tag names, in ranked order.
std::vector<std::string> tag_names(const std::vector<Tag>& tags);
