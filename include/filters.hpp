#pragma once
#include "index.hpp"
#include "store.hpp"
#include <string>
#include <vector>

// Score given to every lexical-fallback hit; it is a placeholder, not a similarity.
constexpr double kLexicalPlaceholderScore = 0.5;

struct Hit {
  std::string id;
  double similarity;
  bool lexical;            // true when produced by the fallback ranking
  UnitMeta meta;
  std::vector<Tag> tags;
  std::string snippet;
};

// At most 300 bytes of content, cut on a UTF-8 character boundary.
std::string make_snippet(const std::string& content);

// Query terms: lowercase words of three or more characters.
std::vector<std::string> query_terms(const std::string& query);

// Orders candidates (given newest first): units containing the whole query,
// then by number of query terms found, then recency. Non-matching units are
// kept at the end so a non-empty scope always answers. At most k hits.
std::vector<Hit> lexical_rank(const std::vector<KnowledgeUnit>& candidates,
                              const std::string& query, int k);
