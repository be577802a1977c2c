// src/filters.cpp
#include "filters.hpp"
#include "strutil.hpp"
#include <re2/re2.h>
#include <algorithm>
#include <stdexcept>
#include <unordered_set>

std::string make_snippet(const std::string& content) {
  if (content.size() <= 300) return content;
  size_t n = 300;
  // never split a UTF-8 sequence: back off continuation bytes
  while (n > 0 && ((unsigned char)content[n] & 0xC0) == 0x80) --n;
  return content.substr(0, n);
}

std::vector<std::string> query_terms(const std::string& query) {
  static const RE2 word_re(R"((\w{3,}))");
  std::string lower = to_lower(query);
  re2::StringPiece input(lower);
  std::string w;
  std::vector<std::string> terms;
  std::unordered_set<std::string> seen;
  while (RE2::FindAndConsume(&input, word_re, &w)) {
    if (seen.insert(w).second) terms.push_back(w);
  }
  return terms;
}

std::vector<Hit> lexical_rank(const std::vector<KnowledgeUnit>& candidates,
                              const std::string& query, int k) {
  if (k < 0) throw std::invalid_argument("lexical_rank: k must be >= 0");

  std::string needle = to_lower(trim(query));
  auto terms = query_terms(query);

  struct Ranked { size_t pos; bool whole; int term_hits; };
  std::vector<Ranked> ranked;
  ranked.reserve(candidates.size());
  for (size_t i = 0; i < candidates.size(); ++i) {
    std::string hay = to_lower(candidates[i].content);
    Ranked r{i, !needle.empty() && hay.find(needle) != std::string::npos, 0};
    for (auto& t : terms) {
      if (hay.find(t) != std::string::npos) r.term_hits++;
    }
    ranked.push_back(r);
  }
  // stable: equal keys keep the newest-first input order
  std::stable_sort(ranked.begin(), ranked.end(), [](const Ranked& a, const Ranked& b) {
    if (a.whole != b.whole) return a.whole;
    return a.term_hits > b.term_hits;
  });

  std::vector<Hit> hits;
  hits.reserve(std::min<size_t>(ranked.size(), (size_t)k));
  for (auto& r : ranked) {
    if ((int)hits.size() >= k) break;
    const KnowledgeUnit& u = candidates[r.pos];
    hits.push_back({u.id, kLexicalPlaceholderScore, true,
                    {u.project, u.knowledge_type, u.created_at}, u.tags, make_snippet(u.content)});
  }
  return hits;
}
