#include "tagger.hpp"
#include "strutil.hpp"
#include <re2/re2.h>
#include <algorithm>
#include <memory>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

namespace {

struct PatternTag {
  std::string tag;
  std::vector<std::string> patterns;
};

const std::vector<PatternTag>& pattern_tag_table() {
  static const std::vector<PatternTag> table = {
    // technology
    {"python",     {R"(\bpython\b)", R"(\.py\b)", R"(\bpip\b)", R"(\bdjango\b)", R"(\bflask\b)"}},
    {"javascript", {R"(\bjavascript\b)", R"(\.js\b)", R"(\bnode\b)", R"(\breact\b)", R"(\bvue\b)"}},
    {"database",   {R"(\bsql\b)", R"(\bdatabase\b)", R"(\bpostgres\b)", R"(\bmysql\b)", R"(\bsqlite\b)"}},
    {"ml",         {R"(\bmachine learning\b)", R"(\bml\b)", R"(\bneural\b)", R"(\bmodel\b)", R"(\btraining\b)"}},
    {"ai",         {R"(\bai\b)", R"(\bartificial intelligence\b)", R"(\bgpt\b)", R"(\bllm\b)"}},
    {"knowledge",  {R"(\bknowledge\b)", R"(\bgraph\b)", R"(\bontology\b)"}},
    // phase
    {"planning",       {R"(\bplan\b)", R"(\broadmap\b)", R"(\bstrategy\b)", R"(\bdesign\b)"}},
    {"implementation", {R"(\bimplement\b)", R"(\bcoding\b)", R"(\bdevelop\b)", R"(\bbuild\b)"}},
    {"testing",        {R"(\btest\b)", R"(\bdebug\b)", R"(\bfix\b)", R"(\bqa\b)"}},
    {"deployment",     {R"(\bdeploy\b)", R"(\brelease\b)", R"(\bproduction\b)", R"(\blive\b)"}},
    // importance
    {"breakthrough", {R"(\bbreakthrough\b)", R"(\bmajor\b)", R"(\bsuccess\b)", R"(\bachieved\b)"}},
    {"issue",        {R"(\bissue\b)", R"(\bproblem\b)", R"(\berror\b)", R"(\bbug\b)", R"(\bfail\b)"}},
    {"todo",         {R"(\btodo\b)", R"(\bnext\b)", R"(\bupcoming\b)", R"(\bplan to\b)"}},
    // retrieval
    {"embedding", {R"(\bembedding\b)", R"(\bvector\b)", R"(\bsemantic\b)"}},
    {"search",    {R"(\bsearch\b)", R"(\bfaiss\b)", R"(\bsimilarity\b)"}},
    {"analytics", {R"(\banalytics\b)", R"(\bmetrics\b)", R"(\bdashboard\b)"}},
  };
  return table;
}

const std::vector<std::vector<std::unique_ptr<RE2>>>& compiled_pattern_tags() {
  static const std::vector<std::vector<std::unique_ptr<RE2>>> compiled = [] {
    std::vector<std::vector<std::unique_ptr<RE2>>> rows;
    for (auto& pt : pattern_tag_table()) {
      std::vector<std::unique_ptr<RE2>> row;
      for (auto& p : pt.patterns) row.emplace_back(new RE2(p));
      rows.push_back(std::move(row));
    }
    return rows;
  }();
  return compiled;
}

const std::unordered_set<std::string>& stop_words() {
  static const std::unordered_set<std::string> words = {
    "that", "this", "with", "from", "have", "been", "were", "will",
    "what", "when", "where", "which", "their", "there", "these", "those"};
  return words;
}

// Every match of a single-group pattern, in order of appearance.
std::vector<std::string> find_all(const std::string& text, const RE2& re) {
  std::vector<std::string> out;
  re2::StringPiece input(text);
  std::string m;
  while (RE2::FindAndConsume(&input, re, &m)) out.push_back(m);
  return out;
}

}  // namespace

std::vector<Tag> pattern_tags(const std::string& text) {
  std::string lower = to_lower(text);
  const auto& table = pattern_tag_table();
  const auto& compiled = compiled_pattern_tags();
  std::vector<Tag> tags;
  for (size_t i = 0; i < table.size(); ++i) {
    for (auto& re : compiled[i]) {
      if (RE2::PartialMatch(lower, *re)) {
        tags.push_back({table[i].tag, kPatternTagConfidence});
        break;
      }
    }
  }
  return tags;
}

std::vector<Tag> token_shape_tags(const std::string& text) {
  static const RE2 file_re(R"(([A-Za-z_]+\.(?:py|js|cs|md|txt|json|yaml|yml)))");
  static const RE2 version_re(R"(v(\d+\.\d+(?:\.\d+)?))");
  static const RE2 acronym_re(R"(\b([A-Z]{2,})\b)");

  std::vector<Tag> tags;

  auto files = find_all(text, file_re);
  for (size_t i = 0; i < files.size() && i < 3; ++i) {
    std::string t = to_lower(files[i]);
    std::replace(t.begin(), t.end(), '.', '_');
    tags.push_back({t, kFileTagConfidence});
  }

  auto versions = find_all(to_lower(text), version_re);
  for (size_t i = 0; i < versions.size() && i < 2; ++i) {
    tags.push_back({"v" + versions[i], kVersionTagConfidence});
  }

  int acronyms = 0;
  for (auto& a : find_all(text, acronym_re)) {
    if (a.size() > 5) continue;
    tags.push_back({to_lower(a), kAcronymTagConfidence});
    if (++acronyms == 3) break;
  }
  return tags;
}

std::vector<Tag> frequency_tags(const std::string& text) {
  static const RE2 word_re(R"(\b([a-z]{4,})\b)");

  struct Count { std::string word; int n; size_t first; };
  std::vector<Count> counts;
  std::unordered_map<std::string, size_t> pos;
  for (auto& w : find_all(to_lower(text), word_re)) {
    auto it = pos.find(w);
    if (it == pos.end()) {
      pos.emplace(w, counts.size());
      counts.push_back({w, 1, counts.size()});
    } else {
      counts[it->second].n++;
    }
  }
  std::stable_sort(counts.begin(), counts.end(),
                   [](const Count& a, const Count& b) { return a.n > b.n; });
  if (counts.size() > 10) counts.resize(10);

  std::vector<Tag> tags;
  for (auto& c : counts) {
    if (c.n <= 1 || stop_words().count(c.word)) continue;
    tags.push_back({c.word, kFrequentTagConfidence});
    if (tags.size() == 3) break;
  }
  return tags;
}

std::vector<Tag> compound_tags(const std::string& text) {
  static const RE2 compound_re(R"(\b([a-z]+[-_][a-z]+)\b)");

  auto compounds = find_all(to_lower(text), compound_re);
  std::vector<Tag> tags;
  for (size_t i = 0; i < compounds.size() && i < 5; ++i) {
    if (compounds[i].size() <= 3) continue;
    std::string t = compounds[i];
    std::replace(t.begin(), t.end(), '-', '_');
    tags.push_back({t, kCompoundTagConfidence});
  }
  return tags;
}

std::vector<Tag> generate_tags(const std::string& text, int max_tags) {
  if (max_tags < 0) throw std::invalid_argument("generate_tags: max_tags must be >= 0");

  std::vector<Tag> pooled;
  for (auto& batch : {pattern_tags(text), token_shape_tags(text),
                      frequency_tags(text), compound_tags(text)}) {
    pooled.insert(pooled.end(), batch.begin(), batch.end());
  }

  // merge by text, first-seen order kept for stable ranking
  std::vector<Tag> merged;
  std::unordered_map<std::string, size_t> at;
  for (auto& t : pooled) {
    auto it = at.find(t.text);
    if (it == at.end()) {
      at.emplace(t.text, merged.size());
      merged.push_back(t);
    } else if (t.confidence > merged[it->second].confidence) {
      merged[it->second].confidence = t.confidence;
    }
  }

  std::stable_sort(merged.begin(), merged.end(),
                   [](const Tag& a, const Tag& b) { return a.confidence > b.confidence; });
  if ((int)merged.size() > max_tags) merged.resize(max_tags);
  return merged;
}

std::vector<std::string> tag_names(const std::vector<Tag>& tags) {
  std::vector<std::string> out;
  out.reserve(tags.size());
  for (auto& t : tags) out.push_back(t.text);
  return out;
}
