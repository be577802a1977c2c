#pragma once
#include "classifier.hpp"
#include "embedder.hpp"
#include "filters.hpp"
#include "index.hpp"
#include "sections.hpp"
#include "store.hpp"
#include "tagger.hpp"
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// Outcome of a request that can fail on user input. Environment and
// usage errors are still thrown.
template <typename T>
struct Result {
  T value{};
  std::string error;

  bool ok() const { return error.empty(); }

  static Result success(T v) { Result r; r.value = std::move(v); return r; }
  static Result failure(std::string msg) { Result r; r.error = std::move(msg); return r; }
};

struct SaveResult {
  KnowledgeUnit unit;
  bool replaced = false;    // the id already existed
  bool embedded = false;    // a vector was stored with the unit
};

struct ProjectReport {
  std::string project;
  ProjectStats totals;
  std::vector<std::pair<std::string, int>> by_type;
  bool has_continuation = false;
};

// Lowercased and trimmed; project names are otherwise opaque.
std::string normalize_project(const std::string& name);

// Save/search lifecycle over a Store, an Embedder and a lazily built
// SimilarityIndex. Requests run one at a time.
class KnowledgeService {
public:
  KnowledgeService(Store& store, Embedder& embedder, int max_tags = 5);
  ~KnowledgeService();

  // Classifies, tags and embeds content, then upserts it. A new id is
  // generated when id is empty; re-saving an id replaces the unit.
  Result<SaveResult> save(const std::string& project, const std::string& content,
                          const std::string& id = "");

  // Semantic ranking when embeddings are available, lexical fallback
  // otherwise. Throws std::invalid_argument for k < 0 or a threshold
  // outside [0,1].
  Result<std::vector<Hit>> search(const std::string& project, const std::string& query,
                                  int k = 5, double threshold = 0.0);

  // Units close to a stored unit, the unit itself excluded.
  Result<std::vector<Hit>> similar_to(const std::string& id, int k = 5);

  Analysis classify(const std::string& text) const;
  std::vector<Tag> tag(const std::string& text, int max_tags) const;

  // Parses the note, keeps it as the project's newest snapshot and saves it
  // as a knowledge unit.
  Result<ParsedContinuation> save_continuation(const std::string& project, const std::string& text);
  Result<std::optional<ParsedContinuation>> load_continuation(const std::string& project);
  Result<std::vector<ParsedContinuation>> continuation_history(const std::string& project, int limit);

  Result<ProjectReport> stats(const std::string& project);
  Result<std::vector<KnowledgeUnit>> by_type(const std::string& project, const std::string& type,
                                             int limit);
  Result<std::vector<std::pair<std::string, int>>> popular_tags(const std::string& project, int limit);

  bool semantic_available() const { return embedder_.available(); }

private:
  std::optional<std::vector<float>> try_embed(const std::string& text);
  bool ensure_index();
  void backfill();
  void refresh_index(const KnowledgeUnit& u, bool existed);
  std::vector<Hit> to_hits(const std::vector<ScoredId>& scored, const std::string& skip_id);
  std::vector<Hit> lexical(const std::string& project, const std::string& query, int k,
                           const std::string& skip_id);
  std::string next_id();
  ParsedContinuation restore(const ContinuationRecord& rec) const;

  Store& store_;
  Embedder& embedder_;
  int max_tags_;
  std::unique_ptr<SimilarityIndex> index_;
  bool degraded_reported_ = false;
  int id_seq_ = 0;
};
