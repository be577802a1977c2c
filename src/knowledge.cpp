#include "knowledge.hpp"
#include "log.hpp"
#include "strutil.hpp"
#include <algorithm>
#include <chrono>
#include <ctime>
#include <stdexcept>

// Newest units considered by the lexical fallback.
static const int kLexicalWindow = 500;
// Vectorless units embedded when the index is first built.
static const int kBackfillBatch = 10000;

std::string normalize_project(const std::string& name) {
  return to_lower(trim(name));
}

KnowledgeService::KnowledgeService(Store& store, Embedder& embedder, int max_tags)
  : store_(store), embedder_(embedder), max_tags_(max_tags) {
  if (max_tags < 0) throw std::invalid_argument("KnowledgeService: max_tags must be >= 0");
}

KnowledgeService::~KnowledgeService() = default;

std::optional<std::vector<float>> KnowledgeService::try_embed(const std::string& text) {
  if (!embedder_.available()) return std::nullopt;
  try {
    auto v = embedder_.encode(text);
    if (!embedder_.available()) return std::nullopt;
    return v;
  } catch (const EmbedderUnavailable& e) {
    if (!degraded_reported_) {
      log_warn("knowledge", std::string(e.what()) + "; using lexical search");
      degraded_reported_ = true;
    }
  } catch (const std::runtime_error& e) {
    log_warn("knowledge", std::string("embedding failed, unit kept without vector: ") + e.what());
  }
  return std::nullopt;
}

bool KnowledgeService::ensure_index() {
  if (index_) return true;
  if (!embedder_.available()) return false;
  int d = embedder_.dim();
  if (!embedder_.available()) return false;
  backfill();
  index_.reset(new SimilarityIndex(d));
  index_->rebuild(store_.all_embeddings());
  log_info("knowledge", "index ready with " + std::to_string(index_->size()) + " vectors");
  return true;
}

void KnowledgeService::backfill() {
  auto pending = store_.fetch_unembedded(kBackfillBatch);
  int filled = 0;
  for (auto& u : pending) {
    u.embedding = try_embed(u.content);
    if (!u.embedding) {
      if (!embedder_.available()) break;
      continue;
    }
    store_.upsert_unit(u);
    ++filled;
  }
  if (filled) log_info("knowledge", "embedded " + std::to_string(filled) + " units saved without a vector");
}

void KnowledgeService::refresh_index(const KnowledgeUnit& u, bool existed) {
  if (!index_) return;   // built from the store on first use
  if (existed || index_->contains(u.id)) {
    index_->rebuild(store_.all_embeddings());
  } else if (u.embedding) {
    index_->add(u.id, *u.embedding, {u.project, u.knowledge_type, u.created_at});
  }
}

std::string KnowledgeService::next_id() {
  std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
  gmtime_r(&t, &tm);
  char stamp[32];
  std::strftime(stamp, sizeof(stamp), "%Y%m%d_%H%M%S", &tm);
  std::string id;
  do {
    id = std::string("session_") + stamp + "_" + std::to_string(++id_seq_);
  } while (store_.exists(id));
  return id;
}

Result<SaveResult> KnowledgeService::save(const std::string& project, const std::string& content,
                                          const std::string& id) {
  if (trim(project).empty()) return Result<SaveResult>::failure("project is required");
  if (trim(content).empty()) return Result<SaveResult>::failure("content is required");

  SaveResult res;
  KnowledgeUnit& u = res.unit;
  u.id = id.empty() ? next_id() : id;
  u.project = normalize_project(project);
  u.content = content;

  auto existing = store_.fetch_by_id(u.id);
  res.replaced = existing.has_value();

  Classification c = ::classify(content);
  u.knowledge_type = c.type;
  u.confidence = c.confidence;
  u.tags = generate_tags(content, max_tags_);
  u.created_at = existing ? existing->created_at : iso_time(std::chrono::system_clock::now());
  u.embedding = try_embed(content);
  res.embedded = u.embedding.has_value();

  store_.upsert_unit(u);
  refresh_index(u, res.replaced);

  log_info("knowledge", "saved " + u.id + " (" + u.project + ") as " + u.knowledge_type);
  return Result<SaveResult>::success(std::move(res));
}

std::vector<Hit> KnowledgeService::to_hits(const std::vector<ScoredId>& scored,
                                           const std::string& skip_id) {
  std::vector<Hit> hits;
  for (auto& s : scored) {
    if (s.id == skip_id) continue;
    auto u = store_.fetch_by_id(s.id);
    if (!u) {
      log_warn("knowledge", "indexed unit " + s.id + " missing from store, skipped");
      continue;
    }
    hits.push_back({s.id, s.similarity, false, s.meta, u->tags, make_snippet(u->content)});
  }
  return hits;
}

std::vector<Hit> KnowledgeService::lexical(const std::string& project, const std::string& query,
                                           int k, const std::string& skip_id) {
  auto candidates = store_.fetch_recent(project, kLexicalWindow);
  for (auto it = candidates.begin(); it != candidates.end(); ++it) {
    if (it->id == skip_id) { candidates.erase(it); break; }
  }
  return lexical_rank(candidates, query, k);
}

Result<std::vector<Hit>> KnowledgeService::search(const std::string& project, const std::string& query,
                                                  int k, double threshold) {
  using R = Result<std::vector<Hit>>;
  if (k < 0) throw std::invalid_argument("search: k must be >= 0");
  if (threshold < 0.0 || threshold > 1.0) throw std::invalid_argument("search: threshold must be in [0,1]");
  if (trim(project).empty()) return R::failure("project is required");
  if (trim(query).empty()) return R::failure("query is required");

  std::string p = normalize_project(project);
  auto q = try_embed(query);
  if (q && ensure_index()) {
    auto hits = to_hits(index_->search(*q, k, threshold, p), "");
    // an empty semantic answer at threshold 0 means the scope has no vectors yet
    if (!hits.empty() || threshold > 0.0) return R::success(std::move(hits));
  }
  return R::success(lexical(p, query, k, ""));
}

Result<std::vector<Hit>> KnowledgeService::similar_to(const std::string& id, int k) {
  using R = Result<std::vector<Hit>>;
  if (k < 0) throw std::invalid_argument("similar_to: k must be >= 0");
  auto u = store_.fetch_by_id(id);
  if (!u) return R::failure("unknown id: " + id);

  if (u->embedding && ensure_index() && (int)u->embedding->size() == index_->dim()) {
    // one extra slot for the unit itself
    int want = (int)std::min<size_t>((size_t)k, index_->size()) + 1;
    auto scored = index_->search(*u->embedding, want, 0.0, u->project);
    auto hits = to_hits(scored, id);
    if ((int)hits.size() > k) hits.resize(k);
    return R::success(std::move(hits));
  }
  return R::success(lexical(u->project, u->content, k, id));
}

Analysis KnowledgeService::classify(const std::string& text) const {
  return analyze(text);
}

std::vector<Tag> KnowledgeService::tag(const std::string& text, int max_tags) const {
  return generate_tags(text, max_tags);
}

ParsedContinuation KnowledgeService::restore(const ContinuationRecord& rec) const {
  ParsedContinuation pc = parse_continuation(rec.text);
  try {
    pc.timestamp = parse_iso_time(rec.created_at);
  } catch (const std::runtime_error& e) {
    log_warn("knowledge", "continuation " + std::to_string(rec.id) + ": " + e.what());
  }
  return pc;
}

Result<ParsedContinuation> KnowledgeService::save_continuation(const std::string& project,
                                                               const std::string& text) {
  using R = Result<ParsedContinuation>;
  if (trim(project).empty()) return R::failure("project is required");
  if (trim(text).empty()) return R::failure("continuation text is required");

  std::string p = normalize_project(project);
  ParsedContinuation pc = parse_continuation(text);
  store_.save_continuation(p, text, iso_time(pc.timestamp));

  auto saved = save(p, text);
  if (!saved.ok()) return R::failure(saved.error);
  return R::success(std::move(pc));
}

Result<std::optional<ParsedContinuation>> KnowledgeService::load_continuation(const std::string& project) {
  using R = Result<std::optional<ParsedContinuation>>;
  if (trim(project).empty()) return R::failure("project is required");
  auto rec = store_.latest_continuation(normalize_project(project));
  if (!rec) return R::success(std::nullopt);
  return R::success(restore(*rec));
}

Result<std::vector<ParsedContinuation>> KnowledgeService::continuation_history(const std::string& project,
                                                                               int limit) {
  using R = Result<std::vector<ParsedContinuation>>;
  if (trim(project).empty()) return R::failure("project is required");
  if (limit < 0) throw std::invalid_argument("continuation_history: limit must be >= 0");
  std::vector<ParsedContinuation> out;
  for (auto& rec : store_.continuation_history(normalize_project(project), limit)) {
    out.push_back(restore(rec));
  }
  return R::success(std::move(out));
}

Result<ProjectReport> KnowledgeService::stats(const std::string& project) {
  if (trim(project).empty()) return Result<ProjectReport>::failure("project is required");
  ProjectReport r;
  r.project = normalize_project(project);
  r.totals = store_.project_stats(r.project);
  r.by_type = store_.type_counts(r.project);
  r.has_continuation = store_.latest_continuation(r.project).has_value();
  return Result<ProjectReport>::success(std::move(r));
}

Result<std::vector<KnowledgeUnit>> KnowledgeService::by_type(const std::string& project,
                                                             const std::string& type, int limit) {
  using R = Result<std::vector<KnowledgeUnit>>;
  if (trim(project).empty()) return R::failure("project is required");
  auto types = knowledge_types();
  if (std::find(types.begin(), types.end(), type) == types.end())
    return R::failure("unknown knowledge type: " + type);
  if (limit < 0) throw std::invalid_argument("by_type: limit must be >= 0");
  return R::success(store_.fetch_by_type(normalize_project(project), type, limit));
}

Result<std::vector<std::pair<std::string, int>>> KnowledgeService::popular_tags(const std::string& project,
                                                                                int limit) {
  using R = Result<std::vector<std::pair<std::string, int>>>;
  if (trim(project).empty()) return R::failure("project is required");
  if (limit < 0) throw std::invalid_argument("popular_tags: limit must be >= 0");
  return R::success(store_.tag_counts(normalize_project(project), limit));
}
