#include "index.hpp"
#include "log.hpp"
#include <hnswlib/hnswlib.h>
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <unordered_map>

static double norm_of(const std::vector<float>& v) {
  double s = 0.0;
  for (float x : v) s += (double)x * (double)x;
  return std::sqrt(s);
}

static double rescale(double cos) {
  return std::min(1.0, std::max(0.0, (cos + 1.0) / 2.0));
}

double cosine_similarity(const std::vector<float>& a, const std::vector<float>& b) {
  if (a.size() != b.size()) throw std::invalid_argument("cosine_similarity: dimension mismatch");
  double na = norm_of(a), nb = norm_of(b);
  if (na == 0.0 || nb == 0.0) return 0.0;
  double dot = 0.0;
  for (size_t i = 0; i < a.size(); ++i) dot += (double)a[i] * (double)b[i];
  return rescale(dot / (na * nb));
}

struct SimilarityIndex::Impl {
  std::unique_ptr<hnswlib::InnerProductSpace> space;   // inner product on unit vectors == cosine
  std::unique_ptr<hnswlib::BruteforceSearch<float>> flat;
  size_t capacity = 0;

  // indexed by hnswlib label
  std::vector<std::string> ids;
  std::vector<UnitMeta> metas;
  std::vector<std::vector<float>> unit_vecs;
  std::vector<bool> zero;
  std::unordered_map<std::string, size_t> labels;

  void reset(int dim, size_t cap) {
    flat.reset();
    space.reset(new hnswlib::InnerProductSpace(dim));
    flat.reset(new hnswlib::BruteforceSearch<float>(space.get(), cap));
    capacity = cap;
    ids.clear(); metas.clear(); unit_vecs.clear(); zero.clear(); labels.clear();
  }

  void append(const std::string& id, const std::vector<float>& vec, const UnitMeta& meta) {
    std::vector<float> u(vec);
    double n = norm_of(u);
    if (n > 0.0) for (auto& x : u) x = (float)(x / n);

    size_t label = ids.size();
    flat->addPoint((void*)u.data(), (hnswlib::labeltype)label);
    ids.push_back(id);
    metas.push_back(meta);
    unit_vecs.push_back(std::move(u));
    zero.push_back(n == 0.0);
    labels.emplace(id, label);
  }

  void grow(int dim) {
    auto old_ids = std::move(ids);
    auto old_metas = std::move(metas);
    auto old_vecs = std::move(unit_vecs);
    reset(dim, std::max<size_t>(capacity * 2, 16));
    for (size_t i = 0; i < old_ids.size(); ++i) append(old_ids[i], old_vecs[i], old_metas[i]);
  }
};

namespace {
// Skips zero vectors and, when a project is given, other projects.
struct ProjectFilter : public hnswlib::BaseFilterFunctor {
  const std::vector<bool>& zero;
  const std::vector<UnitMeta>& metas;
  const std::string& project;

  ProjectFilter(const std::vector<bool>& z, const std::vector<UnitMeta>& m, const std::string& p)
    : zero(z), metas(m), project(p) {}

  bool operator()(hnswlib::labeltype label) override {
    if (zero[label]) return false;
    return project.empty() || metas[label].project == project;
  }
};
}

SimilarityIndex::SimilarityIndex(int dim, size_t initial_capacity)
  : dim_(dim), impl_(new Impl) {
  if (dim <= 0) throw std::invalid_argument("SimilarityIndex: dim must be positive");
  impl_->reset(dim_, std::max<size_t>(initial_capacity, 1));
}

SimilarityIndex::~SimilarityIndex() = default;

void SimilarityIndex::add(const std::string& id, const std::vector<float>& vec, const UnitMeta& meta) {
  if ((int)vec.size() != dim_) throw std::invalid_argument("SimilarityIndex::add dimension mismatch");
  if (impl_->labels.count(id)) throw std::invalid_argument("SimilarityIndex::add duplicate id " + id);
  if (impl_->ids.size() >= impl_->capacity) impl_->grow(dim_);
  impl_->append(id, vec, meta);
}

void SimilarityIndex::rebuild(const std::vector<IndexEntry>& entries) {
  size_t cap = std::max(impl_->capacity, entries.size() + entries.size() / 2 + 1);
  impl_->reset(dim_, cap);
  for (auto& e : entries) {
    if ((int)e.vec.size() != dim_) {
      log_warn("index", "skipping " + e.id + ": dimension " + std::to_string(e.vec.size()));
      continue;
    }
    if (impl_->labels.count(e.id)) continue;   // first occurrence wins
    impl_->append(e.id, e.vec, e.meta);
  }
  log_debug("index", "rebuilt with " + std::to_string(impl_->ids.size()) + " vectors");
}

bool SimilarityIndex::contains(const std::string& id) const {
  return impl_->labels.count(id) > 0;
}

size_t SimilarityIndex::size() const {
  return impl_->ids.size();
}

std::vector<ScoredId> SimilarityIndex::search(const std::vector<float>& q, int k, double threshold,
                                              const std::string& project) const {
  if (k < 0) throw std::invalid_argument("SimilarityIndex::search k must be >= 0");
  if (threshold < 0.0 || threshold > 1.0)
    throw std::invalid_argument("SimilarityIndex::search threshold must be in [0,1]");
  if ((int)q.size() != dim_) throw std::invalid_argument("SimilarityIndex::search dimension mismatch");

  std::vector<ScoredId> out;
  if (k == 0 || impl_->ids.empty()) return out;

  auto in_scope = [&](size_t label) {
    return project.empty() || impl_->metas[label].project == project;
  };

  std::vector<float> u(q);
  double n = norm_of(u);
  if (n > 0.0) {
    for (auto& x : u) x = (float)(x / n);
    ProjectFilter filter(impl_->zero, impl_->metas, project);
    // ask for every element: with a filter, a smaller k can drop in-scope entries
    auto res = impl_->flat->searchKnn((void*)u.data(), impl_->ids.size(), &filter);
    // the queue pops farthest first
    std::vector<std::pair<float, hnswlib::labeltype>> ranked;
    while (!res.empty()) { ranked.push_back(res.top()); res.pop(); }
    std::reverse(ranked.begin(), ranked.end());
    for (auto& r : ranked) {
      double sim = rescale(1.0 - (double)r.first);
      if (sim < threshold || (int)out.size() >= k) break;
      out.push_back({impl_->ids[r.second], sim, impl_->metas[r.second]});
    }
  }

  // zero vectors (stored or query) score exactly 0
  if (threshold <= 0.0) {
    for (size_t label = 0; label < impl_->ids.size() && (int)out.size() < k; ++label) {
      if (!in_scope(label)) continue;
      if (n > 0.0 && !impl_->zero[label]) continue;
      out.push_back({impl_->ids[label], 0.0, impl_->metas[label]});
    }
  }
  return out;
}
