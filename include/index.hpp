#pragma once
#include <memory>
#include <string>
#include <vector>

struct UnitMeta {
  std::string project;
  std::string knowledge_type;
  std::string created_at;   // ISO-8601
};

struct IndexEntry {
  std::string id;
  std::vector<float> vec;
  UnitMeta meta;
};

struct ScoredId {
  std::string id;
  double similarity;        // [0,1]
  UnitMeta meta;
};

// Cosine rescaled to [0,1] as (cos+1)/2. 0 when either vector has zero norm.
// Throws std::invalid_argument on a length mismatch.
double cosine_similarity(const std::vector<float>& a, const std::vector<float>& b);

// Exact, flat nearest-neighbour index. Inserts append; replacing an id's
// vector is done with rebuild() from a consistent snapshot of all entries.
class SimilarityIndex {
public:
  explicit SimilarityIndex(int dim, size_t initial_capacity = 1024);
  ~SimilarityIndex();

  // Throws std::invalid_argument on a wrong dimension or an id already present.
  void add(const std::string& id, const std::vector<float>& vec, const UnitMeta& meta);
  void rebuild(const std::vector<IndexEntry>& entries);
  bool contains(const std::string& id) const;

  // At most k hits with similarity >= threshold, best first. An empty
  // project searches every project. Negative k, threshold outside [0,1]
  // or a wrong query dimension throw std::invalid_argument.
  std::vector<ScoredId> search(const std::vector<float>& q, int k, double threshold = 0.0,
                               const std::string& project = "") const;

  int dim() const { return dim_; }
  size_t size() const;

private:
  int dim_;
  struct Impl;
  std::unique_ptr<Impl> impl_;
};
