#pragma once
#include "index.hpp"
#include "tagger.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

struct KnowledgeUnit {
  std::string id;
  std::string project;
  std::string content;
  std::string knowledge_type;
  double confidence = 0.0;
  std::vector<Tag> tags;
  std::string created_at;                      // ISO-8601, kept across re-saves
  std::optional<std::vector<float>> embedding;
};

struct ContinuationRecord {
  int64_t id;
  std::string project;
  std::string text;
  std::string created_at;
};

struct ProjectStats {
  int total_units = 0;
  std::string first_activity;   // empty when there are no units
  std::string last_activity;
};

class Store {
public:
  explicit Store(const std::string& sqlite_path);   // ":memory:" works
  ~Store();
  Store(const Store&) = delete;
  Store& operator=(const Store&) = delete;

  void ensure_schema();

  // Insert or replace by id; created_at of an existing row is preserved.
  void upsert_unit(const KnowledgeUnit& u);
  bool exists(const std::string& id) const;
  std::optional<KnowledgeUnit> fetch_by_id(const std::string& id) const;

  // Newest first.
  std::vector<KnowledgeUnit> fetch_recent(const std::string& project, int limit) const;
  // Case-insensitive substring match on content, newest first.
  std::vector<KnowledgeUnit> fetch_matching(const std::string& project, const std::string& needle,
                                            int limit) const;
  std::vector<KnowledgeUnit> fetch_by_type(const std::string& project, const std::string& type,
                                           int limit) const;

  // Units stored without a vector, oldest first.
  std::vector<KnowledgeUnit> fetch_unembedded(int limit) const;

  // Every stored (id, vector) pair; undecodable blobs are logged and skipped.
  std::vector<IndexEntry> all_embeddings() const;

  ProjectStats project_stats(const std::string& project) const;
  std::vector<std::pair<std::string, int>> type_counts(const std::string& project) const;
  std::vector<std::pair<std::string, int>> tag_counts(const std::string& project, int limit) const;

  int64_t save_continuation(const std::string& project, const std::string& text,
                            const std::string& created_at);
  std::optional<ContinuationRecord> latest_continuation(const std::string& project) const;
  std::vector<ContinuationRecord> continuation_history(const std::string& project, int limit) const;

private:
  struct Impl;
  Impl* impl_;
};
