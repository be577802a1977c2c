#include "store.hpp"
#include <gtest/gtest.h>
#include <sqlite3.h>
#include <cstdio>

namespace {

KnowledgeUnit unit(const std::string& id, const std::string& project, const std::string& content,
                   const std::string& type = "implementation",
                   const std::string& created_at = "2025-03-01T10:00:00") {
  KnowledgeUnit u;
  u.id = id;
  u.project = project;
  u.content = content;
  u.knowledge_type = type;
  u.confidence = 0.6;
  u.created_at = created_at;
  return u;
}

}  // namespace

TEST(Store, UpsertAndFetch) {
  Store s(":memory:");
  KnowledgeUnit u = unit("a", "proj", "hello world");
  u.tags = {{"python", 0.8}, {"v2.1", 0.6}};
  u.embedding = std::vector<float>{0.5f, -1.0f, 2.0f};
  s.upsert_unit(u);

  EXPECT_TRUE(s.exists("a"));
  EXPECT_FALSE(s.exists("b"));
  auto got = s.fetch_by_id("a");
  ASSERT_TRUE(got.has_value());
  EXPECT_EQ(got->content, "hello world");
  EXPECT_DOUBLE_EQ(got->confidence, 0.6);
  ASSERT_EQ(got->tags.size(), 2u);
  EXPECT_EQ(got->tags[1].text, "v2.1");
  EXPECT_DOUBLE_EQ(got->tags[1].confidence, 0.6);
  ASSERT_TRUE(got->embedding.has_value());
  EXPECT_EQ(*got->embedding, (std::vector<float>{0.5f, -1.0f, 2.0f}));
  EXPECT_FALSE(s.fetch_by_id("missing").has_value());
}

TEST(Store, ReplaceKeepsCreatedAt) {
  Store s(":memory:");
  s.upsert_unit(unit("a", "proj", "first", "implementation", "2025-01-01T00:00:00"));
  s.upsert_unit(unit("a", "proj", "second", "schema", "2025-06-01T00:00:00"));
  auto got = s.fetch_by_id("a");
  ASSERT_TRUE(got.has_value());
  EXPECT_EQ(got->content, "second");
  EXPECT_EQ(got->knowledge_type, "schema");
  EXPECT_EQ(got->created_at, "2025-01-01T00:00:00");
  EXPECT_FALSE(got->embedding.has_value());
  EXPECT_EQ(s.project_stats("proj").total_units, 1);
}

TEST(Store, RecentMatchingAndByType) {
  Store s(":memory:");
  s.upsert_unit(unit("old", "proj", "Database migration", "schema", "2025-01-01T00:00:00"));
  s.upsert_unit(unit("new", "proj", "websocket retry", "implementation", "2025-02-01T00:00:00"));
  s.upsert_unit(unit("other", "elsewhere", "database", "schema", "2025-03-01T00:00:00"));

  auto recent = s.fetch_recent("proj", 10);
  ASSERT_EQ(recent.size(), 2u);
  EXPECT_EQ(recent[0].id, "new");
  EXPECT_EQ(s.fetch_recent("proj", 1).size(), 1u);

  auto matching = s.fetch_matching("proj", "DATABASE", 10);
  ASSERT_EQ(matching.size(), 1u);
  EXPECT_EQ(matching[0].id, "old");

  auto schemas = s.fetch_by_type("proj", "schema", 10);
  ASSERT_EQ(schemas.size(), 1u);
  EXPECT_EQ(schemas[0].id, "old");
}

TEST(Store, StatsAndCounts) {
  Store s(":memory:");
  ProjectStats empty = s.project_stats("proj");
  EXPECT_EQ(empty.total_units, 0);
  EXPECT_TRUE(empty.first_activity.empty());

  KnowledgeUnit a = unit("a", "proj", "x", "schema", "2025-01-01T00:00:00");
  a.tags = {{"database", 0.8}, {"sql", 0.5}};
  KnowledgeUnit b = unit("b", "proj", "y", "schema", "2025-02-01T00:00:00");
  b.tags = {{"database", 0.8}};
  KnowledgeUnit c = unit("c", "proj", "z", "research", "2025-03-01T00:00:00");
  s.upsert_unit(a);
  s.upsert_unit(b);
  s.upsert_unit(c);

  ProjectStats st = s.project_stats("proj");
  EXPECT_EQ(st.total_units, 3);
  EXPECT_EQ(st.first_activity, "2025-01-01T00:00:00");
  EXPECT_EQ(st.last_activity, "2025-03-01T00:00:00");

  auto types = s.type_counts("proj");
  ASSERT_EQ(types.size(), 2u);
  EXPECT_EQ(types[0], std::make_pair(std::string("schema"), 2));

  auto tags = s.tag_counts("proj", 1);
  ASSERT_EQ(tags.size(), 1u);
  EXPECT_EQ(tags[0], std::make_pair(std::string("database"), 2));
}

TEST(Store, Continuations) {
  Store s(":memory:");
  EXPECT_FALSE(s.latest_continuation("proj").has_value());
  int64_t first = s.save_continuation("proj", "STATUS: one", "2025-01-01T00:00:00");
  int64_t second = s.save_continuation("proj", "STATUS: two", "2025-01-01T00:00:00");
  s.save_continuation("other", "STATUS: elsewhere", "2025-01-02T00:00:00");
  EXPECT_LT(first, second);

  auto latest = s.latest_continuation("proj");
  ASSERT_TRUE(latest.has_value());
  EXPECT_EQ(latest->text, "STATUS: two");

  auto history = s.continuation_history("proj", 10);
  ASSERT_EQ(history.size(), 2u);
  EXPECT_EQ(history[1].text, "STATUS: one");
}

TEST(Store, UndecodableEmbeddingSkipped) {
  std::string path = ::testing::TempDir() + "notegrep_store_test.sqlite";
  std::remove(path.c_str());
  {
    Store s(path);
    KnowledgeUnit good = unit("good", "proj", "fine");
    good.embedding = std::vector<float>{1.0f, 0.0f};
    s.upsert_unit(good);
    s.upsert_unit(unit("bad", "proj", "broken"));
  }
  {
    sqlite3* db = nullptr;
    ASSERT_EQ(sqlite3_open(path.c_str(), &db), SQLITE_OK);
    ASSERT_EQ(sqlite3_exec(db, "UPDATE knowledge_units SET embedding = x'010203' WHERE id = 'bad'",
                           nullptr, nullptr, nullptr), SQLITE_OK);
    sqlite3_close(db);
  }
  Store s(path);
  auto entries = s.all_embeddings();
  ASSERT_EQ(entries.size(), 1u);
  EXPECT_EQ(entries[0].id, "good");
  EXPECT_EQ(entries[0].meta.project, "proj");

  auto bad = s.fetch_by_id("bad");
  ASSERT_TRUE(bad.has_value());
  EXPECT_FALSE(bad->embedding.has_value());
  std::remove(path.c_str());
}

TEST(Store, FetchUnembedded) {
  Store s(":memory:");
  KnowledgeUnit with = unit("with", "proj", "has a vector");
  with.embedding = std::vector<float>{1.0f};
  s.upsert_unit(with);
  s.upsert_unit(unit("first", "proj", "no vector"));
  s.upsert_unit(unit("second", "other", "no vector either"));

  auto pending = s.fetch_unembedded(10);
  ASSERT_EQ(pending.size(), 2u);
  EXPECT_EQ(pending[0].id, "first");
  EXPECT_EQ(pending[1].id, "second");
  EXPECT_EQ(s.fetch_unembedded(1).size(), 1u);
}
