#include "index.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

namespace {

UnitMeta meta(const std::string& project = "p") {
  return {project, "implementation", "2025-01-01T00:00:00"};
}

}  // namespace

TEST(Cosine, IdentityZeroAndMismatch) {
  std::vector<float> v = {0.3f, -1.0f, 2.0f};
  EXPECT_NEAR(cosine_similarity(v, v), 1.0, 1e-6);
  EXPECT_DOUBLE_EQ(cosine_similarity(v, {0.0f, 0.0f, 0.0f}), 0.0);
  EXPECT_NEAR(cosine_similarity({1.0f, 0.0f}, {-1.0f, 0.0f}), 0.0, 1e-9);
  EXPECT_NEAR(cosine_similarity({1.0f, 0.0f}, {0.0f, 1.0f}), 0.5, 1e-9);
  EXPECT_THROW(cosine_similarity({1.0f}, {1.0f, 2.0f}), std::invalid_argument);
}

TEST(SimilarityIndex, ThresholdAndOrder) {
  SimilarityIndex idx(4);
  idx.add("same",     {1.0f, 0.0f, 0.0f, 0.0f}, meta());
  idx.add("close",    {0.9f, 0.1f, 0.0f, 0.0f}, meta());
  idx.add("ortho",    {0.0f, 1.0f, 0.0f, 0.0f}, meta());
  idx.add("opposite", {-1.0f, 0.0f, 0.0f, 0.0f}, meta());

  auto hits = idx.search({2.0f, 0.0f, 0.0f, 0.0f}, 5, 0.9);
  ASSERT_EQ(hits.size(), 2u);
  EXPECT_EQ(hits[0].id, "same");
  EXPECT_EQ(hits[1].id, "close");
  for (auto& h : hits) EXPECT_GE(h.similarity, 0.9);
  EXPECT_NEAR(hits[0].similarity, 1.0, 1e-5);

  auto all = idx.search({1.0f, 0.0f, 0.0f, 0.0f}, 10);
  ASSERT_EQ(all.size(), 4u);
  EXPECT_EQ(all.back().id, "opposite");
  for (size_t i = 1; i < all.size(); ++i) EXPECT_GE(all[i - 1].similarity, all[i].similarity);
}

TEST(SimilarityIndex, KLimitsResults) {
  SimilarityIndex idx(2);
  idx.add("a", {1.0f, 0.0f}, meta());
  idx.add("b", {0.0f, 1.0f}, meta());
  EXPECT_EQ(idx.search({1.0f, 1.0f}, 1).size(), 1u);
  EXPECT_TRUE(idx.search({1.0f, 1.0f}, 0).empty());
}

TEST(SimilarityIndex, BadArguments) {
  SimilarityIndex idx(2);
  idx.add("a", {1.0f, 0.0f}, meta());
  EXPECT_THROW(idx.search({1.0f, 0.0f}, -1), std::invalid_argument);
  EXPECT_THROW(idx.search({1.0f, 0.0f}, 1, 1.5), std::invalid_argument);
  EXPECT_THROW(idx.search({1.0f, 0.0f}, 1, -0.1), std::invalid_argument);
  EXPECT_THROW(idx.search({1.0f}, 1), std::invalid_argument);
  EXPECT_THROW(idx.add("a", {0.0f, 1.0f}, meta()), std::invalid_argument);
  EXPECT_THROW(idx.add("b", {0.0f, 1.0f, 2.0f}, meta()), std::invalid_argument);
  EXPECT_THROW(SimilarityIndex(0), std::invalid_argument);
}

TEST(SimilarityIndex, ZeroVectorsScoreZero) {
  SimilarityIndex idx(3);
  idx.add("blank", {0.0f, 0.0f, 0.0f}, meta());
  idx.add("real", {0.0f, 0.0f, 1.0f}, meta());

  auto loose = idx.search({0.0f, 0.0f, 1.0f}, 5, 0.0);
  ASSERT_EQ(loose.size(), 2u);
  EXPECT_EQ(loose[0].id, "real");
  EXPECT_EQ(loose[1].id, "blank");
  EXPECT_DOUBLE_EQ(loose[1].similarity, 0.0);

  auto strict = idx.search({0.0f, 0.0f, 1.0f}, 5, 0.1);
  ASSERT_EQ(strict.size(), 1u);
  EXPECT_EQ(strict[0].id, "real");

  // a blank query matches nothing above zero
  EXPECT_TRUE(idx.search({0.0f, 0.0f, 0.0f}, 5, 0.1).empty());
  EXPECT_EQ(idx.search({0.0f, 0.0f, 0.0f}, 5, 0.0).size(), 2u);
}

TEST(SimilarityIndex, ProjectScope) {
  SimilarityIndex idx(2);
  idx.add("mine", {1.0f, 0.0f}, meta("alpha"));
  idx.add("theirs", {1.0f, 0.0f}, meta("beta"));

  auto hits = idx.search({1.0f, 0.0f}, 5, 0.0, "alpha");
  ASSERT_EQ(hits.size(), 1u);
  EXPECT_EQ(hits[0].id, "mine");
  EXPECT_EQ(hits[0].meta.project, "alpha");
  EXPECT_EQ(idx.search({1.0f, 0.0f}, 5).size(), 2u);
  EXPECT_TRUE(idx.search({1.0f, 0.0f}, 5, 0.0, "gamma").empty());
}

TEST(SimilarityIndex, GrowsPastInitialCapacity) {
  SimilarityIndex idx(3, 2);
  for (int i = 0; i < 9; ++i) {
    idx.add("u" + std::to_string(i), {1.0f, (float)i, 0.5f}, meta());
  }
  EXPECT_EQ(idx.size(), 9u);
  EXPECT_TRUE(idx.contains("u0"));
  EXPECT_TRUE(idx.contains("u8"));
  EXPECT_EQ(idx.search({1.0f, 1.0f, 0.5f}, 20).size(), 9u);
  EXPECT_EQ(idx.search({1.0f, 8.0f, 0.5f}, 1)[0].id, "u8");
}

TEST(SimilarityIndex, RebuildReplacesContents) {
  SimilarityIndex idx(2);
  idx.add("old", {1.0f, 0.0f}, meta());
  idx.rebuild({
    {"x", {0.0f, 1.0f}, meta()},
    {"bad", {1.0f, 2.0f, 3.0f}, meta()},
    {"x", {1.0f, 0.0f}, meta()},
  });
  EXPECT_FALSE(idx.contains("old"));
  EXPECT_FALSE(idx.contains("bad"));
  EXPECT_EQ(idx.size(), 1u);
  EXPECT_NEAR(idx.search({0.0f, 1.0f}, 1)[0].similarity, 1.0, 1e-5);
}

TEST(SimilarityIndex, ScopedSearchSkipsEarlierOutOfScopeEntries) {
  SimilarityIndex idx(2);
  idx.add("a0", {1.0f, 0.0f}, meta("alpha"));
  idx.add("b1", {1.0f, 0.1f}, meta("beta"));
  idx.add("b2", {1.0f, 0.5f}, meta("beta"));
  idx.add("b3", {1.0f, 1.0f}, meta("beta"));

  auto hits = idx.search({1.0f, 0.0f}, 2, 0.0, "beta");
  ASSERT_EQ(hits.size(), 2u);
  EXPECT_EQ(hits[0].id, "b1");
  EXPECT_EQ(hits[1].id, "b2");
}

TEST(SimilarityIndex, ScopedSearchSkipsLeadingZeroVectors) {
  SimilarityIndex idx(2);
  idx.add("z0", {0.0f, 0.0f}, meta());
  idx.add("z1", {0.0f, 0.0f}, meta());
  idx.add("near", {1.0f, 0.2f}, meta());
  idx.add("far", {1.0f, 2.0f}, meta());

  auto hits = idx.search({1.0f, 0.0f}, 2, 0.1);
  ASSERT_EQ(hits.size(), 2u);
  EXPECT_EQ(hits[0].id, "near");
  EXPECT_EQ(hits[1].id, "far");
}
