#pragma once
#include "embedder.hpp"
#include <cctype>
#include <string>
#include <unordered_map>
#include <vector>

// Deterministic bag-of-words embedder: every distinct lowercase word owns
// one slot, so texts sharing words have positive cosine and texts sharing
// none are orthogonal.
class FakeEmbedder : public Embedder {
public:
  explicit FakeEmbedder(int dim = 512) : dim_(dim) {}

  std::vector<float> encode(const std::string& text) override {
    ++calls;
    if (!available_) throw EmbedderUnavailable("fake embedder switched off");
    std::vector<float> v(dim_, 0.0f);
    std::string word;
    auto flush = [&]() {
      if (word.empty()) return;
      auto it = slots_.find(word);
      if (it == slots_.end()) it = slots_.emplace(word, slots_.size()).first;
      v[it->second % dim_] += 1.0f;
      word.clear();
    };
    for (unsigned char c : text) {
      if (std::isalnum(c)) word += (char)std::tolower(c);
      else flush();
    }
    flush();
    return v;
  }

  int dim() const override { return dim_; }
  bool available() const override { return available_; }

  void set_available(bool on) { available_ = on; }

  int calls = 0;

private:
  int dim_;
  bool available_ = true;
  std::unordered_map<std::string, size_t> slots_;
};
