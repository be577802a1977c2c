#pragma once
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

// Raised when the embedding backend cannot produce vectors at all
// (model missing or failed to load).
struct EmbedderUnavailable : std::runtime_error {
  using std::runtime_error::runtime_error;
};

class Embedder {
public:
  virtual ~Embedder() = default;

  // Fixed-length vector; blank text yields all zeros, never an error.
  virtual std::vector<float> encode(const std::string& text) = 0;
  virtual int dim() const = 0;
  // false once the backend is known to be unusable
  virtual bool available() const = 0;
};

// GGUF embedding model via llama.cpp. The model is loaded on the first
// encode() or dim() call, not at construction.
class LlamaEmbedder : public Embedder {
public:
  LlamaEmbedder(const std::string& embed_model_path, int expected_dim);
  ~LlamaEmbedder() override;

  std::vector<float> encode(const std::string& text) override;
  int dim() const override;
  bool available() const override;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

// Stand-in when no model is configured: zero vectors, never available.
class NullEmbedder : public Embedder {
public:
  explicit NullEmbedder(int dim) : dim_(dim) {}

  std::vector<float> encode(const std::string&) override { return std::vector<float>(dim_, 0.0f); }
  int dim() const override { return dim_; }
  bool available() const override { return false; }

private:
  int dim_;
};

// Llama implementation when the model file exists, NullEmbedder otherwise.
std::unique_ptr<Embedder> make_embedder(const std::string& embed_model_path, int dim);
