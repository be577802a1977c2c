// src/embedder.cpp
#include "embedder.hpp"
#include "log.hpp"
#include "strutil.hpp"
#include <llama.h>
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <string>
#include <vector>

struct LlamaEmbedder::Impl {
  std::string path;
  int expected_dim;
  llama_model* model = nullptr;
  llama_context* ctx = nullptr;
  const llama_vocab* vocab = nullptr;
  int n_ctx = 512;
  int dim = 0;
  bool tried = false;
  bool failed = false;

  Impl(const std::string& p, int d) : path(p), expected_dim(d) {}

  ~Impl() {
    if (ctx) llama_free(ctx);
    if (model) llama_free_model(model);
    if (tried) llama_backend_free();
  }

  // Returns false (and remembers it) when the model cannot be used.
  bool load() {
    if (tried) return !failed;
    tried = true;
    llama_backend_init();

    llama_model_params mp = llama_model_default_params();
    mp.n_gpu_layers = 0; // CPU
    model = llama_load_model_from_file(path.c_str(), mp);
    if (!model) {
      log_warn("embedder", "failed to load model " + path);
      failed = true;
      return false;
    }

    llama_context_params cp = llama_context_default_params();
    cp.n_ctx = n_ctx;
    cp.n_batch = n_ctx;
    cp.n_ubatch = n_ctx;
    cp.embeddings = true;
    cp.pooling_type = LLAMA_POOLING_TYPE_MEAN;
    ctx = llama_new_context_with_model(model, cp);
    if (!ctx) {
      log_warn("embedder", "failed to create context for " + path);
      failed = true;
      return false;
    }

    vocab = llama_model_get_vocab(model);
    dim = llama_n_embd(model);
    if (dim <= 0) {
      log_warn("embedder", "model reports invalid embedding dim");
      failed = true;
      return false;
    }
    if (dim != expected_dim) {
      log_info("embedder", "model dim " + std::to_string(dim) +
                           " overrides configured dim " + std::to_string(expected_dim));
    }
    log_info("embedder", "loaded " + path + " (dim " + std::to_string(dim) + ")");
    return true;
  }

  std::vector<llama_token> tokenize(const std::string& text) {
    // a null buffer makes llama_tokenize report the required size, negated
    int32_t needed = -llama_tokenize(vocab, text.c_str(), (int32_t)text.size(),
                                     nullptr, 0, /*add_special=*/true, /*parse_special=*/false);
    if (needed <= 0) throw std::runtime_error("embedder: tokenize failed (len)");
    std::vector<llama_token> toks(needed);
    int32_t n = llama_tokenize(vocab, text.c_str(), (int32_t)text.size(),
                               toks.data(), (int32_t)toks.size(), true, false);
    if (n != needed) throw std::runtime_error("embedder: tokenize failed");
    if ((int)toks.size() > n_ctx) toks.resize(n_ctx);
    return toks;
  }

  std::vector<float> encode_text(const std::string& text) {
    auto toks = tokenize(text);
    llama_kv_cache_clear(ctx);

    llama_batch batch = llama_batch_init((int)toks.size(), /*embd*/ 0, /*n_seq*/ 1);
    for (int i = 0; i < (int)toks.size(); ++i) {
      batch.token[i] = toks[i];
      batch.pos[i] = i;
      batch.n_seq_id[i] = 1;
      batch.seq_id[i][0] = 0;
      batch.logits[i] = true;
    }
    batch.n_tokens = (int)toks.size();
    if (llama_decode(ctx, batch) != 0) {
      llama_batch_free(batch);
      throw std::runtime_error("embedder: llama_decode failed");
    }
    llama_batch_free(batch);

    const float* emb = llama_get_embeddings_seq(ctx, 0);
    if (!emb) emb = llama_get_embeddings_ith(ctx, -1);
    if (!emb) throw std::runtime_error("embedder: embeddings null");

    std::vector<float> v(emb, emb + dim);
    // L2 normalize
    double s = 0.0; for (float x : v) s += (double)x * (double)x;
    float norm = (float)std::sqrt(std::max(s, 1e-12));
    for (auto& x : v) x /= norm;
    return v;
  }
};

LlamaEmbedder::LlamaEmbedder(const std::string& embed_model_path, int expected_dim)
  : impl_(new Impl(embed_model_path, expected_dim)) {}

LlamaEmbedder::~LlamaEmbedder() = default;

int LlamaEmbedder::dim() const {
  return impl_->load() ? impl_->dim : impl_->expected_dim;
}

bool LlamaEmbedder::available() const {
  return !(impl_->tried && impl_->failed);
}

std::vector<float> LlamaEmbedder::encode(const std::string& text) {
  if (trim(text).empty()) return std::vector<float>(dim(), 0.0f);
  if (!impl_->load()) throw EmbedderUnavailable("embedder: model unavailable: " + impl_->path);
  return impl_->encode_text(text);
}

std::unique_ptr<Embedder> make_embedder(const std::string& embed_model_path, int dim) {
  if (!embed_model_path.empty() && std::filesystem::exists(embed_model_path)) {
    return std::unique_ptr<Embedder>(new LlamaEmbedder(embed_model_path, dim));
  }
  log_warn("embedder", "no embedding model at '" + embed_model_path +
                       "', semantic search disabled (lexical fallback)");
  return std::unique_ptr<Embedder>(new NullEmbedder(dim));
}
