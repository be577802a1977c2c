#include "store.hpp"
#include "log.hpp"
#include <nlohmann/json.hpp>
#include <sqlite3.h>
#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <unordered_map>

using json = nlohmann::json;

struct Store::Impl {
  sqlite3* db = nullptr;
};

namespace {

// Finalizes on scope exit so a throw never leaks the statement.
struct Stmt {
  sqlite3_stmt* st = nullptr;

  Stmt(sqlite3* db, const char* sql) {
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
      throw std::runtime_error(std::string("sqlite prepare failed: ") + sqlite3_errmsg(db));
  }
  ~Stmt() { sqlite3_finalize(st); }
  Stmt(const Stmt&) = delete;
  Stmt& operator=(const Stmt&) = delete;

  void text(int i, const std::string& s) { sqlite3_bind_text(st, i, s.c_str(), -1, SQLITE_TRANSIENT); }
  void integer(int i, int64_t v) { sqlite3_bind_int64(st, i, (sqlite3_int64)v); }
  void real(int i, double v) { sqlite3_bind_double(st, i, v); }

  std::string col_text(int i) const {
    auto p = sqlite3_column_text(st, i);
    return p ? reinterpret_cast<const char*>(p) : "";
  }
};

void exec(sqlite3* db, const char* sql) {
  char* err = nullptr;
  if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
    std::string e = err ? err : "unknown";
    sqlite3_free(err);
    throw std::runtime_error("sqlite exec: " + e);
  }
}

std::string tags_to_json(const std::vector<Tag>& tags) {
  json arr = json::array();
  for (auto& t : tags) arr.push_back({{"tag", t.text}, {"confidence", t.confidence}});
  return arr.dump();
}

std::vector<Tag> tags_from_json(const std::string& id, const std::string& s) {
  std::vector<Tag> out;
  if (s.empty()) return out;
  try {
    for (auto& t : json::parse(s)) {
      out.push_back({t.at("tag").get<std::string>(), t.value("confidence", 0.0)});
    }
  } catch (const json::exception& e) {
    log_warn("store", "unit " + id + ": unreadable tags (" + e.what() + ")");
    out.clear();
  }
  return out;
}

// False when the blob is not a whole number of floats.
bool decode_embedding(const void* blob, int bytes, std::vector<float>* out) {
  if (!blob || bytes <= 0 || bytes % (int)sizeof(float) != 0) return false;
  out->resize((size_t)bytes / sizeof(float));
  std::memcpy(out->data(), blob, (size_t)bytes);
  return true;
}

const char* kUnitColumns =
  "id, project, content, knowledge_type, confidence, tags, created_at, embedding";

KnowledgeUnit read_unit(const Stmt& s) {
  KnowledgeUnit u;
  u.id             = s.col_text(0);
  u.project        = s.col_text(1);
  u.content        = s.col_text(2);
  u.knowledge_type = s.col_text(3);
  u.confidence     = sqlite3_column_double(s.st, 4);
  u.tags           = tags_from_json(u.id, s.col_text(5));
  u.created_at     = s.col_text(6);
  if (sqlite3_column_type(s.st, 7) != SQLITE_NULL) {
    std::vector<float> v;
    if (decode_embedding(sqlite3_column_blob(s.st, 7), sqlite3_column_bytes(s.st, 7), &v))
      u.embedding = std::move(v);
    else
      log_warn("store", "unit " + u.id + ": embedding blob does not decode, ignored");
  }
  return u;
}

std::vector<KnowledgeUnit> read_units(Stmt& s) {
  std::vector<KnowledgeUnit> out;
  int rc;
  while ((rc = sqlite3_step(s.st)) == SQLITE_ROW) out.push_back(read_unit(s));
  if (rc != SQLITE_DONE) throw std::runtime_error("sqlite step failed");
  return out;
}

std::vector<ContinuationRecord> read_continuations(Stmt& s) {
  std::vector<ContinuationRecord> out;
  int rc;
  while ((rc = sqlite3_step(s.st)) == SQLITE_ROW) {
    out.push_back({(int64_t)sqlite3_column_int64(s.st, 0), s.col_text(1), s.col_text(2), s.col_text(3)});
  }
  if (rc != SQLITE_DONE) throw std::runtime_error("sqlite step failed");
  return out;
}

}  // namespace

Store::Store(const std::string& path) : impl_(new Impl) {
  if (sqlite3_open(path.c_str(), &impl_->db) != SQLITE_OK) {
    std::string e = impl_->db ? sqlite3_errmsg(impl_->db) : "out of memory";
    sqlite3_close(impl_->db);
    delete impl_;
    throw std::runtime_error("sqlite open failed: " + e);
  }
  try {
    ensure_schema();
  } catch (...) {
    sqlite3_close(impl_->db);
    delete impl_;
    throw;
  }
}

Store::~Store() {
  if (impl_) {
    if (impl_->db) sqlite3_close(impl_->db);
    delete impl_;
  }
}

void Store::ensure_schema() {
  exec(impl_->db,
    "CREATE TABLE IF NOT EXISTS knowledge_units ("
    " id TEXT PRIMARY KEY,"
    " project TEXT NOT NULL,"
    " content TEXT NOT NULL,"
    " knowledge_type TEXT NOT NULL,"
    " confidence REAL NOT NULL,"
    " tags TEXT NOT NULL DEFAULT '[]',"
    " created_at TEXT NOT NULL,"
    " embedding BLOB"
    ");"
    "CREATE INDEX IF NOT EXISTS idx_units_project ON knowledge_units(project, created_at);"
    "CREATE INDEX IF NOT EXISTS idx_units_type ON knowledge_units(knowledge_type);"
    "CREATE TABLE IF NOT EXISTS continuations ("
    " id INTEGER PRIMARY KEY AUTOINCREMENT,"
    " project TEXT NOT NULL,"
    " text TEXT NOT NULL,"
    " created_at TEXT NOT NULL"
    ");"
    "CREATE INDEX IF NOT EXISTS idx_cont_project ON continuations(project, id);");
}

void Store::upsert_unit(const KnowledgeUnit& u) {
  Stmt s(impl_->db,
    "INSERT INTO knowledge_units (id, project, content, knowledge_type, confidence, tags, created_at, embedding) "
    "VALUES (?, ?, ?, ?, ?, ?, ?, ?) "
    "ON CONFLICT(id) DO UPDATE SET "
    " project=excluded.project, content=excluded.content, knowledge_type=excluded.knowledge_type, "
    " confidence=excluded.confidence, tags=excluded.tags, embedding=excluded.embedding;");
  s.text(1, u.id);
  s.text(2, u.project);
  s.text(3, u.content);
  s.text(4, u.knowledge_type);
  s.real(5, u.confidence);
  s.text(6, tags_to_json(u.tags));
  s.text(7, u.created_at);
  if (u.embedding && !u.embedding->empty()) {
    sqlite3_bind_blob(s.st, 8, u.embedding->data(),
                      (int)(u.embedding->size() * sizeof(float)), SQLITE_TRANSIENT);
  } else {
    sqlite3_bind_null(s.st, 8);
  }
  if (sqlite3_step(s.st) != SQLITE_DONE)
    throw std::runtime_error(std::string("sqlite upsert failed: ") + sqlite3_errmsg(impl_->db));
}

bool Store::exists(const std::string& id) const {
  Stmt s(impl_->db, "SELECT 1 FROM knowledge_units WHERE id=?");
  s.text(1, id);
  int rc = sqlite3_step(s.st);
  if (rc != SQLITE_ROW && rc != SQLITE_DONE) throw std::runtime_error("sqlite step failed");
  return rc == SQLITE_ROW;
}

std::optional<KnowledgeUnit> Store::fetch_by_id(const std::string& id) const {
  std::string sql = std::string("SELECT ") + kUnitColumns + " FROM knowledge_units WHERE id=?";
  Stmt s(impl_->db, sql.c_str());
  s.text(1, id);
  auto units = read_units(s);
  if (units.empty()) return std::nullopt;
  return units.front();
}

std::vector<KnowledgeUnit> Store::fetch_recent(const std::string& project, int limit) const {
  std::string sql = std::string("SELECT ") + kUnitColumns +
    " FROM knowledge_units WHERE project=? ORDER BY created_at DESC, rowid DESC LIMIT ?";
  Stmt s(impl_->db, sql.c_str());
  s.text(1, project);
  s.integer(2, limit);
  return read_units(s);
}

std::vector<KnowledgeUnit> Store::fetch_matching(const std::string& project, const std::string& needle,
                                                 int limit) const {
  std::string sql = std::string("SELECT ") + kUnitColumns +
    " FROM knowledge_units WHERE project=? AND instr(lower(content), lower(?)) > 0"
    " ORDER BY created_at DESC, rowid DESC LIMIT ?";
  Stmt s(impl_->db, sql.c_str());
  s.text(1, project);
  s.text(2, needle);
  s.integer(3, limit);
  return read_units(s);
}

std::vector<KnowledgeUnit> Store::fetch_by_type(const std::string& project, const std::string& type,
                                                int limit) const {
  std::string sql = std::string("SELECT ") + kUnitColumns +
    " FROM knowledge_units WHERE project=? AND knowledge_type=?"
    " ORDER BY created_at DESC, rowid DESC LIMIT ?";
  Stmt s(impl_->db, sql.c_str());
  s.text(1, project);
  s.text(2, type);
  s.integer(3, limit);
  return read_units(s);
}

std::vector<KnowledgeUnit> Store::fetch_unembedded(int limit) const {
  std::string sql = std::string("SELECT ") + kUnitColumns +
    " FROM knowledge_units WHERE embedding IS NULL ORDER BY rowid LIMIT ?";
  Stmt s(impl_->db, sql.c_str());
  s.integer(1, limit);
  return read_units(s);
}

std::vector<IndexEntry> Store::all_embeddings() const {
  Stmt s(impl_->db,
    "SELECT id, project, knowledge_type, created_at, embedding FROM knowledge_units "
    "WHERE embedding IS NOT NULL ORDER BY rowid");
  std::vector<IndexEntry> out;
  int rc;
  while ((rc = sqlite3_step(s.st)) == SQLITE_ROW) {
    IndexEntry e;
    e.id = s.col_text(0);
    e.meta = {s.col_text(1), s.col_text(2), s.col_text(3)};
    if (!decode_embedding(sqlite3_column_blob(s.st, 4), sqlite3_column_bytes(s.st, 4), &e.vec)) {
      log_warn("store", "unit " + e.id + ": embedding blob does not decode, skipped");
      continue;
    }
    out.push_back(std::move(e));
  }
  if (rc != SQLITE_DONE) throw std::runtime_error("sqlite step failed");
  return out;
}

ProjectStats Store::project_stats(const std::string& project) const {
  Stmt s(impl_->db,
    "SELECT COUNT(*), MIN(created_at), MAX(created_at) FROM knowledge_units WHERE project=?");
  s.text(1, project);
  ProjectStats st;
  if (sqlite3_step(s.st) != SQLITE_ROW) throw std::runtime_error("sqlite step failed");
  st.total_units = sqlite3_column_int(s.st, 0);
  st.first_activity = s.col_text(1);
  st.last_activity = s.col_text(2);
  return st;
}

std::vector<std::pair<std::string, int>> Store::type_counts(const std::string& project) const {
  Stmt s(impl_->db,
    "SELECT knowledge_type, COUNT(*) AS n FROM knowledge_units WHERE project=? "
    "GROUP BY knowledge_type ORDER BY n DESC, knowledge_type");
  s.text(1, project);
  std::vector<std::pair<std::string, int>> out;
  int rc;
  while ((rc = sqlite3_step(s.st)) == SQLITE_ROW) out.emplace_back(s.col_text(0), sqlite3_column_int(s.st, 1));
  if (rc != SQLITE_DONE) throw std::runtime_error("sqlite step failed");
  return out;
}

std::vector<std::pair<std::string, int>> Store::tag_counts(const std::string& project, int limit) const {
  Stmt s(impl_->db, "SELECT id, tags FROM knowledge_units WHERE project=?");
  s.text(1, project);
  std::unordered_map<std::string, int> counts;
  int rc;
  while ((rc = sqlite3_step(s.st)) == SQLITE_ROW) {
    for (auto& t : tags_from_json(s.col_text(0), s.col_text(1))) counts[t.text]++;
  }
  if (rc != SQLITE_DONE) throw std::runtime_error("sqlite step failed");

  std::vector<std::pair<std::string, int>> out(counts.begin(), counts.end());
  std::sort(out.begin(), out.end(), [](const std::pair<std::string, int>& a,
                                       const std::pair<std::string, int>& b) {
    return a.second != b.second ? a.second > b.second : a.first < b.first;
  });
  if (limit >= 0 && (int)out.size() > limit) out.resize(limit);
  return out;
}

int64_t Store::save_continuation(const std::string& project, const std::string& text,
                                 const std::string& created_at) {
  Stmt s(impl_->db, "INSERT INTO continuations (project, text, created_at) VALUES (?, ?, ?)");
  s.text(1, project);
  s.text(2, text);
  s.text(3, created_at);
  if (sqlite3_step(s.st) != SQLITE_DONE)
    throw std::runtime_error(std::string("sqlite insert failed: ") + sqlite3_errmsg(impl_->db));
  return (int64_t)sqlite3_last_insert_rowid(impl_->db);
}

std::optional<ContinuationRecord> Store::latest_continuation(const std::string& project) const {
  auto h = continuation_history(project, 1);
  if (h.empty()) return std::nullopt;
  return h.front();
}

std::vector<ContinuationRecord> Store::continuation_history(const std::string& project, int limit) const {
  Stmt s(impl_->db,
    "SELECT id, project, text, created_at FROM continuations WHERE project=? ORDER BY id DESC LIMIT ?");
  s.text(1, project);
  s.integer(2, limit);
  return read_continuations(s);
}
