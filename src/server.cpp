#include "server.hpp"
#include "log.hpp"
#include "strutil.hpp"
#include <istream>
#include <limits>
#include <ostream>
#include <stdexcept>

using json = nlohmann::json;

json to_json_value(const std::vector<Tag>& tags) {
  json arr = json::array();
  for (auto& t : tags) arr.push_back({{"tag", t.text}, {"confidence", t.confidence}});
  return arr;
}

json to_json_value(const KnowledgeUnit& u) {
  return {
    {"id", u.id},
    {"project", u.project},
    {"content", u.content},
    {"knowledge_type", u.knowledge_type},
    {"confidence", u.confidence},
    {"tags", to_json_value(u.tags)},
    {"created_at", u.created_at},
    {"has_embedding", u.embedding.has_value()},
  };
}

json to_json_value(const Hit& h) {
  return {
    {"id", h.id},
    {"similarity", h.similarity},
    {"lexical", h.lexical},
    {"project", h.meta.project},
    {"knowledge_type", h.meta.knowledge_type},
    {"created_at", h.meta.created_at},
    {"tags", to_json_value(h.tags)},
    {"snippet", h.snippet},
  };
}

json to_json_value(const ParsedContinuation& pc) {
  json pos = json::object();
  if (pc.position.file) pos["file"] = *pc.position.file;
  if (pc.position.line) pos["line"] = *pc.position.line;
  if (pc.position.function) pos["function"] = *pc.position.function;
  if (!pc.position.raw.empty()) pos["raw"] = pc.position.raw;
  return {
    {"status", pc.status},
    {"position", pos},
    {"problem", pc.problem},
    {"tried", pc.tried},
    {"next", pc.next},
    {"todo", pc.todo},
    {"context", pc.context},
    {"timestamp", iso_time(pc.timestamp)},
    {"raw_sections", pc.raw_sections},
  };
}

json to_json_value(const Analysis& a) {
  json scores = json::object();
  for (auto& s : a.scores) {
    scores[s.type] = {
      {"pattern_matches", s.pattern_matches},
      {"total_patterns", s.total_patterns},
      {"indicator_matches", s.indicator_matches},
      {"total_indicators", s.total_indicators},
      {"score", s.weighted_score},
    };
  }
  return {
    {"knowledge_type", a.primary_type},
    {"confidence", a.confidence},
    {"description", a.description},
    {"all_scores", scores},
    {"content_length", a.content_length},
    {"line_count", a.line_count},
  };
}

static json error_json(const std::string& msg) {
  return {{"error", msg}};
}

std::string dump_line(const json& j, int indent) {
  // stored text is not guaranteed to be valid UTF-8
  return j.dump(indent, ' ', false, json::error_handler_t::replace);
}

// Integer request field; non-numbers and values outside int range are rejected.
static int int_field(const json& req, const char* key, int dflt) {
  auto it = req.find(key);
  if (it == req.end()) return dflt;
  if (!it->is_number()) throw std::invalid_argument(std::string(key) + " must be a number");
  double v = it->get<double>();
  if (!(v >= (double)std::numeric_limits<int>::min() && v <= (double)std::numeric_limits<int>::max()))
    throw std::invalid_argument(std::string(key) + " out of range");
  return (int)v;
}

template <typename T>
static bool failed(const Result<T>& r, json* out) {
  if (r.ok()) return false;
  *out = error_json(r.error);
  return true;
}

static json pairs_json(const std::vector<std::pair<std::string, int>>& v, const char* key) {
  json arr = json::array();
  for (auto& p : v) arr.push_back({{key, p.first}, {"count", p.second}});
  return arr;
}

Server::Server(KnowledgeService& svc, int default_k, double default_threshold, int default_max_tags)
  : svc_(svc), default_k_(default_k), default_threshold_(default_threshold),
    default_max_tags_(default_max_tags) {}

json Server::handle(const json& req) {
  json out;
  try {
    if (!req.is_object()) return error_json("request must be a JSON object");
    std::string cmd = req.value("cmd", "");

    if (cmd == "save") {
      auto r = svc_.save(req.at("project").get<std::string>(), req.at("content").get<std::string>(),
                         req.value("id", ""));
      if (failed(r, &out)) return out;
      const KnowledgeUnit& u = r.value.unit;
      out = {{"ok", true}, {"id", u.id}, {"project", u.project},
             {"knowledge_type", u.knowledge_type}, {"confidence", u.confidence},
             {"tags", to_json_value(u.tags)}, {"replaced", r.value.replaced},
             {"embedded", r.value.embedded}};
    } else if (cmd == "search") {
      auto r = svc_.search(req.at("project").get<std::string>(), req.at("query").get<std::string>(),
                           int_field(req, "k", default_k_), req.value("threshold", default_threshold_));
      if (failed(r, &out)) return out;
      json hits = json::array();
      for (auto& h : r.value) hits.push_back(to_json_value(h));
      out = {{"ok", true}, {"results", hits}};
    } else if (cmd == "similar") {
      auto r = svc_.similar_to(req.at("id").get<std::string>(), int_field(req, "k", default_k_));
      if (failed(r, &out)) return out;
      json hits = json::array();
      for (auto& h : r.value) hits.push_back(to_json_value(h));
      out = {{"ok", true}, {"results", hits}};
    } else if (cmd == "classify") {
      out = to_json_value(svc_.classify(req.at("text").get<std::string>()));
    } else if (cmd == "tags") {
      out = {{"tags", to_json_value(svc_.tag(req.at("text").get<std::string>(),
                                             int_field(req, "max_tags", default_max_tags_)))}};
    } else if (cmd == "cont") {
      auto r = svc_.save_continuation(req.at("project").get<std::string>(),
                                      req.at("text").get<std::string>());
      if (failed(r, &out)) return out;
      out = {{"ok", true}, {"continuation", to_json_value(r.value)}};
    } else if (cmd == "load") {
      auto r = svc_.load_continuation(req.at("project").get<std::string>());
      if (failed(r, &out)) return out;
      out = {{"ok", true}, {"continuation", r.value ? to_json_value(*r.value) : json(nullptr)}};
    } else if (cmd == "history") {
      auto r = svc_.continuation_history(req.at("project").get<std::string>(), int_field(req, "limit", 10));
      if (failed(r, &out)) return out;
      json arr = json::array();
      for (auto& pc : r.value) arr.push_back(to_json_value(pc));
      out = {{"ok", true}, {"history", arr}};
    } else if (cmd == "stats") {
      auto r = svc_.stats(req.at("project").get<std::string>());
      if (failed(r, &out)) return out;
      const ProjectReport& p = r.value;
      out = {{"ok", true}, {"project", p.project}, {"total_units", p.totals.total_units},
             {"first_activity", p.totals.first_activity}, {"last_activity", p.totals.last_activity},
             {"by_type", pairs_json(p.by_type, "knowledge_type")},
             {"has_continuation", p.has_continuation},
             {"semantic", svc_.semantic_available()}};
    } else if (cmd == "by_type") {
      auto r = svc_.by_type(req.at("project").get<std::string>(), req.at("type").get<std::string>(),
                            int_field(req, "limit", 10));
      if (failed(r, &out)) return out;
      json arr = json::array();
      for (auto& u : r.value) arr.push_back(to_json_value(u));
      out = {{"ok", true}, {"units", arr}};
    } else if (cmd == "top_tags") {
      auto r = svc_.popular_tags(req.at("project").get<std::string>(), int_field(req, "limit", 20));
      if (failed(r, &out)) return out;
      out = {{"ok", true}, {"tags", pairs_json(r.value, "tag")}};
    } else {
      out = error_json("unknown cmd: '" + cmd + "'");
    }
  } catch (const json::exception& e) {
    out = error_json(std::string("bad request: ") + e.what());
  } catch (const std::invalid_argument& e) {
    out = error_json(e.what());
  } catch (const std::runtime_error& e) {
    log_error("server", e.what());
    out = error_json(e.what());
  }
  return out;
}

std::string Server::handle_line(const std::string& line) {
  json req;
  try {
    req = json::parse(line);
  } catch (const json::parse_error& e) {
    return dump_line(error_json(std::string("invalid JSON: ") + e.what()));
  }
  return dump_line(handle(req));
}

int Server::run(std::istream& in, std::ostream& out) {
  int served = 0;
  std::string line;
  while (std::getline(in, line)) {
    if (trim(line).empty()) continue;
    out << handle_line(line) << "\n";
    out.flush();
    ++served;
  }
  log_info("server", "input closed after " + std::to_string(served) + " requests");
  return served;
}
