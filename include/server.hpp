#pragma once
#include "knowledge.hpp"
#include <nlohmann/json.hpp>
#include <iosfwd>
#include <string>

// Line-oriented JSON front end over KnowledgeService. Each request is an
// object with a "cmd" field:
//   save      {project, content, id?}
//   search    {project, query, k?, threshold?}
//   similar   {id, k?}
//   classify  {text}
//   tags      {text, max_tags?}
//   cont      {project, text}
//   load      {project}
//   history   {project, limit?}
//   stats     {project}
//   by_type   {project, type, limit?}
//   top_tags  {project, limit?}
// Failures come back as {"error": "..."}; the loop never stops on them.
class Server {
public:
  Server(KnowledgeService& svc, int default_k = 5, double default_threshold = 0.0,
         int default_max_tags = 5);

  nlohmann::json handle(const nlohmann::json& request);
  std::string handle_line(const std::string& line);

  // Until EOF on in; blank lines are skipped. Returns requests served.
  int run(std::istream& in, std::ostream& out);

private:
  KnowledgeService& svc_;
  int default_k_;
  double default_threshold_;
  int default_max_tags_;
};

// Invalid UTF-8 in stored text is replaced, never thrown.
std::string dump_line(const nlohmann::json& j, int indent = -1);

nlohmann::json to_json_value(const KnowledgeUnit& u);
nlohmann::json to_json_value(const Hit& h);
nlohmann::json to_json_value(const ParsedContinuation& pc);
nlohmann::json to_json_value(const Analysis& a);
nlohmann::json to_json_value(const std::vector<Tag>& tags);
