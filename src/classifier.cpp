#include "classifier.hpp"
#include "strutil.hpp"
#include <re2/re2.h>
#include <algorithm>
#include <memory>
#include <stdexcept>

const std::vector<CategorySpec>& category_table() {
  static const std::vector<CategorySpec> table = {
    {"continuation",
     {R"(\bSTATUS:\s*)", R"(\bPOSITION:\s*)", R"(\bNEXT:\s*)", R"(\bTODO:\s*)",
      R"(\bCONTEXT:\s*)", R"(\bPROBLEM:\s*)", R"(\bTRIED:\s*)", R"(\bcontinue\s+with\b)",
      R"(\bresume\s+from\b)", R"(\bleft\s+off\b)"},
     {"STATUS:", "POSITION:", "NEXT:", "TODO:", "PROBLEM:", "TRIED:"},
     1.0, "Session continuation context for seamless handoff"},

    {"api_doc",
     {R"(\bAPI\s+endpoint\b)", R"(\bREST\s+API\b)", R"(\bendpoint:\s*)", R"(\bGET\s+/\w+)",
      R"(\bPOST\s+/\w+)", R"(\bPUT\s+/\w+)", R"(\bDELETE\s+/\w+)", R"(\brequest\s+body\b)",
      R"(\bresponse\s+format\b)", R"(\bstatus\s+code\b)", R"(\bauthentication\b)",
      R"(\bheaders:\s*)", R"(\bparameters:\s*)", R"(\bOpenAPI\b)", R"(\bSwagger\b)",
      R"(\bGraphQL\b)"},
     {"endpoint:", "request:", "response:", "authentication:", "parameters:"},
     0.9, "API documentation and endpoint specifications"},

    {"schema",
     {R"(\bschema\b)", R"(\bdata\s+structure\b)", R"(\btable\s+definition\b)",
      R"(\bCREATE\s+TABLE\b)", R"(\binterface\s+\w+\s*\{)", R"(\bclass\s+\w+:)",
      R"(\btype\s+\w+\s*=)", R"(\bmodel\s+\w+\b)", R"(\bentity\s+\w+\b)", R"(\bfields?:\s*)",
      R"(\bproperties:\s*)", R"(\battributes?:\s*)", R"(\bJSON\s+schema\b)",
      R"(\bXML\s+schema\b)", R"(\bprotobuf\b)"},
     {"CREATE TABLE", "schema", "fields:"},
     0.9, "Data structures, schemas, and type definitions"},

    {"implementation",
     {R"(\bdef\s+\w+\()", R"(\bfunction\s+\w+\()", R"(\bclass\s+\w+[:(])",
      R"(\bimplemented\s+\w+)", R"(\bcode\s+implementation\b)", R"(\bmethod\s+\w+\b)",
      R"(\balgorithm\b)", R"(\bsolution:\s*)", R"(```\w*\n)", R"(\bimport\s+\w+)",
      R"(\bfrom\s+\w+\s+import\b)", R"(\bif\s+__name__\s*==\s*["']__main__["'])"},
     {"def ", "function ", "class ", "import ", "```"},
     0.8, "Code implementations and algorithms"},

    {"architecture",
     {R"(\barchitecture\b)", R"(\bsystem\s+design\b)", R"(\bcomponent\s+diagram\b)",
      R"(\btier\s+\d+\b)", R"(\blayer\s+\w+\b)", R"(\bmodule\s+structure\b)",
      R"(\bworkflow\b)", R"(\bdata\s+flow\b)", R"(\bintegration\s+points?\b)",
      R"(\bdependencies:\s*)", R"(\binterfaces?\b)", R"(\bmicroservices?\b)",
      R"(\bdesign\s+pattern\b)", R"(\bUML\b)", R"(\bdiagram\b)"},
     {"architecture", "tier ", "layer ", "component", "workflow", "design"},
     0.85, "System architecture and design documents"},

    {"milestone",
     {R"(\bmilestone\b)", R"(\bachieved\b)", R"(\bcompleted?\b)", R"(\brelease\s+v?\d+)",
      R"(\bdeployed\b)", R"(\blaunched\b)", R"(\bmajor\s+breakthrough\b)",
      R"(\bfinished\s+\w+\b)", R"(✅\s*\w+)", R"(\bDONE:\s*)", R"(\bsuccess\w*\b)",
      R"(\bdelivered\b)", R"(\bshipped\b)", R"(\baccomplished\b)"},
     {"milestone", "completed", "achieved", "✅", "release", "DONE:"},
     0.85, "Project milestones and achievements"},

    {"error_solution",
     {R"(\berror:\s*)", R"(\bexception:\s*)", R"(\bfixed\s+\w+\b)", R"(\bsolved\s+\w+\b)",
      R"(\bworkaround\b)", R"(\bbugfix\b)", R"(\bissue\s+#\d+)", R"(\bproblem:\s*)",
      R"(\bsolution:\s*)", R"(\btroubleshooting\b)", R"(\bdebug\w*\b)", R"(\bresolved\b)",
      R"(\bstack\s+trace\b)", R"(\btraceback\b)", R"(\bfix:\s*)"},
     {"error:", "exception:", "fixed", "solution:", "resolved", "traceback"},
     0.8, "Error messages and their solutions"},

    {"research",
     {R"(\bresearch\b)", R"(\banalysis\b)", R"(\bfindings?\b)", R"(\bexperiment\w*\b)",
      R"(\btest\s+results?\b)", R"(\bcomparison\b)", R"(\bevaluation\b)",
      R"(\bbenchmark\w*\b)", R"(\bmetrics?\b)", R"(\bconclusions?\b)",
      R"(\bobservations?\b)", R"(\bhypothesis\b)", R"(\bstudy\b)", R"(\binvestigation\b)",
      R"(\bexploration\b)"},
     {"research", "analysis", "findings", "results", "conclusion", "experiment"},
     0.75, "Research findings and analysis results"},
  };
  return table;
}

namespace {

using CompiledRow = std::vector<std::unique_ptr<RE2>>;

std::vector<CompiledRow> compile_table(const std::vector<CategorySpec>& table) {
  RE2::Options opt;
  opt.set_case_sensitive(false);
  opt.set_log_errors(false);
  std::vector<CompiledRow> rows;
  rows.reserve(table.size());
  for (auto& cat : table) {
    CompiledRow row;
    for (auto& p : cat.patterns) {
      std::unique_ptr<RE2> re(new RE2(p, opt));
      if (!re->ok()) throw std::invalid_argument("classifier: bad pattern in " + cat.name + ": " + p);
      row.push_back(std::move(re));
    }
    rows.push_back(std::move(row));
  }
  return rows;
}

std::vector<KnowledgeTypeScore> score_with(const std::string& text,
                                           const std::vector<CategorySpec>& table,
                                           const std::vector<CompiledRow>& compiled) {
  std::string lower = to_lower(text);
  std::vector<KnowledgeTypeScore> out;
  out.reserve(table.size());

  for (size_t i = 0; i < table.size(); ++i) {
    const CategorySpec& cat = table[i];
    KnowledgeTypeScore s;
    s.type = cat.name;
    s.total_patterns = (int)cat.patterns.size();
    s.total_indicators = (int)cat.indicators.size();

    for (auto& re : compiled[i]) {
      if (RE2::PartialMatch(text, *re)) s.pattern_matches++;
    }
    for (auto& ind : cat.indicators) {
      if (lower.find(to_lower(ind)) != std::string::npos) s.indicator_matches++;
    }

    if (s.pattern_matches > 0 || s.indicator_matches > 0) {
      double ps = s.total_patterns ? std::min(1.0, (double)s.pattern_matches / s.total_patterns) : 0.0;
      double is = s.total_indicators ? std::min(1.0, (double)s.indicator_matches / s.total_indicators) : 0.0;
      s.weighted_score = (ps * 0.3 + is * 0.7) * cat.weight;
    }
    out.push_back(s);
  }
  return out;
}

Classification pick_best(const std::vector<KnowledgeTypeScore>& scores) {
  Classification best{kDefaultKnowledgeType, kDefaultConfidence};
  double top = 0.0;
  for (auto& s : scores) {
    // strict '>' keeps the earlier category on ties
    if (s.weighted_score > top) {
      top = s.weighted_score;
      best.type = s.type;
      best.confidence = s.weighted_score;
    }
  }
  return best;
}

}  // namespace

std::vector<KnowledgeTypeScore> score_categories(const std::string& text,
                                                 const std::vector<CategorySpec>& table) {
  if (&table == &category_table()) {
    static const std::vector<CompiledRow> standard = compile_table(table);
    return score_with(text, table, standard);
  }
  return score_with(text, table, compile_table(table));
}

Classification classify(const std::string& text, const std::vector<CategorySpec>& table) {
  return pick_best(score_categories(text, table));
}

Analysis analyze(const std::string& text, const std::vector<CategorySpec>& table) {
  Analysis a;
  a.scores = score_categories(text, table);
  Classification c = pick_best(a.scores);
  a.primary_type = c.type;
  a.confidence = c.confidence;
  a.description = "Unknown knowledge type";
  for (auto& cat : table) {
    if (cat.name == c.type) { a.description = cat.description; break; }
  }
  a.content_length = text.size();
  a.line_count = (size_t)std::count(text.begin(), text.end(), '\n') + 1;
  return a;
}

std::vector<std::string> knowledge_types() {
  std::vector<std::string> out;
  for (auto& cat : category_table()) out.push_back(cat.name);
  return out;
}

std::string describe(const std::string& type) {
  for (auto& cat : category_table()) {
    if (cat.name == type) return cat.description;
  }
  return "Unknown knowledge type";
}
