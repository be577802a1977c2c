#include "sections.hpp"
#include "strutil.hpp"
#include <re2/re2.h>
#include <stdexcept>

struct HeaderTable::Impl {
  struct Group {
    std::string canonical;
    std::vector<std::string> spellings;
    std::unique_ptr<RE2> header;  // (a|b|c):\s*(.*)
    std::unique_ptr<RE2> word;    // (a|b|c)
  };
  std::vector<Group> groups;
};

static std::unique_ptr<RE2> compile_ci(const std::string& pattern) {
  RE2::Options opt;
  opt.set_case_sensitive(false);
  opt.set_log_errors(false);
  std::unique_ptr<RE2> re(new RE2(pattern, opt));
  if (!re->ok()) throw std::invalid_argument("header table: bad pattern " + pattern);
  return re;
}

HeaderTable::HeaderTable(const Groups& groups) : impl_(new Impl) {
  for (auto& g : groups) {
    if (g.second.empty()) throw std::invalid_argument("header table: no spellings for " + g.first);
    std::string alts;
    for (auto& s : g.second) {
      if (!alts.empty()) alts += "|";
      alts += RE2::QuoteMeta(s);
    }
    Impl::Group grp;
    grp.canonical = g.first;
    grp.spellings = g.second;
    grp.header = compile_ci("(?:" + alts + "):\\s*(.*)");
    grp.word = compile_ci("(?:" + alts + ")");
    impl_->groups.push_back(std::move(grp));
  }
}

HeaderTable::~HeaderTable() = default;

const HeaderTable& HeaderTable::standard() {
  static const HeaderTable table({
    {"STATUS",   {"STATUS", "WAS", "AUFGABE", "TASK"}},
    {"POSITION", {"POSITION", "WO", "WHERE", "STELLE"}},
    {"PROBLEM",  {"PROBLEM", "BLOCKER", "ISSUE", "FEHLER"}},
    {"TRIED",    {"TRIED", "VERSUCHT", "ATTEMPTED", "PROBIERT"}},
    {"NEXT",     {"NEXT", "NÄCHSTE", "WEITER"}},
    {"TODO",     {"TODO", "TODOS", "AUFGABEN", "TASKS"}},
    {"CONTEXT",  {"CONTEXT", "KONTEXT", "INFO", "ZUSATZ"}},
  });
  return table;
}

std::string HeaderTable::canonical_of(const std::string& keyword) const {
  for (auto& g : impl_->groups) {
    if (RE2::FullMatch(keyword, *g.word)) return g.canonical;
  }
  return "";
}

std::vector<std::string> HeaderTable::spellings_of(const std::string& canonical) const {
  for (auto& g : impl_->groups) {
    if (g.canonical == canonical) return g.spellings;
  }
  return {};
}

std::vector<std::string> HeaderTable::canonical_names() const {
  std::vector<std::string> out;
  for (auto& g : impl_->groups) out.push_back(g.canonical);
  return out;
}

bool HeaderTable::match_header(const std::string& line, std::string* canonical,
                               std::string* rest) const {
  for (auto& g : impl_->groups) {
    std::string tail;
    if (RE2::FullMatch(line, *g.header, &tail)) {
      if (canonical) *canonical = g.canonical;
      if (rest) *rest = trim(tail);
      return true;
    }
  }
  return false;
}

// All-caps keyword that is not in the table, e.g. "NOTES:".
static const RE2& unknown_header_re() {
  static const RE2 re("([A-Z][A-Z0-9_]+):\\s*(.*)");
  return re;
}

static bool is_header_line(const std::string& trimmed, const HeaderTable& table) {
  return table.match_header(trimmed, nullptr, nullptr) ||
         RE2::FullMatch(trimmed, unknown_header_re());
}

static std::string first_plain_line(const std::string& text, const HeaderTable& table) {
  for (auto& line : split_lines(text)) {
    std::string t = trim(line);
    if (t.empty() || is_header_line(t, table)) continue;
    return t;
  }
  return "";
}

static std::string join_lines(const std::vector<std::string>& lines) {
  std::string out;
  for (size_t i = 0; i < lines.size(); ++i) {
    if (i) out += '\n';
    out += lines[i];
  }
  return out;
}

SectionMap parse_sections(const std::string& text, const HeaderTable& table) {
  SectionMap sections;
  std::string current;
  bool open = false;
  bool recognized = false;
  std::vector<std::string> body;

  auto flush = [&]() {
    if (open) sections[current] = trim(join_lines(body));
  };

  for (auto& line : split_lines(text)) {
    std::string t = trim(line);
    std::string key, rest;
    if (table.match_header(t, &key, &rest)) {
      recognized = true;
    } else if (RE2::FullMatch(t, unknown_header_re(), &key, &rest)) {
      rest = trim(rest);
    } else {
      if (open) body.push_back(line);
      continue;
    }
    flush();
    current = key;
    open = true;
    body.clear();
    if (!rest.empty()) body.push_back(rest);
  }
  flush();

  if (!recognized) {
    std::string first = first_plain_line(text, table);
    if (!first.empty()) sections["STATUS"] = first;
  }
  return sections;
}

Position parse_position(const std::string& text) {
  Position p;
  std::string t = trim(text);
  if (t.empty()) return p;
  p.raw = t;

  static const RE2 file_line("([^:]+?):(\\d+)");
  static const RE2 func("-\\s*(\\w+)\\s*\\(");

  std::string file;
  int line = 0;
  if (RE2::PartialMatch(t, file_line, &file, &line)) {
    p.file = trim(file);
    p.line = line;
    std::string name;
    if (RE2::PartialMatch(t, func, &name)) p.function = name;
  } else {
    p.file = t;
  }
  return p;
}

std::vector<std::string> parse_list(const std::string& text) {
  static const RE2 bullets("^(?:[\\s\\-*>]|•|·|→)+");
  static const RE2 numbering("^\\d+[.)]\\s*");

  std::vector<std::string> items;
  for (auto& line : split_lines(text)) {
    std::string s = trim(line);
    if (s.empty()) continue;
    RE2::Replace(&s, bullets, "");
    RE2::Replace(&s, numbering, "");
    s = trim(s);
    if (!s.empty()) items.push_back(s);
  }
  return items;
}

static std::string section_or_empty(const SectionMap& m, const char* key) {
  auto it = m.find(key);
  return it == m.end() ? std::string() : it->second;
}

ParsedContinuation parse_continuation(const std::string& text, const HeaderTable& table) {
  ParsedContinuation pc;
  pc.timestamp = std::chrono::system_clock::now();
  pc.raw_sections = parse_sections(text, table);

  // headline only; the full STATUS body stays in raw_sections
  pc.status   = trim(split_lines(section_or_empty(pc.raw_sections, "STATUS")).front());
  pc.position = parse_position(section_or_empty(pc.raw_sections, "POSITION"));
  pc.problem  = section_or_empty(pc.raw_sections, "PROBLEM");
  pc.tried    = parse_list(section_or_empty(pc.raw_sections, "TRIED"));
  pc.next     = parse_list(section_or_empty(pc.raw_sections, "NEXT"));
  pc.todo     = parse_list(section_or_empty(pc.raw_sections, "TODO"));
  pc.context  = section_or_empty(pc.raw_sections, "CONTEXT");

  if (pc.status.empty()) {
    pc.status = first_plain_line(text, table);
    if (pc.status.empty()) pc.status = "Continuation session";
  }
  return pc;
}

std::string serialize_sections(const SectionMap& sections, const HeaderTable& table) {
  std::string out;
  auto emit = [&](const std::string& key, const std::string& body) {
    out += key;
    out += ":";
    if (!body.empty()) {
      out += " ";
      out += body;
    }
    out += "\n";
  };
  auto canon = table.canonical_names();
  for (auto& key : canon) {
    auto it = sections.find(key);
    if (it != sections.end()) emit(key, it->second);
  }
  for (auto& kv : sections) {
    bool known = false;
    for (auto& key : canon) if (key == kv.first) { known = true; break; }
    if (!known) emit(kv.first, kv.second);
  }
  return out;
}
