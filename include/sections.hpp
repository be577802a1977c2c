#pragma once
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// Canonical name -> accepted header spellings, e.g. STATUS <- WAS, AUFGABE, TASK.
// Matching is case-insensitive; group order is the canonical display order.
class HeaderTable {
public:
  using Groups = std::vector<std::pair<std::string, std::vector<std::string>>>;

  explicit HeaderTable(const Groups& groups);
  ~HeaderTable();
  HeaderTable(const HeaderTable&) = delete;
  HeaderTable& operator=(const HeaderTable&) = delete;

  static const HeaderTable& standard();

  // "" when the keyword is not a known spelling
  std::string canonical_of(const std::string& keyword) const;
  std::vector<std::string> spellings_of(const std::string& canonical) const;
  std::vector<std::string> canonical_names() const;

  // Matches "<spelling>: rest" on an already trimmed line.
  bool match_header(const std::string& line, std::string* canonical, std::string* rest) const;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

using SectionMap = std::map<std::string, std::string>;

struct Position {
  std::optional<std::string> file;
  std::optional<int> line;
  std::optional<std::string> function;
  std::string raw;      // section text as written

  bool empty() const { return !file && !line && !function; }
};

struct ParsedContinuation {
  std::string status;                 // first line of the STATUS section

  Position position;
  std::string problem;
  std::vector<std::string> tried;
  std::vector<std::string> next;
  std::vector<std::string> todo;
  std::string context;
  std::chrono::system_clock::time_point timestamp;
  SectionMap raw_sections;
};

// Splits text into sections keyed by canonical name. Unknown all-caps headers
// ("NOTES:") are kept under their literal keyword. When no known header is
// present, STATUS is taken from the first non-empty line.
SectionMap parse_sections(const std::string& text,
                          const HeaderTable& table = HeaderTable::standard());

// "main.py:123 - handler()" -> file, line, function; anything else is a bare path.
Position parse_position(const std::string& text);

// Bullet / numbered / plain lines -> items, markup stripped, order preserved.
std::vector<std::string> parse_list(const std::string& text);

ParsedContinuation parse_continuation(const std::string& text,
                                      const HeaderTable& table = HeaderTable::standard());

// Inverse of parse_sections for canonical input: "KEY: body" blocks,
// canonical names first, unknown keys after.
std::string serialize_sections(const SectionMap& sections,
                               const HeaderTable& table = HeaderTable::standard());
