#include "sections.hpp"
#include <gtest/gtest.h>

namespace {

const char* kStandardNote = R"(
    STATUS: WebSocket reconnection implementation
    POSITION: channel_manager.py:245 - reconnect()
    PROBLEM: Connection drops after 30s timeout
    TRIED:
    - Simple setTimeout retry
    - Increasing timeout to 60s
    NEXT:
    - Implement exponential backoff
    - Add connection state tracking
    TODO:
    - Add error handling for network failures
    - Write unit tests for reconnection logic
    CONTEXT: Part of the real-time data feature
    )";

}  // namespace

TEST(Sections, StandardNote) {
  ParsedContinuation pc = parse_continuation(kStandardNote);
  EXPECT_EQ(pc.status, "WebSocket reconnection implementation");
  ASSERT_TRUE(pc.position.file.has_value());
  EXPECT_EQ(*pc.position.file, "channel_manager.py");
  ASSERT_TRUE(pc.position.line.has_value());
  EXPECT_EQ(*pc.position.line, 245);
  ASSERT_TRUE(pc.position.function.has_value());
  EXPECT_EQ(*pc.position.function, "reconnect");
  EXPECT_EQ(pc.problem, "Connection drops after 30s timeout");
  ASSERT_EQ(pc.tried.size(), 2u);
  EXPECT_EQ(pc.tried[0], "Simple setTimeout retry");
  ASSERT_EQ(pc.next.size(), 2u);
  EXPECT_EQ(pc.next[1], "Add connection state tracking");
  EXPECT_EQ(pc.todo.size(), 2u);
  EXPECT_EQ(pc.context, "Part of the real-time data feature");
}

TEST(Sections, GermanKeywords) {
  ParsedContinuation pc = parse_continuation(
    "WAS: Datenbank Schema Update\n"
    "WO: migration_v2.sql:15\n"
    "PROBLEM: Foreign Key Constraint fehlt\n"
    "VERSUCHT: Manual ALTER TABLE\n"
    "NÄCHSTE: Constraint mit CASCADE hinzufügen\n");
  EXPECT_EQ(pc.status, "Datenbank Schema Update");
  EXPECT_EQ(*pc.position.file, "migration_v2.sql");
  EXPECT_EQ(*pc.position.line, 15);
  EXPECT_FALSE(pc.position.function.has_value());
  EXPECT_EQ(pc.problem, "Foreign Key Constraint fehlt");
  ASSERT_EQ(pc.tried.size(), 1u);
  EXPECT_EQ(pc.tried[0], "Manual ALTER TABLE");
  ASSERT_EQ(pc.next.size(), 1u);
  EXPECT_EQ(pc.next[0], "Constraint mit CASCADE hinzufügen");
}

TEST(Sections, MinimalNoteTakesStatusFromFirstLine) {
  ParsedContinuation pc = parse_continuation(
    "\n  Working on API endpoints\n  POSITION: api/routes.py\n  TODO: Add authentication\n");
  EXPECT_EQ(pc.status, "Working on API endpoints");
  EXPECT_EQ(*pc.position.file, "api/routes.py");
  EXPECT_FALSE(pc.position.line.has_value());
  EXPECT_EQ(pc.todo, std::vector<std::string>{"Add authentication"});
}

TEST(Sections, HeaderMatchingIgnoresCase) {
  SectionMap m = parse_sections("status: lowercase works\nNext: step one");
  EXPECT_EQ(m["STATUS"], "lowercase works");
  EXPECT_EQ(m["NEXT"], "step one");
}

TEST(Sections, NoHeadersFallsBackToFirstLine) {
  SectionMap m = parse_sections("\n\n   just a loose thought   \nsecond line\n");
  ASSERT_EQ(m.size(), 1u);
  EXPECT_EQ(m["STATUS"], "just a loose thought");
}

TEST(Sections, EmptyNote) {
  EXPECT_TRUE(parse_sections("").empty());
  EXPECT_EQ(parse_continuation("   \n").status, "Continuation session");
}

TEST(Sections, StatusIsHeadlineOfItsSection) {
  ParsedContinuation pc = parse_continuation("STATUS:   Refactoring the parser  \nsome detail\nmore detail");
  EXPECT_EQ(pc.status, "Refactoring the parser");
  EXPECT_EQ(pc.raw_sections["STATUS"], "Refactoring the parser\nsome detail\nmore detail");
}

TEST(Sections, UnknownHeaderKept) {
  SectionMap m = parse_sections("STATUS: x\nNOTES: remember the cache\nTODO: y");
  EXPECT_EQ(m["NOTES"], "remember the cache");
  EXPECT_EQ(m["STATUS"], "x");
  EXPECT_EQ(m["TODO"], "y");
}

TEST(Sections, LaterHeaderReplacesEarlier) {
  SectionMap m = parse_sections("STATUS: first\nTASK: second");
  EXPECT_EQ(m["STATUS"], "second");
}

TEST(Sections, SerializeThenParseIsStable) {
  SectionMap m = parse_sections(kStandardNote);
  std::string once = serialize_sections(m);
  EXPECT_EQ(parse_sections(once), m);
  EXPECT_EQ(serialize_sections(parse_sections(once)), once);
  EXPECT_EQ(once.rfind("STATUS:", 0), 0u);
}

TEST(Sections, ListMarkupStripped) {
  auto items = parse_list("- dash\n* star\n• dot\n1. numbered\n2) paren\n\n  > quoted\nplain");
  std::vector<std::string> want = {"dash", "star", "dot", "numbered", "paren", "quoted", "plain"};
  EXPECT_EQ(items, want);
}

TEST(Sections, PositionForms) {
  Position p = parse_position("src/app.cpp:12");
  EXPECT_EQ(*p.file, "src/app.cpp");
  EXPECT_EQ(*p.line, 12);
  EXPECT_FALSE(p.function.has_value());

  Position bare = parse_position("README.md");
  EXPECT_EQ(*bare.file, "README.md");
  EXPECT_FALSE(bare.line.has_value());

  EXPECT_TRUE(parse_position("  ").empty());
}

TEST(Sections, CustomTableAddsLanguage) {
  HeaderTable fr({
    {"STATUS", {"STATUS", "ETAT"}},
    {"NEXT",   {"NEXT", "ENSUITE"}},
  });
  EXPECT_EQ(fr.canonical_of("etat"), "STATUS");
  EXPECT_EQ(fr.canonical_of("WAS"), "");
  EXPECT_EQ(fr.spellings_of("NEXT").size(), 2u);

  ParsedContinuation pc = parse_continuation("ETAT: migration en cours\nENSUITE: - tester", fr);
  EXPECT_EQ(pc.status, "migration en cours");
  EXPECT_EQ(pc.next, std::vector<std::string>{"tester"});
}

TEST(Sections, StandardTableGroups) {
  const HeaderTable& t = HeaderTable::standard();
  std::vector<std::string> want = {"STATUS", "POSITION", "PROBLEM", "TRIED", "NEXT", "TODO", "CONTEXT"};
  EXPECT_EQ(t.canonical_names(), want);
  EXPECT_EQ(t.canonical_of("fehler"), "PROBLEM");
  EXPECT_EQ(t.canonical_of("Kontext"), "CONTEXT");
}
