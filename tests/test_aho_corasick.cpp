#include "matching/aho_corasick.hpp"
#include "matching/errors.hpp"
#include "utils/utf8.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <map>
#include <random>
#include <string>
#include <thread>
#include <tuple>
#include <utility>
#include <vector>

using Matching::AhoCorasick;
using Matching::Entity;
using Matching::Match;

namespace {

AhoCorasick
build(const std::vector<std::pair<std::string, std::string>> &patterns) {
  AhoCorasick automaton;
  for (const auto &[text, label] : patterns)
    automaton.add_pattern(text, label);
  automaton.compile();
  return automaton;
}

// Every occurrence of every pattern, found by direct comparison
std::vector<Match> naive_search(const std::string &text,
                                const std::vector<std::string> &patterns) {
  std::vector<Match> matches;
  for (size_t start = 0; start < text.size(); ++start)
    for (const auto &pattern : patterns)
      if (text.compare(start, pattern.size(), pattern) == 0)
        matches.push_back({start, start + pattern.size(), pattern});
  return matches;
}

// Scans left to right and takes the longest pattern starting at each
// position not covered by an earlier entity
std::vector<Entity>
naive_recognize(const std::string &text,
                const std::map<std::string, std::string> &labels) {
  std::vector<Entity> entities;
  size_t pos = 0;
  while (pos < text.size()) {
    size_t best = 0;
    for (const auto &entry : labels)
      if (entry.first.size() > best &&
          text.compare(pos, entry.first.size(), entry.first) == 0)
        best = entry.first.size();
    if (best == 0) {
      pos++;
      continue;
    }
    std::string matched = text.substr(pos, best);
    entities.push_back({pos, pos + best, matched, labels.at(matched)});
    pos += best;
  }
  return entities;
}

void sort_matches(std::vector<Match> &matches) {
  std::sort(matches.begin(), matches.end(), [](const Match &a, const Match &b) {
    return std::tie(a.start, a.end, a.text) < std::tie(b.start, b.end, b.text);
  });
}

} // namespace

// --- Usage errors ---
TEST(AhoCorasickTest, SearchBeforeCompileThrows) {
  AhoCorasick automaton;
  automaton.add_pattern("abc", "X");
  EXPECT_THROW(automaton.search("abc"), Matching::AutomatonUsageError);
  EXPECT_THROW(automaton.recognize("abc"), Matching::AutomatonUsageError);
}

TEST(AhoCorasickTest, CompileTwiceThrows) {
  AhoCorasick automaton;
  automaton.add_pattern("abc", "X");
  automaton.compile();
  EXPECT_TRUE(automaton.is_compiled());
  EXPECT_THROW(automaton.compile(), Matching::AutomatonUsageError);
}

TEST(AhoCorasickTest, AddPatternAfterCompileThrows) {
  AhoCorasick automaton;
  automaton.compile();
  EXPECT_THROW(automaton.add_pattern("abc", "X"),
               Matching::AutomatonUsageError);
}

// --- Empty inputs ---
TEST(AhoCorasickTest, EmptyPatternIsIgnored) {
  AhoCorasick automaton;
  automaton.add_pattern("", "X");
  automaton.compile();
  EXPECT_EQ(automaton.pattern_count(), 0u);
  EXPECT_EQ(automaton.node_count(), 1u);
  EXPECT_TRUE(automaton.recognize("anything").empty());
}

TEST(AhoCorasickTest, EmptyTextYieldsNothing) {
  auto automaton = build({{"abc", "X"}});
  EXPECT_TRUE(automaton.search("").empty());
  EXPECT_TRUE(automaton.recognize("").empty());
}

TEST(AhoCorasickTest, NoPatternsYieldsNothing) {
  auto automaton = build({});
  EXPECT_TRUE(automaton.search("abc").empty());
  EXPECT_TRUE(automaton.recognize("abc").empty());
}

// --- Raw matching ---
TEST(AhoCorasickTest, ReportsEveryPatternEndingAtAPosition) {
  auto automaton =
      build({{"he", "A"}, {"she", "B"}, {"his", "C"}, {"hers", "D"}});
  auto matches = automaton.search("ushers");

  std::vector<Match> expected = {
      {1, 4, "she"}, {2, 4, "he"}, {2, 6, "hers"}};
  EXPECT_EQ(matches, expected);
}

TEST(AhoCorasickTest, RecoversThroughSuffixLinksAfterMismatch) {
  auto automaton = build({{"abcd", "X"}, {"bce", "Y"}});
  auto matches = automaton.search("abce");

  ASSERT_EQ(matches.size(), 1u);
  EXPECT_EQ(matches[0], (Match{1, 4, "bce"}));
}

TEST(AhoCorasickTest, ReportsOverlappingOccurrencesOfOnePattern) {
  auto automaton = build({{"aa", "X"}});

  std::vector<Match> expected = {{0, 2, "aa"}, {1, 3, "aa"}, {2, 4, "aa"}};
  EXPECT_EQ(automaton.search("aaaa"), expected);

  std::vector<Entity> entities = {{0, 2, "aa", "X"}, {2, 4, "aa", "X"}};
  EXPECT_EQ(automaton.recognize("aaaa"), entities);
}

TEST(AhoCorasickTest, CharactersOutsideTheTrieAreSkipped) {
  auto automaton = build({{"cat", "ANIMAL"}});
  auto entities = automaton.recognize("xx cat yy");

  ASSERT_EQ(entities.size(), 1u);
  EXPECT_EQ(entities[0], (Entity{3, 6, "cat", "ANIMAL"}));
}

// --- Recognition ---
TEST(AhoCorasickTest, LongestMatchWins) {
  auto automaton = build({{"AB", "X"}, {"ABC", "Y"}});
  auto entities = automaton.recognize("ABCD");

  ASSERT_EQ(entities.size(), 1u);
  EXPECT_EQ(entities[0], (Entity{0, 3, "ABC", "Y"}));
}

TEST(AhoCorasickTest, LeftmostMatchWinsOnOverlap) {
  auto automaton = build({{"AB", "X"}, {"BC", "Y"}});
  auto entities = automaton.recognize("ABC");

  ASSERT_EQ(entities.size(), 1u);
  EXPECT_EQ(entities[0], (Entity{0, 2, "AB", "X"}));
}

TEST(AhoCorasickTest, LastLabelWinsForRepeatedPattern) {
  AhoCorasick automaton;
  automaton.add_pattern("北京", "LOC");
  automaton.add_pattern("北京", "ORG");
  automaton.compile();

  EXPECT_EQ(automaton.pattern_count(), 1u);
  auto entities = automaton.recognize("北京");
  ASSERT_EQ(entities.size(), 1u);
  EXPECT_EQ(entities[0].label, "ORG");
}

TEST(AhoCorasickTest, OffsetsAreInCodePoints) {
  auto automaton = build({{"北京", "LOC"}, {"天安门", "LOC"}});
  auto entities = automaton.recognize("我爱北京天安门");

  std::vector<Entity> expected = {{2, 4, "北京", "LOC"},
                                  {4, 7, "天安门", "LOC"}};
  EXPECT_EQ(entities, expected);
}

TEST(AhoCorasickTest, MixedWidthCharacters) {
  auto automaton = build({{"café", "FOOD"}});
  auto entities = automaton.recognize("Le café noir");

  ASSERT_EQ(entities.size(), 1u);
  EXPECT_EQ(entities[0], (Entity{3, 7, "café", "FOOD"}));
}

TEST(AhoCorasickTest, MalformedBytesMatchAsReplacementCharacters) {
  auto automaton = build({{"\xFF", "X"}});
  auto entities = automaton.recognize("a\xFF"
                                      "b");

  ASSERT_EQ(entities.size(), 1u);
  EXPECT_EQ(entities[0].start, 1u);
  EXPECT_EQ(entities[0].end, 2u);
  EXPECT_EQ(entities[0].text, "\xEF\xBF\xBD");
  EXPECT_EQ(entities[0].label, "X");
}

TEST(AhoCorasickTest, ResultIsIndependentOfInsertionOrder) {
  std::vector<std::pair<std::string, std::string>> patterns = {
      {"中国", "LOC"},     {"中国银行", "ORG"}, {"国银", "ORG"},
      {"银行", "ORG"},     {"张三", "PER"},     {"三里屯", "LOC"},
      {"北京大学", "ORG"}, {"北京", "LOC"},     {"大学", "ORG"}};
  auto forward = build(patterns);
  std::vector<std::pair<std::string, std::string>> reversed(patterns.rbegin(),
                                                            patterns.rend());
  auto backward = build(reversed);

  const std::string text = "张三在中国银行和北京大学之间的三里屯见到了中国人";
  EXPECT_EQ(forward.recognize(text), backward.recognize(text));
  EXPECT_EQ(forward.recognize(text), forward.recognize(text));
}

TEST(AhoCorasickTest, EntitiesAreRegisteredPatternsInOrder) {
  std::vector<std::pair<std::string, std::string>> patterns = {
      {"ab", "X"}, {"abc", "Y"}, {"bcd", "Z"}, {"c", "W"},
      {"cd", "X"}, {"d", "Y"},   {"xyz", "Z"}};
  auto automaton = build(patterns);

  for (const std::string text :
       {"abcd", "abcdabcd", "xabcdy", "cdcdc", "dxyzab", "zzz"}) {
    auto entities = automaton.recognize(text);
    std::u32string code_points = Utils::utf8_decode(text);

    for (size_t i = 0; i < entities.size(); ++i) {
      const auto &entity = entities[i];
      ASSERT_LT(entity.start, entity.end);
      ASSERT_LE(entity.end, code_points.size());
      EXPECT_EQ(Utils::utf8_encode(std::u32string_view(code_points)
                                       .substr(entity.start, entity.length())),
                entity.text);
      EXPECT_EQ(automaton.labels().label_of(entity.text), entity.label);
      if (i > 0)
        EXPECT_LE(entities[i - 1].end, entity.start) << "in " << text;
    }
  }
}

TEST(AhoCorasickTest, ConcurrentSearchesAgree) {
  auto automaton = build({{"北京", "LOC"}, {"北京大学", "ORG"}, {"学生", "PER"}});
  const std::string text = "北京大学学生在北京";
  const auto expected = automaton.recognize(text);

  std::vector<std::vector<Entity>> observed(8);
  std::vector<std::thread> threads;
  for (size_t t = 0; t < observed.size(); ++t)
    threads.emplace_back([&, t]() {
      for (int round = 0; round < 200; ++round)
        observed[t] = automaton.recognize(text);
    });
  for (auto &thread : threads)
    thread.join();

  for (const auto &entities : observed)
    EXPECT_EQ(entities, expected);
}

TEST(AhoCorasickTest, AgreesWithBruteForceOnRandomInputs) {
  std::mt19937 rng(20261019);
  std::uniform_int_distribution<int> letter('a', 'c');
  std::uniform_int_distribution<int> pattern_count(0, 6);
  std::uniform_int_distribution<int> pattern_length(1, 3);
  std::uniform_int_distribution<int> text_length(0, 12);

  auto random_string = [&](int length) {
    std::string result;
    for (int i = 0; i < length; ++i)
      result += static_cast<char>(letter(rng));
    return result;
  };

  for (int round = 0; round < 2000; ++round) {
    std::vector<std::string> patterns;
    std::map<std::string, std::string> labels;
    AhoCorasick automaton;
    int count = pattern_count(rng);
    for (int p = 0; p < count; ++p) {
      std::string pattern = random_string(pattern_length(rng));
      std::string label = "L" + std::to_string(p);
      automaton.add_pattern(pattern, label);
      if (labels.count(pattern) == 0)
        patterns.push_back(pattern);
      labels[pattern] = label;
    }
    automaton.compile();

    std::string text = random_string(text_length(rng));

    auto found = automaton.search(text);
    auto expected = naive_search(text, patterns);
    sort_matches(found);
    sort_matches(expected);
    ASSERT_EQ(found, expected) << "round " << round << ", text " << text;

    ASSERT_EQ(automaton.recognize(text), naive_recognize(text, labels))
        << "round " << round << ", text " << text;
  }
}
