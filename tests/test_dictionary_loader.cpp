#include "io/dictionary/dictionary_loader.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

class DictionaryLoaderTest : public ::testing::Test {
protected:
  void SetUp() override {
    test_dir =
        std::filesystem::temp_directory_path() / "dict_ner_dictionary_test";
    std::filesystem::create_directories(test_dir);
  }

  void TearDown() override {
    if (std::filesystem::exists(test_dir))
      std::filesystem::remove_all(test_dir);
  }

  void createDictionary(const std::string &name, const std::string &content) {
    std::ofstream file(test_dir / name, std::ios::binary);
    file << content;
  }

  Config::DictionaryConfig configFor(
      const std::vector<Config::DictionarySource> &sources) {
    Config::DictionaryConfig config;
    config.dictionary_dir = test_dir.string();
    config.sources = sources;
    return config;
  }

  std::filesystem::path test_dir;
};

TEST_F(DictionaryLoaderTest, ReadEntriesTrimsDedupsAndSorts) {
  createDictionary("LOCdoc.txt",
                   "\xEF\xBB\xBF上海\n  北京 \n\n北京\r\n天安门\n   \n");

  bool opened = false;
  auto entries = DictionaryLoader::read_entries(
      (test_dir / "LOCdoc.txt").string(), opened);

  EXPECT_TRUE(opened);
  std::vector<std::string> expected = {"上海", "北京", "天安门"};
  std::sort(expected.begin(), expected.end());
  EXPECT_EQ(entries, expected);
}

TEST_F(DictionaryLoaderTest, PaddedEntriesStillMatch) {
  createDictionary("LOCdoc.txt", "\u3000北京\u00A0\n\u3000\n");

  DictionaryLoader loader(configFor({{"LOC", "LOCdoc.txt"}}));
  auto entries = loader.load();
  ASSERT_EQ(entries.size(), 1u);
  EXPECT_EQ(entries[0].text, "北京");

  Matching::AhoCorasick automaton;
  DictionaryLoader::build_automaton(entries, automaton);
  std::vector<Matching::Entity> expected = {{1, 3, "北京", "LOC"}};
  EXPECT_EQ(automaton.recognize("在北京"), expected);
}

TEST_F(DictionaryLoaderTest, ReadEntriesReportsMissingFile) {
  bool opened = true;
  auto entries = DictionaryLoader::read_entries(
      (test_dir / "nope.txt").string(), opened);
  EXPECT_FALSE(opened);
  EXPECT_TRUE(entries.empty());
}

TEST_F(DictionaryLoaderTest, LoadsSourcesInConfiguredOrder) {
  createDictionary("LOCdoc.txt", "北京\n");
  createDictionary("PERdoc.txt", "张三\n李四\n");
  createDictionary("ORGdoc.txt", "北京大学\n");

  DictionaryLoader loader(configFor({{"LOC", "LOCdoc.txt"},
                                     {"PER", "PERdoc.txt"},
                                     {"ORG", "ORGdoc.txt"}}));
  auto entries = loader.load();

  ASSERT_EQ(entries.size(), 4u);
  EXPECT_EQ(entries[0].label, "LOC");
  EXPECT_EQ(entries[1].label, "PER");
  EXPECT_EQ(entries[2].label, "PER");
  EXPECT_EQ(entries[3].label, "ORG");
  EXPECT_EQ(entries[3].text, "北京大学");

  EXPECT_EQ(loader.entries_per_label().at("LOC"), 1u);
  EXPECT_EQ(loader.entries_per_label().at("PER"), 2u);
  EXPECT_EQ(loader.entries_per_label().at("ORG"), 1u);
}

TEST_F(DictionaryLoaderTest, MissingDictionaryIsSkipped) {
  createDictionary("PERdoc.txt", "张三\n");

  DictionaryLoader loader(
      configFor({{"LOC", "LOCdoc.txt"}, {"PER", "PERdoc.txt"}}));
  auto entries = loader.load();

  ASSERT_EQ(entries.size(), 1u);
  EXPECT_EQ(entries[0].text, "张三");
  EXPECT_EQ(loader.entries_per_label().count("LOC"), 0u);
}

TEST_F(DictionaryLoaderTest, NothingLoadedWhenAllMissing) {
  DictionaryLoader loader(configFor({{"LOC", "LOCdoc.txt"}}));
  EXPECT_TRUE(loader.load().empty());
}

TEST_F(DictionaryLoaderTest, LaterDictionaryWinsSharedEntry) {
  createDictionary("LOCdoc.txt", "北京\n");
  createDictionary("ORGdoc.txt", "北京\n");

  DictionaryLoader loader(
      configFor({{"LOC", "LOCdoc.txt"}, {"ORG", "ORGdoc.txt"}}));
  Matching::AhoCorasick automaton;
  DictionaryLoader::build_automaton(loader.load(), automaton);

  EXPECT_TRUE(automaton.is_compiled());
  EXPECT_EQ(automaton.pattern_count(), 1u);
  auto entities = automaton.recognize("我在北京");
  ASSERT_EQ(entities.size(), 1u);
  EXPECT_EQ(entities[0], (Matching::Entity{2, 4, "北京", "ORG"}));
}

TEST_F(DictionaryLoaderTest, BuiltAutomatonRecognizesAcrossLabels) {
  createDictionary("LOCdoc.txt", "北京\n天安门\n");
  createDictionary("PERdoc.txt", "王小明\n");
  createDictionary("ORGdoc.txt", "北京大学\n");

  DictionaryLoader loader(configFor({{"LOC", "LOCdoc.txt"},
                                     {"PER", "PERdoc.txt"},
                                     {"ORG", "ORGdoc.txt"}}));
  Matching::AhoCorasick automaton;
  DictionaryLoader::build_automaton(loader.load(), automaton);

  std::vector<Matching::Entity> expected = {{0, 3, "王小明", "PER"},
                                            {4, 8, "北京大学", "ORG"},
                                            {9, 12, "天安门", "LOC"}};
  EXPECT_EQ(automaton.recognize("王小明在北京大学和天安门"), expected);
}
