#ifndef DICTIONARY_LOADER_HPP
#define DICTIONARY_LOADER_HPP

#include "core/config.hpp"
#include "matching/aho_corasick.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

struct DictionaryEntry {
  std::string text;
  std::string label;
};

class DictionaryLoader {
public:
  explicit DictionaryLoader(Config::DictionaryConfig config);

  // Reads every configured dictionary. Entries come back grouped by source in
  // configuration order, deduplicated and sorted within each source. Missing
  // files are logged and skipped.
  std::vector<DictionaryEntry> load();

  // Reads a single dictionary file: one entry per line, surrounding
  // whitespace and a leading BOM removed, blank lines skipped
  static std::vector<std::string> read_entries(const std::string &filepath,
                                               bool &opened);

  // Registers `entries` in order and compiles the automaton
  static void build_automaton(const std::vector<DictionaryEntry> &entries,
                              Matching::AhoCorasick &automaton);

  // Entry counts per label from the last load()
  const std::map<std::string, size_t> &entries_per_label() const {
    return entries_per_label_;
  }

private:
  Config::DictionaryConfig config_;
  std::map<std::string, size_t> entries_per_label_;
};

#endif // DICTIONARY_LOADER_HPP
