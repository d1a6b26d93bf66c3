#include "dictionary_loader.hpp"
#include "core/logger.hpp"
#include "utils/utf8.hpp"
#include "utils/utils.hpp"

#include <fstream>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

DictionaryLoader::DictionaryLoader(Config::DictionaryConfig config)
    : config_(std::move(config)) {}

std::vector<std::string>
DictionaryLoader::read_entries(const std::string &filepath, bool &opened) {
  std::vector<std::string> entries;
  std::ifstream dict_file(filepath);
  opened = dict_file.is_open();
  if (!opened)
    return entries;

  std::set<std::string> unique_entries;
  std::string line;
  bool first_line = true;
  while (std::getline(dict_file, line)) {
    std::string_view view = line;
    if (first_line) {
      view = Utils::strip_utf8_bom(view);
      first_line = false;
    }
    std::string entry = Utils::utf8_trim(view);
    if (!entry.empty())
      unique_entries.insert(std::move(entry));
  }

  entries.assign(unique_entries.begin(), unique_entries.end());
  return entries;
}

std::vector<DictionaryEntry> DictionaryLoader::load() {
  std::vector<DictionaryEntry> all_entries;
  entries_per_label_.clear();

  for (const auto &source : config_.sources) {
    std::string path =
        Utils::resolve_path(config_.dictionary_dir, source.path);

    bool opened = false;
    std::vector<std::string> entries = read_entries(path, opened);
    if (!opened) {
      LOG(LogLevel::WARN, LogComponent::IO_DICTIONARY,
          "Dictionary for label " << source.label << " not found at " << path
                                  << ". Skipping.");
      continue;
    }

    LOG(LogLevel::INFO, LogComponent::IO_DICTIONARY,
        "Loaded " << entries.size() << " " << source.label
                  << " entries from " << path);
    entries_per_label_[source.label] += entries.size();

    all_entries.reserve(all_entries.size() + entries.size());
    for (auto &entry : entries)
      all_entries.push_back({std::move(entry), source.label});
  }

  return all_entries;
}

void DictionaryLoader::build_automaton(
    const std::vector<DictionaryEntry> &entries,
    Matching::AhoCorasick &automaton) {
  LOG(LogLevel::INFO, LogComponent::MATCH_BUILD,
      "Building automaton from " << entries.size() << " entries...");
  for (const auto &entry : entries)
    automaton.add_pattern(entry.text, entry.label);
  automaton.compile();
  LOG(LogLevel::INFO, LogComponent::MATCH_BUILD,
      "Automaton ready: " << automaton.pattern_count() << " distinct patterns, "
                          << automaton.node_count() << " nodes.");
}
