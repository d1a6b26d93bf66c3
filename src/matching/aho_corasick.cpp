#include "aho_corasick.hpp"
#include "core/logger.hpp"
#include "errors.hpp"
#include "match_resolver.hpp"
#include "utils/utf8.hpp"

#include <cstddef>
#include <queue>
#include <utility>

namespace Matching {

AhoCorasick::AhoCorasick() {
  trie_.emplace_back(); // Root node
}

void AhoCorasick::add_pattern(std::string_view text, std::string label) {
  if (compiled_)
    throw AutomatonUsageError(
        "add_pattern() called on an already compiled automaton");

  std::u32string code_points = Utils::utf8_decode(text);
  if (code_points.empty())
    return;

  int node = 0;
  for (char32_t ch : code_points) {
    auto it = trie_[node].children.find(ch);
    if (it == trie_[node].children.end()) {
      int child = static_cast<int>(trie_.size());
      trie_[node].children.emplace(ch, child);
      trie_.emplace_back();
      node = child;
    } else {
      node = it->second;
    }
  }
  trie_[node].terminal = true;
  trie_[node].pattern_length = static_cast<uint32_t>(code_points.size());

  // Keyed by the re-encoded text so lookups from search() always agree,
  // even when the input contained malformed bytes
  labels_.assign(Utils::utf8_encode(code_points), std::move(label));
}

void AhoCorasick::compile() {
  if (compiled_)
    throw AutomatonUsageError("compile() called twice");

  std::queue<int> q;
  for (auto const &[key, val] : trie_[0].children) {
    q.push(val);
  }

  while (!q.empty()) {
    int u = q.front();
    q.pop();

    for (auto const &[ch, v] : trie_[u].children) {
      int j = trie_[u].suffix_link;
      while (j > 0 && trie_[j].children.find(ch) == trie_[j].children.end()) {
        j = trie_[j].suffix_link;
      }
      auto match_it = trie_[j].children.find(ch);
      if (match_it != trie_[j].children.end()) {
        trie_[v].suffix_link = match_it->second;
      }
      q.push(v);
    }

    // The suffix node is shallower than u, so its output link is final
    int suffix_node = trie_[u].suffix_link;
    if (trie_[suffix_node].terminal) {
      trie_[u].output_link = suffix_node;
    } else {
      trie_[u].output_link = trie_[suffix_node].output_link;
    }
  }

  compiled_ = true;
  LOG(LogLevel::DEBUG, LogComponent::MATCH_BUILD,
      "Automaton compiled: " << labels_.size() << " patterns, "
                             << trie_.size() << " nodes.");
}

std::vector<Match> AhoCorasick::search(std::string_view text) const {
  return search(Utils::utf8_decode(text));
}

std::vector<Match> AhoCorasick::search(std::u32string_view text) const {
  if (!compiled_)
    throw AutomatonUsageError("search() called before compile()");

  std::vector<Match> matches;
  int current_node = 0;

  for (size_t i = 0; i < text.size(); ++i) {
    char32_t ch = text[i];
    while (current_node > 0 && trie_[current_node].children.find(ch) ==
                                   trie_[current_node].children.end()) {
      current_node = trie_[current_node].suffix_link;
    }
    auto it = trie_[current_node].children.find(ch);
    if (it != trie_[current_node].children.end()) {
      current_node = it->second;
    }

    int temp_node = trie_[current_node].terminal
                        ? current_node
                        : trie_[current_node].output_link;
    while (temp_node > 0) {
      const TrieNode &node = trie_[temp_node];
      size_t start = i + 1 - node.pattern_length;
      matches.push_back(
          {start, i + 1,
           Utils::utf8_encode(text.substr(start, node.pattern_length))});
      temp_node = node.output_link;
    }
  }

  LOG(LogLevel::TRACE, LogComponent::MATCH_SEARCH,
      "Search over " << text.size() << " code points produced "
                     << matches.size() << " matches.");
  return matches;
}

std::vector<Entity> AhoCorasick::recognize(std::string_view text) const {
  return resolve_matches(search(text), labels_);
}

} // namespace Matching
