#ifndef AHO_CORASICK_HPP
#define AHO_CORASICK_HPP

#include "entity.hpp"
#include "pattern_labels.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace Matching {

// Multi-pattern matcher over Unicode code points. Patterns are added while
// building, compile() freezes the automaton, and from then on search() and
// recognize() are const and safe to call from several threads at once.
class AhoCorasick {
public:
  AhoCorasick();

  // Registers `text` (UTF-8) under `label`. Empty text is ignored
  void add_pattern(std::string_view text, std::string label);

  // Computes suffix and output links. Must run exactly once, after the last
  // add_pattern() and before the first search()
  void compile();
  bool is_compiled() const { return compiled_; }

  // Every pattern occurrence, grouped by end position
  std::vector<Match> search(std::string_view text) const;
  std::vector<Match> search(std::u32string_view text) const;

  // search() followed by leftmost-longest overlap resolution
  std::vector<Entity> recognize(std::string_view text) const;

  const PatternLabels &labels() const { return labels_; }
  size_t pattern_count() const { return labels_.size(); }
  size_t node_count() const { return trie_.size(); }

private:
  struct TrieNode {
    std::unordered_map<char32_t, int> children;
    int suffix_link = 0; // Default to root
    int output_link = 0; // Nearest terminal on the suffix chain, 0 if none
    uint32_t pattern_length = 0; // In code points, set on terminal nodes
    bool terminal = false;
  };

  std::vector<TrieNode> trie_;
  PatternLabels labels_;
  bool compiled_ = false;
};

} // namespace Matching

#endif // AHO_CORASICK_HPP
