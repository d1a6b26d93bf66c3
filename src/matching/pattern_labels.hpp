#ifndef PATTERN_LABELS_HPP
#define PATTERN_LABELS_HPP

#include <cstddef>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>

namespace Matching {

// Pattern text (UTF-8) to label. Re-assigning a text overwrites its label
class PatternLabels {
public:
  void assign(std::string text, std::string label);

  // Throws LabelLookupError when `text` was never assigned
  const std::string &label_of(std::string_view text) const;

  bool contains(std::string_view text) const;
  size_t size() const { return labels_.size(); }
  bool empty() const { return labels_.empty(); }

  // Distinct labels currently in use, sorted
  std::set<std::string> distinct_labels() const;

private:
  std::unordered_map<std::string, std::string> labels_;
};

} // namespace Matching

#endif // PATTERN_LABELS_HPP
