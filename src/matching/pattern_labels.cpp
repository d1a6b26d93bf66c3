#include "pattern_labels.hpp"
#include "errors.hpp"

#include <string>
#include <utility>

namespace Matching {

void PatternLabels::assign(std::string text, std::string label) {
  labels_[std::move(text)] = std::move(label);
}

const std::string &PatternLabels::label_of(std::string_view text) const {
  auto it = labels_.find(std::string(text));
  if (it == labels_.end())
    throw LabelLookupError("No label registered for matched pattern '" +
                           std::string(text) + "'");
  return it->second;
}

bool PatternLabels::contains(std::string_view text) const {
  return labels_.find(std::string(text)) != labels_.end();
}

std::set<std::string> PatternLabels::distinct_labels() const {
  std::set<std::string> result;
  for (const auto &[text, label] : labels_)
    result.insert(label);
  return result;
}

} // namespace Matching
