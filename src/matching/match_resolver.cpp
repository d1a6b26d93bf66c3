#include "match_resolver.hpp"

#include <algorithm>
#include <cstddef>
#include <utility>

namespace Matching {

std::vector<Entity> resolve_matches(std::vector<Match> matches,
                                    const PatternLabels &labels) {
  std::sort(matches.begin(), matches.end(),
            [](const Match &a, const Match &b) {
              if (a.start != b.start)
                return a.start < b.start;
              if (a.length() != b.length())
                return a.length() > b.length();
              // Byte order of UTF-8 equals code point order
              return a.text < b.text;
            });

  std::vector<Entity> entities;
  size_t last_end = 0; // Offsets are unsigned, so 0 admits the first match
  for (auto &match : matches) {
    if (match.start < last_end)
      continue;

    const std::string &label = labels.label_of(match.text);
    last_end = match.end;
    entities.push_back(
        {match.start, match.end, std::move(match.text), label});
  }
  return entities;
}

} // namespace Matching
