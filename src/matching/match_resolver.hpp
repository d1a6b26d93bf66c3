#ifndef MATCH_RESOLVER_HPP
#define MATCH_RESOLVER_HPP

#include "entity.hpp"
#include "pattern_labels.hpp"

#include <vector>

namespace Matching {

// Leftmost-longest selection. Matches are ordered by start, then longer
// first, then by text; a match is kept when it starts at or after the end of
// the last kept one. Throws LabelLookupError for a match without a label.
std::vector<Entity> resolve_matches(std::vector<Match> matches,
                                    const PatternLabels &labels);

} // namespace Matching

#endif // MATCH_RESOLVER_HPP
