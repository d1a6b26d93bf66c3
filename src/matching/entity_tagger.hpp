#ifndef ENTITY_TAGGER_HPP
#define ENTITY_TAGGER_HPP

#include "entity.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Matching {

enum class TagKind { OUTSIDE, BEGIN, INSIDE };

struct Tag {
  TagKind kind = TagKind::OUTSIDE;
  std::string label; // Empty for OUTSIDE
};

struct TaggedChar {
  std::string character; // One code point, UTF-8 encoded
  Tag tag;
};

// "O", "B-<label>" or "I-<label>"
std::string tag_to_string(const Tag &tag);

// Inverse of tag_to_string; std::nullopt for anything else
std::optional<Tag> parse_tag(std::string_view text);

// One entry per code point of `text`. `entities` must not overlap; spans
// running past the end of the text are clipped.
std::vector<TaggedChar> to_label_sequence(std::string_view text,
                                          const std::vector<Entity> &entities);

// Regroups B/I runs of one label into entities. An I tag that does not
// continue a run of the same label opens a new entity.
std::vector<Entity> from_label_sequence(const std::vector<TaggedChar> &tagged);

} // namespace Matching

#endif // ENTITY_TAGGER_HPP
