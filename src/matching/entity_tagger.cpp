#include "entity_tagger.hpp"
#include "utils/utf8.hpp"

#include <algorithm>
#include <cstddef>
#include <utility>

namespace Matching {

std::string tag_to_string(const Tag &tag) {
  switch (tag.kind) {
  case TagKind::BEGIN:
    return "B-" + tag.label;
  case TagKind::INSIDE:
    return "I-" + tag.label;
  case TagKind::OUTSIDE:
    break;
  }
  return "O";
}

std::optional<Tag> parse_tag(std::string_view text) {
  if (text == "O")
    return Tag{};
  if (text.size() < 3 || text[1] != '-')
    return std::nullopt;

  Tag tag;
  if (text[0] == 'B')
    tag.kind = TagKind::BEGIN;
  else if (text[0] == 'I')
    tag.kind = TagKind::INSIDE;
  else
    return std::nullopt;
  tag.label = std::string(text.substr(2));
  return tag;
}

std::vector<TaggedChar> to_label_sequence(std::string_view text,
                                          const std::vector<Entity> &entities) {
  std::u32string code_points = Utils::utf8_decode(text);

  std::vector<TaggedChar> tagged(code_points.size());
  for (size_t i = 0; i < code_points.size(); ++i)
    tagged[i].character = Utils::utf8_encode(code_points[i]);

  for (const auto &entity : entities) {
    if (entity.start >= tagged.size())
      continue;
    tagged[entity.start].tag = {TagKind::BEGIN, entity.label};
    size_t end = std::min(entity.end, tagged.size());
    for (size_t i = entity.start + 1; i < end; ++i)
      tagged[i].tag = {TagKind::INSIDE, entity.label};
  }
  return tagged;
}

std::vector<Entity> from_label_sequence(const std::vector<TaggedChar> &tagged) {
  std::vector<Entity> entities;
  std::optional<Entity> current;

  auto flush = [&]() {
    if (current) {
      entities.push_back(std::move(*current));
      current.reset();
    }
  };

  for (size_t i = 0; i < tagged.size(); ++i) {
    const Tag &tag = tagged[i].tag;
    switch (tag.kind) {
    case TagKind::OUTSIDE:
      flush();
      break;
    case TagKind::INSIDE:
      if (current && current->label == tag.label && current->end == i) {
        current->end = i + 1;
        current->text += tagged[i].character;
        break;
      }
      [[fallthrough]];
    case TagKind::BEGIN:
      flush();
      current = Entity{i, i + 1, tagged[i].character, tag.label};
      break;
    }
  }
  flush();
  return entities;
}

} // namespace Matching
