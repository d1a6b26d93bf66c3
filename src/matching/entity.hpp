#ifndef ENTITY_HPP
#define ENTITY_HPP

#include <cstddef>
#include <ostream>
#include <string>

namespace Matching {

// A raw pattern occurrence. Offsets count code points, `end` is exclusive
struct Match {
  size_t start = 0;
  size_t end = 0;
  std::string text; // UTF-8

  size_t length() const { return end - start; }
};

// A resolved, labeled, non-overlapping span
struct Entity {
  size_t start = 0;
  size_t end = 0;
  std::string text; // UTF-8
  std::string label;

  size_t length() const { return end - start; }
};

inline bool operator==(const Match &lhs, const Match &rhs) {
  return lhs.start == rhs.start && lhs.end == rhs.end && lhs.text == rhs.text;
}

inline bool operator==(const Entity &lhs, const Entity &rhs) {
  return lhs.start == rhs.start && lhs.end == rhs.end &&
         lhs.text == rhs.text && lhs.label == rhs.label;
}

inline std::ostream &operator<<(std::ostream &os, const Match &match) {
  return os << "Match{" << match.text << ", " << match.start << "-"
            << match.end << "}";
}

inline std::ostream &operator<<(std::ostream &os, const Entity &entity) {
  return os << "Entity{" << entity.text << ", " << entity.label << ", "
            << entity.start << "-" << entity.end << "}";
}

} // namespace Matching

#endif // ENTITY_HPP
