#ifndef ENTITY_STATISTICS_HPP
#define ENTITY_STATISTICS_HPP

#include "matching/entity.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

// Frequency counts of recognized entities. Labels are treated as opaque
// strings; every ranking breaks count ties alphabetically so reports are
// reproducible.
class EntityStatistics {
public:
  struct EntityCount {
    std::string text;
    std::string label;
    uint64_t count = 0;
  };

  void add(const std::vector<Matching::Entity> &entities);
  void merge(const EntityStatistics &other);

  uint64_t total() const { return total_; }
  uint64_t distinct_entities() const { return counts_.size(); }
  uint64_t count_of(const std::string &text, const std::string &label) const;

  // (label, count), highest count first
  std::vector<std::pair<std::string, uint64_t>> label_totals() const;

  // Entities of one label, highest count first. `limit` 0 returns all
  std::vector<EntityCount> top_entities(const std::string &label,
                                        size_t limit = 0) const;

  // Entities of every label, highest count first. `limit` 0 returns all
  std::vector<EntityCount> top_overall(size_t limit = 0) const;

private:
  // Keyed by (text, label)
  std::map<std::pair<std::string, std::string>, uint64_t> counts_;
  std::map<std::string, uint64_t> label_totals_;
  uint64_t total_ = 0;
};

#endif // ENTITY_STATISTICS_HPP
