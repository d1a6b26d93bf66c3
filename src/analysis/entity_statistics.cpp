#include "entity_statistics.hpp"

#include <algorithm>

namespace {

void rank(std::vector<EntityStatistics::EntityCount> &ranked, size_t limit) {
  std::sort(ranked.begin(), ranked.end(),
            [](const EntityStatistics::EntityCount &a,
               const EntityStatistics::EntityCount &b) {
              if (a.count != b.count)
                return a.count > b.count;
              if (a.text != b.text)
                return a.text < b.text;
              return a.label < b.label;
            });
  if (limit > 0 && ranked.size() > limit)
    ranked.resize(limit);
}

} // namespace

void EntityStatistics::add(const std::vector<Matching::Entity> &entities) {
  for (const auto &entity : entities) {
    counts_[{entity.text, entity.label}]++;
    label_totals_[entity.label]++;
    total_++;
  }
}

void EntityStatistics::merge(const EntityStatistics &other) {
  for (const auto &[key, count] : other.counts_)
    counts_[key] += count;
  for (const auto &[label, count] : other.label_totals_)
    label_totals_[label] += count;
  total_ += other.total_;
}

uint64_t EntityStatistics::count_of(const std::string &text,
                                    const std::string &label) const {
  auto it = counts_.find({text, label});
  return it == counts_.end() ? 0 : it->second;
}

std::vector<std::pair<std::string, uint64_t>>
EntityStatistics::label_totals() const {
  std::vector<std::pair<std::string, uint64_t>> totals(label_totals_.begin(),
                                                       label_totals_.end());
  // label_totals_ is already in label order, so a stable sort keeps it for
  // equal counts
  std::stable_sort(totals.begin(), totals.end(),
                   [](const auto &a, const auto &b) {
                     return a.second > b.second;
                   });
  return totals;
}

std::vector<EntityStatistics::EntityCount>
EntityStatistics::top_entities(const std::string &label, size_t limit) const {
  std::vector<EntityCount> ranked;
  for (const auto &[key, count] : counts_)
    if (key.second == label)
      ranked.push_back({key.first, key.second, count});
  rank(ranked, limit);
  return ranked;
}

std::vector<EntityStatistics::EntityCount>
EntityStatistics::top_overall(size_t limit) const {
  std::vector<EntityCount> ranked;
  ranked.reserve(counts_.size());
  for (const auto &[key, count] : counts_)
    ranked.push_back({key.first, key.second, count});
  rank(ranked, limit);
  return ranked;
}
