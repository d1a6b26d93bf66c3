#ifndef STATISTICS_REPORT_HPP
#define STATISTICS_REPORT_HPP

#include "analysis/entity_statistics.hpp"

#include <cstddef>
#include <ostream>
#include <string>

namespace StatisticsReport {

// Totals per label, grand total, then the full frequency ranking of every
// label
void write(std::ostream &out, const EntityStatistics &stats);

// Returns false (and logs) when the file cannot be written
bool write_file(const std::string &file_path, const EntityStatistics &stats);

// Console summary through the logger: totals, top entities per label and
// overall
void log_summary(const EntityStatistics &stats, size_t top_n_per_label,
                 size_t top_n_overall);

} // namespace StatisticsReport

#endif // STATISTICS_REPORT_HPP
