#include "statistics_report.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <fstream>
#include <string>

namespace StatisticsReport {

void write(std::ostream &out, const EntityStatistics &stats) {
  out << "Entity frequency statistics\n";
  out << std::string(50, '=') << "\n";

  auto label_totals = stats.label_totals();

  out << "\nTotals per label:\n";
  for (const auto &[label, count] : label_totals)
    out << label << ": " << count << "\n";

  out << "\nTotal entities: " << stats.total() << "\n";
  out << "Distinct entities: " << stats.distinct_entities() << "\n";

  for (const auto &[label, count] : label_totals) {
    out << "\n" << label << " entities by frequency:\n";
    for (const auto &entry : stats.top_entities(label))
      out << "  " << entry.text << ": " << entry.count << "\n";
  }
}

bool write_file(const std::string &file_path, const EntityStatistics &stats) {
  if (!Utils::create_directory_for_file(file_path))
    LOG(LogLevel::WARN, LogComponent::IO_REPORT,
        "Could not create directory for statistics file: " << file_path);
  std::ofstream out(file_path, std::ios::out | std::ios::trunc);
  if (!out.is_open()) {
    LOG(LogLevel::ERROR, LogComponent::IO_REPORT,
        "Could not open statistics file: " << file_path);
    return false;
  }

  write(out, stats);
  out.flush();
  if (!out.good()) {
    LOG(LogLevel::ERROR, LogComponent::IO_REPORT,
        "Failed to write statistics file: " << file_path);
    return false;
  }
  LOG(LogLevel::INFO, LogComponent::IO_REPORT,
      "Statistics written to " << file_path);
  return true;
}

void log_summary(const EntityStatistics &stats, size_t top_n_per_label,
                 size_t top_n_overall) {
  auto label_totals = stats.label_totals();

  LOG(LogLevel::INFO, LogComponent::STATS, "=== Entity frequency summary ===");
  for (const auto &[label, count] : label_totals)
    LOG(LogLevel::INFO, LogComponent::STATS, label << ": " << count);
  LOG(LogLevel::INFO, LogComponent::STATS,
      "Total entities: " << stats.total());

  for (const auto &[label, count] : label_totals) {
    LOG(LogLevel::INFO, LogComponent::STATS,
        "Top " << top_n_per_label << " " << label << " entities:");
    for (const auto &entry : stats.top_entities(label, top_n_per_label))
      LOG(LogLevel::INFO, LogComponent::STATS,
          "  " << entry.text << ": " << entry.count);
  }

  LOG(LogLevel::INFO, LogComponent::STATS,
      "Top " << top_n_overall << " entities overall:");
  for (const auto &entry : stats.top_overall(top_n_overall))
    LOG(LogLevel::INFO, LogComponent::STATS,
        "  " << entry.text << " [" << entry.label << "]: " << entry.count);
}

} // namespace StatisticsReport
