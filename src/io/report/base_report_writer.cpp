#include "base_report_writer.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

FileReportWriter::FileReportWriter(const std::string &file_path)
    : output_path_(file_path) {
  if (output_path_.empty())
    return;

  if (!Utils::create_directory_for_file(output_path_))
    LOG(LogLevel::WARN, LogComponent::IO_REPORT,
        "Could not create directory for report file: " << output_path_);
  output_stream_.open(output_path_, std::ios::out | std::ios::trunc);
  if (!output_stream_.is_open())
    LOG(LogLevel::ERROR, LogComponent::IO_REPORT,
        "Could not open report file: " << output_path_);
}

FileReportWriter::~FileReportWriter() {
  if (output_stream_.is_open()) {
    output_stream_.flush();
    output_stream_.close();
    LOG(LogLevel::TRACE, LogComponent::IO_REPORT,
        "Closed report file: " << output_path_);
  }
}

bool FileReportWriter::check_stream() {
  if (output_stream_.good())
    return true;
  LOG(LogLevel::ERROR, LogComponent::IO_REPORT,
      "Failed to write to report file: " << output_path_);
  return false;
}
