#ifndef BASE_REPORT_WRITER_HPP
#define BASE_REPORT_WRITER_HPP

#include "core/sentence.hpp"

#include <fstream>
#include <string>

class IReportWriter {
public:
  virtual ~IReportWriter() = default;
  virtual bool write(const RecognizedSentence &sentence) = 0;
  virtual const char *get_name() const = 0;
  virtual bool is_open() const = 0;
};

// Owns the output stream shared by the file based writers. The file is
// truncated on open; missing parent directories are created.
class FileReportWriter : public IReportWriter {
public:
  explicit FileReportWriter(const std::string &file_path);
  ~FileReportWriter() override;

  bool is_open() const override { return output_stream_.is_open(); }
  const std::string &path() const { return output_path_; }

protected:
  // Logs and returns false if the stream went bad after a write
  bool check_stream();

  std::string output_path_;
  std::ofstream output_stream_;
};

#endif // BASE_REPORT_WRITER_HPP
