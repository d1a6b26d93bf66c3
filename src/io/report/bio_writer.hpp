#ifndef BIO_WRITER_HPP
#define BIO_WRITER_HPP

#include "base_report_writer.hpp"

#include <string>

// "<char> <tag>" per code point, a blank line after each sentence. The
// output can be read back with BioCorpusReader.
class BioWriter : public FileReportWriter {
public:
  explicit BioWriter(const std::string &file_path)
      : FileReportWriter(file_path) {}

  bool write(const RecognizedSentence &sentence) override;
  const char *get_name() const override { return "BioWriter"; }
};

#endif // BIO_WRITER_HPP
