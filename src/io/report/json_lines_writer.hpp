#ifndef JSON_LINES_WRITER_HPP
#define JSON_LINES_WRITER_HPP

#include "base_report_writer.hpp"

#include <nlohmann/json.hpp>

#include <string>

// One JSON object per sentence and line
class JsonLinesWriter : public FileReportWriter {
public:
  explicit JsonLinesWriter(const std::string &file_path)
      : FileReportWriter(file_path) {}

  bool write(const RecognizedSentence &sentence) override;
  const char *get_name() const override { return "JsonLinesWriter"; }

  static nlohmann::json sentence_to_json(const RecognizedSentence &sentence);
};

#endif // JSON_LINES_WRITER_HPP
