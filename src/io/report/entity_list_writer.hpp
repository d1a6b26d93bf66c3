#ifndef ENTITY_LIST_WRITER_HPP
#define ENTITY_LIST_WRITER_HPP

#include "base_report_writer.hpp"

#include <string>

// Human readable listing: the sentence, then one line per entity
class EntityListWriter : public FileReportWriter {
public:
  explicit EntityListWriter(const std::string &file_path)
      : FileReportWriter(file_path) {}

  bool write(const RecognizedSentence &sentence) override;
  const char *get_name() const override { return "EntityListWriter"; }
};

#endif // ENTITY_LIST_WRITER_HPP
