#include "entity_list_writer.hpp"

#include <string>

bool EntityListWriter::write(const RecognizedSentence &sentence) {
  if (!is_open())
    return false;

  output_stream_ << "Sentence " << sentence.index + 1 << ": " << sentence.text
                 << "\n";
  output_stream_ << "Entities:\n";
  for (const auto &entity : sentence.entities)
    output_stream_ << "  " << entity.text << " - " << entity.label
                   << " (span: " << entity.start << "-" << entity.end << ")\n";
  output_stream_ << std::string(50, '-') << "\n";
  return check_stream();
}
