#include "bio_writer.hpp"
#include "matching/entity_tagger.hpp"

bool BioWriter::write(const RecognizedSentence &sentence) {
  if (!is_open())
    return false;

  for (const auto &tagged :
       Matching::to_label_sequence(sentence.text, sentence.entities))
    output_stream_ << tagged.character << " "
                   << Matching::tag_to_string(tagged.tag) << "\n";
  output_stream_ << "\n";
  return check_stream();
}
