#include "bio_corpus_reader.hpp"
#include "core/logger.hpp"
#include "matching/entity_tagger.hpp"
#include "utils/utils.hpp"

#include <fstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace {
RecognizedSentence
finish_sentence(size_t index, std::vector<Matching::TaggedChar> &tagged) {
  RecognizedSentence sentence;
  sentence.index = index;
  for (const auto &tagged_char : tagged)
    sentence.text += tagged_char.character;
  sentence.entities = Matching::from_label_sequence(tagged);
  tagged.clear();
  return sentence;
}
} // namespace

std::vector<RecognizedSentence> BioCorpusReader::read(std::istream &in) {
  std::vector<RecognizedSentence> sentences;
  std::vector<Matching::TaggedChar> tagged;
  malformed_lines_ = 0;

  std::string line;
  uint64_t line_num = 0;
  while (std::getline(in, line)) {
    line_num++;
    // Trailing whitespace (a CR included) belongs to no cell
    Utils::rtrim_inplace(line);

    if (line.empty()) {
      if (!tagged.empty())
        sentences.push_back(finish_sentence(sentences.size(), tagged));
      continue;
    }

    // The tag follows the last separator. The character cell is taken as is,
    // since a space in the text is written as "  O"
    size_t separator = line.find_last_of(" \t");
    Matching::TaggedChar tagged_char;
    if (separator == std::string::npos || separator == 0) {
      malformed_lines_++;
      LOG(LogLevel::WARN, LogComponent::IO_READER,
          "BIO line " << line_num << " has no tag: '" << line << "'");
      tagged_char.character = Utils::trim_copy(line);
    } else {
      tagged_char.character = line.substr(0, separator);
      auto tag = Matching::parse_tag(line.substr(separator + 1));
      if (tag) {
        tagged_char.tag = std::move(*tag);
      } else {
        malformed_lines_++;
        LOG(LogLevel::WARN, LogComponent::IO_READER,
            "BIO line " << line_num << " has an unknown tag: '"
                        << line.substr(separator + 1) << "'");
      }
    }
    tagged.push_back(std::move(tagged_char));
  }
  if (!tagged.empty())
    sentences.push_back(finish_sentence(sentences.size(), tagged));

  return sentences;
}

std::vector<RecognizedSentence>
BioCorpusReader::read_file(const std::string &filepath) {
  std::ifstream in(filepath);
  if (!in.is_open()) {
    LOG(LogLevel::ERROR, LogComponent::IO_READER,
        "Failed to open BIO corpus: " << filepath);
    throw std::runtime_error("Failed to open BIO corpus: " + filepath);
  }

  auto sentences = read(in);
  LOG(LogLevel::INFO, LogComponent::IO_READER,
      "Read " << sentences.size() << " gold sentences from " << filepath);
  return sentences;
}
