#ifndef BIO_CORPUS_READER_HPP
#define BIO_CORPUS_READER_HPP

#include "core/sentence.hpp"

#include <cstdint>
#include <istream>
#include <string>
#include <vector>

// Reads a character-per-line BIO corpus ("<char> <tag>", sentences separated
// by blank lines) back into sentences with their entities
class BioCorpusReader {
public:
  // Throws std::runtime_error when the file cannot be opened
  std::vector<RecognizedSentence> read_file(const std::string &filepath);

  std::vector<RecognizedSentence> read(std::istream &in);

  // Lines whose tag could not be parsed during the last read; those
  // characters are treated as outside any entity
  uint64_t malformed_lines() const { return malformed_lines_; }

private:
  uint64_t malformed_lines_ = 0;
};

#endif // BIO_CORPUS_READER_HPP
