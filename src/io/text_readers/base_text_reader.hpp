#ifndef BASE_TEXT_READER_HPP
#define BASE_TEXT_READER_HPP

#include "core/sentence.hpp"

#include <vector>

class ITextReader {
public:
  virtual ~ITextReader() = default;

  // Fetches the next batch of sentences
  // The definition of a "batch" is implementation-specific
  // Returns an empty vector once the source is exhausted
  virtual std::vector<Sentence> get_next_batch() = 0;
};

#endif // BASE_TEXT_READER_HPP
