#ifndef SENTENCE_HPP
#define SENTENCE_HPP

#include "matching/entity.hpp"

#include <cstddef>
#include <string>
#include <vector>

// One unit of input text. `index` is its position in the source, from 0
struct Sentence {
  size_t index = 0;
  std::string text;
};

struct RecognizedSentence {
  size_t index = 0;
  std::string text;
  std::vector<Matching::Entity> entities;
};

#endif // SENTENCE_HPP
