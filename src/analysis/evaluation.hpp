#ifndef EVALUATION_HPP
#define EVALUATION_HPP

#include "core/sentence.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace Evaluation {

struct Score {
  uint64_t true_positives = 0;
  uint64_t predicted = 0;
  uint64_t gold = 0;

  // 0 when there is nothing to divide by
  double precision() const;
  double recall() const;
  double f1() const;
};

struct EvaluationResult {
  Score overall;
  std::map<std::string, Score> per_label;
  size_t sentences_scored = 0;
};

// Exact span scoring: a predicted entity counts when a gold entity of the
// same sentence has identical start, end and label. Sentences are paired by
// position; only the common prefix is scored when the counts differ.
EvaluationResult evaluate(const std::vector<RecognizedSentence> &predicted,
                          const std::vector<RecognizedSentence> &gold);

void log_evaluation(const EvaluationResult &result);

} // namespace Evaluation

#endif // EVALUATION_HPP
