#include "evaluation.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <iomanip>
#include <set>
#include <tuple>

namespace Evaluation {

namespace {

using SpanKey = std::tuple<size_t, size_t, std::string>;

double safe_ratio(uint64_t numerator, uint64_t denominator) {
  return denominator == 0 ? 0.0
                          : static_cast<double>(numerator) /
                                static_cast<double>(denominator);
}

} // namespace

double Score::precision() const { return safe_ratio(true_positives, predicted); }

double Score::recall() const { return safe_ratio(true_positives, gold); }

double Score::f1() const {
  double p = precision();
  double r = recall();
  return (p + r) == 0.0 ? 0.0 : 2.0 * p * r / (p + r);
}

EvaluationResult evaluate(const std::vector<RecognizedSentence> &predicted,
                          const std::vector<RecognizedSentence> &gold) {
  EvaluationResult result;

  if (predicted.size() != gold.size())
    LOG(LogLevel::WARN, LogComponent::EVAL,
        "Sentence count mismatch: " << predicted.size() << " predicted vs "
                                    << gold.size()
                                    << " gold. Scoring the common prefix.");

  size_t common = std::min(predicted.size(), gold.size());
  for (size_t i = 0; i < common; ++i) {
    std::set<SpanKey> gold_spans;
    for (const auto &entity : gold[i].entities) {
      gold_spans.emplace(entity.start, entity.end, entity.label);
      result.per_label[entity.label].gold++;
      result.overall.gold++;
    }

    for (const auto &entity : predicted[i].entities) {
      Score &label_score = result.per_label[entity.label];
      label_score.predicted++;
      result.overall.predicted++;
      if (gold_spans.erase({entity.start, entity.end, entity.label}) > 0) {
        label_score.true_positives++;
        result.overall.true_positives++;
      }
    }
  }
  result.sentences_scored = common;
  return result;
}

void log_evaluation(const EvaluationResult &result) {
  LOG(LogLevel::INFO, LogComponent::EVAL,
      "Evaluated " << result.sentences_scored << " sentences. Overall P="
                   << std::fixed << std::setprecision(4)
                   << result.overall.precision()
                   << " R=" << result.overall.recall()
                   << " F1=" << result.overall.f1());
  for (const auto &[label, score] : result.per_label)
    LOG(LogLevel::INFO, LogComponent::EVAL,
        "  " << label << ": P=" << std::fixed << std::setprecision(4)
             << score.precision() << " R=" << score.recall()
             << " F1=" << score.f1() << " (tp=" << score.true_positives
             << ", predicted=" << score.predicted << ", gold=" << score.gold
             << ")");
}

} // namespace Evaluation
