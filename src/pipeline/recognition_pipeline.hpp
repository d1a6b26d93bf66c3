#ifndef RECOGNITION_PIPELINE_HPP
#define RECOGNITION_PIPELINE_HPP

#include "core/sentence.hpp"
#include "io/text_readers/base_text_reader.hpp"
#include "matching/aho_corasick.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

struct PipelineOptions {
  uint32_t worker_threads = 4;
  uint64_t progress_interval = 100;
  size_t queue_capacity = 4096;
};

// Runs recognize() over every sentence of a reader on a pool of workers that
// share one compiled automaton.
class RecognitionPipeline {
public:
  RecognitionPipeline(const Matching::AhoCorasick &automaton,
                      PipelineOptions options);

  // Results are sorted by sentence index, so the output does not depend on
  // the worker count. The first exception thrown by a worker or by the
  // reader is rethrown after every thread has been joined.
  std::vector<RecognizedSentence> run(ITextReader &reader);

  // Recognizes a single sentence on the calling thread
  RecognizedSentence process(const Sentence &sentence) const;

private:
  const Matching::AhoCorasick &automaton_;
  PipelineOptions options_;
};

#endif // RECOGNITION_PIPELINE_HPP
