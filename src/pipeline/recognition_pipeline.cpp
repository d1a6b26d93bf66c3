#include "recognition_pipeline.hpp"
#include "core/logger.hpp"
#include "utils/scoped_timer.hpp"
#include "utils/thread_safe_queue.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>

RecognitionPipeline::RecognitionPipeline(
    const Matching::AhoCorasick &automaton, PipelineOptions options)
    : automaton_(automaton), options_(options) {
  if (options_.worker_threads == 0)
    options_.worker_threads = 1;
  if (options_.progress_interval == 0)
    options_.progress_interval = 1;
}

RecognizedSentence
RecognitionPipeline::process(const Sentence &sentence) const {
  return {sentence.index, sentence.text, automaton_.recognize(sentence.text)};
}

std::vector<RecognizedSentence> RecognitionPipeline::run(ITextReader &reader) {
  ScopedTimer timer("Entity recognition", LogComponent::CORE);

  ThreadSafeQueue<Sentence> queue(options_.queue_capacity);
  std::vector<RecognizedSentence> results;
  std::mutex results_mutex;

  std::atomic<uint64_t> processed{0};
  std::atomic<bool> failed{false};
  std::exception_ptr first_error;
  std::mutex error_mutex;

  auto record_failure = [&](std::exception_ptr error) {
    {
      std::lock_guard<std::mutex> lock(error_mutex);
      if (!first_error)
        first_error = std::move(error);
    }
    failed = true;
    queue.shutdown();
  };

  auto worker = [&](uint32_t worker_id) {
    LOG(LogLevel::DEBUG, LogComponent::PIPELINE,
        "Worker " << worker_id << " started.");
    uint64_t local_count = 0;

    while (std::optional<Sentence> sentence = queue.wait_and_pop()) {
      if (failed)
        break;
      try {
        RecognizedSentence recognized = process(*sentence);
        {
          std::lock_guard<std::mutex> lock(results_mutex);
          results.push_back(std::move(recognized));
        }
      } catch (...) {
        LOG(LogLevel::ERROR, LogComponent::PIPELINE,
            "Worker " << worker_id << " failed on sentence "
                      << sentence->index);
        record_failure(std::current_exception());
        break;
      }

      local_count++;
      uint64_t done = ++processed;
      if (done % options_.progress_interval == 0)
        LOG(LogLevel::INFO, LogComponent::CORE,
            "Processed " << done << " sentences...");
    }

    LOG(LogLevel::DEBUG, LogComponent::PIPELINE,
        "Worker " << worker_id << " finished. Processed " << local_count
                  << " sentences.");
  };

  std::vector<std::thread> workers;
  workers.reserve(options_.worker_threads);
  for (uint32_t i = 0; i < options_.worker_threads; ++i)
    workers.emplace_back(worker, i);

  try {
    while (!failed) {
      std::vector<Sentence> batch = reader.get_next_batch();
      if (batch.empty())
        break;
      for (auto &sentence : batch)
        if (!queue.push(std::move(sentence)))
          break;
    }
  } catch (...) {
    record_failure(std::current_exception());
  }

  queue.shutdown();
  for (auto &t : workers)
    if (t.joinable())
      t.join();

  if (first_error)
    std::rethrow_exception(first_error);

  std::sort(results.begin(), results.end(),
            [](const RecognizedSentence &a, const RecognizedSentence &b) {
              return a.index < b.index;
            });

  LOG(LogLevel::INFO, LogComponent::CORE,
      "Recognition finished: " << results.size() << " sentences on "
                               << options_.worker_threads << " workers.");
  return results;
}
