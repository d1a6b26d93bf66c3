#include "analysis/entity_statistics.hpp"
#include "analysis/evaluation.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/sentence.hpp"
#include "io/dictionary/dictionary_loader.hpp"
#include "io/report/base_report_writer.hpp"
#include "io/report/bio_writer.hpp"
#include "io/report/entity_list_writer.hpp"
#include "io/report/json_lines_writer.hpp"
#include "io/report/statistics_report.hpp"
#include "io/text_readers/bio_corpus_reader.hpp"
#include "io/text_readers/file_text_reader.hpp"
#include "matching/aho_corasick.hpp"
#include "pipeline/recognition_pipeline.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

// --- Report writer factory ---
std::vector<std::unique_ptr<IReportWriter>>
create_report_writers(const Config::AppConfig &config) {
  std::vector<std::unique_ptr<IReportWriter>> writers;
  if (!config.results_output_path.empty())
    writers.push_back(
        std::make_unique<EntityListWriter>(config.results_output_path));
  if (!config.bio_output_path.empty())
    writers.push_back(std::make_unique<BioWriter>(config.bio_output_path));
  if (!config.json_output_path.empty())
    writers.push_back(
        std::make_unique<JsonLinesWriter>(config.json_output_path));
  return writers;
}

void write_reports(const Config::AppConfig &config,
                   const std::vector<RecognizedSentence> &results) {
  for (auto &writer : create_report_writers(config)) {
    if (!writer->is_open()) {
      LOG(LogLevel::ERROR, LogComponent::IO_REPORT,
          writer->get_name() << " is not available. Skipping.");
      continue;
    }

    size_t failures = 0;
    for (const auto &sentence : results)
      if (!writer->write(sentence))
        failures++;

    if (failures > 0)
      LOG(LogLevel::ERROR, LogComponent::IO_REPORT,
          writer->get_name() << " failed to write " << failures << " of "
                             << results.size() << " sentences.");
    else
      LOG(LogLevel::INFO, LogComponent::IO_REPORT,
          writer->get_name() << " wrote " << results.size() << " sentences.");
  }
}

void run_evaluation(const std::string &gold_path,
                    const std::vector<RecognizedSentence> &results) {
  try {
    BioCorpusReader gold_reader;
    auto gold = gold_reader.read_file(gold_path);
    if (gold_reader.malformed_lines() > 0)
      LOG(LogLevel::WARN, LogComponent::EVAL,
          gold_reader.malformed_lines()
              << " malformed lines in gold corpus were scored as outside.");
    Evaluation::log_evaluation(Evaluation::evaluate(results, gold));
  } catch (const std::runtime_error &e) {
    LOG(LogLevel::ERROR, LogComponent::EVAL,
        "Evaluation skipped: " << e.what());
  }
}

int main(int argc, char *argv[]) {
  std::ios_base::sync_with_stdio(false); // Potentially faster I/O

  // --- Load Configuration ---
  Config::ConfigManager config_manager;
  std::string config_file_to_load = "config.ini";
  if (argc > 1)
    config_file_to_load = argv[1];
  config_manager.load_configuration(config_file_to_load);

  auto current_config = config_manager.get_config();

  // --- Initialize Logging ---
  LogManager::instance().configure(current_config->logging);

  LOG(LogLevel::INFO, LogComponent::CORE,
      "Dictionary entity recognizer starting up...");
  auto time_start = std::chrono::steady_clock::now();

  // --- Dictionaries and Automaton ---
  DictionaryLoader dictionary_loader(current_config->dictionaries);
  std::vector<DictionaryEntry> entries = dictionary_loader.load();
  if (entries.empty()) {
    LOG(LogLevel::FATAL, LogComponent::CORE,
        "No dictionary entries could be loaded from "
            << current_config->dictionaries.dictionary_dir << ". Exiting.");
    return 1;
  }

  Matching::AhoCorasick automaton;
  DictionaryLoader::build_automaton(entries, automaton);

  // --- Input ---
  std::unique_ptr<ITextReader> text_reader;
  try {
    text_reader =
        std::make_unique<FileTextReader>(current_config->input_text_path);
  } catch (const std::runtime_error &e) {
    LOG(LogLevel::FATAL, LogComponent::CORE, e.what() << ". Exiting.");
    return 1;
  }

  // --- Recognition ---
  PipelineOptions options;
  options.worker_threads = current_config->worker_threads;
  options.progress_interval = current_config->progress_interval;
  RecognitionPipeline pipeline(automaton, options);

  std::vector<RecognizedSentence> results;
  try {
    results = pipeline.run(*text_reader);
  } catch (const std::exception &e) {
    LOG(LogLevel::FATAL, LogComponent::CORE,
        "Recognition aborted: " << e.what());
    return 1;
  }

  // --- Reports ---
  write_reports(*current_config, results);

  EntityStatistics statistics;
  for (const auto &sentence : results)
    statistics.add(sentence.entities);
  StatisticsReport::log_summary(statistics, current_config->top_n_per_label,
                                current_config->top_n_overall);
  if (!current_config->statistics_output_path.empty())
    StatisticsReport::write_file(current_config->statistics_output_path,
                                 statistics);

  if (!current_config->gold_bio_path.empty())
    run_evaluation(current_config->gold_bio_path, results);

  auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                         std::chrono::steady_clock::now() - time_start)
                         .count();

  LOG(LogLevel::INFO, LogComponent::CORE, "---Processing Summary---");
  LOG(LogLevel::INFO, LogComponent::CORE,
      "Sentences processed: " << results.size());
  LOG(LogLevel::INFO, LogComponent::CORE,
      "Entities recognized: " << statistics.total());
  LOG(LogLevel::INFO, LogComponent::CORE,
      "Total processing time: " << duration_ms << " ms");
  if (duration_ms > 0 && !results.empty())
    LOG(LogLevel::INFO, LogComponent::CORE,
        "Throughput: " << (results.size() * 1000 / duration_ms)
                       << " sentences/sec");
  LOG(LogLevel::INFO, LogComponent::CORE,
      "Dictionary entity recognizer finished.");
  return 0;
}
