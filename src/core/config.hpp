#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

enum class LogLevel;
enum class LogComponent;

namespace Config {

namespace Keys {

// General Settings
constexpr const char *INPUT_TEXT_PATH = "input_text_path";
constexpr const char *RESULTS_OUTPUT_PATH = "results_output_path";
constexpr const char *BIO_OUTPUT_PATH = "bio_output_path";
constexpr const char *STATISTICS_OUTPUT_PATH = "statistics_output_path";
constexpr const char *JSON_OUTPUT_PATH = "json_output_path";
constexpr const char *GOLD_BIO_PATH = "gold_bio_path";
constexpr const char *WORKER_THREADS = "worker_threads";
constexpr const char *PROGRESS_INTERVAL = "progress_interval";
constexpr const char *TOP_N_PER_LABEL = "top_n_per_label";
constexpr const char *TOP_N_OVERALL = "top_n_overall";

// Dictionary Settings; any other key in the section is a label
constexpr const char *DICT_DIRECTORY = "dictionary_dir";

// Logging Settings
constexpr const char *LOGGING_DEFAULT_LEVEL = "default_level";
} // namespace Keys

struct LoggingConfig {
  std::map<LogComponent, LogLevel> log_levels;
};

struct DictionarySource {
  std::string label;
  std::string path;
};

struct DictionaryConfig {
  std::string dictionary_dir = "data/entitydocs";
  // Loaded in order; a text present in several dictionaries keeps the label
  // of the last one
  std::vector<DictionarySource> sources = {{"LOC", "LOCdoc.txt"},
                                           {"PER", "PERdoc.txt"},
                                           {"ORG", "ORGdoc.txt"}};
};

struct AppConfig {
  std::string input_text_path = "data/MSRA/originaltext.txt";
  std::string results_output_path = "data/MSRA/ner_results.txt";
  std::string bio_output_path = "data/MSRA/ner_bio_results.txt";
  std::string statistics_output_path = "data/MSRA/entity_statistics.txt";
  std::string json_output_path;
  std::string gold_bio_path;

  uint32_t worker_threads = 4;
  uint64_t progress_interval = 100;
  size_t top_n_per_label = 10;
  size_t top_n_overall = 20;

  DictionaryConfig dictionaries;
  LoggingConfig logging;

  std::unordered_map<std::string, std::string> custom_settings;

  AppConfig() = default;
};

LogLevel string_to_log_level(const std::string &level_str_raw);

// Everything at WARN except CORE, STATS and EVAL, which report at INFO
void apply_default_log_levels(LoggingConfig &config);

// Validation functions for configuration parameters
bool validate_dictionary_config(const DictionaryConfig &config,
                                std::vector<std::string> &errors);
bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors);

bool parse_config_into(const std::string &filepath, AppConfig &config);

class ConfigManager {
public:
  ConfigManager();
  bool load_configuration(const std::string &filepath);
  std::shared_ptr<const AppConfig> get_config() const;

private:
  std::string config_filepath_;
  std::shared_ptr<const AppConfig> current_config_;
  mutable std::mutex config_mutex_;
};

} // namespace Config

#endif // CONFIG_HPP
