#include "config.hpp"
#include "logger.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace Config {

LogLevel string_to_log_level(const std::string &level_str_raw) {
  std::string level_str = Utils::trim_copy(level_str_raw);
  std::transform(level_str.begin(), level_str.end(), level_str.begin(),
                 ::toupper);
  if (level_str == "TRACE")
    return LogLevel::TRACE;
  if (level_str == "DEBUG")
    return LogLevel::DEBUG;
  if (level_str == "INFO")
    return LogLevel::INFO;
  if (level_str == "WARN")
    return LogLevel::WARN;
  if (level_str == "ERROR")
    return LogLevel::ERROR;
  if (level_str == "FATAL")
    return LogLevel::FATAL;
  return LogLevel::INFO; // A safe default
}

const std::map<std::string, LogComponent> key_to_component_map = {
    {"core", LogComponent::CORE},
    {"config", LogComponent::CONFIG},
    {"io.dictionary", LogComponent::IO_DICTIONARY},
    {"io.reader", LogComponent::IO_READER},
    {"io.report", LogComponent::IO_REPORT},
    {"match.build", LogComponent::MATCH_BUILD},
    {"match.search", LogComponent::MATCH_SEARCH},
    {"pipeline", LogComponent::PIPELINE},
    {"stats", LogComponent::STATS},
    {"eval", LogComponent::EVAL}};

void apply_default_log_levels(LoggingConfig &config) {
  for (const auto &pair : key_to_component_map)
    config.log_levels[pair.second] = LogLevel::WARN;
  config.log_levels[LogComponent::CORE] = LogLevel::INFO;
  // The statistics and evaluation summaries are the program's main output
  config.log_levels[LogComponent::STATS] = LogLevel::INFO;
  config.log_levels[LogComponent::EVAL] = LogLevel::INFO;
}

bool validate_dictionary_config(const DictionaryConfig &config,
                                std::vector<std::string> &errors) {
  bool valid = true;

  if (config.sources.empty()) {
    errors.push_back("At least one dictionary must be configured");
    valid = false;
  }

  std::set<std::string> seen_labels;
  for (const auto &source : config.sources) {
    if (source.label.empty()) {
      errors.push_back("Dictionary label must not be empty");
      valid = false;
      continue;
    }
    if (std::any_of(source.label.begin(), source.label.end(),
                    [](unsigned char ch) { return std::isspace(ch); })) {
      errors.push_back("Dictionary label '" + source.label +
                       "' must not contain whitespace");
      valid = false;
    }
    if (source.label == "O") {
      errors.push_back(
          "Dictionary label 'O' is reserved for the outside tag");
      valid = false;
    }
    if (!seen_labels.insert(source.label).second) {
      errors.push_back("Dictionary label '" + source.label +
                       "' is configured more than once");
      valid = false;
    }
    if (source.path.empty()) {
      errors.push_back("Dictionary file for label '" + source.label +
                       "' must not be empty");
      valid = false;
    }
  }

  return valid;
}

bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors) {
  bool valid = true;

  if (config.input_text_path.empty()) {
    errors.push_back("input_text_path must not be empty");
    valid = false;
  }

  if (config.worker_threads < 1 || config.worker_threads > 256) {
    errors.push_back("worker_threads must be between 1 and 256");
    valid = false;
  }

  if (config.progress_interval < 1) {
    errors.push_back("progress_interval must be at least 1");
    valid = false;
  }

  if (!validate_dictionary_config(config.dictionaries, errors))
    valid = false;

  return valid;
}

bool parse_config_into(const std::string &filepath, AppConfig &config) {
  apply_default_log_levels(config.logging);

  std::cout << "Attempting to load configuration from " << filepath
            << std::endl;
  std::ifstream config_file(filepath);

  if (!config_file.is_open()) {
    std::cerr << "Warning: Could not open config file '" << filepath
              << "'. Using default configuration values." << std::endl;
    return false;
  }

  std::string line;
  std::string current_section;
  // Dictionaries listed in the file replace the built-in defaults
  bool explicit_dictionaries = false;

  int line_num = 0;
  while (std::getline(config_file, line)) {
    line_num++;
    std::string trimmed_line = Utils::trim_copy(line);

    // Skip empty lines and comments
    if (trimmed_line.empty() || trimmed_line[0] == '#' ||
        trimmed_line[0] == ';')
      continue;

    // Section header [SectionName]
    if (trimmed_line[0] == '[' && trimmed_line.back() == ']') {
      current_section =
          Utils::trim_copy(trimmed_line.substr(1, trimmed_line.length() - 2));
      continue;
    }

    // Key-value pair parsing
    size_t delimiter_pos = trimmed_line.find('=');
    if (delimiter_pos == std::string::npos) {
      std::cerr << "Warning (Config Line " << line_num
                << "): Invalid format (missing '='): " << trimmed_line
                << std::endl;
      continue;
    }

    std::string key = Utils::trim_copy(trimmed_line.substr(0, delimiter_pos));
    std::string value =
        Utils::trim_copy(trimmed_line.substr(delimiter_pos + 1));

    if (key.empty()) {
      std::cerr << "Warning (Config Line " << line_num << "): Empty key found."
                << std::endl;
      continue;
    }

    try {
      // Global (non-section) keys
      if (current_section.empty()) {
        if (key == Keys::INPUT_TEXT_PATH)
          config.input_text_path = value;
        else if (key == Keys::RESULTS_OUTPUT_PATH)
          config.results_output_path = value;
        else if (key == Keys::BIO_OUTPUT_PATH)
          config.bio_output_path = value;
        else if (key == Keys::STATISTICS_OUTPUT_PATH)
          config.statistics_output_path = value;
        else if (key == Keys::JSON_OUTPUT_PATH)
          config.json_output_path = value;
        else if (key == Keys::GOLD_BIO_PATH)
          config.gold_bio_path = value;
        else if (key == Keys::WORKER_THREADS)
          config.worker_threads =
              Utils::string_to_number<uint32_t>(value).value_or(
                  config.worker_threads);
        else if (key == Keys::PROGRESS_INTERVAL)
          config.progress_interval =
              Utils::string_to_number<uint64_t>(value).value_or(
                  config.progress_interval);
        else if (key == Keys::TOP_N_PER_LABEL)
          config.top_n_per_label =
              Utils::string_to_number<size_t>(value).value_or(
                  config.top_n_per_label);
        else if (key == Keys::TOP_N_OVERALL)
          config.top_n_overall =
              Utils::string_to_number<size_t>(value).value_or(
                  config.top_n_overall);
        else
          config.custom_settings[key] = value;

        // Dictionary settings
      } else if (current_section == "Dictionaries") {
        if (key == Keys::DICT_DIRECTORY) {
          config.dictionaries.dictionary_dir = value;
        } else {
          if (!explicit_dictionaries) {
            config.dictionaries.sources.clear();
            explicit_dictionaries = true;
          }
          config.dictionaries.sources.push_back({key, value});
        }

        // Logging Settings
      } else if (current_section == "Logging") {
        if (key == Keys::LOGGING_DEFAULT_LEVEL) {
          LogLevel default_level = string_to_log_level(value);
          for (auto &pair : config.logging.log_levels)
            pair.second = default_level;
        } else {
          auto comp_it = key_to_component_map.find(key);
          if (comp_it != key_to_component_map.end())
            config.logging.log_levels[comp_it->second] =
                string_to_log_level(value);
          else if (key.length() > 2 && key.substr(key.length() - 2) == ".*") {
            // Wildcard match, e.g., "match.* = DEBUG"
            std::string prefix = key.substr(0, key.length() - 1);
            for (const auto &pair : key_to_component_map) {
              if (pair.first.rfind(prefix, 0) == 0)
                config.logging.log_levels[pair.second] =
                    string_to_log_level(value);
            }
          } else {
            std::cerr << "Warning (Config Line " << line_num
                      << "): Unknown logging component '" << key << "'"
                      << std::endl;
          }
        }
      } else {
        std::cerr << "Warning (Config Line " << line_num
                  << "): Unknown section '" << current_section << "'"
                  << std::endl;
      }
    } catch (const std::invalid_argument &e) {
      std::cerr << "Warning (Config Line " << line_num
                << "): Invalid value for key '" << key << "': '" << value
                << "' - " << e.what() << std::endl;
    } catch (const std::out_of_range &e) {
      std::cerr << "Warning (Config Line " << line_num
                << "): Value out of range for key '" << key << "': '" << value
                << "' - " << e.what() << std::endl;
    }
  }

  config_file.close();
  std::cout << "Configuration loaded successfully from " << filepath
            << std::endl;
  return true;
}

ConfigManager::ConfigManager() {
  auto defaults = std::make_shared<AppConfig>();
  apply_default_log_levels(defaults->logging);
  current_config_ = defaults;
}

bool ConfigManager::load_configuration(const std::string &filepath) {
  config_filepath_ = filepath;
  auto new_config = std::make_shared<AppConfig>();

  // Use the parsing logic to fill the new config object
  if (!parse_config_into(filepath, *new_config)) {
    std::cerr << "Failed to parse configuration file: " << filepath
              << ". Keeping existing settings." << std::endl;
    return false;
  }

  // Validate the configuration
  std::vector<std::string> validation_errors;
  if (!validate_app_config(*new_config, validation_errors)) {
    std::cerr << "Configuration validation failed:" << std::endl;
    for (const auto &error : validation_errors) {
      std::cerr << "  - " << error << std::endl;
    }
    std::cerr << "Keeping existing settings." << std::endl;
    return false;
  }

  // Atomically swap the pointer
  std::lock_guard<std::mutex> lock(config_mutex_);
  current_config_ = new_config;
  std::cout << "Configuration loaded and validated successfully from "
            << config_filepath_ << std::endl;
  return true;
}

std::shared_ptr<const AppConfig> ConfigManager::get_config() const {
  std::lock_guard<std::mutex> lock(config_mutex_);
  return current_config_;
}

} // namespace Config
