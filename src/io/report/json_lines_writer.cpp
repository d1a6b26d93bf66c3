#include "json_lines_writer.hpp"
#include "core/logger.hpp"

#include <exception>
#include <string>
#include <utility>

nlohmann::json
JsonLinesWriter::sentence_to_json(const RecognizedSentence &sentence) {
  nlohmann::json j;
  j["index"] = sentence.index;
  j["text"] = sentence.text;

  nlohmann::json entities = nlohmann::json::array();
  for (const auto &entity : sentence.entities) {
    entities.push_back({{"text", entity.text},
                        {"label", entity.label},
                        {"start", entity.start},
                        {"end", entity.end}});
  }
  j["entities"] = std::move(entities);
  return j;
}

bool JsonLinesWriter::write(const RecognizedSentence &sentence) {
  if (!is_open())
    return false;

  try {
    // Invalid UTF-8 is replaced rather than thrown on
    output_stream_ << sentence_to_json(sentence).dump(
                          -1, ' ', false,
                          nlohmann::json::error_handler_t::replace)
                   << "\n";
  } catch (const std::exception &e) {
    LOG(LogLevel::ERROR, LogComponent::IO_REPORT,
        "Exception while serializing sentence " << sentence.index << ": "
                                                << e.what());
    return false;
  }
  return check_stream();
}
