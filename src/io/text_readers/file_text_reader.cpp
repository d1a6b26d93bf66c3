#include "file_text_reader.hpp"
#include "core/logger.hpp"
#include "utils/utf8.hpp"

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

FileTextReader::FileTextReader(const std::string &filepath, size_t batch_size)
    : batch_size_(batch_size == 0 ? DEFAULT_BATCH_SIZE : batch_size) {
  text_file_stream_.open(filepath);
  if (!is_open()) {
    LOG(LogLevel::FATAL, LogComponent::IO_READER,
        "Failed to open input text file: " << filepath);
    throw std::runtime_error("Failed to open input text file: " + filepath);
  }
  LOG(LogLevel::INFO, LogComponent::IO_READER,
      "Successfully opened input text file: " << filepath);
}

FileTextReader::~FileTextReader() {
  if (text_file_stream_.is_open())
    text_file_stream_.close();
  LOG(LogLevel::DEBUG, LogComponent::IO_READER,
      "FileTextReader closed. Lines read: " << line_number_ << ", sentences: "
                                            << sentence_count_);
}

bool FileTextReader::is_open() const { return text_file_stream_.is_open(); }

std::vector<Sentence> FileTextReader::get_next_batch() {
  std::vector<Sentence> batch;
  if (!is_open())
    return batch;

  batch.reserve(batch_size_);
  std::string line;

  while (batch.size() < batch_size_ && std::getline(text_file_stream_, line)) {
    std::string_view view = line;
    if (line_number_ == 0)
      view = Utils::strip_utf8_bom(view);
    line_number_++;

    std::string text = Utils::utf8_trim(view);
    if (text.empty())
      continue;
    batch.push_back({sentence_count_++, std::move(text)});
  }

  LOG(LogLevel::DEBUG, LogComponent::IO_READER,
      "Read " << batch.size() << " sentences, now at line " << line_number_);
  return batch;
}
