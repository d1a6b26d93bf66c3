#ifndef FILE_TEXT_READER_HPP
#define FILE_TEXT_READER_HPP

#include "base_text_reader.hpp"

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

// Reads one sentence per non-blank line of a UTF-8 text file
class FileTextReader : public ITextReader {
public:
  explicit FileTextReader(const std::string &filepath,
                          size_t batch_size = DEFAULT_BATCH_SIZE);
  ~FileTextReader() override;

  std::vector<Sentence> get_next_batch() override;
  bool is_open() const;

  uint64_t sentences_read() const { return sentence_count_; }

  static constexpr size_t DEFAULT_BATCH_SIZE = 1000;

private:
  std::ifstream text_file_stream_;
  uint64_t line_number_ = 0;
  uint64_t sentence_count_ = 0;
  size_t batch_size_;
};

#endif // FILE_TEXT_READER_HPP
