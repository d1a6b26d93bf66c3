#include "utils.hpp"

#include <filesystem>
#include <string>
#include <system_error>

namespace Utils {

bool create_directory_for_file(const std::string &filepath) {
  std::filesystem::path parent = std::filesystem::path(filepath).parent_path();
  if (parent.empty())
    return true;

  std::error_code ec;
  if (std::filesystem::exists(parent, ec))
    return true;
  std::filesystem::create_directories(parent, ec);
  return !ec;
}

std::string resolve_path(const std::string &directory,
                         const std::string &filename) {
  std::filesystem::path file_path(filename);
  if (directory.empty() || file_path.is_absolute())
    return filename;
  return (std::filesystem::path(directory) / file_path).string();
}

} // namespace Utils
