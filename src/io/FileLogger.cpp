/* @file FileLogger.cpp
 * @brief buffered fwrite wrapper shared by the logger and the interaction transcript
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cstddef>
#include <filesystem>
#include <system_error>
#include <utility>

// GENESIS headers
#include "io/FileLogger.hpp"

using namespace genesis::io;

FileLogger::~FileLogger() { close(); }

FileLogger::FileLogger(FileLogger&& other) noexcept
    : fp_(std::exchange(other.fp_, nullptr)), path_(std::move(other.path_)),
      buffer_(std::move(other.buffer_)) {}

FileLogger& FileLogger::operator=(FileLogger&& other) noexcept {
  if (this != &other) {
    close();
    fp_ = std::exchange(other.fp_, nullptr);
    path_ = std::move(other.path_);
    buffer_ = std::move(other.buffer_);
  }
  return *this;
}

bool FileLogger::open(const std::string& path) {
  close();

  const std::filesystem::path target(path);
  if (target.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(target.parent_path(), ec);
    if (ec)
      return false;
  }

  fp_ = std::fopen(path.c_str(), "a");
  if (!fp_)
    return false;

  path_ = path;
  buffer_.reserve(kChunkSize);
  return true;
}

void FileLogger::write(const std::string& text) {
  if (!fp_)
    return;
  buffer_.insert(buffer_.end(), text.begin(), text.end());
  if (buffer_.size() >= kChunkSize)
    flush();
}

bool FileLogger::flush() {
  if (!fp_)
    return false;

  std::size_t offset = 0;
  while (offset < buffer_.size()) {
    const std::size_t chunk = std::min(kChunkSize, buffer_.size() - offset);
    if (std::fwrite(buffer_.data() + offset, 1, chunk, fp_) != chunk) {
      buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(offset));
      return false;
    }
    offset += chunk;
  }
  buffer_.clear();
  return std::fflush(fp_) == 0;
}

void FileLogger::close() {
  if (!fp_)
    return;
  flush();
  std::fclose(fp_);
  fp_ = nullptr;
}
