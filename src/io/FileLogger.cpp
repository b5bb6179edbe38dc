/* @file FileLogger.cpp
 * @brief chunked fwrite CSV sink
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cerrno>
#include <cstring>
#include <utility>

// 3rd-party headers
#include <spdlog/spdlog.h>

// VibroSweep headers
#include "core/Errors.hpp"
#include "io/FileLogger.hpp"

using namespace vsweep::io;

FileLogger::~FileLogger() {
  if (fp_ && !FileLogger::close())
    spdlog::warn("[FileLogger] {} not fully flushed on close", path_);
}

FileLogger::FileLogger(FileLogger&& other) noexcept
    : fp_(std::exchange(other.fp_, nullptr)), path_(std::move(other.path_)),
      buffer_(std::move(other.buffer_)) {}

FileLogger& FileLogger::operator=(FileLogger&& other) noexcept {
  if (this != &other) {
    if (fp_ && !FileLogger::close())
      spdlog::warn("[FileLogger] {} not fully flushed on close", path_);
    fp_ = std::exchange(other.fp_, nullptr);
    path_ = std::move(other.path_);
    buffer_ = std::move(other.buffer_);
  }
  return *this;
}

bool FileLogger::open(const std::string& path, OpenMode mode) {
  if (fp_ && !close())
    return false;

  fp_ = std::fopen(path.c_str(), mode == OpenMode::Append ? "ab" : "wb");
  if (!fp_) {
    spdlog::error("[FileLogger] cannot open {}: {}", path, std::strerror(errno));
    return false;
  }
  path_ = path;
  buffer_.clear();
  buffer_.reserve(kChunkSize);
  return true;
}

void FileLogger::write(const std::string& csv) {
  if (!fp_)
    throw vsweep::core::RecordingIOError("[FileLogger] write to closed file " + path_);

  buffer_.insert(buffer_.end(), csv.begin(), csv.end());
  if (buffer_.size() >= kChunkSize && !flush())
    throw vsweep::core::RecordingIOError("[FileLogger] write failed: " + path_);
}

bool FileLogger::flush() {
  if (!fp_)
    return false;

  if (!buffer_.empty()) {
    const std::size_t n = std::fwrite(buffer_.data(), 1, buffer_.size(), fp_);
    if (n != buffer_.size()) {
      spdlog::error("[FileLogger] short write to {}: {}", path_, std::strerror(errno));
      buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(n));
      return false;
    }
    buffer_.clear();
  }
  return std::fflush(fp_) == 0;
}

bool FileLogger::close() {
  if (!fp_)
    return true;

  const bool flushed = flush();
  const bool closed = std::fclose(fp_) == 0;
  fp_ = nullptr;
  buffer_.clear();
  return flushed && closed;
}
