#pragma once
/** @file  FileLogger.hpp
 *  @brief Buffered CSV writer for recordings and run metadata on the host FS.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdio>
#include <string>
#include <vector>

namespace vsweep {
  namespace io {

    enum class OpenMode {
      Append,  ///< baseline files grow across several recording calls
      Truncate ///< per-sweep-point files start empty
    };

    /**
 * @class FileLogger
 * @brief RAII wrapper that opens a file, buffers writes, and flushes on demand.
 *
 *  * Intended for run recordings (10 kB – 100 MB).
 *  * Uses `std::fwrite` in 4 kB chunks; `write()` throws `RecordingIOError`
 *    when a chunk cannot be written.
 *  * Virtual so tests can capture rows without touching disk.
 */
    class FileLogger {
    public:
      FileLogger() = default;
      virtual ~FileLogger(); ///< flush + fclose

      //---public API------------------------------------------------------
      /** @returns false if path cannot be opened writable. */
      virtual bool open(const std::string& path, OpenMode mode);

      /** Queues one CSV line (caller includes trailing '\n'). */
      virtual void write(const std::string& csv);

      /** Force-flush buffer to disk; returns true on success. */
      virtual bool flush();

      /** Flush + fclose; returns false if the final flush failed. */
      virtual bool close();

      bool isOpen() const { return fp_ != nullptr; }
      const std::string& path() const { return path_; }

      //---non-copyable, move-enabled---------------------------------------
      FileLogger(const FileLogger&) = delete;
      FileLogger& operator=(const FileLogger&) = delete;
      FileLogger(FileLogger&& other) noexcept;
      FileLogger& operator=(FileLogger&& other) noexcept;

    private:
      static constexpr std::size_t kChunkSize = 4096;

      FILE* fp_{ nullptr };
      std::string path_;
      std::vector<char> buffer_;
    };

  } // namespace io
} // namespace vsweep
