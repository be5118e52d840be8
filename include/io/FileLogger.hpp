#pragma once
/** @file  FileLogger.hpp
 *  @brief Buffered append-only text writer for log and transcript files.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdio>
#include <string>
#include <vector>

namespace genesis {
  namespace io {

    /**
 * @class FileLogger
 * @brief RAII wrapper that opens a file, buffers writes, and flushes on demand.
 *
 *  * Always opens in append mode; missing parent directories are created.
 *  * Uses `std::fwrite` in 4 kB chunks.
 */
    class FileLogger {
    public:
      FileLogger() = default;
      ~FileLogger(); ///< flush + fclose

      //---public API------------------------------------------------------
      /** @returns false if path cannot be opened writable. */
      bool open(const std::string& path);

      /** Queues text (caller includes trailing '\n'). Flushes once 4 kB is pending. */
      void write(const std::string& text);

      /** Force-flush buffer to disk; returns true on success. */
      bool flush();

      void close();

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
} // namespace genesis
