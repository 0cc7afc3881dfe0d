#pragma once

#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "types.hpp"

namespace pbo {

class Writer {
public:
  Writer() = default;
  ~Writer() = default;

  // Delete copy, enable move
  Writer(const Writer &) = delete;
  Writer &operator=(const Writer &) = delete;
  Writer(Writer &&) noexcept = default;
  Writer &operator=(Writer &&) noexcept = default;

  // Add file to archive from disk
  // The archivePath is stored with backslash separators; size and modification
  // time are read when the archive is written
  bool addFile(const std::filesystem::path &sourcePath, const std::string &archivePath,
               Error *outError = nullptr);

  // Add file to archive from memory
  bool addFile(std::span<const uint8_t> data, const std::string &archivePath, uint32_t timestamp,
               Error *outError = nullptr);

  // Add every regular file under root, ordered by stored name
  // Returns the number of files added; fails with ErrorCode::EmptySource if none
  std::optional<size_t> addDirectory(const std::filesystem::path &root, Error *outError = nullptr);

  // Write the archive in one pass, reporting progress after each file's bytes
  // On failure a partially written file may remain at destPath
  bool write(const std::filesystem::path &destPath, const Options &options = {},
             Error *outError = nullptr);

  // Clear all files
  void clear();

  // Entries as written by the last successful write()
  const std::vector<FileEntry> &files() const { return entries_; }

  // Get number of files to be written
  size_t fileCount() const { return pendingFiles_.size(); }

  // Backslash separators, ASCII only: the exact name stored in the header
  static std::string normalizeArchivePath(const std::string &path);

private:
  bool isDuplicate(const std::string &archivePath) const;

  struct PendingFile {
    std::string archivePath;          // Normalized stored name
    std::filesystem::path sourcePath; // Empty if from memory
    std::vector<uint8_t> data;        // File data if from memory
    uint32_t timestamp = 0;           // Used for in-memory files only
    bool fromDisk = false;
  };

  std::vector<PendingFile> pendingFiles_;
  std::vector<FileEntry> entries_;
};

} // namespace pbo
