#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "types.hpp"

namespace pbo {

// Forward declarations
class Reader;
class Writer;

// High-level archive interface that combines reading and writing capabilities
class Archive {
public:
  Archive();
  ~Archive();

  // Delete copy, enable move
  Archive(const Archive &) = delete;
  Archive &operator=(const Archive &) = delete;
  Archive(Archive &&) noexcept;
  Archive &operator=(Archive &&) noexcept;

  // Open existing PBO archive for reading
  // Returns std::nullopt on failure, with the error in outError if provided
  static std::optional<Archive> open(const std::filesystem::path &path, Error *outError = nullptr);

  // Create new PBO archive for writing
  static Archive create();

  // Add file to archive (from disk)
  bool addFile(const std::filesystem::path &sourcePath, const std::string &archivePath,
               Error *outError = nullptr);

  // Add file to archive (from memory)
  bool addFile(std::span<const uint8_t> data, const std::string &archivePath, uint32_t timestamp,
               Error *outError = nullptr);

  // Add every regular file under root (writing only)
  std::optional<size_t> addDirectory(const std::filesystem::path &root, Error *outError = nullptr);

  // Write archive to disk
  bool write(const std::filesystem::path &destPath, const Options &options = {},
             Error *outError = nullptr);

  const std::vector<FileEntry> &files() const;

  size_t fileCount() const;

  // Case-insensitive file lookup (only available when reading)
  const FileEntry *findFile(const std::string &path) const;

  // Extract file to disk (only available when reading)
  bool extract(const FileEntry &entry, const std::filesystem::path &destPath,
               Error *outError = nullptr) const;

  // Extract file to memory (only available when reading)
  std::optional<std::vector<uint8_t>> extractToMemory(const FileEntry &entry,
                                                      Error *outError = nullptr) const;

  // Extract every entry under destDir (only available when reading)
  std::optional<size_t> extractAll(const std::filesystem::path &destDir,
                                   const Options &options = {}, Error *outError = nullptr) const;

  // Get file view (zero-copy, only available when reading)
  std::span<const uint8_t> getFileView(const FileEntry &entry) const;

  bool isReading() const { return reader_.get() != nullptr; }

  bool isWriting() const { return writer_.get() != nullptr; }

  bool isOpen() const { return isReading() || isWriting(); }

  void close();

  // Clear all pending files (only available when writing)
  void clear();

private:
  std::unique_ptr<Reader> reader_;
  std::unique_ptr<Writer> writer_;
};

} // namespace pbo
