#pragma once

#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

#include "mmap.hpp"
#include "types.hpp"

namespace pbo {

class Reader {
public:
  Reader() = default;
  ~Reader() = default;

  // Delete copy, enable move
  Reader(const Reader &) = delete;
  Reader &operator=(const Reader &) = delete;
  Reader(Reader &&) noexcept = default;
  Reader &operator=(Reader &&) noexcept = default;

  // Open PBO archive from file (memory-mapped)
  // Returns std::nullopt on failure, with the error in outError if provided.
  // An archive without entries fails with ErrorCode::NoEntries.
  static std::optional<Reader> open(const std::filesystem::path &path, Error *outError = nullptr);

  // Entries in header order
  const std::vector<FileEntry> &files() const { return files_; }

  size_t fileCount() const { return files_.size(); }

  // Key/value pairs from the "sreV" block, usually empty
  const Properties &properties() const { return properties_; }

  // Case-insensitive lookup accepting either separator
  // Returns the first matching entry, or nullptr if not found
  const FileEntry *findFile(const std::string &path) const;

  // Extract one entry to destPath, creating parent directories
  // Timestamps are not touched; see extractAll
  bool extract(const FileEntry &entry, const std::filesystem::path &destPath,
               Error *outError = nullptr) const;

  std::optional<std::vector<uint8_t>> extractToMemory(const FileEntry &entry,
                                                      Error *outError = nullptr) const;

  // Zero-copy view of an entry's payload
  // Returns an empty span if the entry runs past the end of the archive
  std::span<const uint8_t> getFileView(const FileEntry &entry) const;

  // Extract every entry under destDir in header order, restoring timestamps and
  // reporting progress after each file. Returns the number of files extracted.
  std::optional<size_t> extractAll(const std::filesystem::path &destDir,
                                   const Options &options = {}, Error *outError = nullptr) const;

  bool isOpen() const;

  void close();

private:
  bool parse(Error *outError);

  bool inBounds(const FileEntry &entry) const;

  // Lowercase with forward slashes for lookup
  static std::string normalizePath(const std::string &path);

  // Stored name to a relative host path; std::nullopt if it would escape the
  // destination directory
  static std::optional<std::filesystem::path> toHostPath(const std::string &name);

  MappedFile mappedFile_;
  std::vector<FileEntry> files_;
  Properties properties_;
  std::unordered_map<std::string, size_t> lookup_; // normalized path -> index
};

} // namespace pbo
