#include <algorithm>
#include <cstring>
#include <format>
#include <fstream>
#include <limits>

#include <pbo/codec.hpp>
#include <pbo/filetime.hpp>
#include <pbo/mmap.hpp>
#include <pbo/writer.hpp>

namespace pbo {

bool Writer::addFile(const std::filesystem::path &sourcePath, const std::string &archivePath,
                     Error *outError) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(sourcePath, ec)) {
    setError(outError, ErrorCode::IoError,
             std::format("Source file does not exist: {}", sourcePath.string()));
    return false;
  }

  std::string normalized = normalizeArchivePath(archivePath);
  if (normalized.empty()) {
    setError(outError, ErrorCode::UnsafePath,
             std::format("Archive path for {} is empty", sourcePath.string()));
    return false;
  }

  if (isDuplicate(normalized)) {
    setError(outError, ErrorCode::DuplicateEntry,
             std::format("Duplicate file path in archive: {}", normalized));
    return false;
  }

  PendingFile pending;
  pending.archivePath = std::move(normalized);
  pending.sourcePath = sourcePath;
  pending.fromDisk = true;
  pendingFiles_.push_back(std::move(pending));

  return true;
}

bool Writer::addFile(std::span<const uint8_t> data, const std::string &archivePath,
                     uint32_t timestamp, Error *outError) {
  std::string normalized = normalizeArchivePath(archivePath);
  if (normalized.empty()) {
    setError(outError, ErrorCode::UnsafePath, "Archive path is empty");
    return false;
  }

  if (isDuplicate(normalized)) {
    setError(outError, ErrorCode::DuplicateEntry,
             std::format("Duplicate file path in archive: {}", normalized));
    return false;
  }

  if (data.size() > std::numeric_limits<uint32_t>::max()) {
    setError(outError, ErrorCode::EntryTooLarge,
             std::format("{} is {} bytes, larger than a PBO entry can hold", normalized,
                         data.size()));
    return false;
  }

  PendingFile pending;
  pending.archivePath = std::move(normalized);
  pending.data.assign(data.begin(), data.end());
  pending.timestamp = timestamp;
  pendingFiles_.push_back(std::move(pending));

  return true;
}

std::optional<size_t> Writer::addDirectory(const std::filesystem::path &root, Error *outError) {
  std::error_code ec;
  if (!std::filesystem::is_directory(root, ec)) {
    setError(outError, ErrorCode::IoError,
             std::format("Source directory does not exist: {}", root.string()));
    return std::nullopt;
  }

  // (stored name, source path)
  std::vector<std::pair<std::string, std::filesystem::path>> found;

  std::filesystem::recursive_directory_iterator it(root, ec);
  for (; !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
    std::error_code typeEc;
    if (!it->is_regular_file(typeEc)) {
      continue;
    }

    auto relative = it->path().lexically_relative(root);
    found.emplace_back(normalizeArchivePath(relative.generic_string()), it->path());
  }

  if (ec) {
    setError(outError, ErrorCode::IoError,
             std::format("Failed to walk {}: {}", root.string(), ec.message()));
    return std::nullopt;
  }

  if (found.empty()) {
    setError(outError, ErrorCode::EmptySource,
             std::format("No files to pack in {}", root.string()));
    return std::nullopt;
  }

  // Directory iteration order is platform-dependent; sort for reproducible archives
  std::sort(found.begin(), found.end(),
            [](const auto &a, const auto &b) { return a.first < b.first; });

  for (const auto &[archivePath, sourcePath] : found) {
    if (!addFile(sourcePath, archivePath, outError)) {
      return std::nullopt;
    }
  }

  return found.size();
}

bool Writer::write(const std::filesystem::path &destPath, const Options &options,
                   Error *outError) {
  if (pendingFiles_.empty()) {
    setError(outError, ErrorCode::EmptySource, "Cannot write archive with no files");
    return false;
  }

  // Step 1: Collect sizes and timestamps
  std::vector<FileEntry> entries;
  entries.reserve(pendingFiles_.size());

  for (const auto &pending : pendingFiles_) {
    FileEntry entry;
    entry.path = pending.archivePath;

    uint64_t size = 0;
    if (pending.fromDisk) {
      std::error_code ec;
      size = std::filesystem::file_size(pending.sourcePath, ec);
      if (ec) {
        setError(outError, ErrorCode::IoError,
                 std::format("Failed to get file size: {}", pending.sourcePath.string()));
        return false;
      }

      auto timestamp = readModificationTime(pending.sourcePath, outError);
      if (!timestamp) {
        return false;
      }
      entry.timestamp = *timestamp;
    } else {
      size = pending.data.size();
      entry.timestamp = pending.timestamp;
    }

    if (size > std::numeric_limits<uint32_t>::max()) {
      setError(outError, ErrorCode::EntryTooLarge,
               std::format("{} is {} bytes, larger than a PBO entry can hold", entry.path, size));
      return false;
    }

    entry.dataSize = static_cast<uint32_t>(size);
    entry.originalSize = entry.dataSize;
    entries.push_back(std::move(entry));
  }

  // Step 2: Encode preamble and header table
  std::vector<uint8_t> header;
  header.reserve(kPreambleSize + headerTableSize(entries));
  encodePreamble(header);
  for (const auto &entry : entries) {
    encodeEntryHeader(entry, header);
  }
  encodeTerminator(header);

  uint64_t pos = header.size();
  for (auto &entry : entries) {
    entry.offset = pos;
    pos += entry.dataSize;
  }
  const size_t totalSize = static_cast<size_t>(pos) + kChecksumSize;

  // Step 3: Map the output at its final size
  MappedFile outputFile;
  if (!outputFile.openWrite(destPath, totalSize, outError)) {
    return false;
  }

  auto outputData = outputFile.data();
  std::memcpy(outputData.data(), header.data(), header.size());

  // Step 4: Copy payloads in header order
  const size_t total = entries.size();
  for (size_t i = 0; i < total; ++i) {
    if (options.cancelled()) {
      setError(outError, ErrorCode::Cancelled,
               std::format("Packing cancelled after {} of {} files", i, total));
      return false;
    }

    const auto &pending = pendingFiles_[i];
    const auto &entry = entries[i];
    auto dest = outputData.subspan(static_cast<size_t>(entry.offset), entry.dataSize);

    if (pending.fromDisk) {
      std::ifstream inFile(pending.sourcePath, std::ios::binary);
      if (!inFile) {
        setError(outError, ErrorCode::IoError,
                 std::format("Failed to open source file: {}", pending.sourcePath.string()));
        return false;
      }

      inFile.read(reinterpret_cast<char *>(dest.data()), static_cast<std::streamsize>(dest.size()));
      if (static_cast<size_t>(inFile.gcount()) != dest.size() ||
          inFile.peek() != std::ifstream::traits_type::eof()) {
        setError(outError, ErrorCode::IoError,
                 std::format("Source file changed size while packing: {}",
                             pending.sourcePath.string()));
        return false;
      }
    } else if (!dest.empty()) {
      std::memcpy(dest.data(), pending.data.data(), dest.size());
    }

    if (options.onProgress) {
      ProgressEvent event;
      event.path = entry.path;
      event.index = i;
      event.total = total;
      event.percent = static_cast<unsigned>(i * 100 / total);
      event.message = std::format("Packing: {} ({}%)", entry.path, event.percent);
      options.onProgress(event);
    }
  }

  // Step 5: Checksum placeholder, then flush to disk
  std::memset(outputData.data() + totalSize - kChecksumSize, 0, kChecksumSize);

  if (!outputFile.flush(outError)) {
    return false;
  }

  entries_ = std::move(entries);
  return true;
}

void Writer::clear() {
  pendingFiles_.clear();
  entries_.clear();
}

bool Writer::isDuplicate(const std::string &archivePath) const {
  return std::any_of(pendingFiles_.begin(), pendingFiles_.end(),
                     [&](const PendingFile &pending) { return pending.archivePath == archivePath; });
}

std::string Writer::normalizeArchivePath(const std::string &path) {
  std::string result;
  result.reserve(path.size());

  // Forward slashes become backslashes; bytes the header cannot hold are dropped
  for (char c : path) {
    auto byte = static_cast<unsigned char>(c);
    if (c == '/') {
      result += '\\';
    } else if (byte != 0 && byte < 0x80) {
      result += c;
    }
  }

  return result;
}

} // namespace pbo
