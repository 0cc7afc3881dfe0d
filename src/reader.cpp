#include <cctype>
#include <format>
#include <fstream>
#include <iostream>

#include <pbo/codec.hpp>
#include <pbo/filetime.hpp>
#include <pbo/reader.hpp>

namespace pbo {

std::optional<Reader> Reader::open(const std::filesystem::path &path, Error *outError) {
  std::error_code ec;
  if (std::filesystem::is_regular_file(path, ec) && std::filesystem::file_size(path, ec) == 0 &&
      !ec) {
    setError(outError, ErrorCode::NoEntries,
             std::format("Archive is empty: {}", path.string()));
    return std::nullopt;
  }

  Reader reader;
  if (!reader.mappedFile_.openRead(path, outError)) {
    return std::nullopt;
  }

  if (!reader.parse(outError)) {
    reader.close();
    return std::nullopt;
  }

  return reader;
}

bool Reader::parse(Error *outError) {
  auto data = mappedFile_.data();

  size_t pos = skipPreamble(data, &properties_);

  if (!decodeHeaderTable(data, pos, files_, outError)) {
    return false;
  }

  if (files_.empty()) {
    setError(outError, ErrorCode::NoEntries, "No files found in archive");
    return false;
  }

  // First occurrence wins; later duplicates are still extracted in order
  lookup_.reserve(files_.size());
  for (size_t i = 0; i < files_.size(); ++i) {
    lookup_.try_emplace(normalizePath(files_[i].path), i);
  }

  return true;
}

const FileEntry *Reader::findFile(const std::string &path) const {
  auto it = lookup_.find(normalizePath(path));
  if (it == lookup_.end()) {
    return nullptr;
  }
  return &files_[it->second];
}

bool Reader::extract(const FileEntry &entry, const std::filesystem::path &destPath,
                     Error *outError) const {
  if (!inBounds(entry)) {
    setError(outError, ErrorCode::TruncatedArchive,
             std::format("Insufficient data for {}: {} bytes declared at offset {}, archive is "
                         "{} bytes",
                         entry.path, entry.dataSize, entry.offset, mappedFile_.size()));
    return false;
  }

  auto fileData = getFileView(entry);

  std::error_code ec;
  if (destPath.has_parent_path()) {
    std::filesystem::create_directories(destPath.parent_path(), ec);
    if (ec) {
      setError(outError, ErrorCode::IoError,
               std::format("Failed to create directory {}: {}", destPath.parent_path().string(),
                           ec.message()));
      return false;
    }
  }

  std::ofstream out(destPath, std::ios::binary | std::ios::trunc);
  if (!out) {
    setError(outError, ErrorCode::IoError,
             std::format("Failed to create output file: {}", destPath.string()));
    return false;
  }

  out.write(reinterpret_cast<const char *>(fileData.data()),
            static_cast<std::streamsize>(fileData.size()));
  out.close();
  if (!out) {
    setError(outError, ErrorCode::IoError,
             std::format("Failed to write to output file: {}", destPath.string()));
    return false;
  }

  return true;
}

std::optional<std::vector<uint8_t>> Reader::extractToMemory(const FileEntry &entry,
                                                            Error *outError) const {
  if (!inBounds(entry)) {
    setError(outError, ErrorCode::TruncatedArchive,
             std::format("Insufficient data for {}", entry.path));
    return std::nullopt;
  }

  auto fileData = getFileView(entry);
  return std::vector<uint8_t>(fileData.begin(), fileData.end());
}

std::span<const uint8_t> Reader::getFileView(const FileEntry &entry) const {
  if (!inBounds(entry)) {
    return {};
  }

  auto archiveData = mappedFile_.data();
  return archiveData.subspan(static_cast<size_t>(entry.offset), entry.dataSize);
}

std::optional<size_t> Reader::extractAll(const std::filesystem::path &destDir,
                                         const Options &options, Error *outError) const {
  if (!isOpen()) {
    setError(outError, ErrorCode::InvalidState, "Archive is not open");
    return std::nullopt;
  }

  std::error_code ec;
  std::filesystem::create_directories(destDir, ec);
  if (ec) {
    setError(outError, ErrorCode::IoError,
             std::format("Failed to create output directory {}: {}", destDir.string(),
                         ec.message()));
    return std::nullopt;
  }

  const size_t total = files_.size();
  for (size_t i = 0; i < total; ++i) {
    if (options.cancelled()) {
      setError(outError, ErrorCode::Cancelled,
               std::format("Extraction cancelled after {} of {} files", i, total));
      return std::nullopt;
    }

    const auto &entry = files_[i];

    auto relative = toHostPath(entry.path);
    if (!relative) {
      setError(outError, ErrorCode::UnsafePath,
               std::format("Refusing to extract {} outside {}", entry.path, destDir.string()));
      return std::nullopt;
    }

    std::filesystem::path destPath = destDir / *relative;
    if (!extract(entry, destPath, outError)) {
      return std::nullopt;
    }

    Error timeError;
    if (!restoreTimestamp(destPath, entry.timestamp, &timeError)) {
      std::cerr << "[pbo] warning: " << timeError.message << std::endl;
    }

    if (options.onProgress) {
      ProgressEvent event;
      event.path = entry.path;
      event.index = i;
      event.total = total;
      event.percent = static_cast<unsigned>(i * 100 / total);
      event.message = std::format("Extracting: {} ({}%)", entry.path, event.percent);
      options.onProgress(event);
    }
  }

  return total;
}

bool Reader::isOpen() const {
  return mappedFile_.isOpen();
}

void Reader::close() {
  mappedFile_.close();
  files_.clear();
  properties_.clear();
  lookup_.clear();
}

bool Reader::inBounds(const FileEntry &entry) const {
  return entry.offset + entry.dataSize <= mappedFile_.size();
}

std::string Reader::normalizePath(const std::string &path) {
  std::string result;
  result.reserve(path.size());

  // Convert to lowercase and replace backslashes with forward slashes
  for (char c : path) {
    if (c == '\\') {
      result += '/';
    } else {
      result += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
  }

  return result;
}

std::optional<std::filesystem::path> Reader::toHostPath(const std::string &name) {
  std::filesystem::path result;

  size_t start = 0;
  while (start <= name.size()) {
    size_t end = name.find_first_of("\\/", start);
    if (end == std::string::npos) {
      end = name.size();
    }

    std::string component = name.substr(start, end - start);
    start = end + 1;

    if (component.empty() || component == ".") {
      continue;
    }
    if (component == "..") {
      return std::nullopt;
    }
#ifdef _WIN32
    // Drive letters and alternate data streams
    if (component.find(':') != std::string::npos) {
      return std::nullopt;
    }
#endif
    result /= component;
  }

  if (result.empty() || result.has_root_path()) {
    return std::nullopt;
  }
  return result;
}

} // namespace pbo
