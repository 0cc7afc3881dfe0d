#include <pbo/archive.hpp>
#include <pbo/reader.hpp>
#include <pbo/writer.hpp>

namespace pbo {

namespace {

constexpr const char *kNotWriting = "Archive not open for writing";
constexpr const char *kNotReading = "Archive not open for reading";

} // namespace

// Defined here where Reader and Writer are complete
Archive::Archive() = default;
Archive::~Archive() = default;
Archive::Archive(Archive &&) noexcept = default;
Archive &Archive::operator=(Archive &&) noexcept = default;

std::optional<Archive> Archive::open(const std::filesystem::path &path, Error *outError) {
  auto reader = Reader::open(path, outError);
  if (!reader) {
    return std::nullopt;
  }

  Archive archive;
  archive.reader_ = std::make_unique<Reader>(std::move(*reader));
  return archive;
}

Archive Archive::create() {
  Archive archive;
  archive.writer_ = std::make_unique<Writer>();
  return archive;
}

bool Archive::addFile(const std::filesystem::path &sourcePath, const std::string &archivePath,
                      Error *outError) {
  if (!writer_) {
    setError(outError, ErrorCode::InvalidState, kNotWriting);
    return false;
  }
  return writer_->addFile(sourcePath, archivePath, outError);
}

bool Archive::addFile(std::span<const uint8_t> data, const std::string &archivePath,
                      uint32_t timestamp, Error *outError) {
  if (!writer_) {
    setError(outError, ErrorCode::InvalidState, kNotWriting);
    return false;
  }
  return writer_->addFile(data, archivePath, timestamp, outError);
}

std::optional<size_t> Archive::addDirectory(const std::filesystem::path &root, Error *outError) {
  if (!writer_) {
    setError(outError, ErrorCode::InvalidState, kNotWriting);
    return std::nullopt;
  }
  return writer_->addDirectory(root, outError);
}

bool Archive::write(const std::filesystem::path &destPath, const Options &options,
                    Error *outError) {
  if (!writer_) {
    setError(outError, ErrorCode::InvalidState, kNotWriting);
    return false;
  }
  return writer_->write(destPath, options, outError);
}

const std::vector<FileEntry> &Archive::files() const {
  static const std::vector<FileEntry> empty;
  if (reader_) {
    return reader_->files();
  }
  if (writer_) {
    return writer_->files();
  }
  return empty;
}

size_t Archive::fileCount() const {
  if (reader_) {
    return reader_->fileCount();
  }
  if (writer_) {
    return writer_->fileCount();
  }
  return 0;
}

const FileEntry *Archive::findFile(const std::string &path) const {
  if (!reader_) {
    return nullptr;
  }
  return reader_->findFile(path);
}

bool Archive::extract(const FileEntry &entry, const std::filesystem::path &destPath,
                      Error *outError) const {
  if (!reader_) {
    setError(outError, ErrorCode::InvalidState, kNotReading);
    return false;
  }
  return reader_->extract(entry, destPath, outError);
}

std::optional<std::vector<uint8_t>> Archive::extractToMemory(const FileEntry &entry,
                                                             Error *outError) const {
  if (!reader_) {
    setError(outError, ErrorCode::InvalidState, kNotReading);
    return std::nullopt;
  }
  return reader_->extractToMemory(entry, outError);
}

std::optional<size_t> Archive::extractAll(const std::filesystem::path &destDir,
                                          const Options &options, Error *outError) const {
  if (!reader_) {
    setError(outError, ErrorCode::InvalidState, kNotReading);
    return std::nullopt;
  }
  return reader_->extractAll(destDir, options, outError);
}

std::span<const uint8_t> Archive::getFileView(const FileEntry &entry) const {
  if (!reader_) {
    return {};
  }
  return reader_->getFileView(entry);
}

void Archive::close() {
  reader_.reset();
  writer_.reset();
}

void Archive::clear() {
  if (writer_) {
    writer_->clear();
  }
}

} // namespace pbo
