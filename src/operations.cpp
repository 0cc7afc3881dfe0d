#include <pbo/operations.hpp>
#include <pbo/reader.hpp>
#include <pbo/writer.hpp>

namespace pbo {

std::optional<size_t> createArchive(const std::filesystem::path &sourceDir,
                                    const std::filesystem::path &outputFile,
                                    const Options &options, Error *outError) {
  Writer writer;

  auto count = writer.addDirectory(sourceDir, outError);
  if (!count) {
    return std::nullopt;
  }

  if (!writer.write(outputFile, options, outError)) {
    return std::nullopt;
  }

  return count;
}

std::optional<size_t> extractArchive(const std::filesystem::path &archiveFile,
                                     const std::filesystem::path &destDir,
                                     const Options &options, Error *outError) {
  auto reader = Reader::open(archiveFile, outError);
  if (!reader) {
    return std::nullopt;
  }

  return reader->extractAll(destDir, options, outError);
}

std::filesystem::path defaultArchivePath(const std::filesystem::path &sourceDir) {
  std::error_code ec;
  std::filesystem::path dir = std::filesystem::absolute(sourceDir, ec);
  if (ec) {
    dir = sourceDir;
  }

  dir = dir.lexically_normal();
  if (!dir.has_filename()) {
    dir = dir.parent_path();
  }

  std::filesystem::path name = dir.filename();
  name += ".pbo";
  return dir.parent_path() / name;
}

std::filesystem::path defaultExtractDir(const std::filesystem::path &archiveFile) {
  return archiveFile.parent_path() / archiveFile.stem();
}

} // namespace pbo
