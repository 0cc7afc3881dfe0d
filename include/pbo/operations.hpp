#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>

#include "types.hpp"

namespace pbo {

// Pack every regular file under sourceDir into outputFile
// Returns the number of files packed. Fails with ErrorCode::EmptySource when the
// tree holds no regular files. The output is written in place; callers needing
// atomic replacement should write to a temporary path and rename it.
std::optional<size_t> createArchive(const std::filesystem::path &sourceDir,
                                    const std::filesystem::path &outputFile,
                                    const Options &options = {}, Error *outError = nullptr);

// Extract every entry of archiveFile under destDir, creating it if needed
// Returns the number of files extracted. Fails with ErrorCode::NoEntries or
// ErrorCode::TruncatedArchive on malformed archives. Existing files are overwritten.
std::optional<size_t> extractArchive(const std::filesystem::path &archiveFile,
                                     const std::filesystem::path &destDir,
                                     const Options &options = {}, Error *outError = nullptr);

// Default output of pbo_pack: <dir name>.pbo next to sourceDir
// Relative inputs such as "." or "mod/" resolve against the current directory
std::filesystem::path defaultArchivePath(const std::filesystem::path &sourceDir);

// Default output of pbo_unpack: a folder named after the archive stem, next to it
std::filesystem::path defaultExtractDir(const std::filesystem::path &archiveFile);

} // namespace pbo
