#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>

#include "types.hpp"

namespace pbo {

// Modification time of path in whole POSIX seconds, clamped to the u32 range
// stored in entry headers
std::optional<uint32_t> readModificationTime(const std::filesystem::path &path,
                                             Error *outError = nullptr);

// Set both access and modification time of path to seconds
bool restoreTimestamp(const std::filesystem::path &path, uint32_t seconds,
                      Error *outError = nullptr);

} // namespace pbo
