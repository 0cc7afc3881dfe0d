#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace pbo {

// File entry in the PBO header table
struct FileEntry {
  std::string path;           // Stored name, backslash separated, ASCII only
  uint32_t packingMethod = 0; // 0 = stored; anything else is carried as opaque data
  uint32_t originalSize = 0;  // Equal to dataSize for stored entries
  uint32_t reserved = 0;
  uint32_t timestamp = 0;     // POSIX seconds
  uint32_t dataSize = 0;      // Payload bytes for this entry
  uint64_t offset = 0;        // Absolute payload offset within the archive (never stored on disk)
};

// Key/value pairs following the "sreV" marker
using Properties = std::vector<std::pair<std::string, std::string>>;

enum class ErrorCode {
  None,
  EmptySource,      // Nothing to pack
  NoEntries,        // Archive has zero header entries
  TruncatedArchive, // Declared sizes run past the end of the archive
  IoError,          // Filesystem failures
  DuplicateEntry,   // Same stored name added twice
  EntryTooLarge,    // File does not fit a 32-bit size field
  UnsafePath,       // Entry name escapes the destination directory
  InvalidState,     // Archive used in the wrong mode
  Cancelled,
};

struct Error {
  ErrorCode code = ErrorCode::None;
  std::string message;

  explicit operator bool() const { return code != ErrorCode::None; }
};

inline constexpr std::string_view errorCodeName(ErrorCode code) noexcept {
  switch (code) {
  case ErrorCode::None:
    return "None";
  case ErrorCode::EmptySource:
    return "EmptySource";
  case ErrorCode::NoEntries:
    return "NoEntries";
  case ErrorCode::TruncatedArchive:
    return "TruncatedArchive";
  case ErrorCode::IoError:
    return "IOError";
  case ErrorCode::DuplicateEntry:
    return "DuplicateEntry";
  case ErrorCode::EntryTooLarge:
    return "EntryTooLarge";
  case ErrorCode::UnsafePath:
    return "UnsafePath";
  case ErrorCode::InvalidState:
    return "InvalidState";
  case ErrorCode::Cancelled:
    return "Cancelled";
  }
  return "Unknown";
}

// Fill outError if the caller asked for it
inline void setError(Error *outError, ErrorCode code, std::string message) {
  if (outError) {
    outError->code = code;
    outError->message = std::move(message);
  }
}

// Sent after each file is packed or extracted
struct ProgressEvent {
  std::string message; // e.g. "Packing: data\config.cpp (40%)"
  std::string path;    // Stored name of the file just processed
  size_t index = 0;    // 0-based index of that file
  size_t total = 0;
  unsigned percent = 0; // floor(index * 100 / total)
};

using ProgressCallback = std::function<void(const ProgressEvent &)>;

// Cooperative cancellation flag, checked between files
// May be set from any thread
class CancelToken {
public:
  void cancel() noexcept { cancelled_.store(true, std::memory_order_relaxed); }
  void reset() noexcept { cancelled_.store(false, std::memory_order_relaxed); }
  bool isCancelled() const noexcept { return cancelled_.load(std::memory_order_relaxed); }

private:
  std::atomic<bool> cancelled_{false};
};

// Per-call options for packing and extraction
struct Options {
  ProgressCallback onProgress;
  const CancelToken *cancel = nullptr;

  bool cancelled() const { return cancel && cancel->isCancelled(); }
};

} // namespace pbo
