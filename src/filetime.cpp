#include <algorithm>
#include <format>
#include <limits>

#include <pbo/filetime.hpp>

#ifdef _WIN32
#include <sys/stat.h>
#include <sys/utime.h>
#else
#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/stat.h>
#endif

namespace pbo {

namespace {

uint32_t clampSeconds(int64_t seconds) {
  constexpr int64_t maxSeconds = std::numeric_limits<uint32_t>::max();
  return static_cast<uint32_t>(std::clamp<int64_t>(seconds, 0, maxSeconds));
}

} // namespace

std::optional<uint32_t> readModificationTime(const std::filesystem::path &path, Error *outError) {
#ifdef _WIN32
  struct _stat64 st;
  if (_wstat64(path.c_str(), &st) != 0) {
    setError(outError, ErrorCode::IoError,
             std::format("Cannot read modification time of {}", path.string()));
    return std::nullopt;
  }
#else
  struct stat st;
  if (::stat(path.c_str(), &st) != 0) {
    setError(outError, ErrorCode::IoError,
             std::format("Cannot read modification time of {}: {}", path.string(),
                         std::strerror(errno)));
    return std::nullopt;
  }
#endif

  // Sub-second precision is dropped
  return clampSeconds(static_cast<int64_t>(st.st_mtime));
}

bool restoreTimestamp(const std::filesystem::path &path, uint32_t seconds, Error *outError) {
#ifdef _WIN32
  struct __utimbuf64 times;
  times.actime = static_cast<__time64_t>(seconds);
  times.modtime = static_cast<__time64_t>(seconds);
  if (_wutime64(path.c_str(), &times) != 0) {
    setError(outError, ErrorCode::IoError,
             std::format("Cannot set timestamp of {}", path.string()));
    return false;
  }
#else
  struct timespec times[2];
  times[0].tv_sec = static_cast<time_t>(seconds);
  times[0].tv_nsec = 0;
  times[1] = times[0];
  if (utimensat(AT_FDCWD, path.c_str(), times, 0) != 0) {
    setError(outError, ErrorCode::IoError,
             std::format("Cannot set timestamp of {}: {}", path.string(), std::strerror(errno)));
    return false;
  }
#endif

  return true;
}

} // namespace pbo
