#include <format>

#include <pbo/mmap.hpp>

#ifdef _WIN32
#include <windows.h>
#else
#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace pbo {

namespace {

#ifdef _WIN32
std::string lastErrorText() {
  return std::format("error {}", GetLastError());
}
#else
std::string lastErrorText() {
  return std::strerror(errno);
}

// Returns 0 or an errno value
int reserveSpace(int fd, size_t size) {
#ifdef __APPLE__
  fstore_t store{};
  store.fst_flags = F_ALLOCATEALL;
  store.fst_posmode = F_PEOFPOSMODE;
  store.fst_offset = 0;
  store.fst_length = static_cast<off_t>(size);
  if (fcntl(fd, F_PREALLOCATE, &store) < 0) {
    return errno;
  }
  return 0;
#else
  return posix_fallocate(fd, 0, static_cast<off_t>(size));
#endif
}
#endif

} // namespace

MappedFile::MappedFile() = default;

MappedFile::~MappedFile() {
  cleanup();
}

MappedFile::MappedFile(MappedFile &&other) noexcept
    :
#ifdef _WIN32
      fileHandle_(other.fileHandle_), mappingHandle_(other.mappingHandle_),
#else
      fd_(other.fd_),
#endif
      data_(other.data_), size_(other.size_), writable_(other.writable_) {
#ifdef _WIN32
  other.fileHandle_ = nullptr;
  other.mappingHandle_ = nullptr;
#else
  other.fd_ = -1;
#endif
  other.data_ = nullptr;
  other.size_ = 0;
  other.writable_ = false;
}

MappedFile &MappedFile::operator=(MappedFile &&other) noexcept {
  if (this != &other) {
    cleanup();

#ifdef _WIN32
    fileHandle_ = other.fileHandle_;
    mappingHandle_ = other.mappingHandle_;
    other.fileHandle_ = nullptr;
    other.mappingHandle_ = nullptr;
#else
    fd_ = other.fd_;
    other.fd_ = -1;
#endif
    data_ = other.data_;
    size_ = other.size_;
    writable_ = other.writable_;
    other.data_ = nullptr;
    other.size_ = 0;
    other.writable_ = false;
  }
  return *this;
}

bool MappedFile::openRead(const std::filesystem::path &path, Error *outError) {
  close();

#ifdef _WIN32
  fileHandle_ = CreateFileW(path.c_str(), GENERIC_READ, FILE_SHARE_READ, nullptr, OPEN_EXISTING,
                            FILE_ATTRIBUTE_NORMAL, nullptr);
  if (fileHandle_ == INVALID_HANDLE_VALUE) {
    fileHandle_ = nullptr;
    setError(outError, ErrorCode::IoError,
             std::format("Cannot open {} for reading: {}", path.string(), lastErrorText()));
    return false;
  }

  LARGE_INTEGER fileSize;
  if (!GetFileSizeEx(static_cast<HANDLE>(fileHandle_), &fileSize)) {
    setError(outError, ErrorCode::IoError,
             std::format("Cannot stat {}: {}", path.string(), lastErrorText()));
    close();
    return false;
  }
  size_ = static_cast<size_t>(fileSize.QuadPart);
#else
  fd_ = ::open(path.c_str(), O_RDONLY);
  if (fd_ < 0) {
    setError(outError, ErrorCode::IoError,
             std::format("Cannot open {} for reading: {}", path.string(), lastErrorText()));
    return false;
  }

  struct stat st;
  if (fstat(fd_, &st) < 0) {
    setError(outError, ErrorCode::IoError,
             std::format("Cannot stat {}: {}", path.string(), lastErrorText()));
    close();
    return false;
  }
  size_ = static_cast<size_t>(st.st_size);
#endif

  if (size_ == 0) {
    setError(outError, ErrorCode::IoError, std::format("File is empty: {}", path.string()));
    close();
    return false;
  }

  return map(path, outError);
}

bool MappedFile::openWrite(const std::filesystem::path &path, size_t size, Error *outError) {
  close();

  if (size == 0) {
    setError(outError, ErrorCode::IoError, "Cannot create file mapping with zero size");
    return false;
  }

  size_ = size;
  writable_ = true;

#ifdef _WIN32
  fileHandle_ = CreateFileW(path.c_str(), GENERIC_READ | GENERIC_WRITE, 0, nullptr, CREATE_ALWAYS,
                            FILE_ATTRIBUTE_NORMAL, nullptr);
  if (fileHandle_ == INVALID_HANDLE_VALUE) {
    fileHandle_ = nullptr;
    setError(outError, ErrorCode::IoError,
             std::format("Cannot create {}: {}", path.string(), lastErrorText()));
    return false;
  }

  LARGE_INTEGER fileSize;
  fileSize.QuadPart = static_cast<LONGLONG>(size);
  if (!SetFilePointerEx(static_cast<HANDLE>(fileHandle_), fileSize, nullptr, FILE_BEGIN) ||
      !SetEndOfFile(static_cast<HANDLE>(fileHandle_))) {
    setError(outError, ErrorCode::IoError,
             std::format("Cannot size {} to {} bytes: {}", path.string(), size, lastErrorText()));
    close();
    return false;
  }
#else
  fd_ = ::open(path.c_str(), O_RDWR | O_CREAT | O_TRUNC, 0644);
  if (fd_ < 0) {
    setError(outError, ErrorCode::IoError,
             std::format("Cannot create {}: {}", path.string(), lastErrorText()));
    return false;
  }

  // The new region reads back as zeros
  if (ftruncate(fd_, static_cast<off_t>(size)) < 0) {
    setError(outError, ErrorCode::IoError,
             std::format("Cannot size {} to {} bytes: {}", path.string(), size, lastErrorText()));
    close();
    return false;
  }

  // Allocate every block now; a full disk would otherwise raise SIGBUS
  // while the mapping is being filled
  if (int rc = reserveSpace(fd_, size); rc != 0) {
    setError(outError, ErrorCode::IoError,
             std::format("Cannot reserve {} bytes for {}: {}", size, path.string(),
                         std::strerror(rc)));
    close();
    return false;
  }
#endif

  return map(path, outError);
}

bool MappedFile::map(const std::filesystem::path &path, Error *outError) {
#ifdef _WIN32
  mappingHandle_ = CreateFileMappingW(static_cast<HANDLE>(fileHandle_), nullptr,
                                      writable_ ? PAGE_READWRITE : PAGE_READONLY, 0, 0, nullptr);
  if (mappingHandle_) {
    data_ = MapViewOfFile(static_cast<HANDLE>(mappingHandle_),
                          writable_ ? FILE_MAP_WRITE : FILE_MAP_READ, 0, 0, 0);
  }
  if (!data_) {
    setError(outError, ErrorCode::IoError,
             std::format("Cannot map {}: {}", path.string(), lastErrorText()));
    close();
    return false;
  }
#else
  void *mapped = mmap(nullptr, size_, writable_ ? PROT_READ | PROT_WRITE : PROT_READ,
                      writable_ ? MAP_SHARED : MAP_PRIVATE, fd_, 0);
  if (mapped == MAP_FAILED) {
    setError(outError, ErrorCode::IoError,
             std::format("Cannot map {}: {}", path.string(), lastErrorText()));
    close();
    return false;
  }
  data_ = mapped;
#endif

  return true;
}

bool MappedFile::flush(Error *outError) {
  if (!data_ || !writable_) {
    setError(outError, ErrorCode::InvalidState, "Cannot flush: file not open for writing");
    return false;
  }

#ifdef _WIN32
  if (!FlushViewOfFile(data_, 0) || !FlushFileBuffers(static_cast<HANDLE>(fileHandle_))) {
    setError(outError, ErrorCode::IoError,
             std::format("Cannot flush mapped file: {}", lastErrorText()));
    return false;
  }
#else
  if (msync(data_, size_, MS_SYNC) < 0) {
    setError(outError, ErrorCode::IoError,
             std::format("Cannot sync mapped file: {}", lastErrorText()));
    return false;
  }
#endif

  return true;
}

void MappedFile::close() {
  cleanup();
}

void MappedFile::cleanup() noexcept {
  if (data_) {
#ifdef _WIN32
    UnmapViewOfFile(data_);
#else
    munmap(data_, size_);
#endif
    data_ = nullptr;
  }

#ifdef _WIN32
  if (mappingHandle_) {
    CloseHandle(static_cast<HANDLE>(mappingHandle_));
    mappingHandle_ = nullptr;
  }
  if (fileHandle_) {
    CloseHandle(static_cast<HANDLE>(fileHandle_));
    fileHandle_ = nullptr;
  }
#else
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
#endif

  size_ = 0;
  writable_ = false;
}

} // namespace pbo
