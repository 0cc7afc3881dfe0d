#include <ctime>
#include <iomanip>
#include <iostream>

#include <pbo/pbo.hpp>

int main(int argc, char *argv[]) {
  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " <archive.pbo>\n";
    return 1;
  }

  pbo::Error error;
  auto archive = pbo::Reader::open(argv[1], &error);

  if (!archive) {
    std::cerr << "Error: " << pbo::errorCodeName(error.code) << ": " << error.message << "\n";
    return 1;
  }

  std::cout << "Archive: " << argv[1] << "\n";
  for (const auto &[key, value] : archive->properties()) {
    std::cout << "  " << key << " = " << value << "\n";
  }
  std::cout << "Files: " << archive->fileCount() << "\n\n";

  for (const auto &file : archive->files()) {
    std::time_t modified = static_cast<std::time_t>(file.timestamp);
    std::tm utc{};
#ifdef _WIN32
    gmtime_s(&utc, &modified);
#else
    gmtime_r(&modified, &utc);
#endif
    std::cout << "  " << std::put_time(&utc, "%Y-%m-%d %H:%M:%S") << "  " << std::setw(10)
              << file.dataSize << "  " << file.path << "\n";
  }

  return 0;
}
