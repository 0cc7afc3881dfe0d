#include <chrono>
#include <filesystem>
#include <format>
#include <iostream>

#include <pbo/pbo.hpp>

int main(int argc, char *argv[]) {
  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " <source_dir> [output.pbo]\n";
    return 1;
  }

  std::filesystem::path sourceDir = argv[1];
  std::filesystem::path outputPath =
      argc >= 3 ? std::filesystem::path(argv[2]) : pbo::defaultArchivePath(sourceDir);

  pbo::Options options;
  options.onProgress = [](const pbo::ProgressEvent &event) {
    std::cout << event.message << "\n";
  };

  auto start = std::chrono::steady_clock::now();

  pbo::Error error;
  auto packed = pbo::createArchive(sourceDir, outputPath, options, &error);
  if (!packed) {
    std::cerr << "Error: " << pbo::errorCodeName(error.code) << ": " << error.message << "\n";
    return 1;
  }

  std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;

  std::error_code ec;
  auto archiveSize = std::filesystem::file_size(outputPath, ec);
  double megabytes = ec ? 0.0 : static_cast<double>(archiveSize) / 1024.0 / 1024.0;

  std::cout << std::format("Created {} ({} files, {:.2f} MB in {:.1f}s)\n", outputPath.string(),
                           *packed, megabytes, elapsed.count());
  return 0;
}
