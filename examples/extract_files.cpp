#include <chrono>
#include <filesystem>
#include <format>
#include <iostream>

#include <pbo/pbo.hpp>

int main(int argc, char *argv[]) {
  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " <archive.pbo> [output_dir]\n";
    return 1;
  }

  std::filesystem::path archivePath = argv[1];

  std::filesystem::path outputDir =
      argc >= 3 ? std::filesystem::path(argv[2]) : pbo::defaultExtractDir(archivePath);

  pbo::Options options;
  options.onProgress = [](const pbo::ProgressEvent &event) {
    std::cout << event.message << "\n";
  };

  auto start = std::chrono::steady_clock::now();

  pbo::Error error;
  auto extracted = pbo::extractArchive(archivePath, outputDir, options, &error);
  if (!extracted) {
    std::cerr << "Error: " << pbo::errorCodeName(error.code) << ": " << error.message << "\n";
    return 1;
  }

  std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;
  std::cout << std::format("Extracted {} files to {} in {:.1f}s\n", *extracted,
                           outputDir.string(), elapsed.count());
  return 0;
}
