#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <pbo/codec.hpp>
#include <pbo/filetime.hpp>
#include <pbo/reader.hpp>

#include <gtest/gtest.h>

namespace fs = std::filesystem;

class ReaderTest : public ::testing::Test {
protected:
  void SetUp() override {
    tempDir_ = fs::temp_directory_path() / "pbo_test_reader" /
               ::testing::UnitTest::GetInstance()->current_test_info()->name();
    fs::create_directories(tempDir_);
  }

  void TearDown() override { fs::remove_all(tempDir_); }

  struct TestFile {
    std::string name;
    std::vector<uint8_t> content;
    uint32_t timestamp = 0;
  };

  static std::vector<TestFile> defaultFiles() {
    return {
        {"test\\file1.txt", {'H', 'e', 'l', 'l', 'o'}, 1600000000},
        {"test\\file2.dat", {0, 1, 2, 3, 4, 5}, 1600000100},
        {"test\\subdir\\file3.bin", {'A', 'B', 'C'}, 1600000200},
    };
  }

  // Serialize files into a PBO image; dataSizeBias inflates the last entry's declared size
  static std::vector<uint8_t> buildArchive(const std::vector<TestFile> &files,
                                           uint32_t dataSizeBias = 0) {
    std::vector<uint8_t> bytes;
    pbo::encodePreamble(bytes);

    for (size_t i = 0; i < files.size(); ++i) {
      pbo::FileEntry entry;
      entry.path = files[i].name;
      entry.timestamp = files[i].timestamp;
      entry.dataSize = static_cast<uint32_t>(files[i].content.size());
      if (i + 1 == files.size()) {
        entry.dataSize += dataSizeBias;
      }
      entry.originalSize = entry.dataSize;
      pbo::encodeEntryHeader(entry, bytes);
    }
    pbo::encodeTerminator(bytes);

    for (const auto &file : files) {
      bytes.insert(bytes.end(), file.content.begin(), file.content.end());
    }
    pbo::encodeChecksumPlaceholder(bytes);
    return bytes;
  }

  fs::path writeArchive(const std::string &name, const std::vector<uint8_t> &bytes) {
    fs::path filePath = tempDir_ / name;
    std::ofstream file(filePath, std::ios::binary);
    file.write(reinterpret_cast<const char *>(bytes.data()), bytes.size());
    return filePath;
  }

  fs::path createTestArchive(const std::string &name) {
    return writeArchive(name, buildArchive(defaultFiles()));
  }

  static std::string readFile(const fs::path &path) {
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  }

  fs::path tempDir_;
};

TEST_F(ReaderTest, OpenValidArchive) {
  fs::path archivePath = createTestArchive("test.pbo");

  pbo::Error error;
  auto reader = pbo::Reader::open(archivePath, &error);

  ASSERT_TRUE(reader.has_value()) << "Failed to open archive: " << error.message;
  EXPECT_TRUE(reader->isOpen());
  EXPECT_EQ(reader->fileCount(), 3);
  EXPECT_TRUE(reader->properties().empty());
}

TEST_F(ReaderTest, FileListingKeepsHeaderOrderAndNames) {
  fs::path archivePath = createTestArchive("test.pbo");

  pbo::Error error;
  auto reader = pbo::Reader::open(archivePath, &error);
  ASSERT_TRUE(reader.has_value()) << error.message;

  const auto &files = reader->files();
  ASSERT_EQ(files.size(), 3);

  EXPECT_EQ(files[0].path, "test\\file1.txt");
  EXPECT_EQ(files[1].path, "test\\file2.dat");
  EXPECT_EQ(files[2].path, "test\\subdir\\file3.bin");

  EXPECT_EQ(files[0].timestamp, 1600000000);
  EXPECT_EQ(files[2].timestamp, 1600000200);

  // Payloads are contiguous
  EXPECT_EQ(files[1].offset, files[0].offset + files[0].dataSize);
  EXPECT_EQ(files[2].offset, files[1].offset + files[1].dataSize);
}

TEST_F(ReaderTest, FileLookup) {
  fs::path archivePath = createTestArchive("test.pbo");

  pbo::Error error;
  auto reader = pbo::Reader::open(archivePath, &error);
  ASSERT_TRUE(reader.has_value()) << error.message;

  const auto *file1 = reader->findFile("test\\file1.txt");
  ASSERT_NE(file1, nullptr);
  EXPECT_EQ(file1->dataSize, 5);

  EXPECT_NE(reader->findFile("TEST\\FILE1.TXT"), nullptr);
  EXPECT_NE(reader->findFile("test/file1.txt"), nullptr);
  EXPECT_NE(reader->findFile("Test/SubDir/File3.bin"), nullptr);
  EXPECT_EQ(reader->findFile("does/not/exist.txt"), nullptr);
}

TEST_F(ReaderTest, FileView) {
  fs::path archivePath = createTestArchive("test.pbo");

  pbo::Error error;
  auto reader = pbo::Reader::open(archivePath, &error);
  ASSERT_TRUE(reader.has_value()) << error.message;

  const auto *file = reader->findFile("test\\file1.txt");
  ASSERT_NE(file, nullptr);

  auto view = reader->getFileView(*file);
  EXPECT_EQ(std::string(view.begin(), view.end()), "Hello");
}

TEST_F(ReaderTest, ExtractToMemory) {
  fs::path archivePath = createTestArchive("test.pbo");

  pbo::Error error;
  auto reader = pbo::Reader::open(archivePath, &error);
  ASSERT_TRUE(reader.has_value()) << error.message;

  const auto *file = reader->findFile("test\\file2.dat");
  ASSERT_NE(file, nullptr);

  auto data = reader->extractToMemory(*file, &error);
  ASSERT_TRUE(data.has_value()) << error.message;
  EXPECT_EQ(*data, (std::vector<uint8_t>{0, 1, 2, 3, 4, 5}));
}

TEST_F(ReaderTest, ExtractToDisk) {
  fs::path archivePath = createTestArchive("test.pbo");

  pbo::Error error;
  auto reader = pbo::Reader::open(archivePath, &error);
  ASSERT_TRUE(reader.has_value()) << error.message;

  const auto *file = reader->findFile("test\\file1.txt");
  ASSERT_NE(file, nullptr);

  fs::path destPath = tempDir_ / "nested" / "extracted.txt";
  ASSERT_TRUE(reader->extract(*file, destPath, &error)) << error.message;
  EXPECT_EQ(readFile(destPath), "Hello");
}

TEST_F(ReaderTest, ExtractAllTranslatesSeparatorsAndTimestamps) {
  fs::path archivePath = createTestArchive("test.pbo");

  pbo::Error error;
  auto reader = pbo::Reader::open(archivePath, &error);
  ASSERT_TRUE(reader.has_value()) << error.message;

  fs::path outDir = tempDir_ / "out";
  auto count = reader->extractAll(outDir, {}, &error);
  ASSERT_TRUE(count.has_value()) << error.message;
  EXPECT_EQ(*count, 3);

  fs::path nested = outDir / "test" / "subdir" / "file3.bin";
  ASSERT_TRUE(fs::is_regular_file(nested));
  EXPECT_EQ(readFile(nested), "ABC");
  EXPECT_FALSE(fs::exists(outDir / "test\\subdir\\file3.bin"));

  auto modified = pbo::readModificationTime(nested, &error);
  ASSERT_TRUE(modified.has_value()) << error.message;
  EXPECT_EQ(*modified, 1600000200u);
}

TEST_F(ReaderTest, ZeroLengthEntry) {
  auto files = defaultFiles();
  files.insert(files.begin() + 1, TestFile{"empty.txt", {}, 1600000050});
  fs::path archivePath = writeArchive("zero.pbo", buildArchive(files));

  pbo::Error error;
  auto reader = pbo::Reader::open(archivePath, &error);
  ASSERT_TRUE(reader.has_value()) << error.message;
  ASSERT_EQ(reader->fileCount(), 4);

  const auto *empty = reader->findFile("empty.txt");
  ASSERT_NE(empty, nullptr);
  auto data = reader->extractToMemory(*empty, &error);
  ASSERT_TRUE(data.has_value()) << error.message;
  EXPECT_TRUE(data->empty());

  fs::path outDir = tempDir_ / "out";
  ASSERT_TRUE(reader->extractAll(outDir, {}, &error).has_value()) << error.message;
  EXPECT_TRUE(fs::is_regular_file(outDir / "empty.txt"));
  EXPECT_EQ(fs::file_size(outDir / "empty.txt"), 0);
  EXPECT_EQ(readFile(outDir / "test" / "file2.dat").size(), 6);
}

TEST_F(ReaderTest, ReadsProductNameAndProperties) {
  std::vector<uint8_t> bytes = {'X', 0, 's', 'r', 'e', 'V'};
  bytes.insert(bytes.end(), 16, uint8_t{0});
  pbo::encodeString("prefix", bytes);
  pbo::encodeString("x\\addon", bytes);
  bytes.push_back(0);

  auto body = buildArchive(defaultFiles());
  bytes.insert(bytes.end(), body.begin() + pbo::kPreambleSize, body.end());
  fs::path archivePath = writeArchive("props.pbo", bytes);

  pbo::Error error;
  auto reader = pbo::Reader::open(archivePath, &error);
  ASSERT_TRUE(reader.has_value()) << error.message;

  ASSERT_EQ(reader->properties().size(), 1);
  EXPECT_EQ(reader->properties()[0].first, "prefix");
  EXPECT_EQ(reader->properties()[0].second, "x\\addon");
  EXPECT_EQ(reader->fileCount(), 3);

  auto data = reader->extractToMemory(*reader->findFile("test\\file1.txt"), &error);
  ASSERT_TRUE(data.has_value()) << error.message;
  EXPECT_EQ(std::string(data->begin(), data->end()), "Hello");
}

TEST_F(ReaderTest, NoEntries) {
  std::vector<uint8_t> bytes;
  pbo::encodePreamble(bytes);
  pbo::encodeTerminator(bytes);
  pbo::encodeChecksumPlaceholder(bytes);
  fs::path archivePath = writeArchive("empty.pbo", bytes);

  pbo::Error error;
  auto reader = pbo::Reader::open(archivePath, &error);

  EXPECT_FALSE(reader.has_value());
  EXPECT_EQ(error.code, pbo::ErrorCode::NoEntries);
}

TEST_F(ReaderTest, EmptyFileHasNoEntries) {
  fs::path archivePath = tempDir_ / "zero_bytes.pbo";
  std::ofstream(archivePath).close();

  pbo::Error error;
  EXPECT_FALSE(pbo::Reader::open(archivePath, &error).has_value());
  EXPECT_EQ(error.code, pbo::ErrorCode::NoEntries);
}

TEST_F(ReaderTest, TruncatedLastEntry) {
  fs::path archivePath = writeArchive("truncated.pbo", buildArchive(defaultFiles(), 1000));

  pbo::Error error;
  auto reader = pbo::Reader::open(archivePath, &error);
  ASSERT_TRUE(reader.has_value()) << error.message;

  const auto *last = reader->findFile("test\\subdir\\file3.bin");
  ASSERT_NE(last, nullptr);
  EXPECT_TRUE(reader->getFileView(*last).empty());

  fs::path outDir = tempDir_ / "out";
  auto count = reader->extractAll(outDir, {}, &error);
  EXPECT_FALSE(count.has_value());
  EXPECT_EQ(error.code, pbo::ErrorCode::TruncatedArchive);

  // Entries before the bad one were written; the bad one never was
  EXPECT_TRUE(fs::exists(outDir / "test" / "file1.txt"));
  EXPECT_FALSE(fs::exists(outDir / "test" / "subdir" / "file3.bin"));
}

TEST_F(ReaderTest, UnsafeEntryNameRejected) {
  auto files = defaultFiles();
  files.push_back({"..\\escape.txt", {'x'}, 0});
  fs::path archivePath = writeArchive("unsafe.pbo", buildArchive(files));

  pbo::Error error;
  auto reader = pbo::Reader::open(archivePath, &error);
  ASSERT_TRUE(reader.has_value()) << error.message;

  fs::path outDir = tempDir_ / "out";
  EXPECT_FALSE(reader->extractAll(outDir, {}, &error).has_value());
  EXPECT_EQ(error.code, pbo::ErrorCode::UnsafePath);
  EXPECT_FALSE(fs::exists(tempDir_ / "escape.txt"));
}

TEST_F(ReaderTest, NonExistentFile) {
  pbo::Error error;
  auto reader = pbo::Reader::open(tempDir_ / "does_not_exist.pbo", &error);

  EXPECT_FALSE(reader.has_value());
  EXPECT_EQ(error.code, pbo::ErrorCode::IoError);
  EXPECT_FALSE(error.message.empty());
}

TEST_F(ReaderTest, MoveConstruction) {
  fs::path archivePath = createTestArchive("test.pbo");

  pbo::Error error;
  auto reader1 = pbo::Reader::open(archivePath, &error);
  ASSERT_TRUE(reader1.has_value()) << error.message;

  size_t fileCount = reader1->fileCount();

  pbo::Reader reader2(std::move(*reader1));
  EXPECT_EQ(reader2.fileCount(), fileCount);

  const auto *file = reader2.findFile("test\\file1.txt");
  ASSERT_NE(file, nullptr);
  EXPECT_EQ(reader2.getFileView(*file).size(), 5);
}

TEST_F(ReaderTest, Close) {
  fs::path archivePath = createTestArchive("test.pbo");

  pbo::Error error;
  auto reader = pbo::Reader::open(archivePath, &error);
  ASSERT_TRUE(reader.has_value()) << error.message;

  EXPECT_TRUE(reader->isOpen());
  reader->close();
  EXPECT_FALSE(reader->isOpen());
  EXPECT_EQ(reader->fileCount(), 0);

  EXPECT_FALSE(reader->extractAll(tempDir_ / "out", {}, &error).has_value());
  EXPECT_EQ(error.code, pbo::ErrorCode::InvalidState);
}
