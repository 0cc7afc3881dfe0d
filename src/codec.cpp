#include <algorithm>
#include <cstring>
#include <format>

#include <pbo/codec.hpp>
#include <pbo/endian.hpp>

namespace pbo {

namespace {

bool isEncodable(char c) {
  auto byte = static_cast<unsigned char>(c);
  return byte != 0 && byte < 0x80;
}

} // namespace

void encodeString(std::string_view s, std::vector<uint8_t> &out) {
  for (char c : s) {
    if (isEncodable(c)) {
      out.push_back(static_cast<uint8_t>(c));
    }
  }
  out.push_back(0);
}

size_t encodedStringSize(std::string_view s) {
  return static_cast<size_t>(std::count_if(s.begin(), s.end(), isEncodable)) + 1;
}

std::pair<std::string, size_t> decodeString(std::span<const uint8_t> buffer, size_t offset) {
  if (offset >= buffer.size()) {
    return {std::string(), buffer.size()};
  }

  auto begin = buffer.begin() + static_cast<std::ptrdiff_t>(offset);
  auto end = std::find(begin, buffer.end(), uint8_t{0});
  if (end == buffer.end()) {
    return {std::string(), buffer.size()};
  }

  std::string result;
  result.reserve(static_cast<size_t>(end - begin));
  for (auto it = begin; it != end; ++it) {
    if (*it < 0x80) {
      result += static_cast<char>(*it);
    }
  }

  return {std::move(result), static_cast<size_t>(end - buffer.begin()) + 1};
}

void encodeU32LE(uint32_t value, std::vector<uint8_t> &out) {
  uint32_t le = host_to_le32(value);
  uint8_t bytes[4];
  std::memcpy(bytes, &le, 4);
  out.insert(out.end(), bytes, bytes + 4);
}

uint32_t decodeU32LE(std::span<const uint8_t> buffer, size_t offset) {
  uint32_t value;
  std::memcpy(&value, buffer.data() + offset, 4);
  return le32_to_host(value);
}

void encodePreamble(std::vector<uint8_t> &out) {
  // Empty product name
  out.push_back(0);

  out.insert(out.end(), kSignature, kSignature + kSignatureSize);

  // Reserved fields plus the empty property list terminator
  out.insert(out.end(), kPreambleSize - 1 - kSignatureSize, uint8_t{0});
}

size_t skipPreamble(std::span<const uint8_t> buffer, Properties *outProperties) {
  // Product name, possibly empty
  auto terminator = std::find(buffer.begin(), buffer.end(), uint8_t{0});
  size_t pos = static_cast<size_t>(terminator - buffer.begin());
  pos = std::min(pos + 1, buffer.size());

  if (pos + kSignatureSize > buffer.size() ||
      std::memcmp(buffer.data() + pos, kSignature, kSignatureSize) != 0) {
    return pos;
  }

  // Signature occupies the method field; the four remaining fields are reserved
  pos = std::min(pos + kHeaderFieldsSize, buffer.size());

  // Property list: key\0value\0 pairs ending at an empty key
  while (pos < buffer.size()) {
    auto [key, afterKey] = decodeString(buffer, pos);
    if (key.empty()) {
      pos = afterKey;
      break;
    }

    auto [value, afterValue] = decodeString(buffer, afterKey);
    if (outProperties) {
      outProperties->emplace_back(std::move(key), std::move(value));
    }
    pos = afterValue;
  }

  return pos;
}

void encodeEntryHeader(const FileEntry &entry, std::vector<uint8_t> &out) {
  encodeString(entry.path, out);
  encodeU32LE(entry.packingMethod, out);
  encodeU32LE(entry.originalSize, out);
  encodeU32LE(entry.reserved, out);
  encodeU32LE(entry.timestamp, out);
  encodeU32LE(entry.dataSize, out);
}

void encodeTerminator(std::vector<uint8_t> &out) {
  out.insert(out.end(), 1 + kHeaderFieldsSize, uint8_t{0});
}

void encodeChecksumPlaceholder(std::vector<uint8_t> &out) {
  out.insert(out.end(), kChecksumSize, uint8_t{0});
}

size_t headerTableSize(const std::vector<FileEntry> &entries) {
  size_t size = 1 + kHeaderFieldsSize;
  for (const auto &entry : entries) {
    size += encodedStringSize(entry.path) + kHeaderFieldsSize;
  }
  return size;
}

std::optional<size_t> decodeHeaderTable(std::span<const uint8_t> buffer, size_t offset,
                                        std::vector<FileEntry> &entries, Error *outError) {
  entries.clear();

  size_t pos = offset;
  uint64_t payloadOffset = 0;

  while (pos < buffer.size()) {
    auto [name, next] = decodeString(buffer, pos);

    if (name.empty()) {
      // Terminator; its fields carry no information
      pos = std::min(next + kHeaderFieldsSize, buffer.size());
      break;
    }

    if (next + kHeaderFieldsSize > buffer.size()) {
      setError(outError, ErrorCode::TruncatedArchive,
               std::format("Header for '{}' at offset {} extends beyond end of archive", name,
                           pos));
      return std::nullopt;
    }

    FileEntry entry;
    entry.path = std::move(name);
    entry.packingMethod = decodeU32LE(buffer, next);
    entry.originalSize = decodeU32LE(buffer, next + 4);
    entry.reserved = decodeU32LE(buffer, next + 8);
    entry.timestamp = decodeU32LE(buffer, next + 12);
    entry.dataSize = decodeU32LE(buffer, next + 16);
    entry.offset = payloadOffset;
    payloadOffset += entry.dataSize;

    entries.push_back(std::move(entry));
    pos = next + kHeaderFieldsSize;
  }

  // Payload starts right after the table
  for (auto &entry : entries) {
    entry.offset += pos;
  }

  return pos;
}

} // namespace pbo
