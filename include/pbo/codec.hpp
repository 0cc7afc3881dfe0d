#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "types.hpp"

namespace pbo {

// Byte-level layout of a PBO archive:
//
//   0x00 "sreV" 0x00 16*0x00                 preamble (22 bytes)
//   { name\0 method originalSize reserved timestamp dataSize }*
//   \0 0 0 0 0 0                             terminator header
//   payload bytes, in header order
//   21*0x00                                  checksum placeholder
//
// All integers are u32 little-endian.

inline constexpr char kSignature[4] = {'s', 'r', 'e', 'V'};
inline constexpr size_t kSignatureSize = sizeof(kSignature);
inline constexpr size_t kPreambleSize = 22;
inline constexpr size_t kHeaderFieldsSize = 20; // five u32 fields
inline constexpr size_t kChecksumSize = 21;

// Append s as ASCII plus a null terminator. Bytes >= 0x80 and embedded nulls are dropped.
void encodeString(std::string_view s, std::vector<uint8_t> &out);

// Bytes encodeString would emit for s, terminator included
size_t encodedStringSize(std::string_view s);

// Read the null-terminated string at offset. Returns the string and the offset just
// past its terminator, or {"", buffer.size()} when no terminator remains.
std::pair<std::string, size_t> decodeString(std::span<const uint8_t> buffer, size_t offset);

void encodeU32LE(uint32_t value, std::vector<uint8_t> &out);

// Caller guarantees offset + 4 <= buffer.size()
uint32_t decodeU32LE(std::span<const uint8_t> buffer, size_t offset);

// Fixed 22-byte preamble: empty product name, signature, zeroed fields and an
// empty property list
void encodePreamble(std::vector<uint8_t> &out);

// Skip the product string and, if present, the "sreV" block with its property
// list. Returns the offset of the first entry header.
size_t skipPreamble(std::span<const uint8_t> buffer, Properties *outProperties = nullptr);

void encodeEntryHeader(const FileEntry &entry, std::vector<uint8_t> &out);

// Empty name followed by five zero fields
void encodeTerminator(std::vector<uint8_t> &out);

void encodeChecksumPlaceholder(std::vector<uint8_t> &out);

// Size of the header table for entries, terminator included
size_t headerTableSize(const std::vector<FileEntry> &entries);

// Decode entry headers starting at offset until the terminator. Each entry's offset
// is set to its absolute position in buffer. Returns the offset where the payload
// begins, or std::nullopt if a header is cut off.
std::optional<size_t> decodeHeaderTable(std::span<const uint8_t> buffer, size_t offset,
                                        std::vector<FileEntry> &entries,
                                        Error *outError = nullptr);

} // namespace pbo
