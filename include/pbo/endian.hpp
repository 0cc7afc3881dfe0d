#pragma once

#include <bit>
#include <cstdint>

namespace pbo {

// C++20-compatible byteswap (C++23 has std::byteswap)
namespace detail {

inline constexpr uint32_t byteswap(uint32_t value) noexcept {
  return ((value & 0x000000FFu) << 24) | ((value & 0x0000FF00u) << 8) |
         ((value & 0x00FF0000u) >> 8) | ((value & 0xFF000000u) >> 24);
}

} // namespace detail

// Check if the system is little-endian at compile time
inline constexpr bool is_little_endian() noexcept {
  return std::endian::native == std::endian::little;
}

// PBO numeric fields are little-endian. The names avoid glibc's htole32 family,
// which are macros.

inline constexpr uint32_t le32_to_host(uint32_t value) noexcept {
  if constexpr (!is_little_endian()) {
    return detail::byteswap(value);
  }
  return value;
}

inline constexpr uint32_t host_to_le32(uint32_t value) noexcept {
  return le32_to_host(value);
}

} // namespace pbo
