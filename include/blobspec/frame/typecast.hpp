#pragma once

#include <cstdint>

namespace blobspec::frame {

/*
 * 有符号定宽读数 -> 无符号数值域的转换。
 *
 * 宽度 <= 32 位时结果落在“下一档更宽的有符号类型”的非负区间；
 * 64 位没有更宽的内建有符号类型，直接给出 std::uint64_t（0..2^64-1 全覆盖）。
 */

[[nodiscard]] constexpr std::int16_t byte_to_ubyte(std::int8_t x) noexcept {
  return static_cast<std::int16_t>(static_cast<std::int16_t>(x) & 0xFF);
}

[[nodiscard]] constexpr std::int32_t short_to_ushort(std::int16_t x) noexcept {
  return static_cast<std::int32_t>(x) & 0xFFFF;
}

[[nodiscard]] constexpr std::int64_t int_to_uint(std::int32_t x) noexcept {
  return static_cast<std::int64_t>(x) & 0xFFFF'FFFFLL;
}

[[nodiscard]] constexpr std::uint64_t long_to_ulong(std::int64_t x) noexcept {
  return static_cast<std::uint64_t>(x);
}

static_assert(byte_to_ubyte(-1) == 255);
static_assert(short_to_ushort(-1) == 65535);
static_assert(int_to_uint(-1) == 4294967295LL);
static_assert(long_to_ulong(-1) == 18446744073709551615ULL);

}  // namespace blobspec::frame
