#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace blobspec::core {

using byte = std::uint8_t;
using bytes_view = std::span<const byte>;
using mutable_bytes_view = std::span<byte>;

/**
 * @brief 多字节整数的字节序。
 */
enum class ByteOrder : std::uint8_t {
    big_endian = 0,
    little_endian = 1,
};

// 未显式指定时 Cursor 使用的字节序（网络序 / 大端）。
inline constexpr ByteOrder kDefaultByteOrder = ByteOrder::big_endian;

// struct 帧默认的最大嵌套深度：防止恶意 spec 构造极深嵌套导致栈溢出。
inline constexpr std::size_t kDefaultMaxDepth = 64;

}  // 命名空间 blobspec::core
