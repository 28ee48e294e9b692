#pragma once

#include "blobspec/core/common.hpp"
#include "blobspec/core/cursor.hpp"
#include "blobspec/core/error.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace blobspec::utils {

/**
 * @brief 16 进制解析/格式化工具。
 *
 * 典型使用场景：
 * - 测试夹具与示例里用 "00 00 00 05 4D 41 47 49 43" 这样的文本构造缓冲区；
 * - 解码失败时把 Cursor 的可读区 hexdump 出来，并标出当前读指针。
 */

struct HexDumpOptions final {
    // 每行字节数（0 按 16 处理）。
    std::size_t bytes_per_line{16};

    // 输出的最大字节数（0 表示不限制）。超出部分会打印截断提示。
    std::size_t max_bytes{256};

    // 是否输出行首偏移（0000:）。
    bool show_offset{true};

    // 是否输出 ASCII 侧栏（仅展示可打印字符，其余用 '.'）。
    bool show_ascii{false};

    // 是否输出 ANSI 颜色控制码（终端更易读；写入日志/文件时建议关闭）。
    bool enable_color{false};
};

/**
 * @brief 将 bytes 以 hexdump 形式格式化为字符串。
 */
[[nodiscard]] std::string hex_dump(blobspec::core::bytes_view bytes,
                                   HexDumpOptions options = {});

/**
 * @brief 输出 Cursor 的整个可读区 [0, limit)，读指针所在字节用 '>' 标出。
 */
[[nodiscard]] std::string hex_dump(const blobspec::core::Cursor &cursor,
                                   HexDumpOptions options = {});

/**
 * @brief 解析 16 进制字符串为 bytes。
 *
 * 支持大小写 hex；空白、逗号、冒号、连字符、下划线视为分隔符；
 * 每个字节可带 0x/0X 前缀。失败返回 core::errc::invalid_argument，out 被清空。
 */
std::error_code parse_hex(std::string_view text,
                          std::vector<blobspec::core::byte> &out);

} // namespace blobspec::utils
