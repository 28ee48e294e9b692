#pragma once

#include "blobspec/frame/value.hpp"

#include <cstddef>
#include <string>

namespace blobspec::utils {

/**
 * @brief 解码结果（Value / Record）的可读化输出（调试/日志用途）。
 *
 * 说明：
 * - 输出形如 `{ :length uint32 5, :type string[4] "IHDR" }`，不是可回读的格式；
 * - 惰性序列只输出 `<sequence of TAG>`，不会推进其底层 Cursor；
 * - slice 输出长度、当前读指针与（截断后的）字节内容，同样不推进读指针。
 */
struct ValueDumpOptions final {
    // 递归最大深度（0 表示只输出根节点）。
    std::size_t max_depth{16};

    // Record 最大输出字段数（0 表示不限制）。
    std::size_t max_record_items{128};

    // string/bytes/slice 最大输出字节数（0 表示不限制）。
    std::size_t max_payload_bytes{64};

    // Record 是否使用多行缩进格式。
    bool multiline{false};

    // 每层缩进空格数（multiline=true 时生效）。
    std::size_t indent_spaces{2};

    // 是否输出 ANSI 颜色控制码。
    bool enable_color{false};
};

[[nodiscard]] std::string dump_value(const blobspec::frame::Value &value,
                                     ValueDumpOptions options = {});

[[nodiscard]] std::string dump_record(const blobspec::frame::Record &record,
                                      ValueDumpOptions options = {});

} // namespace blobspec::utils
