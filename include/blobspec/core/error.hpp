#pragma once

#include <system_error>

namespace blobspec::core {

/**
 * @brief 本库通用错误码（跨模块复用）。
 *
 * 约定：
 * - 所有解码接口返回 std::error_code，不走异常路径；
 * - 出错即终止本次调用，不做部分结果拼装，也不做默认值替换。
 */
enum class errc : int {
  ok = 0,
  malformed_spec = 1,
  unknown_type = 2,
  out_of_bounds = 3,
  invalid_argument = 4,
  too_deep = 5,
};

const std::error_category& error_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

// 枚举名（如 "out_of_bounds"），用于日志与命令行输出；未知取值返回 "unknown"。
[[nodiscard]] const char* errc_name(errc e) noexcept;

}  // namespace blobspec::core

namespace std {
template <>
struct is_error_code_enum<blobspec::core::errc> : true_type {};
}  // namespace std
