#pragma once

#include "blobspec/core/cursor.hpp"
#include "blobspec/frame/type_spec.hpp"

#include <cstddef>
#include <span>
#include <string_view>
#include <system_error>

namespace blobspec::frame {

class Decoder;
class Record;
class Value;

/**
 * @brief 单次帧解码的上下文：所属 Decoder + 当前 struct 嵌套深度。
 *
 * 内建的 struct / sequence 解码器以及用户注册的解码函数都通过它回调
 * Decoder，从而可以递归解码而不直接依赖全局状态。
 */
class FrameContext final {
 public:
  FrameContext() = default;
  FrameContext(const Decoder& decoder, std::size_t depth) noexcept
      : decoder_(&decoder), depth_(depth) {}

  [[nodiscard]] const Decoder* decoder() const noexcept { return decoder_; }
  [[nodiscard]] std::size_t depth() const noexcept { return depth_; }

  std::error_code decode_frame(core::Cursor& cursor, const TypeSpec& type, Value& out) const;
  std::error_code decode_frame(core::Cursor& cursor,
                               std::string_view tag,
                               std::span<const Param> params,
                               Value& out) const;

  /**
   * @brief 以“嵌套一层”的深度解码 spec（超过 DecoderOptions::max_depth 返回 errc::too_deep）。
   */
  std::error_code decode_blob(core::Cursor& cursor, const Spec& spec, Record& out) const;

 private:
  const Decoder* decoder_{nullptr};
  std::size_t depth_{0};
};

}  // namespace blobspec::frame
