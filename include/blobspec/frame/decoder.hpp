#pragma once

#include "blobspec/core/common.hpp"
#include "blobspec/core/cursor.hpp"
#include "blobspec/frame/context.hpp"
#include "blobspec/frame/sequence.hpp"
#include "blobspec/frame/type_spec.hpp"
#include "blobspec/frame/value.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>

namespace blobspec::frame {

/**
 * @brief 内建类型标签（封闭集合）。用户扩展的标签放在 Decoder 的旁路表中。
 */
enum class BuiltinType : std::uint8_t {
  byte,
  ubyte,
  int16,
  uint16,
  int32,
  uint32,
  int64,
  uint64,
  string,
  array,
  c_string,
  pred_string,
  delimited_string,
  prefixed,
  prefixed_string,
  skip,
  slice,
  structure,
  sequence,
};

[[nodiscard]] std::optional<BuiltinType> builtin_type(std::string_view tag) noexcept;
[[nodiscard]] std::string_view builtin_tag(BuiltinType type) noexcept;

/**
 * @brief 用户解码函数。
 *
 * - 成功时写 out（不产生值时写 Value::nothing()），返回 {}；
 * - 需要递归解码时通过 context 回调，保证嵌套深度被正确计数。
 */
using DecodeFn = std::function<std::error_code(const FrameContext& context,
                                               core::Cursor& cursor,
                                               std::string_view tag,
                                               std::span<const Param> params,
                                               Value& out)>;

struct DecoderOptions final {
  // struct 帧最大嵌套深度（顶层 spec 为 0）。
  std::size_t max_depth{core::kDefaultMaxDepth};
};

/**
 * @brief 帧解码器：类型标签 -> 解码操作的开放注册表，以及 spec 求值器。
 *
 * 说明：
 * - 内建标签不可被覆盖；register_type 对内建标签返回 errc::invalid_argument；
 * - 注册表内部用互斥锁保护，查找时拷贝出 DecodeFn 后在锁外执行；
 * - 解码本身不加锁：同一个 Cursor 不应被并发解码。
 */
class Decoder final {
 public:
  explicit Decoder(DecoderOptions options = {});

  Decoder(const Decoder&) = delete;
  Decoder& operator=(const Decoder&) = delete;

  [[nodiscard]] const DecoderOptions& options() const noexcept { return options_; }

  std::error_code register_type(std::string tag, DecodeFn fn);
  void unregister_type(std::string_view tag);
  void clear_custom_types();

  // 内建标签或已注册的自定义标签。
  [[nodiscard]] bool has_type(std::string_view tag) const;

  /**
   * @brief 解码单个帧。失败时 out 保持不变。
   *
   * 例：
   *   decoder.decode_frame(cursor, TypeSpec::of("string", 5), v);  // v = Text{"MAGIC"}
   */
  std::error_code decode_frame(core::Cursor& cursor, const TypeSpec& type, Value& out) const;
  std::error_code decode_frame(core::Cursor& cursor,
                               std::string_view tag,
                               std::span<const Param> params,
                               Value& out) const;

  /**
   * @brief 按 spec 顺序解码多个字段，组装为 Record。
   *
   * - spec 长度为奇数或结构不合法时返回 errc::malformed_spec，且不读取任何字节；
   * - skip_field 跳过指定字节数，不产生字段；结果为 Nothing 的字段被省略；
   * - 任一字段失败即返回错误，已解码的字段全部丢弃，out 保持不变。
   */
  std::error_code decode_blob(core::Cursor& cursor, const Spec& spec, Record& out) const;

  /**
   * @brief 等价于直接解码 sequence 帧：element 的惰性序列，绑定到 cursor。
   */
  std::error_code decode_blob_array(core::Cursor& cursor, const TypeSpec& element, LazySequence& out) const;

 private:
  friend class FrameContext;

  [[nodiscard]] std::optional<DecodeFn> find_custom_(std::string_view tag) const;

  std::error_code dispatch_(const FrameContext& context,
                            core::Cursor& cursor,
                            std::string_view tag,
                            std::span<const Param> params,
                            Value& out) const;

  std::error_code evaluate_(const FrameContext& context,
                            core::Cursor& cursor,
                            const Spec& spec,
                            Record& out) const;

  DecoderOptions options_{};

  mutable std::mutex mu_{};
  std::map<std::string, DecodeFn, std::less<>> custom_{};
};

/**
 * @brief 进程级默认 Decoder（下列自由函数均作用于它）。
 */
Decoder& default_decoder();

std::error_code register_type(std::string tag, DecodeFn fn);

std::error_code decode_frame(core::Cursor& cursor, const TypeSpec& type, Value& out);
std::error_code decode_blob(core::Cursor& cursor, const Spec& spec, Record& out);
std::error_code decode_blob_array(core::Cursor& cursor, const TypeSpec& element, LazySequence& out);

}  // namespace blobspec::frame
