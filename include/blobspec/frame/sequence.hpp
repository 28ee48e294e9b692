#pragma once

#include "blobspec/core/cursor.hpp"
#include "blobspec/frame/context.hpp"
#include "blobspec/frame/type_spec.hpp"

#include <cstddef>
#include <system_error>
#include <vector>

namespace blobspec::frame {

class Value;

/**
 * @brief 惰性同构序列：反复解码 element_type，直到 Cursor 读到 limit。
 *
 * 约定：
 * - 元素只在 next() 时才解码，每次解码都推进“共享的” Cursor；
 * - 位置状态完全在 Cursor 中，序列本身不缓存元素，因此只能单次遍历；
 *   部分消费后直接对同一 Cursor 解码，会从下一个未消费的字节继续；
 * - 序列不拥有 Cursor，调用方需保证 Cursor 在序列使用期间存活；
 *   Cursor 被移走后变为空视图，next() 返回 errc::out_of_bounds；
 * - 任一元素解码失败（含未消耗任何字节）后，序列视为结束，done() 返回 true。
 */
class LazySequence final {
 public:
  LazySequence() = default;
  LazySequence(FrameContext context, core::Cursor& cursor, TypeSpec element);

  [[nodiscard]] bool done() const noexcept;

  /**
   * @brief 解码下一个元素；已读完时返回 errc::out_of_bounds。
   *
   * 若元素没有消耗任何字节（例如 skip 0、空 struct），返回 errc::invalid_argument，
   * 序列随即结束，避免 `while (!done())` 循环永不退出。
   */
  std::error_code next(Value& out);

  /**
   * @brief 解码剩余全部元素并追加到 out；遇到第一个错误即返回该错误。
   */
  std::error_code collect(std::vector<Value>& out);

  [[nodiscard]] const TypeSpec& element_type() const noexcept { return element_; }
  [[nodiscard]] std::size_t produced() const noexcept { return produced_; }

  // 同一 Cursor 上、同一元素标签的序列视为相等（序列不可重放，无法按内容比较）。
  friend bool operator==(const LazySequence& lhs, const LazySequence& rhs) noexcept {
    return lhs.cursor_ == rhs.cursor_ && lhs.element_.tag == rhs.element_.tag;
  }

 private:
  FrameContext context_{};
  core::Cursor* cursor_{nullptr};
  TypeSpec element_{};
  std::size_t produced_{0};
  bool failed_{false};
};

}  // namespace blobspec::frame
