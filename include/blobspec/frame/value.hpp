#pragma once

#include "blobspec/core/cursor.hpp"
#include "blobspec/frame/sequence.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace blobspec::frame {

class Value;

/**
 * @brief 解码结果：字段名 -> Value 的映射（保留首次插入顺序，比较时不看顺序）。
 *
 * set() 遇到同名字段会覆盖旧值，与 spec 中后出现的同名字段覆盖先出现的语义一致。
 */
class Record final {
 public:
  Record() = default;

  [[nodiscard]] std::size_t size() const noexcept { return keys_.size(); }
  [[nodiscard]] bool empty() const noexcept { return keys_.empty(); }

  [[nodiscard]] bool contains(std::string_view key) const noexcept;
  [[nodiscard]] const Value* find(std::string_view key) const noexcept;
  [[nodiscard]] Value* find(std::string_view key) noexcept;

  void set(std::string key, Value value);
  bool erase(std::string_view key);

  [[nodiscard]] const std::vector<std::string>& keys() const noexcept { return keys_; }
  [[nodiscard]] const std::vector<Value>& values() const noexcept { return values_; }

  friend bool operator==(const Record& lhs, const Record& rhs) noexcept;
  friend bool operator!=(const Record& lhs, const Record& rhs) noexcept { return !(lhs == rhs); }

 private:
  [[nodiscard]] std::size_t index_of(std::string_view key) const noexcept;

  std::vector<std::string> keys_;
  std::vector<Value> values_;
};

// “无值”：skip 等帧的结果，spec 求值时据此省略字段。
struct Nothing final {
  friend bool operator==(const Nothing&, const Nothing&) = default;
};

// width 为位宽（8/16/32/64）。
struct Signed final {
  std::uint8_t width{0};
  std::int64_t value{0};
  friend bool operator==(const Signed&, const Signed&) = default;
};

struct Unsigned final {
  std::uint8_t width{0};
  std::uint64_t value{0};
  friend bool operator==(const Unsigned&, const Unsigned&) = default;
};

struct Text final {
  std::string value;
  friend bool operator==(const Text&, const Text&) = default;
};

struct Bytes final {
  std::vector<byte> value;
  friend bool operator==(const Bytes&, const Bytes&) = default;
};

// slice 帧的结果：与源共享存储、拥有独立读指针的 Cursor。
struct Slice final {
  core::Cursor cursor;

  friend bool operator==(const Slice& lhs, const Slice& rhs) noexcept;
};

/**
 * @brief 单个帧的解码结果（强类型和类型，调用方按 std::visit / get_if 穷举处理）。
 */
class Value final {
 public:
  using storage_type = std::variant<Nothing, Signed, Unsigned, Text, Bytes, Record, Slice, LazySequence>;

  Value() = default;

  explicit Value(Nothing v);
  explicit Value(Signed v);
  explicit Value(Unsigned v);
  explicit Value(Text v);
  explicit Value(Bytes v);
  explicit Value(Record v);
  explicit Value(Slice v);
  explicit Value(LazySequence v);

  [[nodiscard]] const storage_type& storage() const noexcept { return storage_; }
  [[nodiscard]] storage_type& storage() noexcept { return storage_; }

  template <class T>
  [[nodiscard]] const T* get_if() const noexcept {
    return std::get_if<T>(&storage_);
  }

  template <class T>
  [[nodiscard]] T* get_if() noexcept {
    return std::get_if<T>(&storage_);
  }

  [[nodiscard]] bool is_nothing() const noexcept { return std::holds_alternative<Nothing>(storage_); }

  /**
   * @brief 整数值（Signed，或不超过 int64 上限的 Unsigned）；其他类型返回 nullopt。
   */
  [[nodiscard]] std::optional<std::int64_t> as_int64() const noexcept;

  static Value nothing();
  static Value signed_int(std::uint8_t width, std::int64_t value);
  static Value unsigned_int(std::uint8_t width, std::uint64_t value);
  static Value text(std::string value);
  static Value bytes(std::vector<byte> value);
  static Value record(Record value);
  static Value slice(core::Cursor cursor);
  static Value sequence(LazySequence value);

  friend bool operator==(const Value& lhs, const Value& rhs) noexcept;
  friend bool operator!=(const Value& lhs, const Value& rhs) noexcept { return !(lhs == rhs); }

 private:
  storage_type storage_{};
};

}  // namespace blobspec::frame
