#include "blobspec/frame/value.hpp"

#include <algorithm>
#include <limits>

namespace blobspec::frame {

std::size_t Record::index_of(std::string_view key) const noexcept {
  for (std::size_t i = 0; i < keys_.size(); ++i) {
    if (keys_[i] == key) {
      return i;
    }
  }
  return keys_.size();
}

bool Record::contains(std::string_view key) const noexcept {
  return index_of(key) != keys_.size();
}

const Value* Record::find(std::string_view key) const noexcept {
  const auto i = index_of(key);
  if (i == keys_.size()) {
    return nullptr;
  }
  return &values_[i];
}

Value* Record::find(std::string_view key) noexcept {
  const auto i = index_of(key);
  if (i == keys_.size()) {
    return nullptr;
  }
  return &values_[i];
}

void Record::set(std::string key, Value value) {
  const auto i = index_of(key);
  if (i != keys_.size()) {
    values_[i] = std::move(value);
    return;
  }
  keys_.push_back(std::move(key));
  values_.push_back(std::move(value));
}

bool Record::erase(std::string_view key) {
  const auto i = index_of(key);
  if (i == keys_.size()) {
    return false;
  }
  keys_.erase(keys_.begin() + static_cast<std::ptrdiff_t>(i));
  values_.erase(values_.begin() + static_cast<std::ptrdiff_t>(i));
  return true;
}

// 映射语义：键集合相同且每个键对应的值相等即可，不要求插入顺序一致。
bool operator==(const Record& lhs, const Record& rhs) noexcept {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  for (std::size_t i = 0; i < lhs.keys_.size(); ++i) {
    const auto* other = rhs.find(lhs.keys_[i]);
    if (other == nullptr || !(lhs.values_[i] == *other)) {
      return false;
    }
  }
  return true;
}

// Slice 按“视图内容”比较：可读区字节、读指针与字节序都一致才相等。
bool operator==(const Slice& lhs, const Slice& rhs) noexcept {
  if (lhs.cursor.position() != rhs.cursor.position() || lhs.cursor.order() != rhs.cursor.order()) {
    return false;
  }
  const auto a = lhs.cursor.readable_bytes();
  const auto b = rhs.cursor.readable_bytes();
  return std::equal(a.begin(), a.end(), b.begin(), b.end());
}

Value::Value(Nothing v) : storage_(v) {}
Value::Value(Signed v) : storage_(v) {}
Value::Value(Unsigned v) : storage_(v) {}
Value::Value(Text v) : storage_(std::move(v)) {}
Value::Value(Bytes v) : storage_(std::move(v)) {}
Value::Value(Record v) : storage_(std::move(v)) {}
Value::Value(Slice v) : storage_(std::move(v)) {}
Value::Value(LazySequence v) : storage_(std::move(v)) {}

std::optional<std::int64_t> Value::as_int64() const noexcept {
  if (const auto* s = std::get_if<Signed>(&storage_)) {
    return s->value;
  }
  if (const auto* u = std::get_if<Unsigned>(&storage_)) {
    if (u->value > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
      return std::nullopt;
    }
    return static_cast<std::int64_t>(u->value);
  }
  return std::nullopt;
}

Value Value::nothing() {
  return Value(Nothing{});
}

Value Value::signed_int(std::uint8_t width, std::int64_t value) {
  return Value(Signed{width, value});
}

Value Value::unsigned_int(std::uint8_t width, std::uint64_t value) {
  return Value(Unsigned{width, value});
}

Value Value::text(std::string value) {
  return Value(Text{std::move(value)});
}

Value Value::bytes(std::vector<byte> value) {
  return Value(Bytes{std::move(value)});
}

Value Value::record(Record value) {
  return Value(std::move(value));
}

Value Value::slice(core::Cursor cursor) {
  return Value(Slice{std::move(cursor)});
}

Value Value::sequence(LazySequence value) {
  return Value(std::move(value));
}

bool operator==(const Value& lhs, const Value& rhs) noexcept {
  return lhs.storage_ == rhs.storage_;
}

}  // namespace blobspec::frame
