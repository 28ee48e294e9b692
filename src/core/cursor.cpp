#include "blobspec/core/cursor.hpp"

#include <algorithm>
#include <type_traits>

namespace blobspec::core {

/*
 * Cursor 的实现模型：
 * - storage_ 为整块底层字节，offset_ 为本视图起点，limit_ 为本视图长度；
 * - 所有读取先做边界检查再移动 pos_，失败时 pos_ 保持不变；
 * - 多字节整数按 order_ 逐字节拼装，不依赖宿主字节序。
 */
Cursor::Cursor(std::vector<byte> bytes, ByteOrder order)
    : storage_(std::make_shared<const std::vector<byte>>(std::move(bytes))),
      order_(order) {
    limit_ = storage_->size();
}

Cursor::Cursor(Cursor &&other) noexcept
    : storage_(std::move(other.storage_)),
      offset_(other.offset_),
      limit_(other.limit_),
      pos_(other.pos_),
      order_(other.order_) {
    other.reset_view_();
}

Cursor &Cursor::operator=(Cursor &&other) noexcept {
    if (this != &other) {
        storage_ = std::move(other.storage_);
        offset_ = other.offset_;
        limit_ = other.limit_;
        pos_ = other.pos_;
        order_ = other.order_;
        other.reset_view_();
    }
    return *this;
}

void Cursor::reset_view_() noexcept {
    storage_.reset();
    offset_ = 0;
    limit_ = 0;
    pos_ = 0;
}

Cursor Cursor::wrap(bytes_view bytes, ByteOrder order) {
    return Cursor(std::vector<byte>(bytes.begin(), bytes.end()), order);
}

const byte *Cursor::base() const noexcept {
    if (!storage_) {
        return nullptr;
    }
    return storage_->data() + offset_;
}

std::error_code Cursor::set_position(std::size_t pos) noexcept {
    if (pos > limit_) {
        return make_error_code(errc::out_of_bounds);
    }
    pos_ = pos;
    return {};
}

bytes_view Cursor::readable_bytes() const noexcept {
    if (limit_ == 0) {
        return {};
    }
    return bytes_view{base(), limit_};
}

bytes_view Cursor::remaining_bytes() const noexcept {
    if (remaining() == 0) {
        return {};
    }
    return bytes_view{base() + pos_, remaining()};
}

template <class UInt>
std::error_code Cursor::get_uint_(UInt &out) noexcept {
    static_assert(std::is_unsigned_v<UInt>, "UInt must be unsigned");
    constexpr std::size_t width = sizeof(UInt);
    if (remaining() < width) {
        return make_error_code(errc::out_of_bounds);
    }
    const byte *p = base() + pos_;
    UInt v = 0;
    if (order_ == ByteOrder::big_endian) {
        for (std::size_t i = 0; i < width; ++i) {
            v = static_cast<UInt>((v << 8) | static_cast<UInt>(p[i]));
        }
    } else {
        for (std::size_t i = width; i > 0; --i) {
            v = static_cast<UInt>((v << 8) | static_cast<UInt>(p[i - 1]));
        }
    }
    pos_ += width;
    out = v;
    return {};
}

std::error_code Cursor::get_u8(std::uint8_t &out) noexcept {
    return get_uint_(out);
}

std::error_code Cursor::get_u16(std::uint16_t &out) noexcept {
    return get_uint_(out);
}

std::error_code Cursor::get_u32(std::uint32_t &out) noexcept {
    return get_uint_(out);
}

std::error_code Cursor::get_u64(std::uint64_t &out) noexcept {
    return get_uint_(out);
}

// 有符号读取：先按无符号拼装，再按二进制补码转换（C++20 起为定义行为）。
std::error_code Cursor::get_i8(std::int8_t &out) noexcept {
    std::uint8_t v = 0;
    auto ec = get_uint_(v);
    if (ec) {
        return ec;
    }
    out = static_cast<std::int8_t>(v);
    return {};
}

std::error_code Cursor::get_i16(std::int16_t &out) noexcept {
    std::uint16_t v = 0;
    auto ec = get_uint_(v);
    if (ec) {
        return ec;
    }
    out = static_cast<std::int16_t>(v);
    return {};
}

std::error_code Cursor::get_i32(std::int32_t &out) noexcept {
    std::uint32_t v = 0;
    auto ec = get_uint_(v);
    if (ec) {
        return ec;
    }
    out = static_cast<std::int32_t>(v);
    return {};
}

std::error_code Cursor::get_i64(std::int64_t &out) noexcept {
    std::uint64_t v = 0;
    auto ec = get_uint_(v);
    if (ec) {
        return ec;
    }
    out = static_cast<std::int64_t>(v);
    return {};
}

std::error_code Cursor::read_bytes(std::size_t n, std::vector<byte> &out) {
    if (n > remaining()) {
        return make_error_code(errc::out_of_bounds);
    }
    const byte *p = base() + pos_;
    out.assign(p, p + n);
    pos_ += n;
    return {};
}

std::error_code Cursor::skip(std::size_t n) noexcept {
    if (n > remaining()) {
        return make_error_code(errc::out_of_bounds);
    }
    pos_ += n;
    return {};
}

std::error_code Cursor::slice(std::size_t n, Cursor &out) noexcept {
    if (n > remaining()) {
        return make_error_code(errc::out_of_bounds);
    }
    Cursor view;
    view.storage_ = storage_;
    view.offset_ = offset_ + pos_;
    view.limit_ = n;
    view.pos_ = 0;
    view.order_ = order_;

    pos_ += n;
    out = std::move(view);
    return {};
}

} // namespace blobspec::core
