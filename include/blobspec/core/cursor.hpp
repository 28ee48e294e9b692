#pragma once

#include "blobspec/core/common.hpp"
#include "blobspec/core/error.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <system_error>
#include <vector>

namespace blobspec::core {

/**
 * @brief 带读指针的只读字节缓冲区（position / limit 模型）。
 *
 * 模型：
 * - 底层字节由 shared_ptr 持有，slice() 得到的子 Cursor 与源共享同一份存储；
 * - 每个 Cursor 有自己独立的 position / limit / byte order；
 * - 0 <= position <= limit，读取越过 limit 返回 errc::out_of_bounds，且 position 不变。
 *
 * 注意：
 * - slice() 会推进“源” Cursor 的 position（切走的字节不会被源再次读到）；
 * - 本类不做线程安全保证，同一个 Cursor 不应被多个读者同时解码。
 */
class Cursor final {
public:
    Cursor() = default;
    explicit Cursor(std::vector<byte> bytes,
                    ByteOrder order = kDefaultByteOrder);

    Cursor(const Cursor &) = default;
    Cursor &operator=(const Cursor &) = default;

    // 被移走的 Cursor 变为空视图（limit 为 0），之后的读取返回 out_of_bounds。
    Cursor(Cursor &&other) noexcept;
    Cursor &operator=(Cursor &&other) noexcept;

    /**
     * @brief 拷贝 bytes 构造一个新的 Cursor（调用方无需保证 bytes 的生命周期）。
     */
    [[nodiscard]] static Cursor wrap(bytes_view bytes,
                                     ByteOrder order = kDefaultByteOrder);

    [[nodiscard]] std::size_t position() const noexcept { return pos_; }
    [[nodiscard]] std::size_t limit() const noexcept { return limit_; }
    [[nodiscard]] std::size_t remaining() const noexcept { return limit_ - pos_; }
    [[nodiscard]] bool exhausted() const noexcept { return pos_ == limit_; }

    [[nodiscard]] ByteOrder order() const noexcept { return order_; }
    void set_order(ByteOrder order) noexcept { order_ = order; }

    std::error_code set_position(std::size_t pos) noexcept;
    void rewind() noexcept { pos_ = 0; }

    // [0, limit) 整个可读区。
    [[nodiscard]] bytes_view readable_bytes() const noexcept;
    // [position, limit) 尚未读取的部分。
    [[nodiscard]] bytes_view remaining_bytes() const noexcept;

    std::error_code get_i8(std::int8_t &out) noexcept;
    std::error_code get_u8(std::uint8_t &out) noexcept;
    std::error_code get_i16(std::int16_t &out) noexcept;
    std::error_code get_u16(std::uint16_t &out) noexcept;
    std::error_code get_i32(std::int32_t &out) noexcept;
    std::error_code get_u32(std::uint32_t &out) noexcept;
    std::error_code get_i64(std::int64_t &out) noexcept;
    std::error_code get_u64(std::uint64_t &out) noexcept;

    /**
     * @brief 读取 n 个字节到新分配的数组（out 被整体替换）。
     */
    std::error_code read_bytes(std::size_t n, std::vector<byte> &out);

    std::error_code skip(std::size_t n) noexcept;

    /**
     * @brief 切出 [position, position + n) 作为独立 Cursor，不拷贝底层存储。
     *
     * 成功时 out 的 position 为 0、limit 为 n、字节序继承自源；源 position 前进 n。
     */
    std::error_code slice(std::size_t n, Cursor &out) noexcept;

private:
    [[nodiscard]] const byte *base() const noexcept;

    template <class UInt>
    std::error_code get_uint_(UInt &out) noexcept;

    void reset_view_() noexcept;

    std::shared_ptr<const std::vector<byte>> storage_;

    // 本视图在 storage_ 中的起始偏移（slice 时累加）。
    std::size_t offset_{0};
    std::size_t limit_{0};
    std::size_t pos_{0};
    ByteOrder order_{kDefaultByteOrder};
};

} // namespace blobspec::core
