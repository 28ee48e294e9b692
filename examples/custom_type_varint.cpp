/**
 * @file custom_type_varint.cpp
 * @brief 演示如何注册自定义帧类型，并与内建类型组合使用
 *
 * 注册两个类型：
 * - varint：LEB128 无符号变长整数；
 * - varint-bytes：以 varint 为长度前缀的字节串（内部回调 prefixed 内建类型）。
 *
 * 之后就可以在 spec（包括文本 spec）里像内建类型一样使用它们。
 */

#include <blobspec/dsl/parser.hpp>
#include <blobspec/frame/decoder.hpp>
#include <blobspec/utils/hex.hpp>
#include <blobspec/utils/value_dump.hpp>

#include <cstdint>
#include <iostream>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

using namespace blobspec;

namespace {

std::error_code decode_varint(const frame::FrameContext &,
                              core::Cursor &cursor,
                              std::string_view,
                              std::span<const frame::Param> params,
                              frame::Value &out) {
    if (!params.empty()) {
        return core::make_error_code(core::errc::invalid_argument);
    }
    std::uint64_t value = 0;
    for (unsigned shift = 0; shift < 64; shift += 7) {
        std::uint8_t b = 0;
        if (auto ec = cursor.get_u8(b)) {
            return ec;
        }
        value |= static_cast<std::uint64_t>(b & 0x7F) << shift;
        if ((b & 0x80) == 0) {
            out = frame::Value::unsigned_int(64, value);
            return {};
        }
    }
    // 超过 10 字节仍未结束：不是合法的 64 位 varint。
    return core::make_error_code(core::errc::invalid_argument);
}

std::error_code decode_varint_bytes(const frame::FrameContext &context,
                                    core::Cursor &cursor,
                                    std::string_view,
                                    std::span<const frame::Param> params,
                                    frame::Value &out) {
    if (!params.empty()) {
        return core::make_error_code(core::errc::invalid_argument);
    }
    return context.decode_frame(
        cursor, frame::TypeSpec::of("prefixed", "array", "varint"), out);
}

} // namespace

int main() {
    frame::Decoder decoder;
    for (auto [tag, fn] : {std::pair{"varint", &decode_varint},
                           std::pair{"varint-bytes", &decode_varint_bytes}}) {
        if (auto ec = decoder.register_type(tag, fn)) {
            std::cerr << "注册 " << tag << " 失败: " << ec.message() << "\n";
            return 1;
        }
    }

    // 内建标签不可覆盖。
    if (auto ec = decoder.register_type("uint32", decode_varint)) {
        std::cout << "register_type(\"uint32\") -> " << ec.message() << "\n";
    }

    const auto parsed = dsl::parse_spec(R"(
        [:id      :varint
         :payload :varint-bytes
         :version :uint16])");
    if (parsed.ec) {
        std::cerr << "spec 解析失败 (" << parsed.error_line << ":"
                  << parsed.error_column << "): " << parsed.error_message << "\n";
        return 1;
    }

    std::vector<core::byte> bytes;
    if (auto ec = utils::parse_hex("AC 02 03 DE AD BE 00 02", bytes)) {
        std::cerr << "parse_hex 失败: " << ec.message() << "\n";
        return 1;
    }

    core::Cursor cursor(std::move(bytes));
    frame::Record record;
    if (auto ec = decoder.decode_blob(cursor, parsed.spec, record)) {
        std::cerr << "decode_blob 失败: " << ec.message() << "\n";
        return 1;
    }

    utils::ValueDumpOptions opt;
    opt.multiline = true;
    std::cout << utils::dump_record(record, opt) << "\n";
    return 0;
}
