/**
 * @file png_chunks.cpp
 * @brief 演示“部分解码 + slice + 嵌套解码 + 继续外层解码”的典型流程
 *
 * 输入是一段 PNG 风格的字节流：8 字节签名，随后若干 chunk
 * （length:uint32, type:string[4], data:length 字节, crc:uint32）。
 *
 * 运行：
 * - 无参数：使用内置样例（IHDR + tEXt + IEND）
 * - ./build/examples/png_chunks "<hex>" [--no-color]
 */

#include <blobspec/core/log.hpp>
#include <blobspec/frame/decoder.hpp>
#include <blobspec/utils/hex.hpp>
#include <blobspec/utils/value_dump.hpp>

#include <iostream>
#include <string>
#include <string_view>
#include <vector>

using namespace blobspec;
using frame::Record;
using frame::Spec;
using frame::TypeSpec;

namespace {

constexpr std::string_view kSample =
    "89 50 4E 47 0D 0A 1A 0A "
    "00 00 00 0D 49 48 44 52 00 00 01 00 00 00 00 80 08 06 00 00 00 11 22 33 44 "
    "00 00 00 0C 74 45 58 74 41 75 74 68 6F 72 00 62 6C 6F 62 73 AA BB CC DD "
    "00 00 00 00 49 45 4E 44 AE 42 60 82";

[[nodiscard]] bool has_flag(int argc, char **argv, std::string_view flag) {
    for (int i = 1; i < argc; ++i) {
        if (argv[i] == flag) {
            return true;
        }
    }
    return false;
}

// chunk 类型 -> 数据区的 spec；未知类型只打印原始字节。
[[nodiscard]] const Spec *data_spec_for(std::string_view type) {
    static const Spec ihdr{"width", "uint32",
                           "height", "uint32",
                           "bit-depth", "ubyte",
                           "color-type", "ubyte",
                           "compression", "ubyte",
                           "filter", "ubyte",
                           "interlace", "ubyte"};
    static const Spec text{"keyword", "c-string",
                           "text", TypeSpec::of("sequence", "ubyte")};
    if (type == "IHDR") {
        return &ihdr;
    }
    if (type == "tEXt") {
        return &text;
    }
    return nullptr;
}

int run(core::Cursor &png, bool enable_color) {
    const frame::Decoder decoder;

    utils::ValueDumpOptions dump;
    dump.enable_color = enable_color;

    Record signature;
    if (auto ec = decoder.decode_blob(png, Spec{"signature", TypeSpec::of("array", 8)}, signature)) {
        std::cerr << "签名读取失败: " << ec.message() << "\n";
        return 1;
    }
    std::cout << "signature " << utils::dump_record(signature, dump) << "\n";

    const Spec header{"length", "uint32", "type", TypeSpec::of("string", 4)};
    while (!png.exhausted()) {
        Record head;
        if (auto ec = decoder.decode_blob(png, header, head)) {
            std::cerr << "chunk 头解码失败 @" << png.position() << ": " << ec.message() << "\n";
            utils::HexDumpOptions hex;
            hex.enable_color = enable_color;
            std::cerr << utils::hex_dump(png, hex);
            return 1;
        }
        const auto length = head.find("length")->as_int64().value_or(0);
        const auto &type = head.find("type")->get_if<frame::Text>()->value;

        // 数据区切成独立视图，外层 Cursor 直接跳到 crc。
        Record body;
        if (auto ec = decoder.decode_blob(png, Spec{"data", TypeSpec::of("slice", length), "crc", "uint32"}, body)) {
            std::cerr << "chunk " << type << " 数据越界: " << ec.message() << "\n";
            return 1;
        }

        std::cout << "\nchunk " << utils::dump_record(head, dump) << "\n";
        auto &data = body.find("data")->get_if<frame::Slice>()->cursor;

        if (const auto *spec = data_spec_for(type)) {
            Record fields;
            if (auto ec = decoder.decode_blob(data, *spec, fields)) {
                std::cerr << "  数据区解码失败: " << ec.message() << "\n";
                continue;
            }
            // 惰性序列需在 data 视图仍存活时展开。
            auto *text = fields.find("text");
            auto *seq = text != nullptr ? text->get_if<frame::LazySequence>() : nullptr;
            if (seq != nullptr) {
                std::vector<frame::Value> bytes;
                if (auto ec = seq->collect(bytes)) {
                    std::cerr << "  text 展开失败: " << ec.message() << "\n";
                    continue;
                }
                std::string s;
                for (const auto &b : bytes) {
                    s.push_back(static_cast<char>(b.as_int64().value_or('?')));
                }
                fields.set("text", frame::Value::text(std::move(s)));
            }
            utils::ValueDumpOptions multi = dump;
            multi.multiline = true;
            std::cout << "  " << utils::dump_record(fields, multi) << "\n";
        } else {
            std::cout << "  " << utils::dump_value(*body.find("data"), dump) << "\n";
        }
        std::cout << "  crc " << utils::dump_value(*body.find("crc"), dump) << "\n";
    }
    return 0;
}

} // namespace

int main(int argc, char **argv) {
    core::set_log_level(core::LogLevel::warn);

    std::string_view hex_text = kSample;
    if (argc > 1 && std::string_view(argv[1]).rfind("--", 0) != 0) {
        hex_text = argv[1];
    }

    std::vector<core::byte> bytes;
    if (auto ec = utils::parse_hex(hex_text, bytes)) {
        std::cerr << "parse_hex 失败: " << ec.message() << "\n";
        return 2;
    }

    core::Cursor png(std::move(bytes));
    return run(png, !has_flag(argc, argv, "--no-color"));
}
