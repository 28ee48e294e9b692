/**
 * @file spec_text_dump.cpp
 * @brief 命令行工具：用文本 spec 解码一段十六进制数据并输出结果
 *
 * 运行：
 * - 无参数：运行内置示例
 * - ./build/examples/spec_text_dump "<spec>" "<hex>" [--little-endian] [--log=<level>] [--no-color]
 *
 * 例：
 *   spec_text_dump '[:len :uint16 :name [:string 3] :skip 1 :rest [:sequence :ubyte]]' \
 *                  '00 03 61 62 63 ff 01 02'
 */

#include <blobspec/core/error.hpp>
#include <blobspec/core/log.hpp>
#include <blobspec/dsl/parser.hpp>
#include <blobspec/frame/decoder.hpp>
#include <blobspec/utils/hex.hpp>
#include <blobspec/utils/value_dump.hpp>

#include <iostream>
#include <string>
#include <string_view>
#include <vector>

using namespace blobspec;

namespace {

constexpr std::string_view kDefaultSpec = R"(
    ; 一个带嵌套结构的简单报文
    [:magic   [:string 4]
     :version :ubyte
     :skip    1
     :header  [:struct [:id :uint32 :name :c-string]]
     :body    [:prefixed :array :uint16]])";

constexpr std::string_view kDefaultHex =
    "42 4C 4F 42 02 00 00 00 00 2A 6E 6F 64 65 00 00 03 0A 0B 0C";

[[nodiscard]] bool has_flag(int argc, char **argv, std::string_view flag) {
    for (int i = 1; i < argc; ++i) {
        if (argv[i] == flag) {
            return true;
        }
    }
    return false;
}

void print_usage(const char *argv0) {
    std::cout << "用法:\n";
    std::cout << "  " << argv0 << "\n";
    std::cout << "  " << argv0
              << " \"<spec>\" \"<hex>\" [--little-endian] [--log=<level>] [--no-color]\n";
}

} // namespace

int main(int argc, char **argv) {
    if (has_flag(argc, argv, "--help") || has_flag(argc, argv, "-h")) {
        print_usage(argv[0]);
        return 0;
    }

    std::vector<std::string_view> positional;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg.rfind("--", 0) != 0) {
            positional.push_back(arg);
        }
    }
    if (!positional.empty() && positional.size() != 2) {
        print_usage(argv[0]);
        return 2;
    }

    const auto spec_text = positional.empty() ? kDefaultSpec : positional[0];
    const auto hex_text = positional.empty() ? kDefaultHex : positional[1];
    const bool enable_color = !has_flag(argc, argv, "--no-color");

    core::set_log_level(core::LogLevel::warn);
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg.rfind("--log=", 0) != 0) {
            continue;
        }
        const auto level = core::parse_log_level(arg.substr(6));
        if (!level) {
            std::cerr << "未知日志级别: " << arg.substr(6) << "\n";
            return 2;
        }
        core::set_log_level(*level);
    }

    const auto parsed = dsl::parse_spec(spec_text);
    if (parsed.ec) {
        std::cerr << "spec 解析失败 (" << parsed.error_line << ":" << parsed.error_column
                  << ") [" << parsed.ec.category().name() << "] " << parsed.error_message << "\n";
        return 2;
    }

    std::vector<core::byte> bytes;
    if (auto ec = utils::parse_hex(hex_text, bytes)) {
        std::cerr << "parse_hex 失败: " << ec.message() << "\n";
        return 2;
    }

    const auto order = has_flag(argc, argv, "--little-endian") ? core::ByteOrder::little_endian
                                                               : core::ByteOrder::big_endian;
    core::Cursor cursor(std::move(bytes), order);

    utils::HexDumpOptions hex;
    hex.show_ascii = true;
    hex.enable_color = enable_color;

    frame::Record record;
    if (auto ec = frame::decode_blob(cursor, parsed.spec, record)) {
        std::cerr << "decode_blob 失败: [" << ec.category().name();
        if (ec.category() == core::error_category()) {
            std::cerr << "/" << core::errc_name(static_cast<core::errc>(ec.value()));
        }
        std::cerr << "] " << ec.message() << "\n";
        std::cerr << utils::hex_dump(cursor, hex);
        return 1;
    }

    utils::ValueDumpOptions opt;
    opt.multiline = true;
    opt.enable_color = enable_color;
    std::cout << utils::dump_record(record, opt) << "\n";

    if (!cursor.exhausted()) {
        std::cout << "\n未消费的字节 (" << cursor.remaining() << "):\n";
        std::cout << utils::hex_dump(cursor, hex);
    }
    return 0;
}
