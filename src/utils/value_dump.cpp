#include "blobspec/utils/value_dump.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <type_traits>

namespace blobspec::utils {
namespace {

using blobspec::frame::Record;
using blobspec::frame::Value;

struct Ansi final {
    static constexpr const char *reset = "\033[0m";
    static constexpr const char *type = "\033[1;35m";
    static constexpr const char *key = "\033[1;36m";
    static constexpr const char *string = "\033[1;32m";
    static constexpr const char *value = "\033[1;33m";
    static constexpr const char *dim = "\033[2m";
};

[[nodiscard]] const char *ansi_(bool enable, const char *code) noexcept {
    return enable ? code : "";
}

struct DumpContext final {
    std::ostringstream oss;
    ValueDumpOptions options{};

    [[nodiscard]] const char *color(const char *code) const noexcept {
        return ansi_(options.enable_color, code);
    }
};

[[nodiscard]] std::string indent_(std::size_t depth, std::size_t spaces) {
    return std::string(depth * spaces, ' ');
}

// 与内置类型标签保持一致，便于对照 spec 阅读。
[[nodiscard]] const char *int_type_name_(bool is_signed,
                                         std::uint8_t width) noexcept {
    switch (width) {
    case 8:
        return is_signed ? "byte" : "ubyte";
    case 16:
        return is_signed ? "int16" : "uint16";
    case 32:
        return is_signed ? "int32" : "uint32";
    case 64:
        return is_signed ? "int64" : "uint64";
    default:
        return is_signed ? "int" : "uint";
    }
}

void append_quoted_(DumpContext &ctx, const std::string &s) {
    const std::size_t limit = ctx.options.max_payload_bytes;
    const std::size_t n = (limit == 0 ? s.size() : std::min(s.size(), limit));

    ctx.oss << ctx.color(Ansi::string) << '"';
    for (std::size_t i = 0; i < n; ++i) {
        const auto c = static_cast<unsigned char>(s[i]);
        if (c == '\\' || c == '"') {
            ctx.oss << '\\' << static_cast<char>(c);
        } else if (c >= 0x20 && c <= 0x7E) {
            ctx.oss << static_cast<char>(c);
        } else {
            ctx.oss << "\\x" << std::hex << std::setw(2) << std::setfill('0')
                    << static_cast<int>(c) << std::dec;
        }
    }
    if (limit != 0 && s.size() > limit) {
        ctx.oss << "...";
    }
    ctx.oss << '"' << ctx.color(Ansi::reset);
}

void append_hex_(DumpContext &ctx, blobspec::core::bytes_view bytes) {
    if (bytes.empty()) {
        return;
    }
    const std::size_t limit = ctx.options.max_payload_bytes;
    const std::size_t n =
        (limit == 0 ? bytes.size() : std::min(bytes.size(), limit));

    ctx.oss << ' ' << ctx.color(Ansi::value);
    for (std::size_t i = 0; i < n; ++i) {
        if (i != 0) {
            ctx.oss << ' ';
        }
        ctx.oss << std::hex << std::setw(2) << std::setfill('0')
                << static_cast<int>(bytes[i]) << std::dec;
    }
    ctx.oss << ctx.color(Ansi::reset);
    if (limit != 0 && bytes.size() > limit) {
        ctx.oss << ' ' << ctx.color(Ansi::dim) << "..." << ctx.color(Ansi::reset);
    }
}

void append_value_(DumpContext &ctx, const Value &value, std::size_t depth);

void append_record_(DumpContext &ctx, const Record &record, std::size_t depth) {
    const auto &opt = ctx.options;
    const auto *dim = ctx.color(Ansi::dim);
    const auto *reset = ctx.color(Ansi::reset);

    const std::size_t total = record.size();
    if (total == 0) {
        ctx.oss << dim << "{}" << reset;
        return;
    }
    if (depth >= opt.max_depth) {
        ctx.oss << dim << "{...}" << reset;
        return;
    }

    const std::size_t n = (opt.max_record_items == 0
                               ? total
                               : std::min(total, opt.max_record_items));
    const bool truncated = opt.max_record_items != 0 && total > n;

    const auto &keys = record.keys();
    const auto &values = record.values();

    if (!opt.multiline) {
        ctx.oss << dim << "{ " << reset;
        for (std::size_t i = 0; i < n; ++i) {
            if (i != 0) {
                ctx.oss << ", ";
            }
            ctx.oss << ctx.color(Ansi::key) << ':' << keys[i] << reset << ' ';
            append_value_(ctx, values[i], depth + 1);
        }
        if (truncated) {
            ctx.oss << ", " << dim << "..." << reset;
        }
        ctx.oss << dim << " }" << reset;
        return;
    }

    ctx.oss << dim << "{\n" << reset;
    for (std::size_t i = 0; i < n; ++i) {
        ctx.oss << indent_(depth + 1, opt.indent_spaces) << ctx.color(Ansi::key)
                << ':' << keys[i] << reset << ' ';
        append_value_(ctx, values[i], depth + 1);
        ctx.oss << '\n';
    }
    if (truncated) {
        ctx.oss << indent_(depth + 1, opt.indent_spaces) << dim << "..."
                << reset << '\n';
    }
    ctx.oss << indent_(depth, opt.indent_spaces) << dim << '}' << reset;
}

void append_value_(DumpContext &ctx, const Value &value, std::size_t depth) {
    const auto *type = ctx.color(Ansi::type);
    const auto *val = ctx.color(Ansi::value);
    const auto *reset = ctx.color(Ansi::reset);

    std::visit(
        [&](const auto &v) {
            using T = std::decay_t<decltype(v)>;

            if constexpr (std::is_same_v<T, blobspec::frame::Nothing>) {
                ctx.oss << ctx.color(Ansi::dim) << "nothing" << reset;
            } else if constexpr (std::is_same_v<T, blobspec::frame::Signed>) {
                ctx.oss << type << int_type_name_(true, v.width) << reset << ' '
                        << val << v.value << reset;
            } else if constexpr (std::is_same_v<T, blobspec::frame::Unsigned>) {
                ctx.oss << type << int_type_name_(false, v.width) << reset
                        << ' ' << val << v.value << reset;
            } else if constexpr (std::is_same_v<T, blobspec::frame::Text>) {
                ctx.oss << type << "string[" << v.value.size() << ']' << reset
                        << ' ';
                append_quoted_(ctx, v.value);
            } else if constexpr (std::is_same_v<T, blobspec::frame::Bytes>) {
                ctx.oss << type << "bytes[" << v.value.size() << ']' << reset;
                append_hex_(ctx, v.value);
            } else if constexpr (std::is_same_v<T, Record>) {
                append_record_(ctx, v, depth);
            } else if constexpr (std::is_same_v<T, blobspec::frame::Slice>) {
                ctx.oss << type << "slice[" << v.cursor.limit() << ']' << reset
                        << ' ' << ctx.color(Ansi::dim)
                        << "pos=" << v.cursor.position() << reset;
                append_hex_(ctx, v.cursor.readable_bytes());
            } else {
                static_assert(
                    std::is_same_v<T, blobspec::frame::LazySequence>);
                ctx.oss << type << "<sequence of " << v.element_type().tag
                        << '>' << reset;
            }
        },
        value.storage());
}

} // namespace

std::string dump_value(const Value &value, ValueDumpOptions options) {
    DumpContext ctx;
    ctx.options = options;

    append_value_(ctx, value, 0);
    return ctx.oss.str();
}

std::string dump_record(const Record &record, ValueDumpOptions options) {
    DumpContext ctx;
    ctx.options = options;

    append_record_(ctx, record, 0);
    return ctx.oss.str();
}

} // namespace blobspec::utils
