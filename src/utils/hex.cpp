#include "blobspec/utils/hex.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <optional>
#include <sstream>

namespace blobspec::utils {
namespace {

struct Ansi final {
    static constexpr const char *reset = "\033[0m";
    static constexpr const char *dim = "\033[2m";
    static constexpr const char *bytes = "\033[1;33m";
    static constexpr const char *cursor = "\033[1;36m";
    static constexpr const char *ascii = "\033[1;32m";
    static constexpr const char *error = "\033[1;31m";
};

[[nodiscard]] const char *ansi_(bool enable, const char *code) noexcept {
    return enable ? code : "";
}

[[nodiscard]] bool is_separator_(unsigned char c) noexcept {
    return std::isspace(c) != 0 || c == ',' || c == ':' || c == '-' ||
           c == '_';
}

[[nodiscard]] int nibble_(unsigned char c) noexcept {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    const auto lower = static_cast<unsigned char>(std::tolower(c));
    if (lower >= 'a' && lower <= 'f') {
        return lower - 'a' + 10;
    }
    return -1;
}

[[nodiscard]] char printable_(blobspec::core::byte b) noexcept {
    return (b >= 0x20 && b <= 0x7E) ? static_cast<char>(b) : '.';
}

// marker 为读指针在 bytes 中的下标；nullopt 表示不标记。
std::string dump_(blobspec::core::bytes_view bytes,
                  std::optional<std::size_t> marker,
                  const HexDumpOptions &options) {
    std::ostringstream oss;
    const bool color = options.enable_color;
    const std::size_t total = bytes.size();
    const std::size_t shown =
        (options.max_bytes == 0 ? total : std::min(total, options.max_bytes));
    const std::size_t per_line =
        (options.bytes_per_line == 0 ? 16 : options.bytes_per_line);

    for (std::size_t line = 0; line < shown; line += per_line) {
        const std::size_t n = std::min(per_line, shown - line);

        if (options.show_offset) {
            oss << ansi_(color, Ansi::dim) << std::setw(4) << std::setfill('0')
                << std::hex << line << ": " << ansi_(color, Ansi::reset);
        }

        for (std::size_t i = 0; i < n; ++i) {
            const std::size_t at = line + i;
            const bool here = marker.has_value() && *marker == at;
            if (i != 0) {
                oss << ' ';
            }
            if (marker.has_value()) {
                oss << (here ? '>' : ' ');
            }
            oss << ansi_(color, here ? Ansi::cursor : Ansi::bytes)
                << std::setw(2) << std::setfill('0') << std::hex
                << static_cast<int>(bytes[at]) << ansi_(color, Ansi::reset);
        }

        if (options.show_ascii) {
            const std::size_t cell = marker.has_value() ? 4 : 3;
            oss << std::string((per_line - n) * cell + 2, ' ');
            oss << ansi_(color, Ansi::ascii);
            for (std::size_t i = 0; i < n; ++i) {
                oss << printable_(bytes[line + i]);
            }
            oss << ansi_(color, Ansi::reset);
        }
        oss << '\n';
    }

    // 读指针位于末尾（已读完）时单独给出提示。
    if (marker.has_value() && *marker == total) {
        oss << ansi_(color, Ansi::cursor) << "> (end, " << std::dec << total
            << " bytes)" << ansi_(color, Ansi::reset) << '\n';
    }

    if (options.max_bytes != 0 && total > options.max_bytes) {
        oss << ansi_(color, Ansi::error) << "... (truncated, total=" << std::dec
            << total << " bytes)" << ansi_(color, Ansi::reset) << '\n';
    }
    return oss.str();
}

} // namespace

std::string hex_dump(blobspec::core::bytes_view bytes, HexDumpOptions options) {
    return dump_(bytes, std::nullopt, options);
}

std::string hex_dump(const blobspec::core::Cursor &cursor,
                     HexDumpOptions options) {
    return dump_(cursor.readable_bytes(), cursor.position(), options);
}

std::error_code parse_hex(std::string_view text,
                          std::vector<blobspec::core::byte> &out) {
    out.clear();
    int high = -1;

    for (std::size_t i = 0; i < text.size(); ++i) {
        const auto c = static_cast<unsigned char>(text[i]);
        if (is_separator_(c)) {
            if (high >= 0) {
                // 分隔符不能把一个字节拆成两半。
                out.clear();
                return blobspec::core::make_error_code(
                    blobspec::core::errc::invalid_argument);
            }
            continue;
        }

        // 0x/0X 前缀只允许出现在字节边界上。
        if (high < 0 && c == '0' && i + 1 < text.size() &&
            (text[i + 1] == 'x' || text[i + 1] == 'X')) {
            ++i;
            continue;
        }

        const int v = nibble_(c);
        if (v < 0) {
            out.clear();
            return blobspec::core::make_error_code(
                blobspec::core::errc::invalid_argument);
        }
        if (high < 0) {
            high = v;
            continue;
        }
        out.push_back(static_cast<blobspec::core::byte>((high << 4) | v));
        high = -1;
    }

    if (high >= 0) {
        out.clear();
        return blobspec::core::make_error_code(
            blobspec::core::errc::invalid_argument);
    }
    return {};
}

} // namespace blobspec::utils
