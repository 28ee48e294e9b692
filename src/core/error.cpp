#include "blobspec/core/error.hpp"

#include <string>

namespace blobspec::core {
namespace {

struct ErrcInfo final {
  errc code;
  const char* name;
  const char* message;
};

// 按 errc 取值顺序排列；message 写明是哪一步解码失败。
constexpr ErrcInfo kErrcTable[] = {
    {errc::ok, "ok", "ok"},
    {errc::malformed_spec, "malformed_spec",
     "malformed spec: odd term count, non-word key or bad descriptor"},
    {errc::unknown_type, "unknown_type", "frame type tag is neither built in nor registered"},
    {errc::out_of_bounds, "out_of_bounds", "frame read runs past the cursor limit"},
    {errc::invalid_argument, "invalid_argument",
     "invalid argument: bad frame parameter, zero-width element or bad hex text"},
    {errc::too_deep, "too_deep", "nested struct depth exceeds DecoderOptions::max_depth"},
};

const ErrcInfo* find_info_(int ev) noexcept {
  for (const auto& info : kErrcTable) {
    if (static_cast<int>(info.code) == ev) {
      return &info;
    }
  }
  return nullptr;
}

class blobspec_error_category final : public std::error_category {
 public:
  const char* name() const noexcept override { return "blobspec.core"; }

  std::string message(int ev) const override {
    const auto* info = find_info_(ev);
    if (info == nullptr) {
      return "unknown blobspec.core error " + std::to_string(ev);
    }
    return info->message;
  }
};

}  // 匿名命名空间

const std::error_category& error_category() noexcept {
  static blobspec_error_category category;
  return category;
}

const char* errc_name(errc e) noexcept {
  const auto* info = find_info_(static_cast<int>(e));
  return info == nullptr ? "unknown" : info->name;
}

std::error_code make_error_code(errc e) noexcept {
  return {static_cast<int>(e), error_category()};
}

}  // 命名空间 blobspec::core
