#include "blobspec/frame/decoder.hpp"

#include <spdlog/spdlog.h>

namespace blobspec::frame {
namespace {

using core::errc;
using core::make_error_code;

// 结构检查在任何读取之前完成：偶数长度，键为 word / skip_field，
// skip_field 后跟非负整数，其余描述符为 word 或 TypeSpec。
std::error_code validate_spec(const Spec& spec) noexcept {
  if (spec.size() % 2 != 0) {
    return make_error_code(errc::malformed_spec);
  }
  for (std::size_t i = 0; i < spec.size(); i += 2) {
    const auto& key = spec[i];
    const auto& descriptor = spec[i + 1];
    if (key.is_skip()) {
      if (!descriptor.is_integer()) {
        return make_error_code(errc::malformed_spec);
      }
      if (*descriptor.get_if<std::int64_t>() < 0) {
        return make_error_code(errc::invalid_argument);
      }
      continue;
    }
    if (!key.is_word()) {
      return make_error_code(errc::malformed_spec);
    }
    if (!descriptor.is_word() && !descriptor.is_type()) {
      return make_error_code(errc::malformed_spec);
    }
  }
  return {};
}

std::string_view descriptor_tag(const Term& descriptor) noexcept {
  if (const auto* word = descriptor.get_if<std::string>()) {
    return *word;
  }
  if (const auto* type = descriptor.get_if<TypeSpec>()) {
    return type->tag;
  }
  return {};
}

}  // namespace

std::error_code FrameContext::decode_frame(core::Cursor& cursor, const TypeSpec& type, Value& out) const {
  return decode_frame(cursor, type.tag, type.params, out);
}

std::error_code FrameContext::decode_frame(core::Cursor& cursor,
                                           std::string_view tag,
                                           std::span<const Param> params,
                                           Value& out) const {
  if (decoder_ == nullptr) {
    return make_error_code(errc::invalid_argument);
  }
  return decoder_->dispatch_(*this, cursor, tag, params, out);
}

std::error_code FrameContext::decode_blob(core::Cursor& cursor, const Spec& spec, Record& out) const {
  if (decoder_ == nullptr) {
    return make_error_code(errc::invalid_argument);
  }
  if (depth_ + 1 > decoder_->options().max_depth) {
    return make_error_code(errc::too_deep);
  }
  return decoder_->evaluate_(FrameContext(*decoder_, depth_ + 1), cursor, spec, out);
}

std::error_code Decoder::decode_blob(core::Cursor& cursor, const Spec& spec, Record& out) const {
  return evaluate_(FrameContext(*this, 0), cursor, spec, out);
}

std::error_code Decoder::evaluate_(const FrameContext& context,
                                   core::Cursor& cursor,
                                   const Spec& spec,
                                   Record& out) const {
  auto ec = validate_spec(spec);
  if (ec) {
    return ec;
  }

  Record result;
  for (std::size_t i = 0; i < spec.size(); i += 2) {
    const auto& key = spec[i];
    const auto& descriptor = spec[i + 1];

    if (key.is_skip()) {
      const auto n = *descriptor.get_if<std::int64_t>();
      ec = cursor.skip(static_cast<std::size_t>(n));
      if (ec) {
        spdlog::debug("blobspec: skip {} at offset {} failed: {}", n, cursor.position(), ec.message());
        return ec;
      }
      continue;
    }

    const auto& name = *key.get_if<std::string>();
    const auto offset = cursor.position();
    Value v;
    if (const auto* word = descriptor.get_if<std::string>()) {
      ec = dispatch_(context, cursor, *word, {}, v);
    } else {
      const auto& type = *descriptor.get_if<TypeSpec>();
      ec = dispatch_(context, cursor, type.tag, type.params, v);
    }
    if (ec) {
      spdlog::debug("blobspec: field '{}' ({}) at offset {} failed: {}",
                    name, descriptor_tag(descriptor), offset, ec.message());
      return ec;
    }

    if (!v.is_nothing()) {
      result.set(name, std::move(v));
    }
  }

  out = std::move(result);
  return {};
}

}  // namespace blobspec::frame
