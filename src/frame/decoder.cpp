#include "blobspec/frame/decoder.hpp"

#include "blobspec/frame/typecast.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <string>
#include <vector>

namespace blobspec::frame {
namespace {

using core::errc;
using core::make_error_code;

using BuiltinFn = std::error_code (*)(const FrameContext& context,
                                      core::Cursor& cursor,
                                      std::span<const Param> params,
                                      Value& out);

std::error_code expect_arity(std::span<const Param> params, std::size_t n) noexcept {
  if (params.size() != n) {
    return make_error_code(errc::invalid_argument);
  }
  return {};
}

std::error_code length_param(const Param& param, std::size_t& out) noexcept {
  const auto* v = param.get_if<std::int64_t>();
  if (v == nullptr || *v < 0) {
    return make_error_code(errc::invalid_argument);
  }
  out = static_cast<std::size_t>(*v);
  return {};
}

// ---- 定宽整数 ----

std::error_code get_signed(core::Cursor& cursor, std::int8_t& v) noexcept { return cursor.get_i8(v); }
std::error_code get_signed(core::Cursor& cursor, std::int16_t& v) noexcept { return cursor.get_i16(v); }
std::error_code get_signed(core::Cursor& cursor, std::int32_t& v) noexcept { return cursor.get_i32(v); }
std::error_code get_signed(core::Cursor& cursor, std::int64_t& v) noexcept { return cursor.get_i64(v); }

std::uint64_t to_unsigned(std::int8_t v) noexcept { return static_cast<std::uint64_t>(byte_to_ubyte(v)); }
std::uint64_t to_unsigned(std::int16_t v) noexcept { return static_cast<std::uint64_t>(short_to_ushort(v)); }
std::uint64_t to_unsigned(std::int32_t v) noexcept { return static_cast<std::uint64_t>(int_to_uint(v)); }
std::uint64_t to_unsigned(std::int64_t v) noexcept { return long_to_ulong(v); }

template <class Int>
std::error_code decode_signed(const FrameContext&, core::Cursor& cursor, std::span<const Param> params, Value& out) {
  auto ec = expect_arity(params, 0);
  if (ec) {
    return ec;
  }
  Int v{};
  ec = get_signed(cursor, v);
  if (ec) {
    return ec;
  }
  out = Value::signed_int(static_cast<std::uint8_t>(sizeof(Int) * 8), v);
  return {};
}

// 无符号：按有符号读出，再经 typecast 拓宽到非负区间。
template <class Int>
std::error_code decode_unsigned(const FrameContext&, core::Cursor& cursor, std::span<const Param> params, Value& out) {
  auto ec = expect_arity(params, 0);
  if (ec) {
    return ec;
  }
  Int v{};
  ec = get_signed(cursor, v);
  if (ec) {
    return ec;
  }
  out = Value::unsigned_int(static_cast<std::uint8_t>(sizeof(Int) * 8), to_unsigned(v));
  return {};
}

// ---- 字符串 / 字节 ----

std::error_code decode_string(const FrameContext&, core::Cursor& cursor, std::span<const Param> params, Value& out) {
  auto ec = expect_arity(params, 1);
  if (ec) {
    return ec;
  }
  std::size_t length = 0;
  ec = length_param(params[0], length);
  if (ec) {
    return ec;
  }
  std::vector<byte> raw;
  ec = cursor.read_bytes(length, raw);
  if (ec) {
    return ec;
  }
  out = Value::text(std::string(raw.begin(), raw.end()));
  return {};
}

std::error_code decode_array(const FrameContext&, core::Cursor& cursor, std::span<const Param> params, Value& out) {
  auto ec = expect_arity(params, 1);
  if (ec) {
    return ec;
  }
  std::size_t length = 0;
  ec = length_param(params[0], length);
  if (ec) {
    return ec;
  }
  std::vector<byte> raw;
  ec = cursor.read_bytes(length, raw);
  if (ec) {
    return ec;
  }
  out = Value::bytes(std::move(raw));
  return {};
}

// 逐字节读取直到 stop(b) 为真：终止字节被消耗，但不计入结果。
template <class Stop>
std::error_code read_until(core::Cursor& cursor, const Stop& stop, Value& out) {
  std::string acc;
  for (;;) {
    std::uint8_t b = 0;
    auto ec = cursor.get_u8(b);
    if (ec) {
      return ec;
    }
    if (stop(b)) {
      break;
    }
    acc.push_back(static_cast<char>(b));
  }
  out = Value::text(std::move(acc));
  return {};
}

std::error_code decode_c_string(const FrameContext&, core::Cursor& cursor, std::span<const Param> params, Value& out) {
  auto ec = expect_arity(params, 0);
  if (ec) {
    return ec;
  }
  return read_until(cursor, [](byte b) { return b == 0; }, out);
}

std::error_code decode_pred_string(const FrameContext&, core::Cursor& cursor, std::span<const Param> params, Value& out) {
  auto ec = expect_arity(params, 1);
  if (ec) {
    return ec;
  }
  const auto* pred = params[0].get_if<BytePredicate>();
  if (pred == nullptr || !*pred) {
    return make_error_code(errc::invalid_argument);
  }
  return read_until(cursor, *pred, out);
}

std::error_code decode_delimited_string(const FrameContext&,
                                        core::Cursor& cursor,
                                        std::span<const Param> params,
                                        Value& out) {
  auto ec = expect_arity(params, 1);
  if (ec) {
    return ec;
  }
  const auto* delimiters = params[0].get_if<Delimiters>();
  if (delimiters == nullptr) {
    return make_error_code(errc::invalid_argument);
  }
  return read_until(cursor, [delimiters](byte b) { return delimiters->contains(b); }, out);
}

// ---- 组合类型 ----

std::error_code read_length_prefix(const FrameContext& context,
                                   core::Cursor& cursor,
                                   const TypeSpec& prefix,
                                   std::int64_t& length) {
  Value v;
  auto ec = context.decode_frame(cursor, prefix, v);
  if (ec) {
    return ec;
  }
  const auto n = v.as_int64();
  if (!n.has_value() || *n < 0) {
    return make_error_code(errc::invalid_argument);
  }
  length = *n;
  return {};
}

// 参数布局：data_type, prefix_type, extras...
// 解码 data_type 时的实参为：长度, data_type 自带参数..., extras...
std::error_code decode_prefixed(const FrameContext& context,
                                core::Cursor& cursor,
                                std::span<const Param> params,
                                Value& out) {
  if (params.size() < 2) {
    return make_error_code(errc::invalid_argument);
  }
  const auto* data = params[0].get_if<TypeSpec>();
  const auto* prefix = params[1].get_if<TypeSpec>();
  if (data == nullptr || prefix == nullptr) {
    return make_error_code(errc::invalid_argument);
  }

  std::int64_t length = 0;
  auto ec = read_length_prefix(context, cursor, *prefix, length);
  if (ec) {
    return ec;
  }

  std::vector<Param> args;
  args.reserve(1 + data->params.size() + (params.size() - 2));
  args.emplace_back(length);
  args.insert(args.end(), data->params.begin(), data->params.end());
  args.insert(args.end(), params.begin() + 2, params.end());
  return context.decode_frame(cursor, data->tag, args, out);
}

std::error_code decode_prefixed_string(const FrameContext& context,
                                       core::Cursor& cursor,
                                       std::span<const Param> params,
                                       Value& out) {
  auto ec = expect_arity(params, 1);
  if (ec) {
    return ec;
  }
  const auto* prefix = params[0].get_if<TypeSpec>();
  if (prefix == nullptr) {
    return make_error_code(errc::invalid_argument);
  }
  std::int64_t length = 0;
  ec = read_length_prefix(context, cursor, *prefix, length);
  if (ec) {
    return ec;
  }
  const std::array<Param, 1> args{Param(length)};
  return decode_string(context, cursor, args, out);
}

std::error_code decode_skip(const FrameContext&, core::Cursor& cursor, std::span<const Param> params, Value& out) {
  auto ec = expect_arity(params, 1);
  if (ec) {
    return ec;
  }
  std::size_t n = 0;
  ec = length_param(params[0], n);
  if (ec) {
    return ec;
  }
  ec = cursor.skip(n);
  if (ec) {
    return ec;
  }
  out = Value::nothing();
  return {};
}

std::error_code decode_slice(const FrameContext&, core::Cursor& cursor, std::span<const Param> params, Value& out) {
  auto ec = expect_arity(params, 1);
  if (ec) {
    return ec;
  }
  std::size_t length = 0;
  ec = length_param(params[0], length);
  if (ec) {
    return ec;
  }
  core::Cursor view;
  ec = cursor.slice(length, view);
  if (ec) {
    return ec;
  }
  out = Value::slice(std::move(view));
  return {};
}

std::error_code decode_structure(const FrameContext& context,
                                 core::Cursor& cursor,
                                 std::span<const Param> params,
                                 Value& out) {
  auto ec = expect_arity(params, 1);
  if (ec) {
    return ec;
  }
  const auto* spec = params[0].get_if<Spec>();
  if (spec == nullptr) {
    return make_error_code(errc::invalid_argument);
  }
  Record record;
  ec = context.decode_blob(cursor, *spec, record);
  if (ec) {
    return ec;
  }
  out = Value::record(std::move(record));
  return {};
}

// 参数布局：element_type, extras...（extras 追加在 element_type 自带参数之后）
std::error_code decode_sequence(const FrameContext& context,
                                core::Cursor& cursor,
                                std::span<const Param> params,
                                Value& out) {
  if (params.empty()) {
    return make_error_code(errc::invalid_argument);
  }
  const auto* element = params[0].get_if<TypeSpec>();
  if (element == nullptr) {
    return make_error_code(errc::invalid_argument);
  }
  TypeSpec combined = *element;
  combined.params.insert(combined.params.end(), params.begin() + 1, params.end());
  out = Value::sequence(LazySequence(context, cursor, std::move(combined)));
  return {};
}

struct BuiltinEntry final {
  BuiltinType type;
  std::string_view tag;
  BuiltinFn fn;
};

// 顺序必须与 BuiltinType 枚举一致（下标即枚举值）。
constexpr std::array<BuiltinEntry, 19> kBuiltins{{
  {BuiltinType::byte, "byte", &decode_signed<std::int8_t>},
  {BuiltinType::ubyte, "ubyte", &decode_unsigned<std::int8_t>},
  {BuiltinType::int16, "int16", &decode_signed<std::int16_t>},
  {BuiltinType::uint16, "uint16", &decode_unsigned<std::int16_t>},
  {BuiltinType::int32, "int32", &decode_signed<std::int32_t>},
  {BuiltinType::uint32, "uint32", &decode_unsigned<std::int32_t>},
  {BuiltinType::int64, "int64", &decode_signed<std::int64_t>},
  {BuiltinType::uint64, "uint64", &decode_unsigned<std::int64_t>},
  {BuiltinType::string, "string", &decode_string},
  {BuiltinType::array, "array", &decode_array},
  {BuiltinType::c_string, "c-string", &decode_c_string},
  {BuiltinType::pred_string, "pred-string", &decode_pred_string},
  {BuiltinType::delimited_string, "delimited-string", &decode_delimited_string},
  {BuiltinType::prefixed, "prefixed", &decode_prefixed},
  {BuiltinType::prefixed_string, "prefixed-string", &decode_prefixed_string},
  {BuiltinType::skip, "skip", &decode_skip},
  {BuiltinType::slice, "slice", &decode_slice},
  {BuiltinType::structure, "struct", &decode_structure},
  {BuiltinType::sequence, "sequence", &decode_sequence},
}};

constexpr bool builtins_in_enum_order() noexcept {
  for (std::size_t i = 0; i < kBuiltins.size(); ++i) {
    if (static_cast<std::size_t>(kBuiltins[i].type) != i) {
      return false;
    }
  }
  return true;
}

static_assert(builtins_in_enum_order(), "kBuiltins must follow BuiltinType order");

}  // namespace

std::optional<BuiltinType> builtin_type(std::string_view tag) noexcept {
  for (const auto& entry : kBuiltins) {
    if (entry.tag == tag) {
      return entry.type;
    }
  }
  return std::nullopt;
}

std::string_view builtin_tag(BuiltinType type) noexcept {
  const auto index = static_cast<std::size_t>(type);
  if (index >= kBuiltins.size()) {
    return {};
  }
  return kBuiltins[index].tag;
}

Decoder::Decoder(DecoderOptions options) : options_(options) {}

std::error_code Decoder::register_type(std::string tag, DecodeFn fn) {
  if (tag.empty() || !fn || builtin_type(tag).has_value()) {
    return make_error_code(errc::invalid_argument);
  }
  spdlog::debug("blobspec: register frame type '{}'", tag);
  std::lock_guard lk(mu_);
  custom_.insert_or_assign(std::move(tag), std::move(fn));
  return {};
}

void Decoder::unregister_type(std::string_view tag) {
  std::lock_guard lk(mu_);
  const auto it = custom_.find(tag);
  if (it == custom_.end()) {
    return;
  }
  custom_.erase(it);
  spdlog::debug("blobspec: unregister frame type '{}'", tag);
}

void Decoder::clear_custom_types() {
  std::lock_guard lk(mu_);
  custom_.clear();
}

bool Decoder::has_type(std::string_view tag) const {
  if (builtin_type(tag).has_value()) {
    return true;
  }
  std::lock_guard lk(mu_);
  return custom_.find(tag) != custom_.end();
}

// 返回 DecodeFn 的拷贝，避免在持锁期间执行用户代码（用户代码可能再次查表）。
std::optional<DecodeFn> Decoder::find_custom_(std::string_view tag) const {
  std::lock_guard lk(mu_);
  const auto it = custom_.find(tag);
  if (it == custom_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::error_code Decoder::dispatch_(const FrameContext& context,
                                   core::Cursor& cursor,
                                   std::string_view tag,
                                   std::span<const Param> params,
                                   Value& out) const {
  if (const auto builtin = builtin_type(tag)) {
    return kBuiltins[static_cast<std::size_t>(*builtin)].fn(context, cursor, params, out);
  }

  const auto fn = find_custom_(tag);
  if (!fn.has_value()) {
    spdlog::debug("blobspec: unknown frame type '{}'", tag);
    return make_error_code(errc::unknown_type);
  }

  Value v;
  auto ec = (*fn)(context, cursor, tag, params, v);
  if (ec) {
    return ec;
  }
  out = std::move(v);
  return {};
}

std::error_code Decoder::decode_frame(core::Cursor& cursor, const TypeSpec& type, Value& out) const {
  return dispatch_(FrameContext(*this, 0), cursor, type.tag, type.params, out);
}

std::error_code Decoder::decode_frame(core::Cursor& cursor,
                                      std::string_view tag,
                                      std::span<const Param> params,
                                      Value& out) const {
  return dispatch_(FrameContext(*this, 0), cursor, tag, params, out);
}

std::error_code Decoder::decode_blob_array(core::Cursor& cursor,
                                           const TypeSpec& element,
                                           LazySequence& out) const {
  out = LazySequence(FrameContext(*this, 0), cursor, element);
  return {};
}

Decoder& default_decoder() {
  static Decoder decoder;
  return decoder;
}

std::error_code register_type(std::string tag, DecodeFn fn) {
  return default_decoder().register_type(std::move(tag), std::move(fn));
}

std::error_code decode_frame(core::Cursor& cursor, const TypeSpec& type, Value& out) {
  return default_decoder().decode_frame(cursor, type, out);
}

std::error_code decode_blob(core::Cursor& cursor, const Spec& spec, Record& out) {
  return default_decoder().decode_blob(cursor, spec, out);
}

std::error_code decode_blob_array(core::Cursor& cursor, const TypeSpec& element, LazySequence& out) {
  return default_decoder().decode_blob_array(cursor, element, out);
}

}  // namespace blobspec::frame
