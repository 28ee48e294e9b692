#include "blobspec/frame/decoder.hpp"

#include "test_main.hpp"

#include <atomic>
#include <cstdint>
#include <string>
#include <thread>
#include <vector>

namespace {

using blobspec::core::Cursor;
using blobspec::core::byte;
using blobspec::core::errc;
using blobspec::core::make_error_code;
using namespace blobspec::frame;

// LEB128 风格的无符号变长整数。
std::error_code decode_varint(const FrameContext&,
                              Cursor& cursor,
                              std::string_view,
                              std::span<const Param> params,
                              Value& out) {
  if (!params.empty()) {
    return make_error_code(errc::invalid_argument);
  }
  std::uint64_t acc = 0;
  for (unsigned shift = 0; shift < 64; shift += 7) {
    std::uint8_t b = 0;
    auto ec = cursor.get_u8(b);
    if (ec) {
      return ec;
    }
    acc |= static_cast<std::uint64_t>(b & 0x7F) << shift;
    if ((b & 0x80) == 0) {
      out = Value::unsigned_int(64, acc);
      return {};
    }
  }
  return make_error_code(errc::invalid_argument);
}

void test_register_and_decode_custom_type() {
  Decoder d;
  TEST_EXPECT(!d.has_type("varint"));
  TEST_EXPECT_OK(d.register_type("varint", decode_varint));
  TEST_EXPECT(d.has_type("varint"));

  Cursor c(std::vector<byte>{0xAC, 0x02, 0x05});
  Record out;
  TEST_EXPECT_OK(d.decode_blob(c, Spec{"n", "varint", "m", "varint"}, out));
  TEST_EXPECT(*out.find("n") == Value::unsigned_int(64, 300));
  TEST_EXPECT(*out.find("m") == Value::unsigned_int(64, 5));
}

void test_builtin_tags_cannot_be_replaced() {
  Decoder d;
  TEST_EXPECT_ERR(d.register_type("uint32", decode_varint), errc::invalid_argument);
  TEST_EXPECT_ERR(d.register_type("", decode_varint), errc::invalid_argument);
  TEST_EXPECT_ERR(d.register_type("empty-fn", DecodeFn{}), errc::invalid_argument);

  Cursor c(std::vector<byte>{0x00, 0x00, 0x00, 0x01});
  Value v;
  TEST_EXPECT_OK(d.decode_frame(c, TypeSpec::of("uint32"), v));
  TEST_EXPECT(v == Value::unsigned_int(32, 1));
}

void test_reregister_replaces_and_unregister_removes() {
  Decoder d;
  TEST_EXPECT_OK(d.register_type("answer", [](const FrameContext&, Cursor&, std::string_view, std::span<const Param>,
                                              Value& out) {
    out = Value::signed_int(64, 41);
    return std::error_code{};
  }));
  TEST_EXPECT_OK(d.register_type("answer", [](const FrameContext&, Cursor&, std::string_view, std::span<const Param>,
                                              Value& out) {
    out = Value::signed_int(64, 42);
    return std::error_code{};
  }));

  Cursor c;
  Value v;
  TEST_EXPECT_OK(d.decode_frame(c, TypeSpec::of("answer"), v));
  TEST_EXPECT(v == Value::signed_int(64, 42));

  d.unregister_type("answer");
  TEST_EXPECT(!d.has_type("answer"));
  TEST_EXPECT_ERR(d.decode_frame(c, TypeSpec::of("answer"), v), errc::unknown_type);

  d.unregister_type("answer");
  d.unregister_type("uint8");
  TEST_EXPECT(d.has_type("uint16"));
}

void test_custom_type_receives_tag_and_params() {
  Decoder d;
  std::string seen_tag;
  std::size_t seen_params = 0;
  TEST_EXPECT_OK(d.register_type("probe", [&](const FrameContext&, Cursor&, std::string_view tag,
                                             std::span<const Param> params, Value& out) {
    seen_tag = std::string(tag);
    seen_params = params.size();
    out = Value::nothing();
    return std::error_code{};
  }));

  Cursor c;
  Record out;
  TEST_EXPECT_OK(d.decode_blob(c, Spec{"p", TypeSpec::of("probe", 1, "uint8", Delimiters{","})}, out));
  TEST_EXPECT_EQ(seen_tag, "probe");
  TEST_EXPECT_EQ(seen_params, 3u);
  TEST_EXPECT(out.empty());
}

// 自定义类型可通过 FrameContext 组合其他类型（包括其他自定义类型）。
void test_custom_type_composes_through_context() {
  Decoder d;
  TEST_EXPECT_OK(d.register_type("varint", decode_varint));
  TEST_EXPECT_OK(d.register_type("varint-string", [](const FrameContext& ctx, Cursor& cursor, std::string_view,
                                                     std::span<const Param>, Value& out) {
    return ctx.decode_frame(cursor, TypeSpec::of("prefixed", "string", "varint"), out);
  }));

  Cursor c(std::vector<byte>{0x03, 'a', 'b', 'c'});
  Value v;
  TEST_EXPECT_OK(d.decode_frame(c, TypeSpec::of("varint-string"), v));
  TEST_EXPECT(v == Value::text("abc"));
}

void test_custom_failure_leaves_out_untouched() {
  Decoder d;
  TEST_EXPECT_OK(d.register_type("varint", decode_varint));

  Cursor c(std::vector<byte>{0x80, 0x80});
  Value v = Value::text("keep");
  TEST_EXPECT_ERR(d.decode_frame(c, TypeSpec::of("varint"), v), errc::out_of_bounds);
  TEST_EXPECT(v == Value::text("keep"));
}

void test_decoders_are_independent() {
  Decoder a;
  Decoder b;
  TEST_EXPECT_OK(a.register_type("varint", decode_varint));
  TEST_EXPECT(a.has_type("varint"));
  TEST_EXPECT(!b.has_type("varint"));

  a.clear_custom_types();
  TEST_EXPECT(!a.has_type("varint"));
}

void test_registry_mutators_lock_and_may_throw() {
  Decoder d;
  // 这几个接口都要加锁，可能抛出 std::system_error，因此与 register_type 一样不是 noexcept。
  static_assert(!noexcept(d.register_type(std::string{}, DecodeFn{})));
  static_assert(!noexcept(d.unregister_type(std::string_view{})));
  static_assert(!noexcept(d.clear_custom_types()));

  // 注销未注册的标签或内建标签：无副作用。
  d.unregister_type("never-registered");
  d.unregister_type("uint32");
  TEST_EXPECT(d.has_type("uint32"));

  TEST_EXPECT_OK(d.register_type("varint", decode_varint));
  TEST_EXPECT_OK(d.register_type("varint2", decode_varint));
  d.clear_custom_types();
  TEST_EXPECT(!d.has_type("varint"));
  TEST_EXPECT(!d.has_type("varint2"));
  TEST_EXPECT(d.has_type("uint32"));

  Cursor c(std::vector<byte>{0x01});
  Value v;
  TEST_EXPECT_ERR(d.decode_frame(c, TypeSpec::of("varint"), v), errc::unknown_type);
}

void test_default_decoder_registration() {
  TEST_EXPECT_OK(register_type("test-registry-varint", decode_varint));
  Cursor c(std::vector<byte>{0x7F});
  Value v;
  TEST_EXPECT_OK(decode_frame(c, TypeSpec::of("test-registry-varint"), v));
  TEST_EXPECT(v == Value::unsigned_int(64, 127));
  default_decoder().unregister_type("test-registry-varint");
}

void test_concurrent_registration_and_decode() {
  Decoder d;
  TEST_EXPECT_OK(d.register_type("varint", decode_varint));

  std::atomic<int> failures{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&d, &failures, t] {
      const auto tag = "extra-" + std::to_string(t);
      for (int i = 0; i < 200; ++i) {
        if (d.register_type(tag, decode_varint)) {
          ++failures;
        }
        Cursor c(std::vector<byte>{0x01});
        Value v;
        if (d.decode_frame(c, TypeSpec::of("varint"), v)) {
          ++failures;
        }
        d.unregister_type(tag);
      }
    });
  }
  for (auto& th : threads) {
    th.join();
  }
  TEST_EXPECT_EQ(failures.load(), 0);
}

}  // namespace

int main() {
  test_register_and_decode_custom_type();
  test_builtin_tags_cannot_be_replaced();
  test_reregister_replaces_and_unregister_removes();
  test_custom_type_receives_tag_and_params();
  test_custom_type_composes_through_context();
  test_custom_failure_leaves_out_untouched();
  test_decoders_are_independent();
  test_registry_mutators_lock_and_may_throw();
  test_default_decoder_registration();
  test_concurrent_registration_and_decode();
  return ::blobspec::tests::run_and_report();
}
