#include "blobspec/frame/decoder.hpp"

#include "test_main.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace {

using blobspec::core::ByteOrder;
using blobspec::core::Cursor;
using blobspec::core::byte;
using blobspec::core::errc;
using namespace blobspec::frame;

Cursor from_bytes(std::vector<byte> b, ByteOrder order = blobspec::core::kDefaultByteOrder) {
  return Cursor(std::move(b), order);
}

std::string text_at(const Record& r, std::string_view key) {
  const auto* v = r.find(key);
  if (v == nullptr) {
    return "<missing>";
  }
  const auto* t = v->get_if<Text>();
  return t == nullptr ? std::string("<not text>") : t->value;
}

// 00 00 00 05 "MAGIC" 00 00 00 0D "IHDR" + 13 字节 + 4 字节 CRC
std::vector<byte> png_like_chunk() {
  std::vector<byte> b{0x00, 0x00, 0x00, 0x05, 'M', 'A', 'G', 'I', 'C',
                      0x00, 0x00, 0x00, 0x0D, 'I', 'H', 'D', 'R'};
  const std::vector<byte> ihdr{0x00, 0x00, 0x01, 0x00,  // width 256
                               0x00, 0x00, 0x00, 0x80,  // height 128
                               0x08, 0x06, 0x00, 0x00, 0x00};
  b.insert(b.end(), ihdr.begin(), ihdr.end());
  const std::vector<byte> crc{0xDE, 0xAD, 0xBE, 0xEF};
  b.insert(b.end(), crc.begin(), crc.end());
  return b;
}

void test_flat_spec() {
  Decoder d;
  auto c = from_bytes({0x00, 0x00, 0x00, 0x05, 'M', 'A', 'G', 'I', 'C'});
  Record out;
  TEST_EXPECT_OK(d.decode_blob(c, Spec{"length", "uint32", "magic", TypeSpec::of("string", 5)}, out));
  TEST_EXPECT_EQ(out.size(), 2u);
  TEST_EXPECT(*out.find("length") == Value::unsigned_int(32, 5));
  TEST_EXPECT_EQ(text_at(out, "magic"), "MAGIC");
  TEST_EXPECT(c.exhausted());
}

void test_mixed_widths() {
  Decoder d;
  auto c = from_bytes({1, 1, 1, 1, 2, 2});
  Record out;
  TEST_EXPECT_OK(d.decode_blob(c, Spec{"a", "int32", "b", "int16"}, out));
  Record expected;
  expected.set("a", Value::signed_int(32, 16843009));
  expected.set("b", Value::signed_int(16, 514));
  TEST_EXPECT(out == expected);
}

// 先 slice 再解码与直接顺序解码得到相同结果。
void test_slice_equivalent_to_direct_decode() {
  Decoder d;
  const std::vector<byte> bytes{0x00, 0x2A, 'a', 'b', 'c', 0x00, 0x07};
  const Spec inner{"id", "uint16", "name", "c-string"};

  auto direct = from_bytes(bytes);
  Record expected;
  TEST_EXPECT_OK(d.decode_blob(direct, inner, expected));

  auto outer = from_bytes(bytes);
  Record sliced;
  TEST_EXPECT_OK(d.decode_blob(outer, Spec{"s", TypeSpec::of("slice", 6)}, sliced));
  auto* s = sliced.find("s")->get_if<Slice>();
  TEST_EXPECT(s != nullptr);
  if (s != nullptr) {
    Record via_slice;
    TEST_EXPECT_OK(d.decode_blob(s->cursor, inner, via_slice));
    TEST_EXPECT(via_slice == expected);
  }
  TEST_EXPECT_EQ(outer.position(), direct.position());
}

void test_prefixed_field() {
  Decoder d;
  auto c = from_bytes({0x00, 0x00, 0x00, 0x05, 'M', 'A', 'G', 'I', 'C', 0x7F});
  Record out;
  TEST_EXPECT_OK(d.decode_blob(c, Spec{"magic", TypeSpec::of("prefixed", "string", "uint32")}, out));
  TEST_EXPECT_EQ(out.size(), 1u);
  TEST_EXPECT_EQ(text_at(out, "magic"), "MAGIC");
  TEST_EXPECT_EQ(c.position(), 9u);
}

void test_partial_decode_leaves_rest() {
  Decoder d;
  auto c = from_bytes(png_like_chunk());
  Record out;
  TEST_EXPECT_OK(d.decode_blob(c, Spec{"magic", TypeSpec::of("prefixed", "string", "uint32")}, out));
  TEST_EXPECT_EQ(c.position(), 9u);
  TEST_EXPECT_EQ(c.remaining(), 4u + 4u + 13u + 4u);
}

void test_slice_then_nested_decode_then_resume() {
  Decoder d;
  auto c = from_bytes(png_like_chunk());

  Record head;
  TEST_EXPECT_OK(d.decode_blob(c,
                               Spec{"magic", TypeSpec::of("prefixed", "string", "uint32"),
                                    "length", "uint32",
                                    "type", TypeSpec::of("string", 4)},
                               head));
  const auto length = head.find("length")->as_int64().value_or(-1);
  TEST_EXPECT_EQ(length, 13);
  TEST_EXPECT_EQ(text_at(head, "type"), "IHDR");

  Record chunk;
  TEST_EXPECT_OK(d.decode_blob(c, Spec{"data", TypeSpec::of("slice", length)}, chunk));
  TEST_EXPECT_EQ(c.position(), 17u + 13u);

  auto* data = chunk.find("data")->get_if<Slice>();
  TEST_EXPECT(data != nullptr);
  if (data != nullptr) {
    Record ihdr;
    TEST_EXPECT_OK(d.decode_blob(data->cursor, Spec{"width", "uint32", "height", "uint32", "depth", "ubyte"}, ihdr));
    TEST_EXPECT(*ihdr.find("width") == Value::unsigned_int(32, 256));
    TEST_EXPECT(*ihdr.find("height") == Value::unsigned_int(32, 128));
    TEST_EXPECT(*ihdr.find("depth") == Value::unsigned_int(8, 8));
    TEST_EXPECT_EQ(data->cursor.position(), 9u);
  }

  // 子视图的读取不影响外层 Cursor。
  TEST_EXPECT_EQ(c.position(), 30u);

  Record tail;
  TEST_EXPECT_OK(d.decode_blob(c, Spec{"crc", "uint32"}, tail));
  TEST_EXPECT(*tail.find("crc") == Value::unsigned_int(32, 0xDEADBEEFULL));
  TEST_EXPECT(c.exhausted());
}

void test_skip_key() {
  Decoder d;
  auto c = from_bytes({0xAA, 0xBB, 0x00, 0x2A});
  Record out;
  TEST_EXPECT_OK(d.decode_blob(c, Spec{skip_field, 2, "answer", "uint16"}, out));
  TEST_EXPECT_EQ(out.size(), 1u);
  TEST_EXPECT(!out.contains("skip"));
  TEST_EXPECT(*out.find("answer") == Value::unsigned_int(16, 42));
}

void test_nothing_results_are_omitted() {
  Decoder d;
  auto c = from_bytes({0x00, 0x00, 0x00, 0x01});
  Record out;
  TEST_EXPECT_OK(d.decode_blob(c, Spec{"pad", TypeSpec::of("skip", 3), "flag", "ubyte"}, out));
  TEST_EXPECT_EQ(out.size(), 1u);
  TEST_EXPECT(!out.contains("pad"));
}

void test_nested_struct() {
  Decoder d;
  auto c = from_bytes({0x01, 0x00, 0x02, 'h', 'i', 0x00});
  Record out;
  const Spec inner{"code", "uint16", "name", "c-string"};
  TEST_EXPECT_OK(d.decode_blob(c, Spec{"version", "ubyte", "body", TypeSpec::of("struct", inner)}, out));

  const auto* body = out.find("body")->get_if<Record>();
  TEST_EXPECT(body != nullptr);
  if (body != nullptr) {
    TEST_EXPECT(*body->find("code") == Value::unsigned_int(16, 2));
    TEST_EXPECT_EQ(text_at(*body, "name"), "hi");
  }
  TEST_EXPECT(c.exhausted());
}

void test_odd_spec_performs_no_reads() {
  Decoder d;
  auto c = from_bytes({0x01, 0x02, 0x03, 0x04});
  Record out;
  out.set("sentinel", Value::unsigned_int(8, 1));

  TEST_EXPECT_ERR(d.decode_blob(c, Spec{"a", "ubyte", "b"}, out), errc::malformed_spec);
  TEST_EXPECT_EQ(c.position(), 0u);
  TEST_EXPECT(out.contains("sentinel"));
}

void test_malformed_structure_detected_before_reads() {
  Decoder d;
  auto c = from_bytes({0x01, 0x02, 0x03, 0x04});
  Record out;

  // 键不是名字。
  TEST_EXPECT_ERR(d.decode_blob(c, Spec{"a", "ubyte", 3, "ubyte"}, out), errc::malformed_spec);
  // skip 后面不是整数。
  TEST_EXPECT_ERR(d.decode_blob(c, Spec{"a", "ubyte", skip_field, "ubyte"}, out), errc::malformed_spec);
  // 普通字段的描述符是整数。
  TEST_EXPECT_ERR(d.decode_blob(c, Spec{"a", "ubyte", "b", 2}, out), errc::malformed_spec);
  // 负数跳过长度。
  TEST_EXPECT_ERR(d.decode_blob(c, Spec{"a", "ubyte", skip_field, -1}, out), errc::invalid_argument);

  TEST_EXPECT_EQ(c.position(), 0u);
  TEST_EXPECT(out.empty());
}

void test_duplicate_keys_overwrite() {
  Decoder d;
  auto c = from_bytes({0x01, 0x02, 0x03});
  Record out;
  TEST_EXPECT_OK(d.decode_blob(c, Spec{"v", "ubyte", "w", "ubyte", "v", "ubyte"}, out));
  TEST_EXPECT_EQ(out.size(), 2u);
  TEST_EXPECT(*out.find("v") == Value::unsigned_int(8, 3));
  TEST_EXPECT_EQ(out.keys().front(), "v");
}

void test_failure_discards_partial_record() {
  Decoder d;
  auto c = from_bytes({0x00, 0x01, 0x02});
  Record out;
  TEST_EXPECT_ERR(d.decode_blob(c, Spec{"a", "uint16", "b", "uint32"}, out), errc::out_of_bounds);
  TEST_EXPECT(out.empty());

  auto c2 = from_bytes({0x00, 0x01});
  TEST_EXPECT_ERR(d.decode_blob(c2, Spec{"a", "uint16", "b", "mystery"}, out), errc::unknown_type);
  TEST_EXPECT(out.empty());
}

void test_little_endian_buffer() {
  Decoder d;
  auto c = from_bytes({0x05, 0x00, 0x00, 0x00, 'M', 'A', 'G', 'I', 'C'}, ByteOrder::little_endian);
  Record out;
  TEST_EXPECT_OK(d.decode_blob(c, Spec{"magic", TypeSpec::of("prefixed", "string", "uint32")}, out));
  TEST_EXPECT_EQ(text_at(out, "magic"), "MAGIC");
}

void test_empty_spec() {
  Decoder d;
  auto c = from_bytes({0x01});
  Record out;
  out.set("stale", Value::nothing());
  TEST_EXPECT_OK(d.decode_blob(c, Spec{}, out));
  TEST_EXPECT(out.empty());
  TEST_EXPECT_EQ(c.position(), 0u);
}

void test_max_depth() {
  Decoder shallow(DecoderOptions{1});
  const Spec leaf{"x", "ubyte"};
  const Spec one{"a", TypeSpec::of("struct", leaf)};
  const Spec two{"b", TypeSpec::of("struct", one)};

  auto c = from_bytes({0x01});
  Record out;
  TEST_EXPECT_OK(shallow.decode_blob(c, one, out));

  c.rewind();
  TEST_EXPECT_ERR(shallow.decode_blob(c, two, out), errc::too_deep);

  Decoder deep;
  c.rewind();
  TEST_EXPECT_OK(deep.decode_blob(c, two, out));
}

void test_default_decoder_free_functions() {
  auto c = from_bytes({0x00, 0x03, 'a', 'b', 'c'});
  Record out;
  TEST_EXPECT_OK(decode_blob(c, Spec{"name", TypeSpec::of("prefixed", "string", "uint16")}, out));
  TEST_EXPECT_EQ(text_at(out, "name"), "abc");
}

}  // namespace

int main() {
  test_flat_spec();
  test_mixed_widths();
  test_slice_equivalent_to_direct_decode();
  test_prefixed_field();
  test_partial_decode_leaves_rest();
  test_slice_then_nested_decode_then_resume();
  test_skip_key();
  test_nothing_results_are_omitted();
  test_nested_struct();
  test_odd_spec_performs_no_reads();
  test_malformed_structure_detected_before_reads();
  test_duplicate_keys_overwrite();
  test_failure_discards_partial_record();
  test_little_endian_buffer();
  test_empty_spec();
  test_max_depth();
  test_default_decoder_free_functions();
  return ::blobspec::tests::run_and_report();
}
