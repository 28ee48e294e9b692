#include "blobspec/frame/decoder.hpp"
#include "blobspec/utils/hex.hpp"
#include "blobspec/utils/value_dump.hpp"

#include "test_main.hpp"

#include <string>
#include <vector>

namespace {

using blobspec::core::Cursor;
using blobspec::core::byte;
using blobspec::core::errc;
using blobspec::frame::Record;
using blobspec::frame::TypeSpec;
using blobspec::frame::Value;
using namespace blobspec::utils;

void test_parse_hex() {
  std::vector<byte> out;
  TEST_EXPECT_OK(parse_hex("de ad,BE:ef", out));
  TEST_EXPECT_EQ(out, (std::vector<byte>{0xDE, 0xAD, 0xBE, 0xEF}));

  TEST_EXPECT_OK(parse_hex("0x00 0X2a\n4d-41_47", out));
  TEST_EXPECT_EQ(out, (std::vector<byte>{0x00, 0x2A, 0x4D, 0x41, 0x47}));

  TEST_EXPECT_OK(parse_hex("", out));
  TEST_EXPECT(out.empty());
}

void test_parse_hex_errors() {
  std::vector<byte> out{0x01};
  TEST_EXPECT_ERR(parse_hex("abc", out), errc::invalid_argument);
  TEST_EXPECT(out.empty());

  TEST_EXPECT_ERR(parse_hex("zz", out), errc::invalid_argument);
  TEST_EXPECT_ERR(parse_hex("d e", out), errc::invalid_argument);
}

void test_hex_dump_bytes() {
  const std::vector<byte> b{0x00, 0x01, 0xAB};
  TEST_EXPECT_EQ(hex_dump(b), std::string("0000: 00 01 ab\n"));

  HexDumpOptions no_offset;
  no_offset.show_offset = false;
  TEST_EXPECT_EQ(hex_dump(b, no_offset), std::string("00 01 ab\n"));

  HexDumpOptions two_per_line;
  two_per_line.bytes_per_line = 2;
  TEST_EXPECT_EQ(hex_dump(b, two_per_line), std::string("0000: 00 01\n0002: ab\n"));

  TEST_EXPECT(hex_dump(std::vector<byte>{}).empty());
}

void test_hex_dump_truncation_and_ascii() {
  const std::vector<byte> b{'A', 'B', 0x00};

  HexDumpOptions truncated;
  truncated.max_bytes = 2;
  TEST_EXPECT_EQ(hex_dump(b, truncated), std::string("0000: 41 42\n... (truncated, total=3 bytes)\n"));

  HexDumpOptions ascii;
  ascii.show_ascii = true;
  const auto text = hex_dump(b, ascii);
  TEST_EXPECT(text.find("AB.\n") != std::string::npos);
}

void test_hex_dump_cursor_marks_position() {
  Cursor c(std::vector<byte>{0x00, 0x01, 0x02});
  TEST_EXPECT_OK(c.skip(1));
  TEST_EXPECT_EQ(hex_dump(c), std::string("0000:  00 >01  02\n"));

  TEST_EXPECT_OK(c.skip(2));
  const auto end = hex_dump(c);
  TEST_EXPECT(end.find("> (end, 3 bytes)") != std::string::npos);
  TEST_EXPECT_EQ(c.position(), 3u);
}

void test_dump_scalars() {
  TEST_EXPECT_EQ(dump_value(Value::nothing()), std::string("nothing"));
  TEST_EXPECT_EQ(dump_value(Value::signed_int(16, -2)), std::string("int16 -2"));
  TEST_EXPECT_EQ(dump_value(Value::unsigned_int(8, 255)), std::string("ubyte 255"));
  TEST_EXPECT_EQ(dump_value(Value::unsigned_int(64, 18446744073709551615ULL)),
                 std::string("uint64 18446744073709551615"));
  TEST_EXPECT_EQ(dump_value(Value::text("hi\n")), std::string("string[3] \"hi\\x0a\""));
  TEST_EXPECT_EQ(dump_value(Value::bytes({0xDE, 0xAD})), std::string("bytes[2] de ad"));
  TEST_EXPECT_EQ(dump_value(Value::bytes({})), std::string("bytes[0]"));
}

void test_dump_payload_truncation() {
  ValueDumpOptions opt;
  opt.max_payload_bytes = 2;
  TEST_EXPECT_EQ(dump_value(Value::text("abcdef"), opt), std::string("string[6] \"ab...\""));
  TEST_EXPECT_EQ(dump_value(Value::bytes({0x01, 0x02, 0x03}), opt), std::string("bytes[3] 01 02 ..."));
}

void test_dump_record() {
  Record r;
  r.set("a", Value::unsigned_int(8, 1));
  r.set("b", Value::text("x"));
  TEST_EXPECT_EQ(dump_record(r), std::string("{ :a ubyte 1, :b string[1] \"x\" }"));
  TEST_EXPECT_EQ(dump_record(Record{}), std::string("{}"));

  ValueDumpOptions multi;
  multi.multiline = true;
  TEST_EXPECT_EQ(dump_record(r, multi), std::string("{\n  :a ubyte 1\n  :b string[1] \"x\"\n}"));

  ValueDumpOptions one;
  one.max_record_items = 1;
  TEST_EXPECT_EQ(dump_record(r, one), std::string("{ :a ubyte 1, ... }"));
}

void test_dump_nested_depth_limit() {
  Record inner;
  inner.set("x", Value::unsigned_int(8, 7));
  Record outer;
  outer.set("in", Value::record(inner));

  TEST_EXPECT_EQ(dump_record(outer), std::string("{ :in { :x ubyte 7 } }"));

  ValueDumpOptions shallow;
  shallow.max_depth = 1;
  TEST_EXPECT_EQ(dump_record(outer, shallow), std::string("{ :in {...} }"));
}

void test_dump_slice_and_sequence_do_not_consume() {
  Cursor c(std::vector<byte>{0x01, 0x02, 0x03});
  TEST_EXPECT_OK(c.skip(1));
  TEST_EXPECT_EQ(dump_value(Value::slice(c)), std::string("slice[3] pos=1 01 02 03"));

  c.rewind();
  blobspec::frame::Decoder d;
  Value seq;
  TEST_EXPECT_OK(d.decode_frame(c, TypeSpec::of("sequence", "ubyte"), seq));
  TEST_EXPECT_EQ(dump_value(seq), std::string("<sequence of ubyte>"));
  TEST_EXPECT_EQ(c.position(), 0u);
}

void test_dump_color() {
  ValueDumpOptions opt;
  opt.enable_color = true;
  const auto s = dump_value(Value::unsigned_int(8, 1), opt);
  TEST_EXPECT(s.find("\033[") != std::string::npos);
}

}  // namespace

int main() {
  test_parse_hex();
  test_parse_hex_errors();
  test_hex_dump_bytes();
  test_hex_dump_truncation_and_ascii();
  test_hex_dump_cursor_marks_position();
  test_dump_scalars();
  test_dump_payload_truncation();
  test_dump_record();
  test_dump_nested_depth_limit();
  test_dump_slice_and_sequence_do_not_consume();
  test_dump_color();
  return ::blobspec::tests::run_and_report();
}
