#include "bench_main.hpp"
#include "blobspec/dsl/parser.hpp"
#include "blobspec/frame/decoder.hpp"

#include <cstdint>
#include <string>
#include <vector>

using namespace blobspec;
using namespace blobspec::frame;
using core::byte;
using core::Cursor;

namespace {

// 记录格式：id:uint32, flags:ubyte, name:prefixed-string(ubyte), pad 2
std::vector<byte> make_records(std::size_t count) {
  std::vector<byte> out;
  out.reserve(count * 16);
  for (std::size_t i = 0; i < count; ++i) {
    const auto id = static_cast<std::uint32_t>(i);
    out.push_back(static_cast<byte>(id >> 24));
    out.push_back(static_cast<byte>(id >> 16));
    out.push_back(static_cast<byte>(id >> 8));
    out.push_back(static_cast<byte>(id));
    out.push_back(static_cast<byte>(i & 0x0F));
    out.push_back(7);
    for (char c : std::string("record_")) {
      out.push_back(static_cast<byte>(c));
    }
    out.push_back(0x00);
    out.push_back(0x00);
  }
  return out;
}

void bench_flat_records() {
  constexpr std::size_t count = 20'000;
  const auto buffer = make_records(count);
  const Spec record{"id", "uint32", "flags", "ubyte", "name", TypeSpec::of("prefixed-string", "ubyte"), skip_field, 2};
  const Decoder decoder;

  BENCH_RUN("decode_blob: 20k flat records", buffer.size(), 5, {
    Cursor cursor = Cursor::wrap(buffer);
    Record out;
    while (!cursor.exhausted()) {
      if (auto ec = decoder.decode_blob(cursor, record, out)) {
        std::cerr << "decode failed: " << ec.message() << "\n";
        break;
      }
    }
  });
}

void bench_sequence_of_structs() {
  constexpr std::size_t count = 20'000;
  const auto buffer = make_records(count);
  const Spec record{"id", "uint32", "flags", "ubyte", "name", TypeSpec::of("prefixed-string", "ubyte"), skip_field, 2};
  const auto element = TypeSpec::of("struct", record);
  const Decoder decoder;

  BENCH_RUN("sequence: collect 20k structs", buffer.size(), 5, {
    Cursor cursor = Cursor::wrap(buffer);
    LazySequence seq;
    std::vector<Value> items;
    auto ec = decoder.decode_blob_array(cursor, element, seq);
    if (!ec) {
      ec = seq.collect(items);
    }
    if (ec) {
      std::cerr << "collect failed: " << ec.message() << "\n";
    }
  });
}

void bench_integers() {
  constexpr std::size_t count = 256 * 1024;
  std::vector<byte> buffer(count * 4, 0x5A);
  const Decoder decoder;
  const auto element = TypeSpec::of("uint32");

  BENCH_RUN("decode_frame: 256k uint32", buffer.size(), 5, {
    Cursor cursor = Cursor::wrap(buffer);
    Value v;
    while (!cursor.exhausted()) {
      if (auto ec = decoder.decode_frame(cursor, element, v)) {
        std::cerr << "decode failed: " << ec.message() << "\n";
        break;
      }
    }
  });
}

void bench_c_strings() {
  std::vector<byte> buffer;
  for (int i = 0; i < 16'384; ++i) {
    for (char c : std::string("null-terminated-field")) {
      buffer.push_back(static_cast<byte>(c));
    }
    buffer.push_back(0x00);
  }
  const Decoder decoder;
  const auto element = TypeSpec::of("c-string");

  BENCH_RUN("decode_frame: 16k c-string", buffer.size(), 5, {
    Cursor cursor = Cursor::wrap(buffer);
    Value v;
    while (!cursor.exhausted()) {
      if (auto ec = decoder.decode_frame(cursor, element, v)) {
        std::cerr << "decode failed: " << ec.message() << "\n";
        break;
      }
    }
  });
}

void bench_parse_spec_text() {
  const std::string text = R"([:magic [:prefixed :string :uint32]
                               :skip 4
                               :header [:struct [:width :uint32 :height :uint32 :depth :ubyte]]
                               :entries [:sequence :uint16]])";

  BENCH_RUN("dsl: parse_spec x1000", text.size() * 1000, 5, {
    for (int i = 0; i < 1000; ++i) {
      auto result = dsl::parse_spec(text);
      if (result.ec) {
        std::cerr << "parse failed: " << result.error_message << "\n";
        break;
      }
    }
  });
}

}  // namespace

int main() {
  bench_flat_records();
  bench_sequence_of_structs();
  bench_integers();
  bench_c_strings();
  bench_parse_spec_text();
  blobspec::benchmarks::print_results();
  return 0;
}
