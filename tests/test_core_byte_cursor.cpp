#include "bsonx/core/byte_cursor.hpp"

#include "test_main.hpp"

#include <cmath>
#include <cstdint>
#include <string>
#include <vector>

namespace {

using bsonx::core::byte;
using bsonx::core::ByteReader;
using bsonx::core::ByteWriter;
using bsonx::core::bytes_view;
using bsonx::core::errc;
using bsonx::core::make_error_code;

bytes_view view(const std::vector<byte>& v) { return {v.data(), v.size()}; }

void test_writer_little_endian_layout() {
  ByteWriter w;
  w.write_i32(1);
  w.write_i64(-2);
  w.write_u8(0xAB);

  const std::vector<byte> expected{
    0x01, 0x00, 0x00, 0x00,
    0xFE, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0xAB,
  };
  TEST_EXPECT(w.release() == expected);
}

void test_reader_roundtrip_scalars() {
  ByteWriter w;
  w.write_i32(-123456);
  w.write_u32(0xDEADBEEFu);
  w.write_i64(INT64_MIN);
  w.write_u64(UINT64_MAX);
  w.write_double(1.5);
  const auto buf = w.release();

  ByteReader r(view(buf));
  std::int32_t i32 = 0;
  std::uint32_t u32 = 0;
  std::int64_t i64 = 0;
  std::uint64_t u64 = 0;
  double d = 0.0;
  TEST_EXPECT_OK(r.read_i32(i32));
  TEST_EXPECT_OK(r.read_u32(u32));
  TEST_EXPECT_OK(r.read_i64(i64));
  TEST_EXPECT_OK(r.read_u64(u64));
  TEST_EXPECT_OK(r.read_double(d));
  TEST_EXPECT_EQ(i32, -123456);
  TEST_EXPECT_EQ(u32, 0xDEADBEEFu);
  TEST_EXPECT_EQ(i64, INT64_MIN);
  TEST_EXPECT_EQ(u64, UINT64_MAX);
  TEST_EXPECT_EQ(d, 1.5);
  TEST_EXPECT(r.at_end());
}

void test_reader_short_read_keeps_position() {
  const std::vector<byte> buf{0x01, 0x02, 0x03};
  ByteReader r(view(buf));
  std::int32_t v = 0;
  TEST_EXPECT_EQ(r.read_i32(v), make_error_code(errc::out_of_range));
  TEST_EXPECT_EQ(r.position(), 0u);

  byte b = 0;
  TEST_EXPECT_OK(r.read_u8(b));
  TEST_EXPECT_EQ(b, 0x01);
  TEST_EXPECT_EQ(r.remaining(), 2u);

  TEST_EXPECT_EQ(r.seek(4), make_error_code(errc::out_of_range));
  TEST_EXPECT_OK(r.seek(3));
  TEST_EXPECT(r.at_end());
  TEST_EXPECT_EQ(r.read_u8(b), make_error_code(errc::out_of_range));
}

void test_cstring() {
  ByteWriter w;
  TEST_EXPECT_OK(w.write_cstring("abc"));
  TEST_EXPECT_EQ(w.write_cstring(std::string("a\0b", 3)), make_error_code(errc::invalid_argument));
  const auto buf = w.release();
  TEST_EXPECT_EQ(buf.size(), 4u);

  ByteReader r(view(buf));
  std::string s;
  TEST_EXPECT_OK(r.read_cstring(s, true));
  TEST_EXPECT_EQ(s, "abc");

  const std::vector<byte> unterminated{'a', 'b'};
  ByteReader r2(view(unterminated));
  TEST_EXPECT_EQ(r2.read_cstring(s, true), make_error_code(errc::missing_terminator));
  TEST_EXPECT_EQ(r2.position(), 0u);
}

void test_length_prefixed_string() {
  ByteWriter w;
  TEST_EXPECT_OK(w.write_string("hi"));
  const auto buf = w.release();
  const std::vector<byte> expected{0x03, 0x00, 0x00, 0x00, 'h', 'i', 0x00};
  TEST_EXPECT(buf == expected);

  ByteReader r(view(buf));
  std::string s;
  TEST_EXPECT_OK(r.read_string(s, true));
  TEST_EXPECT_EQ(s, "hi");

  // 长度 0：至少要包含结尾 NUL
  const std::vector<byte> zero{0x00, 0x00, 0x00, 0x00, 0x00};
  ByteReader r2(view(zero));
  TEST_EXPECT_EQ(r2.read_string(s, true), make_error_code(errc::invalid_length));
  TEST_EXPECT_EQ(r2.position(), 0u);

  // 长度超出剩余字节
  const std::vector<byte> too_long{0x10, 0x00, 0x00, 0x00, 'a', 0x00};
  ByteReader r3(view(too_long));
  TEST_EXPECT_EQ(r3.read_string(s, true), make_error_code(errc::invalid_length));

  // 末尾不是 NUL
  const std::vector<byte> no_nul{0x02, 0x00, 0x00, 0x00, 'a', 'b'};
  ByteReader r4(view(no_nul));
  TEST_EXPECT_EQ(r4.read_string(s, true), make_error_code(errc::missing_terminator));
}

void test_invalid_utf8_rejected_only_when_validating() {
  const std::vector<byte> buf{0x03, 0x00, 0x00, 0x00, 0xC3, 0x28, 0x00};
  std::string s;

  ByteReader strict(view(buf));
  TEST_EXPECT_EQ(strict.read_string(s, true), make_error_code(errc::invalid_utf8));
  TEST_EXPECT_EQ(strict.position(), 0u);

  ByteReader lax(view(buf));
  TEST_EXPECT_OK(lax.read_string(s, false));
  TEST_EXPECT_EQ(s.size(), 2u);
}

void test_reserve_and_patch_length() {
  ByteWriter w;
  const auto at = w.reserve_length();
  w.write_u8(0x00);
  TEST_EXPECT_OK(w.patch_length(at));
  const auto buf = w.release();
  const std::vector<byte> expected{0x05, 0x00, 0x00, 0x00, 0x00};
  TEST_EXPECT(buf == expected);

  ByteWriter w2;
  w2.write_u8(1);
  TEST_EXPECT_EQ(w2.patch_i32(0, 7), make_error_code(errc::out_of_range));
  TEST_EXPECT_EQ(w2.patch_length(5), make_error_code(errc::out_of_range));
}

void test_truncate() {
  ByteWriter w(std::vector<byte>{1, 2, 3});
  w.write_u8(4);
  w.truncate(3);
  TEST_EXPECT_EQ(w.position(), 3u);
  w.truncate(10);
  TEST_EXPECT_EQ(w.position(), 3u);
}

void test_is_valid_utf8() {
  using bsonx::core::is_valid_utf8;
  TEST_EXPECT(is_valid_utf8(""));
  TEST_EXPECT(is_valid_utf8("plain ascii"));
  TEST_EXPECT(is_valid_utf8("\xC3\xA9"));          // é
  TEST_EXPECT(is_valid_utf8("\xE4\xB8\xAD"));      // 中
  TEST_EXPECT(is_valid_utf8("\xF0\x9F\x98\x80"));  // U+1F600

  TEST_EXPECT(!is_valid_utf8("\xC3"));              // 截断
  TEST_EXPECT(!is_valid_utf8("\xC0\xAF"));          // 过长编码
  TEST_EXPECT(!is_valid_utf8("\xED\xA0\x80"));      // 代理区
  TEST_EXPECT(!is_valid_utf8("\xF4\x90\x80\x80"));  // > U+10FFFF
  TEST_EXPECT(!is_valid_utf8("\xFF"));
}

}  // namespace

int main() {
  test_writer_little_endian_layout();
  test_reader_roundtrip_scalars();
  test_reader_short_read_keeps_position();
  test_cstring();
  test_length_prefixed_string();
  test_invalid_utf8_rejected_only_when_validating();
  test_reserve_and_patch_length();
  test_truncate();
  test_is_valid_utf8();
  return ::bsonx::tests::run_and_report();
}
