#include "bsonx/utils/base64.hpp"
#include "bsonx/utils/hex.hpp"

#include "test_main.hpp"

#include <array>
#include <string>
#include <vector>

namespace {

using bsonx::core::byte;
using bsonx::core::bytes_view;

bytes_view view(const std::vector<byte>& v) { return {v.data(), v.size()}; }

void test_to_hex_and_parse_hex() {
  const std::vector<byte> bytes{0x00, 0x1F, 0xAB, 0xFF};
  TEST_EXPECT_EQ(bsonx::utils::to_hex(view(bytes)), "001fabff");

  std::vector<byte> out;
  TEST_EXPECT_OK(bsonx::utils::parse_hex("00 1f AB ff", out));
  TEST_EXPECT(out == bytes);

  // 分隔符与 0x 前缀都被忽略（GUID 的 8-4-4-4-12 形式也能直接解析）
  TEST_EXPECT_OK(bsonx::utils::parse_hex("0x00-0x1f-0xab-0xff", out));
  TEST_EXPECT(out == bytes);

  TEST_EXPECT(static_cast<bool>(bsonx::utils::parse_hex("abc", out)));
  TEST_EXPECT(static_cast<bool>(bsonx::utils::parse_hex("zz", out)));
}

void test_decode_hex_exact() {
  std::array<byte, 2> out{};
  TEST_EXPECT(bsonx::utils::decode_hex_exact("beEF", out));
  TEST_EXPECT_EQ(out[0], 0xBE);
  TEST_EXPECT_EQ(out[1], 0xEF);

  TEST_EXPECT(!bsonx::utils::decode_hex_exact("bee", out));
  TEST_EXPECT(!bsonx::utils::decode_hex_exact("be-f", out));
}

void test_hex_dump() {
  std::vector<byte> bytes;
  for (int i = 0; i < 20; ++i) {
    bytes.push_back(static_cast<byte>(0x41 + i));
  }

  bsonx::utils::HexDumpOptions opt;
  opt.bytes_per_line = 16;
  opt.max_bytes = 0;
  const auto dump = bsonx::utils::hex_dump(view(bytes), opt);
  TEST_EXPECT(dump.rfind("0000: 41 42", 0) == 0);
  TEST_EXPECT(dump.find("\n0010: 51 52 53 54\n") != std::string::npos);

  opt.max_bytes = 4;
  opt.show_offset = false;
  const auto truncated = bsonx::utils::hex_dump(view(bytes), opt);
  TEST_EXPECT(truncated.rfind("41 42 43 44\n", 0) == 0);
  TEST_EXPECT(truncated.find("truncated, total=20 bytes") != std::string::npos);

  opt.max_bytes = 0;
  opt.show_ascii = true;
  opt.bytes_per_line = 4;
  const auto ascii = bsonx::utils::hex_dump(view(std::vector<byte>{0x41, 0x00}), opt);
  TEST_EXPECT(ascii.find("A.") != std::string::npos);
}

void test_base64_vectors() {
  struct Vector {
    const char* plain;
    const char* encoded;
  };
  const Vector vectors[] = {
    {"", ""},
    {"f", "Zg=="},
    {"fo", "Zm8="},
    {"foo", "Zm9v"},
    {"foob", "Zm9vYg=="},
    {"fooba", "Zm9vYmE="},
    {"foobar", "Zm9vYmFy"},
  };
  for (const auto& v : vectors) {
    const std::string plain(v.plain);
    const std::vector<byte> bytes(plain.begin(), plain.end());
    TEST_EXPECT_EQ(bsonx::utils::base64_encode(view(bytes)), std::string(v.encoded));

    std::vector<byte> decoded;
    TEST_EXPECT_OK(bsonx::utils::base64_decode(v.encoded, decoded));
    TEST_EXPECT(decoded == bytes);
  }
}

void test_base64_rejects_malformed() {
  std::vector<byte> out;
  TEST_EXPECT(static_cast<bool>(bsonx::utils::base64_decode("Zg=", out)));     // 长度不是 4 的倍数
  TEST_EXPECT(static_cast<bool>(bsonx::utils::base64_decode("Z===", out)));    // 填充过多
  TEST_EXPECT(static_cast<bool>(bsonx::utils::base64_decode("Zg==Zg==", out))); // 填充不在末尾
  TEST_EXPECT(static_cast<bool>(bsonx::utils::base64_decode("Zm9*", out)));    // 非法字符
}

}  // namespace

int main() {
  test_to_hex_and_parse_hex();
  test_decode_hex_exact();
  test_hex_dump();
  test_base64_vectors();
  test_base64_rejects_malformed();
  return ::bsonx::tests::run_and_report();
}
