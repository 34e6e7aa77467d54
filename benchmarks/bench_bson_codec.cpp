#include "bench_main.hpp"
#include "bsonx/bson/codec.hpp"
#include "bsonx/bson/value.hpp"

#include <string>
#include <vector>

using namespace bsonx;
using namespace bsonx::bson;

static Document create_deep_nested_document(int depth) {
  // 每层一个子文档，最内层放一个 int32
  Document doc;
  if (depth <= 0) {
    doc.append("v", Value::int32(42));
    return doc;
  }
  doc.append("child", Value::document(create_deep_nested_document(depth - 1)));
  return doc;
}

static void bench_codec_deep_nested() {
  // 深度嵌套文档 (64层)
  constexpr int depth = 64;

  Document doc = create_deep_nested_document(depth);
  std::vector<byte> encoded;
  std::size_t encoded_bytes = 0;

  BENCH_RUN("BSON: Deep nested document encode (64 levels)", depth, 3, {
    encoded.clear();
    auto ec = encode(doc, encoded);
    if (ec) {
      std::cerr << "Encode failed: " << ec.message() << "\n";
    }
    encoded_bytes = encoded.size();
  });

  BENCH_RUN("BSON: Deep nested document decode (64 levels)", encoded_bytes, 3, {
    auto result = decode(bytes_view{encoded.data(), encoded.size()});
    if (result.ec) {
      std::cerr << "Decode failed: " << result.ec.message() << "\n";
    }
  });
}

static void bench_codec_large_array() {
  // 大数组 (10000 个 int64)
  constexpr std::size_t item_count = 10000;

  std::vector<Value> values;
  values.reserve(item_count);
  for (std::size_t i = 0; i < item_count; ++i) {
    values.push_back(Value::int64(static_cast<std::int64_t>(i)));
  }
  Document doc;
  doc.append("items", Value::array(std::move(values)));

  std::vector<byte> encoded;
  std::size_t encoded_bytes = 0;

  BENCH_RUN("BSON: Large array encode (10000 int64)", item_count * sizeof(std::int64_t), 3, {
    encoded.clear();
    auto ec = encode(doc, encoded);
    if (ec) {
      std::cerr << "Encode failed: " << ec.message() << "\n";
    }
    encoded_bytes = encoded.size();
  });

  BENCH_RUN("BSON: Large array decode (10000 int64)", encoded_bytes, 3, {
    auto result = decode(bytes_view{encoded.data(), encoded.size()});
    if (result.ec) {
      std::cerr << "Decode failed: " << result.ec.message() << "\n";
    }
  });
}

static void bench_codec_large_string() {
  // 大字符串 (1MB)
  constexpr std::size_t string_size = 1024 * 1024;

  Document doc;
  doc.append("s", Value::string(std::string(string_size, 'A')));

  std::vector<byte> encoded;
  std::size_t encoded_bytes = 0;

  BENCH_RUN("BSON: Large string encode (1MB)", string_size, 3, {
    encoded.clear();
    auto ec = encode(doc, encoded);
    if (ec) {
      std::cerr << "Encode failed: " << ec.message() << "\n";
    }
    encoded_bytes = encoded.size();
  });

  // 解码时 UTF-8 校验覆盖整段字符串
  BENCH_RUN("BSON: Large string decode (1MB)", encoded_bytes, 3, {
    auto result = decode(bytes_view{encoded.data(), encoded.size()});
    if (result.ec) {
      std::cerr << "Decode failed: " << result.ec.message() << "\n";
    }
  });
}

static void bench_codec_large_binary() {
  // 大 binary (1MB)
  constexpr std::size_t binary_size = 1024 * 1024;

  Document doc;
  doc.append("b", Value(Binary(std::vector<byte>(binary_size, 0xFF))));

  std::vector<byte> encoded;
  std::size_t encoded_bytes = 0;

  BENCH_RUN("BSON: Large binary encode (1MB)", binary_size, 3, {
    encoded.clear();
    auto ec = encode(doc, encoded);
    if (ec) {
      std::cerr << "Encode failed: " << ec.message() << "\n";
    }
    encoded_bytes = encoded.size();
  });

  BENCH_RUN("BSON: Large binary decode (1MB)", encoded_bytes, 3, {
    auto result = decode(bytes_view{encoded.data(), encoded.size()});
    if (result.ec) {
      std::cerr << "Decode failed: " << result.ec.message() << "\n";
    }
  });
}

int main() {
  bench_codec_deep_nested();
  bench_codec_large_array();
  bench_codec_large_string();
  bench_codec_large_binary();

  bsonx::benchmarks::print_results();
  return 0;
}
