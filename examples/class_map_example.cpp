/**
 * @file class_map_example.cpp
 * @brief 演示 ClassMap 把业务结构体映射为文档
 *
 * 本示例展示如何：
 * 1. 为结构体声明成员映射（含 Guid 字段级表示法与字符串形式的枚举）
 * 2. 结构体 -> 文档 -> BSON 字节 -> 文档 -> 结构体
 * 3. 处理缺失/多余元素
 */

#include "bsonx/bson/codec.hpp"
#include "bsonx/bson/defaults.hpp"
#include "bsonx/json/writer.hpp"
#include "bsonx/serialization/class_map.hpp"

#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace bsonx;
using namespace bsonx::serialization;

// ============================================================================
// 业务结构
// ============================================================================
enum class Status : std::int32_t {
  active = 1,
  retired = 2,
};

struct Device {
  bson::Guid id;
  std::string model;
  Status status{Status::active};
  std::vector<std::int32_t> ports;
  std::optional<std::string> location;
};

ClassMap<Device> device_map() {
  ClassMap<Device> map;
  map.map("_id", &Device::id, GuidSerializer(bson::GuidRepresentation::standard))
      .map("model", &Device::model)
      .map("status",
           &Device::status,
           EnumSerializer<Status>(EnumRepresentation::string,
                                  {{Status::active, "active"}, {Status::retired, "retired"}}))
      .map("ports", &Device::ports)
      .map_optional("location", &Device::location);
  return map;
}

int main() {
  // v3：表示法只由字段级 serializer 决定
  bson::ScopedGuidRepresentationMode mode(bson::GuidRepresentationMode::v3);

  const auto map = device_map();

  Device device;
  if (auto ec = bson::Guid::parse("6f2c1a3e-8b4d-4c2a-9e71-0d5b3f6a8c90", device.id)) {
    std::cerr << "Guid parse failed: " << ec.message() << "\n";
    return 1;
  }
  device.model = "EQ-100";
  device.ports = {5000, 5001};
  device.location = "bay-3";

  bson::Document doc;
  if (auto ec = map.to_document(device, doc)) {
    std::cerr << "to_document failed: " << ec.message() << "\n";
    return 1;
  }
  std::cout << "[to_document] " << json::to_json(doc) << "\n";

  std::vector<bson::byte> encoded;
  if (auto ec = bson::encode(doc, encoded)) {
    std::cerr << "encode failed: " << ec.message() << "\n";
    return 1;
  }
  std::cout << "[encode] " << encoded.size() << " bytes\n";

  const auto decoded = bson::decode(bson::bytes_view{encoded.data(), encoded.size()});
  if (decoded.ec) {
    std::cerr << "decode failed: " << decoded.ec.message() << "\n";
    return 1;
  }

  Device back;
  if (auto ec = map.from_document(decoded.document, back)) {
    std::cerr << "from_document failed: " << ec.message() << "\n";
    return 1;
  }
  std::cout << "[from_document] id=" << back.id.to_string() << " model=" << back.model
            << " ports=" << back.ports.size() << " location=" << back.location.value_or("-") << "\n";

  // 多余元素：默认拒绝，可配置忽略
  bson::Document extra = decoded.document;
  extra.append("firmware", bson::Value::string("1.2.0"));
  const auto strict_ec = map.from_document(extra, back);
  std::cout << "[extra element] " << strict_ec.message() << "\n";

  auto lenient = device_map();
  lenient.set_ignore_extra_elements(true);
  std::cout << "[extra element, ignored] " << lenient.from_document(extra, back).message() << "\n";

  return 0;
}
