#include <bsonx/bson/codec.hpp>
#include <bsonx/bson/value.hpp>
#include <bsonx/json/writer.hpp>

#include <iostream>

using namespace bsonx::bson;

int main() {
    std::cout << "=== BSON 编解码简单示例 ===\n\n";

    // 构造文档
    Document doc;
    doc.append("greeting", Value::string("Hello BSON"))
        .append("count", Value::int32(3))
        .append("tags", Value::array({Value::string("a"), Value::string("b")}));

    // 编码
    std::vector<byte> encoded;
    auto ec = encode(doc, encoded);
    if (ec) {
        std::cerr << "编码失败: " << ec.message() << "\n";
        return 1;
    }

    std::cout << "编码成功: " << encoded.size() << " 字节\n";

    // 解码
    auto result = decode(bytes_view{encoded.data(), encoded.size()});
    if (result.ec) {
        std::cerr << "解码失败: " << result.ec.message() << " (offset "
                  << result.error_offset << ")\n";
        return 1;
    }

    if (const auto *greeting = result.document.find("greeting")) {
        if (const auto *s = greeting->get_if<String>()) {
            std::cout << "解码成功: \"" << s->value << "\"\n";
        }
    }

    std::cout << "文本形式: " << bsonx::json::to_json(result.document) << "\n";
    return 0;
}
