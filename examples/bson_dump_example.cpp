/**
 * @file bson_dump_example.cpp
 * @brief 演示 bsonx 的二进制/文本互转与 hexdump 输出
 *
 * 典型用途：
 * - 从抓包/日志里复制一段十六进制字符串，解码为文档并以 shell 或 strict 文本输出；
 * - 把一段 shell 文本解析为文档，编码后查看线上字节。
 *
 * 运行：
 * - 无参数：运行内置示例
 * - 指定输入（整体作为一个参数传入）：
 *   - ./build/examples/bson_dump_example bson "<hex>" [--strict] [--indent]
 *   - ./build/examples/bson_dump_example text "<shell 文本>" [--ascii]
 */

#include <bsonx/bson/codec.hpp>
#include <bsonx/bson/object_id.hpp>
#include <bsonx/core/log.hpp>
#include <bsonx/json/parser.hpp>
#include <bsonx/json/writer.hpp>
#include <bsonx/utils/hex.hpp>

#include <iostream>
#include <string>
#include <string_view>
#include <vector>

using namespace bsonx;

namespace {

[[nodiscard]] bool has_flag(int argc, char **argv, std::string_view flag) {
    for (int i = 0; i < argc; ++i) {
        if (argv[i] == flag) {
            return true;
        }
    }
    return false;
}

void print_usage(const char *argv0) {
    std::cout << "用法:\n";
    std::cout << "  " << argv0 << "\n";
    std::cout << "  " << argv0 << " bson \"<hex>\" [--strict] [--indent]\n";
    std::cout << "  " << argv0 << " text \"<shell 文本>\" [--ascii]\n";
}

[[nodiscard]] core::bytes_view as_view(const std::vector<core::byte> &bytes) {
    return core::bytes_view{bytes.data(), bytes.size()};
}

int dump_bson_hex(std::string_view hex_text, bool strict, bool indent) {
    std::vector<core::byte> bytes;
    const auto ec = utils::parse_hex(hex_text, bytes);
    if (ec) {
        std::cerr << "parse_hex 失败: " << ec.message() << "\n";
        return 2;
    }

    const auto result = bson::decode(as_view(bytes));
    if (result.ec) {
        std::cerr << "decode 失败: " << result.ec.message() << " ["
                  << result.ec.category().name() << "] offset "
                  << result.error_offset << "\n";
        return 1;
    }

    json::WriterSettings settings;
    (void)settings.set_output_mode(strict ? json::OutputMode::strict
                                          : json::OutputMode::shell);
    (void)settings.set_indent(indent);

    std::string text;
    const auto wec = json::write(result.document, settings, text);
    if (wec) {
        std::cerr << "write 失败: " << wec.message() << "\n";
        return 1;
    }
    std::cout << text << "\n";
    return 0;
}

int dump_shell_text(std::string_view text, bool show_ascii) {
    const auto parsed = json::parse(text);
    if (parsed.ec) {
        std::cerr << "parse 失败 (" << parsed.error_line << ":"
                  << parsed.error_column << "): " << parsed.error_message
                  << "\n";
        return 1;
    }

    std::vector<core::byte> encoded;
    const auto ec = bson::encode(parsed.document, encoded);
    if (ec) {
        std::cerr << "encode 失败: " << ec.message() << "\n";
        return 1;
    }

    utils::HexDumpOptions opt;
    opt.max_bytes = 0;
    opt.show_ascii = show_ascii;
    std::cout << encoded.size() << " 字节\n";
    std::cout << utils::hex_dump(as_view(encoded), opt) << "\n";
    return 0;
}

void demo_text_to_bson() {
    std::cout << "\n====================\n";
    std::cout << "示例 1：shell 文本 -> BSON 字节\n";
    std::cout << "====================\n";

    (void)dump_shell_text(
        R"({ "_id" : ObjectId("5f1d7a8b9c0d1e2f30415263"), "n" : NumberLong(42), "at" : ISODate("2020-07-26T12:00:00Z") })",
        true);
}

void demo_bson_to_text() {
    std::cout << "\n====================\n";
    std::cout << "示例 2：BSON 字节 -> shell / strict 文本\n";
    std::cout << "====================\n";

    bson::ObjectId oid;
    (void)bson::ObjectId::parse("5f1d7a8b9c0d1e2f30415263", oid);

    bson::Document doc;
    doc.append("_id", bson::Value(oid))
        .append("ts", bson::Value(bson::Timestamp(1595764800, 1)))
        .append("bin", bson::Value(bson::Binary(std::vector<core::byte>{0xDE, 0xAD, 0xBE, 0xEF})));

    std::vector<core::byte> encoded;
    if (const auto ec = bson::encode(doc, encoded)) {
        std::cerr << "encode 失败: " << ec.message() << "\n";
        return;
    }

    // 演示“抓包十六进制字符串 -> parse_hex -> decode”的常见流程
    const auto hex_text = utils::to_hex(as_view(encoded));
    std::cout << "可复制的十六进制字符串：\n" << hex_text << "\n\n";

    std::cout << "[shell]\n";
    (void)dump_bson_hex(hex_text, false, false);
    std::cout << "[strict, indent]\n";
    (void)dump_bson_hex(hex_text, true, true);
}

void demo_decode_error() {
    std::cout << "\n====================\n";
    std::cout << "示例 3：截断的输入\n";
    std::cout << "====================\n";

    // 声明长度 12，实际只有 8 字节
    (void)dump_bson_hex("0c 00 00 00 10 61 00 01", false, false);
}

} // namespace

int main(int argc, char **argv) {
    core::set_log_level(core::LogLevel::warn);

    if (argc >= 3) {
        const std::string_view mode = argv[1];
        if (mode == "bson") {
            return dump_bson_hex(argv[2],
                                 has_flag(argc, argv, "--strict"),
                                 has_flag(argc, argv, "--indent"));
        }
        if (mode == "text") {
            return dump_shell_text(argv[2], has_flag(argc, argv, "--ascii"));
        }
        print_usage(argv[0]);
        return 2;
    }
    if (argc == 2) {
        print_usage(argv[0]);
        return 2;
    }

    demo_text_to_bson();
    demo_bson_to_text();
    demo_decode_error();
    return 0;
}
