#include "bench_main.hpp"
#include "bsonx/bson/object_id.hpp"
#include "bsonx/bson/value.hpp"
#include "bsonx/json/parser.hpp"
#include "bsonx/json/writer.hpp"

#include <string>
#include <vector>

using namespace bsonx;

static bson::Document create_records(std::size_t count) {
  // 模拟一批混合类型的记录
  bson::ObjectId oid;
  (void)bson::ObjectId::parse("5f1d7a8b9c0d1e2f30415263", oid);

  std::vector<bson::Value> records;
  records.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    bson::Document r;
    r.append("_id", bson::Value(oid))
        .append("seq", bson::Value::int64(static_cast<std::int64_t>(i)))
        .append("name", bson::Value::string("record-" + std::to_string(i)))
        .append("ratio", bson::Value::double_(static_cast<double>(i) / 7.0))
        .append("at", bson::Value::date_time(1600000000000LL + static_cast<std::int64_t>(i)))
        .append("ok", bson::Value::boolean(i % 2 == 0));
    records.push_back(bson::Value::document(std::move(r)));
  }
  bson::Document doc;
  doc.append("records", bson::Value::array(std::move(records)));
  return doc;
}

static void bench_text_round_trip(json::OutputMode mode, std::string_view write_name, std::string_view parse_name) {
  constexpr std::size_t record_count = 2000;

  const bson::Document doc = create_records(record_count);
  json::WriterSettings settings;
  (void)settings.set_output_mode(mode);

  std::string text;
  BENCH_RUN(write_name, record_count, 3, {
    text.clear();
    auto ec = json::write(doc, settings, text);
    if (ec) {
      std::cerr << "Write failed: " << ec.message() << "\n";
    }
  });

  BENCH_RUN(parse_name, text.size(), 3, {
    auto result = json::parse(text);
    if (result.ec) {
      std::cerr << "Parse failed: " << result.error_message << "\n";
    }
  });
}

int main() {
  bench_text_round_trip(json::OutputMode::shell, "Text: shell write (2000 records)", "Text: shell parse (2000 records)");
  bench_text_round_trip(json::OutputMode::strict, "Text: strict write (2000 records)", "Text: strict parse (2000 records)");

  bsonx::benchmarks::print_results();
  return 0;
}
