#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace bsonx::json {

class WriterSettings;

/**
 * @brief 文本输出错误（"bsonx.json.writer" 错误域）。
 */
enum class writer_errc : int {
  ok = 0,
  invalid_state = 1,
  missing_converter = 2,
  invalid_converter_slot = 3,
  guid_representation_mismatch = 4,
  max_depth_exceeded = 5,
};

const std::error_category& writer_error_category() noexcept;
std::error_code make_error_code(writer_errc e) noexcept;

/**
 * @brief JSON 字符串字面量（含两侧双引号）。
 *
 * 转义：\" \\ \b \f \n \r \t；控制字符（含 C1）、格式字符、U+2028/U+2029、
 * 私用区与非字符为小写 \uXXXX（BMP 以外输出代理对）；其余 UTF-8 原样输出。
 * 非法 UTF-8 字节逐个输出为 \ufffd。
 */
[[nodiscard]] std::string quote_string(std::string_view value);

/**
 * @brief 浮点数文本：最短往返表示，整数值补 ".0"（2.0 而非 2）。
 *
 * NaN / Infinity / -Infinity 以裸标识符输出。
 */
[[nodiscard]] std::string format_double(double value);

/**
 * @brief 字段名是否必须加引号：空串、数字开头、或含字母/数字/下划线以外的字符。
 */
[[nodiscard]] bool name_needs_quotes(std::string_view name) noexcept;

/**
 * @brief 低层文本 writer（文档结构状态机 + 格式化）。
 *
 * 状态机：
 *   value(顶层) -> write_start_document -> name -> write_name -> value -> ... -> write_end_document -> done
 * 数组内部只有 value 状态（元素不带名字）。
 *
 * 格式：
 * - 文档：'{'，每个元素前：非首元素写 ','；indent 时写换行 + 当前缩进，否则写一个空格；
 *   然后是名字、" : "、值；结束时 indent 且非空写换行 + 父级缩进 + '}'，否则写 " }"；
 *   空文档为 "{ }"；
 * - 数组：'[' 元素以 ", " 分隔 ']'。
 *
 * 约定：
 * - 调用顺序错误返回 writer_errc::invalid_state，且不产生任何输出；
 * - settings 引用在 writer 生命周期内必须有效。
 */
class TextWriter {
 public:
  enum class State : std::uint8_t {
    value,
    name,
    done,
  };

  explicit TextWriter(const WriterSettings& settings);

  std::error_code write_start_document() noexcept;
  std::error_code write_end_document() noexcept;
  std::error_code write_start_array() noexcept;
  std::error_code write_end_array() noexcept;
  std::error_code write_name(std::string_view name) noexcept;

  /**
   * @brief 原样写入一个值的文本表示（converter 的 shell 形式如 ObjectId("...") 通过此接口输出）。
   */
  std::error_code write_raw_value(std::string_view representation) noexcept;

  std::error_code write_string_value(std::string_view value) noexcept;
  std::error_code write_int32_value(std::int32_t value) noexcept;
  std::error_code write_int64_value(std::int64_t value) noexcept;
  std::error_code write_double_value(double value) noexcept;
  std::error_code write_boolean_value(bool value) noexcept;
  std::error_code write_null_value() noexcept;

  [[nodiscard]] const WriterSettings& settings() const noexcept { return settings_; }
  [[nodiscard]] State state() const noexcept { return state_; }

  /**
   * @brief 当前嵌套层数（顶层为 0，根文档内为 1）。
   */
  [[nodiscard]] std::size_t depth() const noexcept { return contexts_.size() - 1; }

  [[nodiscard]] const std::string& str() const noexcept { return out_; }
  [[nodiscard]] std::string release() noexcept;

 private:
  enum class ContextType : std::uint8_t {
    top_level,
    document,
    array,
  };

  struct Context {
    ContextType type{ContextType::top_level};
    std::string indentation;
    bool has_elements{false};
  };

  void push_context(ContextType type);
  void pop_context() noexcept;
  void prepare_to_write_value();
  void after_value() noexcept;

  const WriterSettings& settings_;
  std::vector<Context> contexts_;
  State state_{State::value};
  std::string out_;
};

}  // namespace bsonx::json

namespace std {
template <>
struct is_error_code_enum<bsonx::json::writer_errc> : true_type {};
}  // namespace std
