#pragma once

#include "bsonx/core/common.hpp"
#include "bsonx/core/error.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace bsonx::core {

/**
 * @brief 顺序读取字节序列的游标（小端序）。
 *
 * 约定：
 * - 不拥有数据，调用方需保证 data 在读取期间有效；
 * - 任意 read_* 失败时 position() 保持不变（便于上层报告出错偏移）；
 * - 字符串格式：int32 长度（含末尾 NUL）+ 字节 + NUL。
 */
class ByteReader final {
 public:
  explicit ByteReader(bytes_view data) noexcept : data_(data) {}

  [[nodiscard]] std::size_t position() const noexcept { return pos_; }
  [[nodiscard]] std::size_t size() const noexcept { return data_.size(); }
  [[nodiscard]] std::size_t remaining() const noexcept { return data_.size() - pos_; }
  [[nodiscard]] bool at_end() const noexcept { return pos_ >= data_.size(); }

  std::error_code seek(std::size_t pos) noexcept;

  std::error_code read_u8(byte& out) noexcept;
  std::error_code read_i32(std::int32_t& out) noexcept;
  std::error_code read_u32(std::uint32_t& out) noexcept;
  std::error_code read_i64(std::int64_t& out) noexcept;
  std::error_code read_u64(std::uint64_t& out) noexcept;
  std::error_code read_double(double& out) noexcept;

  /**
   * @brief 读取 n 个原始字节（返回指向原缓冲区的视图，不拷贝）。
   */
  std::error_code read_bytes(std::size_t n, bytes_view& out) noexcept;

  /**
   * @brief 读取以 NUL 结尾的字符串（元素名、正则 pattern/options）。
   */
  std::error_code read_cstring(std::string& out, bool validate_utf8) noexcept;

  /**
   * @brief 读取带长度前缀的字符串。
   *
   * 失败：
   * - 长度 < 1 或超过剩余字节：errc::invalid_length
   * - 末尾不是 NUL：errc::missing_terminator
   * - validate_utf8 且内容非法：errc::invalid_utf8
   */
  std::error_code read_string(std::string& out, bool validate_utf8) noexcept;

 private:
  template <class UInt>
  std::error_code read_le(UInt& out) noexcept;

  bytes_view data_{};
  std::size_t pos_{0};
};

/**
 * @brief 追加写入的字节缓冲（小端序，自持有 std::vector<byte>）。
 *
 * 长度前缀的典型写法：
 *   auto at = w.reserve_length();
 *   ... 写入正文 ...
 *   w.patch_length(at);   // 回填 position() - at
 */
class ByteWriter final {
 public:
  ByteWriter() = default;
  explicit ByteWriter(std::vector<byte> initial) noexcept : buf_(std::move(initial)) {}

  [[nodiscard]] std::size_t position() const noexcept { return buf_.size(); }
  [[nodiscard]] bytes_view bytes() const noexcept { return {buf_.data(), buf_.size()}; }
  [[nodiscard]] std::vector<byte> release() noexcept { return std::move(buf_); }

  void reserve(std::size_t n) { buf_.reserve(n); }

  void write_u8(byte v);
  void write_i32(std::int32_t v);
  void write_u32(std::uint32_t v);
  void write_i64(std::int64_t v);
  void write_u64(std::uint64_t v);
  void write_double(double v);
  void write_bytes(bytes_view v);

  /**
   * @brief 写入以 NUL 结尾的字符串；内容含 NUL 时返回 errc::invalid_argument（不写入）。
   */
  std::error_code write_cstring(std::string_view s);

  /**
   * @brief 写入带长度前缀的字符串（长度含末尾 NUL）。
   */
  std::error_code write_string(std::string_view s);

  /**
   * @brief 写入 4 字节占位长度，返回其位置（用于 patch_length）。
   */
  std::size_t reserve_length();

  /**
   * @brief 回填占位长度：值为 position() - at（即包含长度字段自身）。
   */
  std::error_code patch_length(std::size_t at) noexcept;
  std::error_code patch_i32(std::size_t at, std::int32_t value) noexcept;

  void truncate(std::size_t size) noexcept;

 private:
  template <class UInt>
  void write_le(UInt v);

  std::vector<byte> buf_;
};

/**
 * @brief 从 s[pos] 解码一个 UTF-8 码点。
 *
 * 成功时写入 cp 并把 pos 移到下一码点；非法、截断、过长编码、代理区或
 * > U+10FFFF 时返回 false，pos 与 cp 不变。
 */
[[nodiscard]] bool decode_utf8(std::string_view s, std::size_t& pos, std::uint32_t& cp) noexcept;

/**
 * @brief 校验 UTF-8（拒绝过长编码、代理区码点与 > U+10FFFF）。
 */
[[nodiscard]] bool is_valid_utf8(std::string_view s) noexcept;

}  // namespace bsonx::core
