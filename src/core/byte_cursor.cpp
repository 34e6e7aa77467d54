#include "bsonx/core/byte_cursor.hpp"

#include <bit>
#include <cstring>
#include <limits>

namespace bsonx::core {

std::error_code ByteReader::seek(std::size_t pos) noexcept {
  if (pos > data_.size()) {
    return make_error_code(errc::out_of_range);
  }
  pos_ = pos;
  return {};
}

template <class UInt>
std::error_code ByteReader::read_le(UInt& out) noexcept {
  if (remaining() < sizeof(UInt)) {
    return make_error_code(errc::out_of_range);
  }
  UInt v = 0;
  for (std::size_t i = 0; i < sizeof(UInt); ++i) {
    v = static_cast<UInt>(v | (static_cast<UInt>(data_[pos_ + i]) << (8u * i)));
  }
  pos_ += sizeof(UInt);
  out = v;
  return {};
}

std::error_code ByteReader::read_u8(byte& out) noexcept {
  if (at_end()) {
    return make_error_code(errc::out_of_range);
  }
  out = data_[pos_++];
  return {};
}

std::error_code ByteReader::read_i32(std::int32_t& out) noexcept {
  std::uint32_t bits = 0;
  auto ec = read_le(bits);
  if (ec) {
    return ec;
  }
  out = std::bit_cast<std::int32_t>(bits);
  return {};
}

std::error_code ByteReader::read_u32(std::uint32_t& out) noexcept { return read_le(out); }

std::error_code ByteReader::read_i64(std::int64_t& out) noexcept {
  std::uint64_t bits = 0;
  auto ec = read_le(bits);
  if (ec) {
    return ec;
  }
  out = std::bit_cast<std::int64_t>(bits);
  return {};
}

std::error_code ByteReader::read_u64(std::uint64_t& out) noexcept { return read_le(out); }

std::error_code ByteReader::read_double(double& out) noexcept {
  std::uint64_t bits = 0;
  auto ec = read_le(bits);
  if (ec) {
    return ec;
  }
  out = std::bit_cast<double>(bits);
  return {};
}

std::error_code ByteReader::read_bytes(std::size_t n, bytes_view& out) noexcept {
  if (remaining() < n) {
    return make_error_code(errc::out_of_range);
  }
  out = data_.subspan(pos_, n);
  pos_ += n;
  return {};
}

std::error_code ByteReader::read_cstring(std::string& out, bool validate_utf8) noexcept {
  const auto* begin = data_.data() + pos_;
  const auto* nul = static_cast<const byte*>(std::memchr(begin, 0, remaining()));
  if (nul == nullptr) {
    return make_error_code(errc::missing_terminator);
  }
  const auto n = static_cast<std::size_t>(nul - begin);
  std::string_view text{reinterpret_cast<const char*>(begin), n};
  if (validate_utf8 && !is_valid_utf8(text)) {
    return make_error_code(errc::invalid_utf8);
  }
  out.assign(text);
  pos_ += n + 1;
  return {};
}

std::error_code ByteReader::read_string(std::string& out, bool validate_utf8) noexcept {
  const auto start = pos_;
  std::int32_t length = 0;
  auto ec = read_i32(length);
  if (ec) {
    return ec;
  }
  if (length < 1 || static_cast<std::size_t>(length) > remaining()) {
    pos_ = start;
    return make_error_code(errc::invalid_length);
  }
  const auto n = static_cast<std::size_t>(length);
  if (data_[pos_ + n - 1] != 0) {
    pos_ = start;
    return make_error_code(errc::missing_terminator);
  }
  std::string_view text{reinterpret_cast<const char*>(data_.data() + pos_), n - 1};
  if (validate_utf8 && !is_valid_utf8(text)) {
    pos_ = start;
    return make_error_code(errc::invalid_utf8);
  }
  out.assign(text);
  pos_ += n;
  return {};
}

template <class UInt>
void ByteWriter::write_le(UInt v) {
  for (std::size_t i = 0; i < sizeof(UInt); ++i) {
    buf_.push_back(static_cast<byte>((v >> (8u * i)) & 0xFFu));
  }
}

void ByteWriter::write_u8(byte v) { buf_.push_back(v); }

void ByteWriter::write_i32(std::int32_t v) { write_le(std::bit_cast<std::uint32_t>(v)); }

void ByteWriter::write_u32(std::uint32_t v) { write_le(v); }

void ByteWriter::write_i64(std::int64_t v) { write_le(std::bit_cast<std::uint64_t>(v)); }

void ByteWriter::write_u64(std::uint64_t v) { write_le(v); }

void ByteWriter::write_double(double v) { write_le(std::bit_cast<std::uint64_t>(v)); }

void ByteWriter::write_bytes(bytes_view v) { buf_.insert(buf_.end(), v.begin(), v.end()); }

std::error_code ByteWriter::write_cstring(std::string_view s) {
  if (s.find('\0') != std::string_view::npos) {
    return make_error_code(errc::invalid_argument);
  }
  write_bytes(bytes_view{reinterpret_cast<const byte*>(s.data()), s.size()});
  write_u8(0);
  return {};
}

std::error_code ByteWriter::write_string(std::string_view s) {
  if (s.size() >= static_cast<std::size_t>(std::numeric_limits<std::int32_t>::max())) {
    return make_error_code(errc::invalid_length);
  }
  write_i32(static_cast<std::int32_t>(s.size() + 1));
  write_bytes(bytes_view{reinterpret_cast<const byte*>(s.data()), s.size()});
  write_u8(0);
  return {};
}

std::size_t ByteWriter::reserve_length() {
  const auto at = buf_.size();
  write_i32(0);
  return at;
}

std::error_code ByteWriter::patch_length(std::size_t at) noexcept {
  if (at > buf_.size()) {
    return make_error_code(errc::out_of_range);
  }
  const auto length = buf_.size() - at;
  if (length > static_cast<std::size_t>(std::numeric_limits<std::int32_t>::max())) {
    return make_error_code(errc::invalid_length);
  }
  return patch_i32(at, static_cast<std::int32_t>(length));
}

std::error_code ByteWriter::patch_i32(std::size_t at, std::int32_t value) noexcept {
  if (at > buf_.size() || buf_.size() - at < 4) {
    return make_error_code(errc::out_of_range);
  }
  const auto bits = std::bit_cast<std::uint32_t>(value);
  for (std::size_t i = 0; i < 4; ++i) {
    buf_[at + i] = static_cast<byte>((bits >> (8u * i)) & 0xFFu);
  }
  return {};
}

void ByteWriter::truncate(std::size_t size) noexcept {
  if (size < buf_.size()) {
    buf_.resize(size);
  }
}

bool decode_utf8(std::string_view s, std::size_t& pos, std::uint32_t& cp) noexcept {
  const auto n = s.size();
  if (pos >= n) {
    return false;
  }
  const auto c = static_cast<unsigned char>(s[pos]);
  if (c < 0x80) {
    cp = c;
    ++pos;
    return true;
  }

  std::size_t extra = 0;
  std::uint32_t v = 0;
  if ((c & 0xE0u) == 0xC0u) {
    extra = 1;
    v = c & 0x1Fu;
  } else if ((c & 0xF0u) == 0xE0u) {
    extra = 2;
    v = c & 0x0Fu;
  } else if ((c & 0xF8u) == 0xF0u) {
    extra = 3;
    v = c & 0x07u;
  } else {
    return false;
  }
  if (n - pos <= extra) {
    return false;
  }
  for (std::size_t k = 1; k <= extra; ++k) {
    const auto cc = static_cast<unsigned char>(s[pos + k]);
    if ((cc & 0xC0u) != 0x80u) {
      return false;
    }
    v = (v << 6) | (cc & 0x3Fu);
  }

  // 过长编码 / 代理区 / 超出 Unicode 范围
  if ((extra == 1 && v < 0x80u) || (extra == 2 && v < 0x800u) || (extra == 3 && v < 0x10000u)) {
    return false;
  }
  if ((v >= 0xD800u && v <= 0xDFFFu) || v > 0x10FFFFu) {
    return false;
  }
  cp = v;
  pos += extra + 1;
  return true;
}

bool is_valid_utf8(std::string_view s) noexcept {
  std::size_t i = 0;
  std::uint32_t cp = 0;
  while (i < s.size()) {
    if (!decode_utf8(s, i, cp)) {
      return false;
    }
  }
  return true;
}

}  // namespace bsonx::core
