#include "bsonx/bson/decimal128.hpp"

#include "bsonx/bson/error.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace bsonx::bson {
namespace {

constexpr int kExponentBias = 6176;
constexpr int kExponentMax = 6111;
constexpr int kExponentMin = -6176;
constexpr std::size_t kMaxDigits = 34;

constexpr std::uint64_t kSignBit = 1ull << 63;
constexpr std::uint64_t kInfinity = 0x7800000000000000ull;
constexpr std::uint64_t kNaN = 0x7C00000000000000ull;
constexpr std::uint64_t kCombinationMask = 0x1Full << 58;

// 128-bit 无符号整数，按 32-bit 分段存放（parts[0] 为最高位）。
using Limbs = std::array<std::uint32_t, 4>;

// 除以 1e9，返回余数。
std::uint32_t divide_1e9(Limbs& v) noexcept {
  std::uint64_t rem = 0;
  for (auto& part : v) {
    const std::uint64_t cur = (rem << 32) | part;
    part = static_cast<std::uint32_t>(cur / 1000000000u);
    rem = cur % 1000000000u;
  }
  return static_cast<std::uint32_t>(rem);
}

// v = v * 10 + digit
void mul10_add(Limbs& v, std::uint32_t digit) noexcept {
  std::uint64_t carry = digit;
  for (std::size_t i = v.size(); i-- > 0;) {
    const std::uint64_t cur = static_cast<std::uint64_t>(v[i]) * 10u + carry;
    v[i] = static_cast<std::uint32_t>(cur & 0xFFFFFFFFu);
    carry = cur >> 32;
  }
}

[[nodiscard]] bool is_zero(const Limbs& v) noexcept {
  return std::all_of(v.begin(), v.end(), [](std::uint32_t p) { return p == 0; });
}

[[nodiscard]] bool iequals(std::string_view a, std::string_view b) noexcept {
  if (a.size() != b.size()) {
    return false;
  }
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

}  // namespace

bool Decimal128::is_nan() const noexcept { return (high_ & kNaN) == kNaN; }

bool Decimal128::is_infinity() const noexcept { return (high_ & kNaN) == kInfinity; }

std::error_code Decimal128::parse(std::string_view text, Decimal128& out) noexcept {
  bool negative = false;
  std::string_view body = text;
  if (!body.empty() && (body.front() == '+' || body.front() == '-')) {
    negative = body.front() == '-';
    body.remove_prefix(1);
  }

  if (iequals(body, "infinity") || iequals(body, "inf")) {
    out = Decimal128(kInfinity | (negative ? kSignBit : 0), 0);
    return {};
  }
  if (iequals(text, "nan")) {
    out = Decimal128(kNaN, 0);
    return {};
  }

  // 收集有效数字（去掉前导零），记录小数点位置
  std::string digits;
  bool seen_digit = false;
  bool seen_point = false;
  int exponent = 0;
  std::size_t i = 0;
  for (; i < body.size(); ++i) {
    const char c = body[i];
    if (c == '.') {
      if (seen_point) {
        return make_error_code(errc::invalid_decimal128);
      }
      seen_point = true;
      continue;
    }
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      break;
    }
    seen_digit = true;
    if (seen_point) {
      --exponent;
    }
    if (digits.empty() && c == '0') {
      continue;
    }
    digits.push_back(c);
  }
  if (!seen_digit) {
    return make_error_code(errc::invalid_decimal128);
  }

  if (i < body.size()) {
    if (body[i] != 'e' && body[i] != 'E') {
      return make_error_code(errc::invalid_decimal128);
    }
    ++i;
    bool exp_negative = false;
    if (i < body.size() && (body[i] == '+' || body[i] == '-')) {
      exp_negative = body[i] == '-';
      ++i;
    }
    if (i >= body.size()) {
      return make_error_code(errc::invalid_decimal128);
    }
    long long e = 0;
    for (; i < body.size(); ++i) {
      if (!std::isdigit(static_cast<unsigned char>(body[i]))) {
        return make_error_code(errc::invalid_decimal128);
      }
      e = e * 10 + (body[i] - '0');
      if (e > 100000) {
        return make_error_code(errc::invalid_decimal128);
      }
    }
    exponent += static_cast<int>(exp_negative ? -e : e);
  }

  // 有效数字超过 34 位：只允许截去末尾的 0
  while (digits.size() > kMaxDigits) {
    if (digits.back() != '0') {
      return make_error_code(errc::invalid_decimal128);
    }
    digits.pop_back();
    ++exponent;
  }

  if (digits.empty()) {
    exponent = std::clamp(exponent, kExponentMin, kExponentMax);
  } else {
    // 指数过大：补零降低指数（不改变数值）
    while (exponent > kExponentMax && digits.size() < kMaxDigits) {
      digits.push_back('0');
      --exponent;
    }
    // 指数过小：只允许去掉末尾的 0
    while (exponent < kExponentMin && !digits.empty() && digits.back() == '0') {
      digits.pop_back();
      ++exponent;
    }
    if (exponent > kExponentMax || exponent < kExponentMin) {
      return make_error_code(errc::invalid_decimal128);
    }
  }

  Limbs coefficient{};
  for (char c : digits) {
    mul10_add(coefficient, static_cast<std::uint32_t>(c - '0'));
  }

  const auto biased = static_cast<std::uint64_t>(exponent + kExponentBias);
  const std::uint64_t coef_high = (static_cast<std::uint64_t>(coefficient[0]) << 32) | coefficient[1];
  const std::uint64_t coef_low = (static_cast<std::uint64_t>(coefficient[2]) << 32) | coefficient[3];

  std::uint64_t high = (biased << 49) | (coef_high & 0x1FFFFFFFFFFFFull);
  if (negative) {
    high |= kSignBit;
  }
  out = Decimal128(high, coef_low);
  return {};
}

std::string Decimal128::to_string() const {
  std::string out;
  if (is_negative()) {
    out.push_back('-');
  }

  const auto combination = (high_ & kCombinationMask) >> 58;
  int biased_exponent = 0;
  Limbs coefficient{};
  if ((combination >> 3) == 3) {
    if (combination == 0x1E) {
      out += "Infinity";
      return out;
    }
    if (combination == 0x1F) {
      return "NaN";
    }
    // 11 开头的大系数形式：系数必然超过 10^34-1，按规范视为 0
    biased_exponent = static_cast<int>((high_ >> 47) & 0x3FFF);
  } else {
    biased_exponent = static_cast<int>((high_ >> 49) & 0x3FFF);
    const std::uint64_t coef_high = high_ & 0x1FFFFFFFFFFFFull;
    coefficient = {static_cast<std::uint32_t>(coef_high >> 32), static_cast<std::uint32_t>(coef_high),
                   static_cast<std::uint32_t>(low_ >> 32), static_cast<std::uint32_t>(low_)};
    // 超过 10^34-1 的系数同样视为 0
    const std::uint64_t max_high = 0x0001ED09BEAD87C0ull;
    const std::uint64_t max_low = 0x378D8E63FFFFFFFFull;
    if (coef_high > max_high || (coef_high == max_high && low_ > max_low)) {
      coefficient = {};
    }
  }
  const int exponent = biased_exponent - kExponentBias;

  std::string digits;
  if (is_zero(coefficient)) {
    digits = "0";
  } else {
    while (!is_zero(coefficient)) {
      auto rem = divide_1e9(coefficient);
      for (int k = 0; k < 9; ++k) {
        digits.push_back(static_cast<char>('0' + rem % 10));
        rem /= 10;
      }
    }
    while (digits.size() > 1 && digits.back() == '0') {
      digits.pop_back();
    }
    std::reverse(digits.begin(), digits.end());
  }

  const auto ndigits = static_cast<int>(digits.size());
  const int adjusted = exponent + ndigits - 1;

  if (exponent > 0 || adjusted < -6) {
    out.push_back(digits[0]);
    if (ndigits > 1) {
      out.push_back('.');
      out.append(digits, 1, std::string::npos);
    }
    out.push_back('E');
    if (adjusted >= 0) {
      out.push_back('+');
    }
    out += std::to_string(adjusted);
    return out;
  }

  if (exponent == 0) {
    out += digits;
    return out;
  }

  const int frac = -exponent;
  if (ndigits > frac) {
    out.append(digits, 0, static_cast<std::size_t>(ndigits - frac));
    out.push_back('.');
    out.append(digits, static_cast<std::size_t>(ndigits - frac), std::string::npos);
  } else {
    out += "0.";
    out.append(static_cast<std::size_t>(frac - ndigits), '0');
    out += digits;
  }
  return out;
}

}  // namespace bsonx::bson
