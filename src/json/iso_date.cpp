#include "iso_date.hpp"

#include <array>
#include <chrono>
#include <cstdio>

namespace bsonx::json::detail {

namespace {

// 顺序读取定长十进制字段的游标
class DigitCursor {
 public:
  explicit DigitCursor(std::string_view text) noexcept : text_(text) {}

  bool digits(std::size_t n, int& out) noexcept {
    if (pos_ + n > text_.size()) {
      return false;
    }
    int v = 0;
    for (std::size_t i = 0; i < n; ++i) {
      const char c = text_[pos_ + i];
      if (c < '0' || c > '9') {
        return false;
      }
      v = v * 10 + (c - '0');
    }
    pos_ += n;
    out = v;
    return true;
  }

  bool match(char c) noexcept {
    if (pos_ < text_.size() && text_[pos_] == c) {
      ++pos_;
      return true;
    }
    return false;
  }

  [[nodiscard]] char peek() const noexcept { return pos_ < text_.size() ? text_[pos_] : '\0'; }
  [[nodiscard]] bool at_end() const noexcept { return pos_ >= text_.size(); }

 private:
  std::string_view text_;
  std::size_t pos_{0};
};

}  // namespace

bool format_iso_date(std::int64_t millis, std::string& out) {
  if (millis < kIsoDateMinMillis || millis > kIsoDateMaxMillis) {
    return false;
  }

  using namespace std::chrono;
  const sys_time<milliseconds> tp{milliseconds{millis}};
  const auto day = floor<days>(tp);
  const year_month_day ymd{day};
  const hh_mm_ss<milliseconds> hms{tp - day};

  std::array<char, 40> buf{};
  std::snprintf(buf.data(),
                buf.size(),
                "%04d-%02u-%02uT%02d:%02d:%02d",
                static_cast<int>(ymd.year()),
                static_cast<unsigned>(ymd.month()),
                static_cast<unsigned>(ymd.day()),
                static_cast<int>(hms.hours().count()),
                static_cast<int>(hms.minutes().count()),
                static_cast<int>(hms.seconds().count()));
  out = buf.data();

  const auto ms = static_cast<int>(hms.subseconds().count());
  if (ms != 0) {
    std::snprintf(buf.data(), buf.size(), ".%03d", ms);
    std::string fraction(buf.data());
    while (fraction.back() == '0') {
      fraction.pop_back();
    }
    out += fraction;
  }
  out += 'Z';
  return true;
}

bool parse_iso_date(std::string_view text, std::int64_t& out) noexcept {
  DigitCursor cur(text);

  int y = 0, mo = 0, d = 0, h = 0, mi = 0, s = 0;
  if (!cur.digits(4, y) || !cur.match('-') || !cur.digits(2, mo) || !cur.match('-') || !cur.digits(2, d)) {
    return false;
  }
  if (!cur.match('T') || !cur.digits(2, h) || !cur.match(':') || !cur.digits(2, mi)) {
    return false;
  }

  int ms = 0;
  if (cur.match(':')) {
    if (!cur.digits(2, s)) {
      return false;
    }
    if (cur.match('.')) {
      int scale = 100;
      int digit = 0;
      if (!cur.digits(1, digit)) {
        return false;
      }
      do {
        ms += digit * scale;
        scale /= 10;
      } while (cur.digits(1, digit));
    }
  }

  int offset_minutes = 0;
  if (!cur.match('Z')) {
    const char sign = cur.peek();
    if (sign != '+' && sign != '-') {
      return false;
    }
    cur.match(sign);
    int oh = 0, om = 0;
    if (!cur.digits(2, oh)) {
      return false;
    }
    cur.match(':');
    if (!cur.digits(2, om) || oh > 23 || om > 59) {
      return false;
    }
    offset_minutes = (oh * 60 + om) * (sign == '-' ? -1 : 1);
  }
  if (!cur.at_end()) {
    return false;
  }

  if (h > 23 || mi > 59 || s > 59) {
    return false;
  }

  using namespace std::chrono;
  const year_month_day ymd{year{y}, month{static_cast<unsigned>(mo)}, day{static_cast<unsigned>(d)}};
  if (!ymd.ok()) {
    return false;
  }

  const auto tp = sys_days{ymd} + hours{h} + minutes{mi} + seconds{s} + milliseconds{ms} - minutes{offset_minutes};
  out = duration_cast<milliseconds>(tp.time_since_epoch()).count();
  return true;
}

}  // namespace bsonx::json::detail
