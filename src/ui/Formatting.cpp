#include "ui/Formatting.hpp"
#include "ui/Terminal.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <ctime>

namespace zenmon::ui {

int u8_len(unsigned char c){
  if (c < 0x80) return 1;
  if ((c >> 5) == 0x6) return 2;
  if ((c >> 4) == 0xE) return 3;
  if ((c >> 3) == 0x1E) return 4;
  return 1;
}

int display_cols(const std::string& s){
  int cols = 0;
  for (size_t i=0; i<s.size();){
    // Skip ANSI escape sequences
    if (s[i] == '\x1B' && i+1 < s.size() && s[i+1] == '[') {
      i += 2;
      while (i < s.size() && (s[i] < '@' || s[i] > '~')) i++;
      if (i < s.size()) i++; // skip final byte
      continue;
    }
    i += u8_len((unsigned char)s[i]);
    cols += 1;
  }
  return cols;
}

std::string take_cols(const std::string& s, int cols){
  if (cols <= 0) return std::string();
  std::string out;
  out.reserve(s.size());
  int seen = 0;
  size_t i = 0;
  while (i < s.size() && seen < cols) {
    // Copy ANSI escape sequences without counting them
    if (s[i] == '\x1B' && i+1 < s.size() && s[i+1] == '[') {
      size_t start = i;
      i += 2;
      while (i < s.size() && (s[i] < '@' || s[i] > '~')) i++;
      if (i < s.size()) i++; // include final byte
      out.append(s, start, i - start);
      continue;
    }
    int len = u8_len((unsigned char)s[i]);
    if (i + (size_t)len > s.size()) len = 1;
    out.append(s, i, len);
    i += len;
    seen += 1;
  }
  return out;
}

std::string trunc_pad(const std::string& s, int w) {
  if (w <= 0) return "";
  int cols = display_cols(s);
  if (cols == w) return s;
  if (cols < w) return s + std::string(w - cols, ' ');
  if (w <= 1) return take_cols(s, w);
  return take_cols(s, w - 1) + (use_unicode()? "…" : ".");
}

std::string rpad_trunc(const std::string& s, int w) {
  if (w <= 0) return "";
  int cols = display_cols(s);
  if (cols == w) return s;
  if (cols < w) return std::string(w - cols, ' ') + s;
  return take_cols(s, w);
}

std::string lr_align(int iw, const std::string& left, const std::string& right){
  if (iw <= 0) return std::string();
  int rvis = display_cols(right);
  int tlw = iw - rvis - 1;
  if (tlw < 0) tlw = 0;
  std::string l = trunc_pad(left, tlw);
  int lvis = display_cols(l);
  int space = iw - lvis - rvis;
  if (space < 0) space = 0;
  return l + std::string(space, ' ') + right;
}

std::string format_time_now() {
  std::time_t t = std::time(nullptr);
  std::tm lt{};
  localtime_r(&t, &lt);
  char buf[32];
  if (std::strftime(buf, sizeof(buf), "%H:%M:%S", &lt) == 0) return std::string();
  return std::string(buf);
}

std::string fmt_fixed(double v, int precision) {
  if (std::isnan(v)) return kNoValue;
  char buf[48];
  std::snprintf(buf, sizeof(buf), "%.*f", precision, v);
  return buf;
}

std::string fmt_unit(double v, int precision, const char* unit) {
  if (std::isnan(v)) return kNoValue;
  return fmt_fixed(v, precision) + " " + unit;
}

int constraint_pct(double value, double limit) {
  if (std::isnan(value) || std::isnan(limit) || limit <= 0.0) return 0;
  double pct = value / limit * 100.0;
  pct = std::clamp(pct, 0.0, 100.0);
  return static_cast<int>(pct);
}

std::string constraint_label(double value, double limit, const char* unit) {
  return fmt_fixed(value, 1) + " / " + fmt_fixed(limit, 0) + " " + unit;
}

std::string core_freq_cell(const zenmon::model::CoreReading& c) {
  if (c.disabled) return "Disabled";
  if (c.sleeping) return "Sleeping";
  if (std::isnan(c.frequency_mhz)) return kNoValue;
  return std::to_string(std::lround(c.frequency_mhz));
}

} // namespace zenmon::ui
