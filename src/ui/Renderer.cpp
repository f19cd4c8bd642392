#include "ui/Renderer.hpp"
#include "ui/Config.hpp"
#include "ui/Terminal.hpp"
#include "ui/Formatting.hpp"
#include "ui/Panels.hpp"
#include <unistd.h>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstring>
#include <utility>

namespace zenmon::ui {

static std::string repeat_str(const std::string& ch, int n){
  std::string r;
  r.reserve(std::max(0,n* (int)ch.size()));
  for (int i=0;i<n;i++) r += ch;
  return r;
}

std::vector<std::string> make_box(const std::string& title, const std::vector<std::string>& lines, int width, int min_height) {
  int iw = std::max(3, width - 2);
  std::vector<std::string> out;
  const bool uni = use_unicode();
  const std::string TL = uni? "╭" : "+";
  const std::string TR = uni? "╮" : "+";
  const std::string BL = uni? "╰" : "+";
  const std::string BR = uni? "╯" : "+";
  const std::string H  = uni? "─" : "-";
  const std::string V  = uni? "│" : "|";
  auto top = [&]{
    std::string t = take_cols("[ " + title + " ]", iw);
    int fill = std::max(0, iw - display_cols(t));
    int left = fill / 2; int right = fill - left;
    return TL + repeat_str(H, left) + t + repeat_str(H, right) + TR;
  }();
  out.push_back(top);
  int content_lines = std::max((int)lines.size(), min_height);
  for (int i = 0; i < content_lines; ++i) {
    std::string ln = (i < (int)lines.size()) ? lines[i] : std::string();
    out.push_back(V + trunc_pad(ln, iw) + V);
  }
  out.push_back(BL + repeat_str(H, iw) + BR);
  return out;
}

std::string colorize_line(const std::string& s) {
  if (!tty_stdout()) return s;
  const auto& cfg = config();
  const std::string& border = cfg.colors.border;
  auto uni = use_unicode();
  const char* V = uni ? "│" : "|";

  auto is_border = [&](const std::string& str){
    if (str.empty()) return false;
    if (str.find(V) != std::string::npos) return false;
    if (uni) {
      return str.rfind("╭",0)==0 || str.rfind("╰",0)==0;
    }
    return str.rfind("+",0)==0;
  };

  if (is_border(s)) {
    size_t lb = s.find('[');
    size_t rb = (lb!=std::string::npos) ? s.find(']', lb+1) : std::string::npos;
    if (lb != std::string::npos && rb != std::string::npos && rb > lb) {
      std::string pre = s.substr(0, lb);
      std::string mid = s.substr(lb, rb - lb + 1);
      std::string suf = s.substr(rb + 1);
      return border + pre + cfg.colors.accent + mid + sgr_reset() + border + suf + sgr_reset();
    }
    return border + s + sgr_reset();
  }

  size_t lpos = s.rfind(V);
  size_t fpos = s.find(V);
  if (fpos != std::string::npos && lpos != std::string::npos && lpos > fpos) {
    const size_t vlen = std::strlen(V);
    std::string pre = s.substr(0, fpos);
    std::string leftb = s.substr(fpos, vlen);
    std::string mid = s.substr(fpos + vlen, lpos - (fpos + vlen));
    std::string rightb = s.substr(lpos, vlen);
    std::string suf = s.substr(lpos + vlen);

    // Bars carry their own "NN%" right after the closing bracket.
    auto color_bar = [&](const std::string& part)->std::string{
      if (part.find('\x1B') != std::string::npos) return part;
      size_t lb = part.find('[');
      size_t rb = (lb!=std::string::npos) ? part.find(']', lb+1) : std::string::npos;
      if (lb==std::string::npos || rb==std::string::npos || rb<=lb) {
        if (part.find(kNoValue) != std::string::npos) {
          // dim placeholders
          std::string out;
          size_t pos = 0, f;
          while ((f = part.find(kNoValue, pos)) != std::string::npos) {
            out += part.substr(pos, f - pos) + cfg.colors.muted + kNoValue + sgr_reset();
            pos = f + std::strlen(kNoValue);
          }
          return out + part.substr(pos);
        }
        return part;
      }
      int pct = 0;
      size_t p = part.find('%', rb);
      if (p != std::string::npos) {
        size_t st = p;
        while (st > rb + 1 && std::isdigit((unsigned char)part[st-1])) --st;
        std::from_chars(part.data() + st, part.data() + p, pct);
      }
      std::string pre2 = part.substr(0, lb+1);
      std::string bar = part.substr(lb+1, rb - (lb+1));
      std::string suf2 = part.substr(rb);
      return pre2 + bar_color(pct) + bar + sgr_reset() + suf2;
    };

    std::string mid2 = color_bar(mid);
    return pre + border + leftb + sgr_reset() + mid2 + border + rightb + sgr_reset() + suf;
  }
  return s;
}

std::vector<std::string> compose_frame(const zenmon::model::Snapshot& s, int cols, int rows) {
  cols = std::max(40, cols);
  rows = std::max(10, rows);
  int body_rows = rows - 1 - (g_ui.show_help ? 1 : 0);

  std::vector<std::string> frame;
  if (g_ui.show_help) frame.push_back(trunc_pad(help_text(), cols));

  auto append = [](std::vector<std::string>& col, const std::vector<std::string>& box){
    col.insert(col.end(), box.begin(), box.end());
  };

  const bool two_col = cols >= 100;
  int gutter = two_col ? 1 : 0;
  int left_w = two_col ? (cols * 11) / 20 : cols;
  int right_w = two_col ? cols - left_w - gutter : cols;
  int side_w = two_col ? right_w : left_w;

  std::vector<std::string> side;
  append(side, render_stats_panel(s, side_w));
  append(side, render_constraints_panel(s, side_w));
  append(side, render_memory_panel(s, side_w));
  append(side, render_power_panel(s, side_w));
  if (g_ui.show_graphics) append(side, render_graphics_panel(s, side_w));

  std::vector<std::string> left, right;
  append(left, render_system_panel(s, left_w));
  if (g_ui.show_cores) {
    // Core table is budgeted before the side panels; in one column it is
    // capped at what the cores need so the side panels follow it.
    int remaining = body_rows - static_cast<int>(left.size());
    size_t core_count = build_core_rows(s.telemetry).size();
    int box_rows = two_col ? remaining : std::min(remaining, std::max(4, static_cast<int>(core_count) + 3));
    if (box_rows >= 4) {
      g_ui.last_core_page_rows = core_page_rows(box_rows);
      g_ui.scroll = clamp_core_scroll(g_ui.scroll, core_count, box_rows);
      append(left, render_cores_panel(s, left_w, box_rows, g_ui.scroll));
    }
  }
  if (two_col) right = std::move(side);
  else append(left, side);

  for (int row = 0; row < body_rows; ++row) {
    std::string l = (row < (int)left.size()) ? left[row] : std::string();
    l = trunc_pad(l, left_w);
    if (two_col) {
      std::string r = (row < (int)right.size()) ? right[row] : std::string();
      l += std::string(gutter, ' ') + trunc_pad(r, right_w);
    }
    frame.push_back(l);
  }
  frame.push_back(trunc_pad(render_status_line(s, cols), cols));
  return frame;
}

void render_screen(const zenmon::model::Snapshot& s) {
  int cols = term_cols();
  int rows = term_rows();
  auto lines = compose_frame(s, cols, rows);
  std::string frame; frame.reserve((size_t)rows * (size_t)cols + 64);
  frame += "\x1B[H";
  const bool two_col = std::max(40, cols) >= 100;
  int left_w = two_col ? (std::max(40, cols) * 11) / 20 : std::max(40, cols);
  for (size_t i = 0; i < lines.size(); ++i) {
    const auto& l = lines[i];
    if (two_col && display_cols(l) > left_w) {
      // colorize each column separately so both borders pick up colour
      std::string a = take_cols(l, left_w);
      std::string b = l.substr(a.size());
      frame += colorize_line(a) + colorize_line(b);
    } else {
      frame += colorize_line(l);
    }
    frame += "\x1B[K";
    if (i + 1 < lines.size()) frame += "\n";
  }
  best_effort_write(STDOUT_FILENO, frame.data(), frame.size());
}

std::string render_report(const zenmon::model::Snapshot& s) {
  const int width = 72;
  std::vector<std::string> all;
  auto append = [&](const std::vector<std::string>& box){ all.insert(all.end(), box.begin(), box.end()); };
  append(render_system_panel(s, width));
  append(render_stats_panel(s, width));
  append(render_cores_panel(s, width, static_cast<int>(s.telemetry.cores.size()) + 4, 0));
  append(render_constraints_panel(s, width));
  append(render_memory_panel(s, width));
  append(render_power_panel(s, width));
  append(render_graphics_panel(s, width));
  std::string out;
  for (const auto& l : all) { out += l; out += '\n'; }
  return out;
}

} // namespace zenmon::ui
