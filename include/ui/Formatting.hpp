#pragma once

#include <string>
#include "model/Telemetry.hpp"

namespace zenmon::ui {

// UTF-8 text width utilities
int u8_len(unsigned char c);
int display_cols(const std::string& s);
std::string take_cols(const std::string& s, int cols);

// Text formatting and alignment
std::string trunc_pad(const std::string& s, int w);
std::string rpad_trunc(const std::string& s, int w);
std::string lr_align(int iw, const std::string& left, const std::string& right);

// Wall clock for the status line
std::string format_time_now();

// Placeholder for unavailable (NaN) readings.
inline constexpr const char* kNoValue = "--";

// Fixed-point number, or kNoValue when v is NaN.
std::string fmt_fixed(double v, int precision);

// "12.3 W" style, or kNoValue when v is NaN.
std::string fmt_unit(double v, int precision, const char* unit);

// Bar fill for a value/limit pair: 0 when the limit is non-positive or
// either side is unavailable, otherwise value/limit*100 clamped to 0..100.
int constraint_pct(double value, double limit);

// "45.2 / 142 W": raw value (1 decimal) and limit (0 decimals).
std::string constraint_label(double value, double limit, const char* unit);

// Core table frequency cell: Disabled, else Sleeping, else whole MHz.
std::string core_freq_cell(const zenmon::model::CoreReading& c);

} // namespace zenmon::ui
