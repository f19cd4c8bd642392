#include "minitest.hpp"
#include "ui/Formatting.hpp"
#include "util/Retro.hpp"
#include <cmath>
#include <limits>

using namespace zenmon;

static constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

TEST(format_nan_shows_placeholder) {
  ASSERT_EQ(ui::fmt_fixed(kNaN, 1), "--");
  ASSERT_EQ(ui::fmt_unit(kNaN, 3, "W"), "--");
  ASSERT_EQ(ui::fmt_fixed(1.23456, 3), "1.235");
  ASSERT_EQ(ui::fmt_unit(61.5, 1, "C"), "61.5 C");
}

TEST(format_constraint_pct_zero_limit) {
  ASSERT_EQ(ui::constraint_pct(45.2, 0.0), 0);
  ASSERT_EQ(ui::constraint_label(45.2, 0.0, "W"), "45.2 / 0 W");
}

TEST(format_constraint_pct_edges) {
  ASSERT_EQ(ui::constraint_pct(50.0, -10.0), 0);
  ASSERT_EQ(ui::constraint_pct(kNaN, 100.0), 0);
  ASSERT_EQ(ui::constraint_pct(50.0, kNaN), 0);
  ASSERT_EQ(ui::constraint_pct(-5.0, 100.0), 0);
  ASSERT_EQ(ui::constraint_pct(200.0, 140.0), 100);
  ASSERT_EQ(ui::constraint_pct(31.9, 100.0), 31);
  ASSERT_EQ(ui::constraint_pct(71.0, 142.0), 50);
}

TEST(format_constraint_label_nan_sides) {
  ASSERT_EQ(ui::constraint_label(kNaN, 142.0, "W"), "-- / 142 W");
  ASSERT_EQ(ui::constraint_label(30.04, 95.0, "A"), "30.0 / 95 A");
}

TEST(format_core_freq_cell_priority) {
  model::CoreReading c;
  c.frequency_mhz = 4549.6;
  ASSERT_EQ(ui::core_freq_cell(c), "4550");
  c.sleeping = true;
  ASSERT_EQ(ui::core_freq_cell(c), "Sleeping");
  c.disabled = true;
  ASSERT_EQ(ui::core_freq_cell(c), "Disabled");
  model::CoreReading n;
  ASSERT_EQ(ui::core_freq_cell(n), "--");
}

TEST(retro_bar_fill_and_clamp) {
  ASSERT_EQ(util::retro_bar(50.0, 4, "#", "."), "[##..]");
  ASSERT_EQ(util::retro_bar(0.0, 4, "#", "."), "[....]");
  ASSERT_EQ(util::retro_bar(250.0, 4, "#", "."), "[####]");
  ASSERT_EQ(util::retro_bar(-3.0, 4, "#", "."), "[....]");
  ASSERT_EQ(util::retro_bar(kNaN, 4, "#", "."), "[....]");
}

TEST(format_lr_align_width) {
  auto s = ui::lr_align(20, "PPT", "45.2 / 0 W");
  ASSERT_EQ(ui::display_cols(s), 20);
  ASSERT_EQ(s.substr(0, 3), "PPT");
  ASSERT_EQ(s.substr(s.size() - 10), "45.2 / 0 W");
}
