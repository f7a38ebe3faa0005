#ifndef SUMMARY_STATS_HPP
#define SUMMARY_STATS_HPP

#include <cstddef>

// Aircraft-agnostic statistics of a whole flight log. Used only to decide
// which aircraft type produced the log.
struct SummaryStats {
  size_t row_count = 0;

  size_t motor_channel_count = 0;
  size_t active_motor_count = 0;
  // 1 - coefficient of variation of the active motors' mean RPM
  double motor_symmetry = 0.0;

  bool has_control_surfaces = false;

  double hover_ratio = 0.0;
  double cruise_ratio = 0.0;
  double average_speed = 0.0;
  double max_speed = 0.0;

  // Sign changes of the vertical rate per consecutive pair of rates
  double vertical_transition_ratio = 0.0;
  // Combined climb + acceleration events (hover <-> forward flight)
  size_t transition_events = 0;

  bool has_signal = false;

  bool is_degenerate() const { return row_count == 0 || !has_signal; }
};

#endif // SUMMARY_STATS_HPP
