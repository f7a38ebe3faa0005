#ifndef SCOPED_TIMER_HPP
#define SCOPED_TIMER_HPP

#include <chrono>
#include <prometheus/histogram.h>

// Observes the scope's wall time (seconds) into a histogram on destruction.
// A null histogram only measures.
class ScopedTimer {
public:
  explicit ScopedTimer(prometheus::Histogram *histogram_metric)
      : metric_(histogram_metric),
        start_time_(std::chrono::high_resolution_clock::now()) {}

  ~ScopedTimer() {
    if (metric_ != nullptr)
      metric_->Observe(elapsed_seconds());
  }

  double elapsed_seconds() const {
    auto end_time = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::duration<double>>(
        end_time - start_time_);
    return duration.count();
  }

  double elapsed_ms() const { return elapsed_seconds() * 1000.0; }

private:
  prometheus::Histogram *metric_;
  std::chrono::time_point<std::chrono::high_resolution_clock> start_time_;
};

#endif // SCOPED_TIMER_HPP
