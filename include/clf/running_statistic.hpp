#pragma once
#include <cstdint>

namespace clf {

// Incremental weighted mean of a scalar signal. avg is only meaningful once count > 0.
class RunningStatistic {
public:
  RunningStatistic() { reset(); }

  void reset() {
    count_ = 0;
    sum_ = 0.0;
    avg_ = 0.0;
    last_ = 0.0;
  }

  // weight is the number of examples that produced value.
  void update(double value, int64_t weight = 1) {
    last_ = value;
    sum_ += value * static_cast<double>(weight);
    count_ += weight;
    avg_ = sum_ / static_cast<double>(count_);
  }

  int64_t count() const { return count_; }
  double sum() const { return sum_; }
  double avg() const { return avg_; }
  double last() const { return last_; }

private:
  int64_t count_;
  double sum_;
  double avg_;
  double last_;
};

} // namespace clf
