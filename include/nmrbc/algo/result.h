//
// Project NMRBC - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef NMRBC_ALGO_RESULT_H_
#define NMRBC_ALGO_RESULT_H_

//! @cond
#include <cmath>
#include <limits>
#include <utility>
#include <vector>

#include <absl/status/status.h>
//! @endcond

namespace nmrbc {
struct RecordFailure {
  int index;
  absl::Status status;
};

/**
 * @brief Back-calculated values of one structure.
 *
 * The values are aligned with the records of the template: values()[i]
 * corresponds to the i-th record. Records that could not be computed hold NaN
 * and are listed in failures().
 */
class BackCalcResult {
public:
  BackCalcResult() = default;

  explicit BackCalcResult(int size) { values_.reserve(size); }

  void add_value(double value) { values_.push_back(value); }

  void add_failure(absl::Status status) {
    failures_.push_back(
        { static_cast<int>(values_.size()), std::move(status) });
    values_.push_back(std::numeric_limits<double>::quiet_NaN());
  }

  const std::vector<double> &values() const { return values_; }

  int size() const { return static_cast<int>(values_.size()); }

  double operator[](int i) const { return values_[i]; }

  const std::vector<RecordFailure> &failures() const { return failures_; }

  bool complete() const { return failures_.empty(); }

  static bool is_failed(double value) { return std::isnan(value); }

private:
  std::vector<double> values_;
  std::vector<RecordFailure> failures_;
};
}  // namespace nmrbc

#endif /* NMRBC_ALGO_RESULT_H_ */
