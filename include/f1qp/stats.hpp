#pragma once
#include <cstddef>
#include <optional>
#include <vector>

namespace f1qp {

double mean_of(const std::vector<double>& xs);                 // 0 for empty input
double sample_stddev(const std::vector<double>& xs);           // n - 1; 0 for n < 2

// Paired two-sided t-test on d_i = a_i - b_i.
struct PairedTest {
  std::size_t n = 0;
  double mean_difference = 0.0;
  double stddev_difference = 0.0;
  double t_statistic = 0.0;
  double p_value = 1.0;
  double effect_size = 0.0;  // Cohen's d_z = mean / stddev
};

// nullopt when the sequences differ in length or have fewer than two pairs.
std::optional<PairedTest> paired_t_test(const std::vector<double>& a, const std::vector<double>& b);

} // namespace f1qp
