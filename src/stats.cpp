#include <f1qp/stats.hpp>
#include <boost/math/distributions/students_t.hpp>
#include <cmath>
#include <limits>

namespace f1qp {

double mean_of(const std::vector<double>& xs) {
  if (xs.empty()) return 0.0;
  double sum = 0.0;
  for (double x : xs) sum += x;
  return sum / static_cast<double>(xs.size());
}

double sample_stddev(const std::vector<double>& xs) {
  if (xs.size() < 2) return 0.0;
  const double m = mean_of(xs);
  double ss = 0.0;
  for (double x : xs) ss += (x - m) * (x - m);
  return std::sqrt(ss / static_cast<double>(xs.size() - 1));
}

std::optional<PairedTest> paired_t_test(const std::vector<double>& a, const std::vector<double>& b) {
  if (a.size() != b.size() || a.size() < 2) return std::nullopt;

  std::vector<double> d(a.size());
  for (std::size_t i = 0; i < a.size(); ++i) d[i] = a[i] - b[i];

  PairedTest out;
  out.n = d.size();
  out.mean_difference = mean_of(d);
  out.stddev_difference = sample_stddev(d);

  if (out.stddev_difference == 0.0) {
    // Constant differences: either no effect at all or a perfectly consistent one.
    if (out.mean_difference == 0.0) return out;
    const double inf = std::numeric_limits<double>::infinity();
    out.t_statistic = out.mean_difference > 0.0 ? inf : -inf;
    out.effect_size = out.t_statistic;
    out.p_value = 0.0;
    return out;
  }

  const double n = static_cast<double>(out.n);
  out.t_statistic = out.mean_difference / (out.stddev_difference / std::sqrt(n));
  out.effect_size = out.mean_difference / out.stddev_difference;

  boost::math::students_t dist{n - 1.0};
  out.p_value = 2.0 * boost::math::cdf(boost::math::complement(dist, std::abs(out.t_statistic)));
  if (out.p_value > 1.0) out.p_value = 1.0;
  return out;
}

} // namespace f1qp
