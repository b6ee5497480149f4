#ifndef CALIBRATION_METRICS_HPP
#define CALIBRATION_METRICS_HPP

#include <cstddef>
#include <vector>

namespace FIOGT {

/**
 * @brief Agreement metrics between predicted and observed concentrations
 *
 * Correlations are NaN when either series has fewer than two distinct
 * values; RMSE is NaN only for an empty set.
 */
struct MetricSet {
    std::size_t n_matched = 0;
    double spearman_rho;
    double kendall_tau;
    double pearson_r_log;
    double rmse_log;
    // Log-space offset that moves the predicted mean onto the observed mean
    double log_bias_shift;

    MetricSet();
};

namespace Metrics {

// 1-based ranks, ties get their average rank
void computeRanks(const std::vector<double>& values, std::vector<double>& ranks_out);

std::size_t countDistinct(const std::vector<double>& values);

// Product-moment correlation; NaN for constant or too-short series
double pearson(const std::vector<double>& a, const std::vector<double>& b);

double spearmanRho(const std::vector<double>& a, const std::vector<double>& b);

// Kendall tau-b (tie corrected)
double kendallTau(const std::vector<double>& a, const std::vector<double>& b);

// log10(max(v, floor)) element-wise
std::vector<double> log10Clipped(const std::vector<double>& values, double floor);

double pearsonLog(const std::vector<double>& a, const std::vector<double>& b, double floor);

double rmseLog(const std::vector<double>& predicted, const std::vector<double>& observed,
               double floor);

// mean(log1p(observed)) - mean(log1p(predicted)); NaN for an empty set
double logBiasShift(const std::vector<double>& predicted, const std::vector<double>& observed);

// expm1(log1p(v) + shift) element-wise; leaves the ordering unchanged
std::vector<double> applyLogBiasShift(const std::vector<double>& values, double shift);

/**
 * @brief All metrics for one matched set
 * @param min_distinct Minimum distinct values per series for correlations
 */
MetricSet compute(const std::vector<double>& predicted,
                  const std::vector<double>& observed,
                  double log_floor = 1e-6,
                  std::size_t min_distinct = 2);

} // namespace Metrics

} // namespace FIOGT

#endif // CALIBRATION_METRICS_HPP
