#include "CalibrationMetrics.hpp"
#include "FIOGT.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace FIOGT {

MetricSet::MetricSet()
    : spearman_rho(undefinedMetric()),
      kendall_tau(undefinedMetric()),
      pearson_r_log(undefinedMetric()),
      rmse_log(undefinedMetric()),
      log_bias_shift(undefinedMetric()) {}

namespace Metrics {

namespace {

double clampUnit(double r) {
    if (std::isnan(r)) return r;
    return std::max(-1.0, std::min(1.0, r));
}

bool sameLength(const std::vector<double>& a, const std::vector<double>& b) {
    return a.size() == b.size();
}

} // namespace

void computeRanks(const std::vector<double>& values, std::vector<double>& ranks_out) {
    const std::size_t n = values.size();
    std::vector<std::size_t> order(n);
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
                     [&values](std::size_t a, std::size_t b) { return values[a] < values[b]; });

    ranks_out.assign(n, 0.0);

    std::size_t i = 0;
    while (i < n) {
        std::size_t j = i + 1;
        while (j < n && values[order[j]] == values[order[i]]) {
            j++;
        }

        double rank = 0.5 * (double(i + 1) + double(j));
        for (std::size_t k = i; k < j; k++) {
            ranks_out[order[k]] = rank;
        }

        i = j;
    }
}

std::size_t countDistinct(const std::vector<double>& values) {
    std::vector<double> sorted(values);
    std::sort(sorted.begin(), sorted.end());
    return static_cast<std::size_t>(std::unique(sorted.begin(), sorted.end()) - sorted.begin());
}

double pearson(const std::vector<double>& a, const std::vector<double>& b) {
    const std::size_t n = a.size();
    if (!sameLength(a, b) || n < 2) return undefinedMetric();

    double mean_a = 0.0, mean_b = 0.0;
    for (std::size_t i = 0; i < n; i++) {
        mean_a += a[i];
        mean_b += b[i];
    }
    mean_a /= double(n);
    mean_b /= double(n);

    double num = 0.0;
    double den_a = 0.0;
    double den_b = 0.0;
    for (std::size_t i = 0; i < n; i++) {
        double da = a[i] - mean_a;
        double db = b[i] - mean_b;
        num += da * db;
        den_a += da * da;
        den_b += db * db;
    }

    if (den_a <= 0.0 || den_b <= 0.0) return undefinedMetric();
    return clampUnit(num / std::sqrt(den_a * den_b));
}

double spearmanRho(const std::vector<double>& a, const std::vector<double>& b) {
    if (!sameLength(a, b)) return undefinedMetric();

    std::vector<double> ra, rb;
    computeRanks(a, ra);
    computeRanks(b, rb);
    return pearson(ra, rb);
}

double kendallTau(const std::vector<double>& a, const std::vector<double>& b) {
    const std::size_t n = a.size();
    if (!sameLength(a, b) || n < 2) return undefinedMetric();

    // Matched sets are lab samples (tens to hundreds), so the direct
    // pairwise count is sufficient
    double concordant = 0.0;
    double discordant = 0.0;
    double ties_a = 0.0;
    double ties_b = 0.0;

    for (std::size_t i = 0; i < n; ++i) {
        for (std::size_t j = i + 1; j < n; ++j) {
            double da = a[i] - a[j];
            double db = b[i] - b[j];
            if (da == 0.0 && db == 0.0) {
                continue;
            } else if (da == 0.0) {
                ties_a += 1.0;
            } else if (db == 0.0) {
                ties_b += 1.0;
            } else if ((da > 0.0) == (db > 0.0)) {
                concordant += 1.0;
            } else {
                discordant += 1.0;
            }
        }
    }

    double den = std::sqrt((concordant + discordant + ties_a) *
                           (concordant + discordant + ties_b));
    if (den <= 0.0) return undefinedMetric();
    return clampUnit((concordant - discordant) / den);
}

std::vector<double> log10Clipped(const std::vector<double>& values, double floor) {
    std::vector<double> out;
    out.reserve(values.size());
    for (double v : values) {
        out.push_back(std::log10(std::max(v, floor)));
    }
    return out;
}

double pearsonLog(const std::vector<double>& a, const std::vector<double>& b, double floor) {
    return pearson(log10Clipped(a, floor), log10Clipped(b, floor));
}

double rmseLog(const std::vector<double>& predicted, const std::vector<double>& observed,
               double floor) {
    if (!sameLength(predicted, observed) || predicted.empty()) return undefinedMetric();

    std::vector<double> lp = log10Clipped(predicted, floor);
    std::vector<double> lo = log10Clipped(observed, floor);

    double sum = 0.0;
    for (std::size_t i = 0; i < lp.size(); ++i) {
        double d = lp[i] - lo[i];
        sum += d * d;
    }
    return std::sqrt(sum / double(lp.size()));
}

double logBiasShift(const std::vector<double>& predicted, const std::vector<double>& observed) {
    if (!sameLength(predicted, observed) || predicted.empty()) return undefinedMetric();

    double sum_obs = 0.0, sum_pred = 0.0;
    for (std::size_t i = 0; i < predicted.size(); ++i) {
        sum_obs += std::log1p(observed[i]);
        sum_pred += std::log1p(predicted[i]);
    }
    return (sum_obs - sum_pred) / double(predicted.size());
}

std::vector<double> applyLogBiasShift(const std::vector<double>& values, double shift) {
    std::vector<double> out;
    out.reserve(values.size());
    for (double v : values) {
        out.push_back(std::expm1(std::log1p(v) + shift));
    }
    return out;
}

MetricSet compute(const std::vector<double>& predicted,
                  const std::vector<double>& observed,
                  double log_floor,
                  std::size_t min_distinct) {
    MetricSet m;
    m.n_matched = std::min(predicted.size(), observed.size());
    if (!sameLength(predicted, observed) || predicted.empty()) {
        return m;
    }

    m.rmse_log = rmseLog(predicted, observed, log_floor);
    m.log_bias_shift = logBiasShift(predicted, observed);

    if (countDistinct(predicted) < min_distinct || countDistinct(observed) < min_distinct) {
        return m;
    }

    m.spearman_rho = spearmanRho(predicted, observed);
    m.kendall_tau = kendallTau(predicted, observed);
    m.pearson_r_log = pearsonLog(predicted, observed, log_floor);
    return m;
}

} // namespace Metrics

} // namespace FIOGT
