#include "CalibrationSearch.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>

namespace FIOGT {

namespace {

// Numeric fields exchanged per record: index, status, n, rho, tau, r, rmse, shift
constexpr int PACKED_FIELDS = 8;

// -1 if a ranks before b, 1 if after, 0 if tied; NaN always ranks last
int compareKey(double a, double b, bool descending) {
    const bool a_nan = std::isnan(a);
    const bool b_nan = std::isnan(b);
    if (a_nan && b_nan) return 0;
    if (a_nan) return 1;
    if (b_nan) return -1;
    if (a == b) return 0;
    if (descending) return a > b ? -1 : 1;
    return a < b ? -1 : 1;
}

void checkGrid(const std::vector<double>& grid, const std::string& name,
               double lo, double hi) {
    if (grid.empty()) {
        throw ConfigurationError("Calibration grid for " + name + " is empty");
    }
    for (double v : grid) {
        if (!(v >= lo && v <= hi)) {
            std::ostringstream msg;
            msg << "Calibration grid for " << name << " has value " << v
                << " outside [" << lo << ", " << hi << "]";
            throw ConfigurationError(msg.str());
        }
    }
}

} // namespace

// =============================================================================
// ParameterVector / CalibrationConfig
// =============================================================================

TransportParameters ParameterVector::toTransportParameters(const EfficiencyTable& base) const {
    TransportParameters params;
    params.decay_rate = decay_rate;
    params.shedding_rate = shedding_rate;
    params.efficiencies = base;
    for (int c = 0; c < NUM_SANITATION_CATEGORIES; ++c) {
        params.efficiencies = params.efficiencies.withCategory(categoryFromIndex(c), efficiency[c]);
    }
    return params;
}

bool ParameterVector::operator==(const ParameterVector& other) const {
    return decay_rate == other.decay_rate && shedding_rate == other.shedding_rate &&
           efficiency == other.efficiency;
}

void CalibrationConfig::validate() const {
    const double inf = std::numeric_limits<double>::infinity();
    checkGrid(decay_rate_grid, "decay_rate", 0.0, inf);
    checkGrid(shedding_rate_grid, "shedding_rate", 0.0, inf);
    for (int c = 0; c < NUM_SANITATION_CATEGORIES; ++c) {
        checkGrid(efficiency_grid[c],
                  "efficiency_" + sanitationCategoryName(categoryFromIndex(c)), 0.0, 1.0);
    }
    if (!(detection_threshold >= 0.0)) {
        throw ConfigurationError("Detection threshold must be non-negative");
    }
    if (!(log_floor > 0.0)) {
        throw ConfigurationError("Log floor must be positive");
    }
    if (min_distinct < 2) {
        throw ConfigurationError("Minimum distinct values must be at least 2");
    }
}

// =============================================================================
// ParameterGrid
// =============================================================================

ParameterGrid::ParameterGrid(const CalibrationConfig& config)
    : size_(1) {
    config.validate();

    axes_[0] = config.decay_rate_grid;
    axes_[1] = config.shedding_rate_grid;
    for (int c = 0; c < NUM_SANITATION_CATEGORIES; ++c) {
        axes_[2 + c] = config.efficiency_grid[c];
    }
    for (const auto& axis : axes_) {
        size_ *= axis.size();
    }
}

ParameterVector ParameterGrid::at(std::size_t index) const {
    if (index >= size_) {
        throw std::out_of_range("Grid index out of range");
    }

    std::array<std::size_t, NUM_PARAMETERS> digit{};
    std::size_t rem = index;
    for (int p = NUM_PARAMETERS - 1; p >= 0; --p) {
        digit[p] = rem % axes_[p].size();
        rem /= axes_[p].size();
    }

    ParameterVector v;
    v.decay_rate = axes_[0][digit[0]];
    v.shedding_rate = axes_[1][digit[1]];
    for (int c = 0; c < NUM_SANITATION_CATEGORIES; ++c) {
        v.efficiency[c] = axes_[2 + c][digit[2 + c]];
    }
    return v;
}

std::string ParameterGrid::parameterName(int p) {
    if (p == 0) return "decay_rate";
    if (p == 1) return "shedding_rate";
    return "efficiency_" + sanitationCategoryName(categoryFromIndex(p - 2));
}

std::vector<int> ParameterGrid::fixedParameters() const {
    std::vector<int> fixed;
    for (int p = 0; p < NUM_PARAMETERS; ++p) {
        if (axes_[p].size() == 1) fixed.push_back(p);
    }
    return fixed;
}

std::string runStatusName(RunStatus status) {
    switch (status) {
        case RunStatus::OK: return "OK";
        case RunStatus::UNSCOREABLE: return "UNSCOREABLE";
        case RunStatus::FAILED: return "FAILED";
        case RunStatus::SKIPPED: return "SKIPPED";
    }
    return "UNKNOWN";
}

// =============================================================================
// CalibrationReport
// =============================================================================

std::size_t CalibrationReport::countStatus(RunStatus status) const {
    return static_cast<std::size_t>(
        std::count_if(records.begin(), records.end(),
                      [status](const CalibrationRecord& r) { return r.status == status; }));
}

std::vector<std::size_t> CalibrationReport::unscoreablePoints() const {
    std::vector<std::size_t> points;
    for (const auto& r : records) {
        if (r.status != RunStatus::OK) points.push_back(r.grid_index);
    }
    std::sort(points.begin(), points.end());
    return points;
}

// =============================================================================
// CalibrationSearch
// =============================================================================

CalibrationSearch::CalibrationSearch(const TransportPipeline& pipeline,
                                     const CalibrationConfig& config,
                                     const EfficiencyTable& base_efficiencies,
                                     const ScenarioConfig* scenario)
    : pipeline_(pipeline),
      config_(config),
      base_efficiencies_(base_efficiencies),
      has_scenario_(scenario != nullptr),
      grid_(config) {
    base_efficiencies_.validate();
    if (scenario) {
        scenario->validate();
        scenario_ = *scenario;
    }

    const ReceptorNetwork& receptors = pipeline_.receptors();
    for (std::size_t r = 0; r < receptors.size(); ++r) {
        const Receptor& rec = receptors[r];
        if (!rec.hasObservation()) continue;
        if (!(rec.observed > config_.detection_threshold)) continue;
        if (!config_.receptor_class.empty() && rec.receptor_class != config_.receptor_class) {
            continue;
        }
        matched_.push_back(r);
    }
}

CalibrationRecord CalibrationSearch::evaluate(std::size_t grid_index) const {
    CalibrationRecord rec;
    rec.grid_index = grid_index;
    rec.parameters = grid_.at(grid_index);

    if (filter_ && !filter_(rec.parameters)) {
        rec.status = RunStatus::SKIPPED;
        rec.message = "skipped by point filter";
        return rec;
    }

    try {
        TransportParameters params = rec.parameters.toTransportParameters(base_efficiencies_);
        PipelineResult result = pipeline_.run(params, has_scenario_ ? &scenario_ : nullptr);

        std::vector<double> predicted;
        std::vector<double> observed;
        predicted.reserve(matched_.size());
        observed.reserve(matched_.size());
        for (std::size_t r : matched_) {
            predicted.push_back(result.concentrations[r]);
            observed.push_back(pipeline_.receptors()[r].observed);
        }

        rec.metrics = Metrics::compute(predicted, observed, config_.log_floor,
                                       config_.min_distinct);

        if (std::isnan(rec.metrics.spearman_rho)) {
            rec.status = RunStatus::UNSCOREABLE;
            rec.message = rec.metrics.n_matched == 0
                              ? "no observations above detection threshold"
                              : "insufficient variation in matched values";
        } else {
            rec.status = RunStatus::OK;
        }
    } catch (const DataValidationError& e) {
        rec.metrics = MetricSet();
        rec.status = RunStatus::FAILED;
        rec.message = e.what();
    }

    return rec;
}

PetscErrorCode CalibrationSearch::run(MPI_Comm comm, CalibrationReport& report) const {
    PetscMPIInt rank, size;

    PetscFunctionBeginUser;
    PetscCallMPI(MPI_Comm_rank(comm, &rank));
    PetscCallMPI(MPI_Comm_size(comm, &size));

    const std::size_t n_points = grid_.size();

    // Map: round-robin over ranks
    std::vector<double> packed;
    std::string messages;
    std::size_t n_local = 0;
    for (std::size_t i = static_cast<std::size_t>(rank); i < n_points;
         i += static_cast<std::size_t>(size)) {
        CalibrationRecord rec = evaluate(i);
        packed.push_back(static_cast<double>(rec.grid_index));
        packed.push_back(static_cast<double>(static_cast<int>(rec.status)));
        packed.push_back(static_cast<double>(rec.metrics.n_matched));
        packed.push_back(rec.metrics.spearman_rho);
        packed.push_back(rec.metrics.kendall_tau);
        packed.push_back(rec.metrics.pearson_r_log);
        packed.push_back(rec.metrics.rmse_log);
        packed.push_back(rec.metrics.log_bias_shift);
        messages += rec.message;
        messages += '\0';
        ++n_local;

        if (n_local % 50 == 0) {
            PetscCall(PetscPrintf(PETSC_COMM_SELF, "  [rank %d] evaluated %zu grid points\n",
                                  rank, n_local));
        }
    }

    // Gather numeric fields
    PetscMPIInt send_count = static_cast<PetscMPIInt>(packed.size());
    std::vector<PetscMPIInt> counts(size), displs(size, 0);
    PetscCallMPI(MPI_Allgather(&send_count, 1, MPI_INT, counts.data(), 1, MPI_INT, comm));
    for (PetscMPIInt r = 1; r < size; ++r) displs[r] = displs[r - 1] + counts[r - 1];

    std::vector<double> all(static_cast<std::size_t>(displs[size - 1] + counts[size - 1]));
    PetscCallMPI(MPI_Allgatherv(packed.data(), send_count, MPI_DOUBLE,
                                all.data(), counts.data(), displs.data(), MPI_DOUBLE, comm));

    // Gather messages
    PetscMPIInt msg_count = static_cast<PetscMPIInt>(messages.size());
    std::vector<PetscMPIInt> msg_counts(size), msg_displs(size, 0);
    PetscCallMPI(MPI_Allgather(&msg_count, 1, MPI_INT, msg_counts.data(), 1, MPI_INT, comm));
    for (PetscMPIInt r = 1; r < size; ++r) msg_displs[r] = msg_displs[r - 1] + msg_counts[r - 1];

    std::vector<char> all_msgs(static_cast<std::size_t>(msg_displs[size - 1] + msg_counts[size - 1]));
    PetscCallMPI(MPI_Allgatherv(messages.data(), msg_count, MPI_CHAR,
                                all_msgs.data(), msg_counts.data(), msg_displs.data(),
                                MPI_CHAR, comm));

    // Unpack; ranks are concatenated in order, so records and messages line up
    std::vector<CalibrationRecord> records;
    records.reserve(n_points);
    std::size_t msg_pos = 0;
    for (std::size_t k = 0; k + PACKED_FIELDS <= all.size(); k += PACKED_FIELDS) {
        CalibrationRecord rec;
        rec.grid_index = static_cast<std::size_t>(all[k]);
        rec.parameters = grid_.at(rec.grid_index);
        rec.status = static_cast<RunStatus>(static_cast<int>(all[k + 1]));
        rec.metrics.n_matched = static_cast<std::size_t>(all[k + 2]);
        rec.metrics.spearman_rho = all[k + 3];
        rec.metrics.kendall_tau = all[k + 4];
        rec.metrics.pearson_r_log = all[k + 5];
        rec.metrics.rmse_log = all[k + 6];
        rec.metrics.log_bias_shift = all[k + 7];

        std::size_t end = msg_pos;
        while (end < all_msgs.size() && all_msgs[end] != '\0') ++end;
        rec.message.assign(all_msgs.begin() + msg_pos, all_msgs.begin() + end);
        msg_pos = end + 1;

        records.push_back(std::move(rec));
    }

    // Reduce: order-independent sort-and-select
    report = rank(std::move(records));

    PetscCall(PetscPrintf(comm, "Calibration: %zu grid points, %zu scored, %zu unscoreable, "
                                "%zu failed, %zu skipped\n",
                          n_points, report.countStatus(RunStatus::OK),
                          report.countStatus(RunStatus::UNSCOREABLE),
                          report.countStatus(RunStatus::FAILED),
                          report.countStatus(RunStatus::SKIPPED)));

    PetscFunctionReturn(0);
}

bool CalibrationSearch::rankBefore(const CalibrationRecord& a, const CalibrationRecord& b) {
    int c = compareKey(a.metrics.spearman_rho, b.metrics.spearman_rho, true);
    if (c != 0) return c < 0;
    c = compareKey(a.metrics.kendall_tau, b.metrics.kendall_tau, true);
    if (c != 0) return c < 0;
    c = compareKey(a.metrics.pearson_r_log, b.metrics.pearson_r_log, true);
    if (c != 0) return c < 0;
    c = compareKey(a.metrics.rmse_log, b.metrics.rmse_log, false);
    if (c != 0) return c < 0;
    return a.grid_index < b.grid_index;
}

CalibrationReport CalibrationSearch::rank(std::vector<CalibrationRecord> records) {
    CalibrationReport report;
    report.records = std::move(records);
    std::sort(report.records.begin(), report.records.end(), rankBefore);

    report.has_best = !report.records.empty() &&
                      report.records.front().status == RunStatus::OK &&
                      !std::isnan(report.records.front().metrics.spearman_rho);
    return report;
}

} // namespace FIOGT
