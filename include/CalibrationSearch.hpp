#ifndef CALIBRATION_SEARCH_HPP
#define CALIBRATION_SEARCH_HPP

#include "TransportPipeline.hpp"
#include "CalibrationMetrics.hpp"
#include <petscsys.h>
#include <array>
#include <functional>
#include <string>
#include <vector>

namespace FIOGT {

/**
 * @brief One point of the calibration grid
 */
struct ParameterVector {
    double decay_rate = 0.0;
    double shedding_rate = 0.0;
    std::array<double, NUM_SANITATION_CATEGORIES> efficiency{};

    // Transport parameters with these values applied over a base table
    TransportParameters toTransportParameters(const EfficiencyTable& base) const;

    bool operator==(const ParameterVector& other) const;
};

/**
 * @brief Candidate values of each tunable parameter
 *
 * Defaults reproduce the trend search used for the survey data. A
 * single-value grid fixes that parameter.
 */
struct CalibrationConfig {
    std::vector<double> decay_rate_grid{0.05, 0.08, 0.10, 0.12};
    std::vector<double> shedding_rate_grid{1.0e7};
    std::array<std::vector<double>, NUM_SANITATION_CATEGORIES> efficiency_grid{{
        {0.5},          // sewered
        {0.1, 0.2},     // pit
        {0.3, 0.5},     // septic
        {0.0}           // open defecation
    }};

    double detection_threshold = 10.0;  // CFU/100mL, observations at or below are non-detects
    double log_floor = 1.0e-6;          // Clip before log10
    std::size_t min_distinct = 2;       // Minimum-variation guard for correlations
    std::string receptor_class;         // Restrict matching to one class, empty for all
    bool apply_scenario = false;        // Evaluate under the [SCENARIO] interventions

    /**
     * @throws ConfigurationError on empty grids or out-of-domain values
     */
    void validate() const;
};

/**
 * @brief Mixed-radix enumeration of the Cartesian product of grids
 *
 * Parameter order is decay rate, shedding rate, then efficiencies by
 * category; the last parameter varies fastest.
 */
class ParameterGrid {
public:
    static constexpr int NUM_PARAMETERS = 2 + NUM_SANITATION_CATEGORIES;

    explicit ParameterGrid(const CalibrationConfig& config);

    std::size_t size() const { return size_; }
    ParameterVector at(std::size_t index) const;

    const std::vector<double>& axis(int p) const { return axes_[p]; }
    static std::string parameterName(int p);

    // Parameters with a single candidate value
    std::vector<int> fixedParameters() const;

private:
    std::array<std::vector<double>, NUM_PARAMETERS> axes_;
    std::size_t size_;
};

enum class RunStatus {
    OK = 0,
    UNSCOREABLE = 1,    // Too few matched receptors or no variation
    FAILED = 2,         // Data validation error during the run
    SKIPPED = 3         // Rejected by the point filter
};

std::string runStatusName(RunStatus status);

/**
 * @brief Score of one grid point
 */
struct CalibrationRecord {
    std::size_t grid_index = 0;
    ParameterVector parameters;
    MetricSet metrics;
    RunStatus status = RunStatus::UNSCOREABLE;
    std::string message;
};

/**
 * @brief All records in ranking order plus the selected best point
 */
struct CalibrationReport {
    std::vector<CalibrationRecord> records;
    bool has_best = false;

    const CalibrationRecord& best() const { return records.front(); }
    std::size_t countStatus(RunStatus status) const;
    std::vector<std::size_t> unscoreablePoints() const;
};

/**
 * @brief Grid search over transport and efficiency parameters
 *
 * Each grid point runs the full pipeline and is scored against observed
 * concentrations above the detection threshold. Points are independent:
 * run() deals them round-robin over the ranks of a communicator, gathers
 * every record on every rank and ranks the union, so the report does not
 * depend on the number of ranks or the completion order.
 */
class CalibrationSearch {
public:
    // Return false to skip a point without scoring it
    using PointFilter = std::function<bool(const ParameterVector&)>;

    /**
     * @param scenario Interventions applied at every point, nullptr for none
     * @throws ConfigurationError if the configuration is invalid
     */
    CalibrationSearch(const TransportPipeline& pipeline,
                      const CalibrationConfig& config,
                      const EfficiencyTable& base_efficiencies,
                      const ScenarioConfig* scenario = nullptr);

    void setPointFilter(PointFilter filter) { filter_ = std::move(filter); }

    const ParameterGrid& grid() const { return grid_; }

    // Receptors that take part in matching (observed above threshold)
    const std::vector<std::size_t>& matchedReceptors() const { return matched_; }

    /**
     * @brief Score one grid point; data errors become a FAILED record
     */
    CalibrationRecord evaluate(std::size_t grid_index) const;

    /**
     * @brief Evaluate the whole grid across the ranks of comm
     */
    PetscErrorCode run(MPI_Comm comm, CalibrationReport& report) const;

    /**
     * @brief Lexicographic ranking: rho desc, tau desc, r_log desc, rmse asc
     *
     * NaN sorts last for each key; ties fall back to grid index.
     */
    static bool rankBefore(const CalibrationRecord& a, const CalibrationRecord& b);

    /**
     * @brief Sort records and mark the best one (first with a defined rho)
     */
    static CalibrationReport rank(std::vector<CalibrationRecord> records);

private:
    const TransportPipeline& pipeline_;
    CalibrationConfig config_;
    EfficiencyTable base_efficiencies_;
    bool has_scenario_;
    ScenarioConfig scenario_;
    ParameterGrid grid_;
    PointFilter filter_;
    std::vector<std::size_t> matched_;
};

} // namespace FIOGT

#endif // CALIBRATION_SEARCH_HPP
