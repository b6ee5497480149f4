#ifndef TRANSPORT_PIPELINE_HPP
#define TRANSPORT_PIPELINE_HPP

#include "FacilityInventory.hpp"
#include "ReceptorNetwork.hpp"
#include "ScenarioTransform.hpp"
#include "LoadDecayEngine.hpp"
#include "SpatialLinker.hpp"
#include "DilutionEngine.hpp"
#include "CoordinateSystem.hpp"
#include <string>
#include <vector>

namespace FIOGT {

/**
 * @brief Output of one pipeline evaluation
 */
struct PipelineResult {
    FacilityInventory inventory;                // Evaluated rows (after scenario)
    std::vector<double> loads;                  // Net load per row, CFU/day
    std::vector<double> surviving_loads;        // Per receptor, CFU/day
    std::vector<double> concentrations;         // Per receptor, CFU/100mL
    std::vector<std::size_t> link_counts;       // Linked rows per receptor
    std::vector<Link> links;                    // Only when requested

    double totalLoad() const;
    std::size_t numLinkedReceptors() const;
};

/**
 * @brief Inventory -> scenario -> load/decay -> linking -> dilution
 *
 * Holds the immutable base tables and the site/receptor adjacency, which
 * is computed once at construction. run() never modifies them, so one
 * pipeline can be evaluated for any number of parameter sets.
 */
class TransportPipeline {
public:
    /**
     * @param input_crs CRS of the lat/long columns (EPSG code or LOCAL)
     * @param model_crs Planar CRS for distances (EPSG code, AUTO or LOCAL)
     * @param index_cell_size Spatial index cell side, <= 0 for the largest radius
     * @throws ConfigurationError on invalid classes or projection failure
     * @throws DataValidationError on negative populations
     */
    TransportPipeline(FacilityInventory base,
                      ReceptorNetwork receptors,
                      const ReceptorClassTable& classes,
                      const std::string& input_crs = CRS::WGS84,
                      const std::string& model_crs = CRS::AUTO,
                      double index_cell_size = 0.0);

    /**
     * @brief Evaluate the pipeline
     * @param scenario Interventions to apply, nullptr for none
     * @param keep_links Fill PipelineResult::links
     * @throws DataValidationError on bad input (non-positive flux, ...)
     */
    PipelineResult run(const TransportParameters& params,
                       const ScenarioConfig* scenario = nullptr,
                       bool keep_links = false) const;

    const FacilityInventory& baseInventory() const { return base_; }
    const ReceptorNetwork& receptors() const { return receptors_; }
    const Adjacency& adjacency() const { return adjacency_; }
    const std::vector<GeoPoint>& sitePoints() const { return site_points_; }
    const std::vector<GeoPoint>& receptorPoints() const { return receptor_points_; }
    const std::vector<double>& linkRadii() const { return radii_; }
    const std::string& modelCRS() const { return model_crs_; }

private:
    FacilityInventory base_;
    ReceptorNetwork receptors_;
    std::vector<double> radii_;
    std::vector<GeoPoint> site_points_;
    std::vector<GeoPoint> receptor_points_;
    Adjacency adjacency_;
    std::size_t num_sites_;
    std::string model_crs_;
};

} // namespace FIOGT

#endif // TRANSPORT_PIPELINE_HPP
