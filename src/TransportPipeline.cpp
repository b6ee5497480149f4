#include "TransportPipeline.hpp"

namespace FIOGT {

double PipelineResult::totalLoad() const {
    double total = 0.0;
    for (double l : loads) total += l;
    return total;
}

std::size_t PipelineResult::numLinkedReceptors() const {
    std::size_t n = 0;
    for (std::size_t c : link_counts) {
        if (c > 0) ++n;
    }
    return n;
}

TransportPipeline::TransportPipeline(FacilityInventory base,
                                     ReceptorNetwork receptors,
                                     const ReceptorClassTable& classes,
                                     const std::string& input_crs,
                                     const std::string& model_crs,
                                     double index_cell_size)
    : base_(std::move(base)),
      receptors_(std::move(receptors)),
      num_sites_(0) {
    classes.validate();
    base_.validate();

    radii_ = receptors_.linkRadii(classes);
    num_sites_ = base_.numSites();

    // Site locations come from the rows that own them
    std::vector<double> site_lat(num_sites_, 0.0);
    std::vector<double> site_lon(num_sites_, 0.0);
    for (const auto& row : base_) {
        site_lat[row.site] = row.lat;
        site_lon[row.site] = row.lon;
    }

    std::vector<double> rec_lat;
    std::vector<double> rec_lon;
    rec_lat.reserve(receptors_.size());
    rec_lon.reserve(receptors_.size());
    for (const auto& rec : receptors_.receptors()) {
        rec_lat.push_back(rec.lat);
        rec_lon.push_back(rec.lon);
    }

    CoordinateSystemManager coords;
    coords.setInputCRS(input_crs);
    coords.setModelCRS(model_crs);

    if (model_crs == CRS::AUTO && !coords.isIdentity()) {
        double sum_lat = 0.0, sum_lon = 0.0;
        std::size_t n = 0;
        for (const auto& row : base_) {
            sum_lat += row.lat;
            sum_lon += row.lon;
            ++n;
        }
        for (std::size_t i = 0; i < rec_lat.size(); ++i) {
            sum_lat += rec_lat[i];
            sum_lon += rec_lon[i];
            ++n;
        }
        if (n == 0 || !coords.useAutoLocalCRS(sum_lat / n, sum_lon / n)) {
            throw ConfigurationError("Model CRS AUTO requires geographic input with data");
        }
    }

    coords.initialize();
    model_crs_ = coords.isIdentity() ? CRS::LOCAL : coords.getModelCRS().code;

    site_points_ = coords.toModelCoords(site_lat, site_lon);
    receptor_points_ = coords.toModelCoords(rec_lat, rec_lon);

    SpatialLinker linker(index_cell_size);
    adjacency_ = linker.link(site_points_, receptor_points_, radii_);
}

PipelineResult TransportPipeline::run(const TransportParameters& params,
                                      const ScenarioConfig* scenario,
                                      bool keep_links) const {
    LoadDecayEngine engine(params);

    PipelineResult result;
    result.inventory = base_.withEfficiencies(params.efficiencies);
    if (scenario) {
        ScenarioTransform transform(params.efficiencies);
        result.inventory = transform.apply(result.inventory, *scenario);
    }

    result.loads = engine.computeLoads(result.inventory);

    SiteRows site_rows = SiteRows::build(result.inventory, num_sites_);
    result.surviving_loads = engine.survivingLoads(adjacency_, site_rows, result.loads,
                                                   keep_links ? &result.links : nullptr);
    result.concentrations = DilutionEngine::concentrations(result.surviving_loads, receptors_);

    result.link_counts.assign(receptors_.size(), 0);
    for (std::size_t r = 0; r < adjacency_.numReceptors(); ++r) {
        std::size_t count = 0;
        for (std::size_t e = adjacency_.offsets[r]; e < adjacency_.offsets[r + 1]; ++e) {
            const std::size_t s = adjacency_.site[e];
            count += site_rows.offsets[s + 1] - site_rows.offsets[s];
        }
        result.link_counts[r] = count;
    }

    return result;
}

} // namespace FIOGT
