#include "ReferenceNormalizer.hpp"

#include <utility>
#include <vector>

namespace FSPLIT {

ReferenceNormalizer::ReferenceNormalizer(ReprojectionService& service,
                                         std::string default_reference)
    : service_(service), default_reference_(normalizeReferenceId(default_reference)) {
}

SetupResult<NormalizationOutcome> ReferenceNormalizer::normalize(FeatureSet& faults,
                                                                 FeatureSet& regions) const {
    NormalizationOutcome outcome;

    if (default_reference_.empty()) {
        return SetupResult<NormalizationOutcome>::fatal("No default reference system configured");
    }

    // Region data without a recorded projection is assumed geographic
    if (!regions.hasReference()) {
        regions.setReference(default_reference_);
        outcome.region_default_assigned = true;
    }
    if (!faults.hasReference()) {
        faults.setReference(default_reference_);
        outcome.fault_default_assigned = true;
    }

    const std::string fault_ref = normalizeReferenceId(faults.getReference());
    const std::string region_ref = normalizeReferenceId(regions.getReference());
    faults.setReference(fault_ref);
    regions.setReference(region_ref);
    outcome.reference_id = fault_ref;

    if (fault_ref == region_ref) {
        return SetupResult<NormalizationOutcome>::success(std::move(outcome));
    }

    if (!service_.initialize(region_ref, fault_ref)) {
        return SetupResult<NormalizationOutcome>::fatal(
            "Cannot reproject regions from '" + region_ref + "' to fault reference '" +
            fault_ref + "': " + service_.getLastError());
    }

    std::vector<double> xs;
    std::vector<double> ys;
    for (std::size_t i = 0; i < regions.size(); ++i) {
        Geometry& geom = regions.getFeature(i).geometry;
        if (isEmpty(geom)) continue;

        xs.clear();
        ys.clear();
        forEachPoint(geom, [&](GeoPoint& p) {
            xs.push_back(p.x);
            ys.push_back(p.y);
        });

        if (!service_.transform(xs.data(), ys.data(), xs.size())) {
            return SetupResult<NormalizationOutcome>::fatal(
                "Reprojection of region #" + std::to_string(i) + " failed: " +
                service_.getLastError());
        }

        std::size_t k = 0;
        forEachPoint(geom, [&](GeoPoint& p) {
            p.x = xs[k];
            p.y = ys[k];
            ++k;
        });
        correct(geom);
        outcome.points_transformed += k;
    }

    regions.setReference(fault_ref);
    outcome.reprojected = true;
    return SetupResult<NormalizationOutcome>::success(std::move(outcome));
}

} // namespace FSPLIT
