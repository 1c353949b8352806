#ifndef REFERENCE_NORMALIZER_HPP
#define REFERENCE_NORMALIZER_HPP

#include "FSPLIT.hpp"
#include "CoordinateSystem.hpp"
#include "Feature.hpp"

#include <cstddef>
#include <string>

namespace FSPLIT {

/**
 * @brief What the normalizer did to bring both sets into one frame
 */
struct NormalizationOutcome {
    std::string reference_id;           ///< Shared identifier after normalization
    bool fault_default_assigned = false;
    bool region_default_assigned = false;
    bool reprojected = false;           ///< Region geometries were transformed
    std::size_t points_transformed = 0;
};

/**
 * @brief Brings fault and region sets into one reference system
 *
 * Faults are authoritative: when the identifiers differ, every region
 * geometry is reprojected into the fault reference, once. A set without a
 * declared reference is assigned the default (geographic WGS84 unless
 * configured otherwise) before the comparison.
 */
class ReferenceNormalizer {
public:
    explicit ReferenceNormalizer(ReprojectionService& service,
                                 std::string default_reference = CRS::WGS84);

    /**
     * @brief Normalize both sets in place
     * @return the outcome, or a fatal error if the reference pair cannot be
     *         resolved or a region coordinate fails to transform
     */
    SetupResult<NormalizationOutcome> normalize(FeatureSet& faults, FeatureSet& regions) const;

private:
    ReprojectionService& service_;
    std::string default_reference_;
};

} // namespace FSPLIT

#endif // REFERENCE_NORMALIZER_HPP
