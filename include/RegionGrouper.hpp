#ifndef REGION_GROUPER_HPP
#define REGION_GROUPER_HPP

#include "FSPLIT.hpp"
#include "Feature.hpp"
#include "SpatialJoin.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace FSPLIT {

/**
 * @brief Fields that exist only because of the join and never reach output
 */
enum class JoinArtifactField {
    LEFT_INDEX,     ///< "index_left": row reference into the fault set
    RIGHT_INDEX,    ///< "index_right": row reference into the region set
    REGION_NAME     ///< the configured region-name field
};

/**
 * @brief Field name of an artifact (REGION_NAME resolves to region_name_field)
 */
std::string joinArtifactFieldName(JoinArtifactField field, const std::string& region_name_field);

/**
 * @brief All artifact field names for the given region-name field
 */
std::vector<std::string> joinArtifactFieldNames(const std::string& region_name_field);

/**
 * @brief Faults assigned to one region identifier
 */
struct RegionGroup {
    std::string region_id;                  ///< Raw region name
    std::vector<std::size_t> fault_indices; ///< Input order, no repeats
    FeatureSet features;                    ///< Sanitized fault features
};

struct GroupingResult {
    std::vector<RegionGroup> groups;        ///< Ordered by first appearance
    std::size_t discarded_records = 0;      ///< Records dropped for invalid names
    Diagnostics diagnostics;
};

/**
 * @brief Groups join records by region name and strips join artifacts
 *
 * A region whose name value is null, blank or not text invalidates every
 * record that references it; those records are dropped with one diagnostic
 * per region and grouping continues. No other names are rejected: a name
 * made only of characters the file naming strips (e.g. "'''") forms a valid
 * group that is written under the fallback file name.
 */
class RegionGrouper {
public:
    explicit RegionGrouper(std::string region_name_field);

    /**
     * @brief Build one group per region name that received at least one fault
     * @param records join records sorted by (fault, region)
     * @throws std::invalid_argument if the region set lacks the name field
     */
    GroupingResult group(const std::vector<JoinRecord>& records,
                         const FeatureSet& faults,
                         const FeatureSet& regions) const;

    /**
     * @brief Fault schema with every join-artifact field removed
     */
    std::vector<FieldDefinition> sanitizedFields(const FeatureSet& faults) const;

private:
    std::string region_name_field_;
};

} // namespace FSPLIT

#endif // REGION_GROUPER_HPP
