#ifndef SPATIAL_JOIN_HPP
#define SPATIAL_JOIN_HPP

#include "FSPLIT.hpp"
#include "Feature.hpp"
#include "RegionIndex.hpp"

#include <mpi.h>

#include <cstddef>
#include <string>
#include <vector>

namespace FSPLIT {

/**
 * @brief One (fault, region) pair whose geometries intersect
 */
struct JoinRecord {
    std::size_t fault_index;
    std::size_t region_index;

    bool operator==(const JoinRecord& other) const {
        return fault_index == other.fault_index && region_index == other.region_index;
    }
    bool operator<(const JoinRecord& other) const {
        if (fault_index != other.fault_index) return fault_index < other.fault_index;
        return region_index < other.region_index;
    }
};

struct JoinResult {
    std::vector<JoinRecord> records;        ///< Sorted by (fault, region)
    std::vector<std::size_t> skipped_faults; ///< Faults without usable geometry
    std::size_t faults_examined = 0;
    std::size_t unassigned_faults = 0;      ///< Valid faults that hit no region
    std::size_t candidate_tests = 0;        ///< Exact predicate evaluations
};

/**
 * @brief Progress line for a join over `total` faults of which `done` are finished
 *
 * Progress is printed by rank 0 and covers only its own block, so with more
 * than one rank the line says so.
 */
std::string formatJoinProgress(int percent, std::size_t done, std::size_t total, int nranks);

/**
 * @brief Intersection join of faults against an indexed region set
 *
 * The engine takes ownership of the region index for its lifetime. With more
 * than one rank in the communicator each rank joins a contiguous block of
 * faults and the records are gathered on rank 0, sorted into the same order a
 * single-rank run produces. Non-root ranks receive an empty record list.
 */
class SpatialJoinEngine {
public:
    SpatialJoinEngine(MPI_Comm comm, RegionIndex index);

    /**
     * @brief Report progress every `percent` percent of the local block (0 disables)
     */
    void setProgressInterval(int percent) { progress_interval_ = percent; }

    /**
     * @brief Join every fault against the indexed regions
     *
     * Collective over the communicator.
     */
    JoinResult join(const FeatureSet& faults, const FeatureSet& regions) const;

    /**
     * @brief Join faults [begin, end) on the calling rank only
     */
    JoinResult joinRange(const FeatureSet& faults, const FeatureSet& regions,
                         std::size_t begin, std::size_t end) const;

private:
    MPI_Comm comm_;
    int rank_;
    int size_;
    RegionIndex index_;
    int progress_interval_;

    void gatherToRoot(JoinResult& result) const;
};

} // namespace FSPLIT

#endif // SPATIAL_JOIN_HPP
