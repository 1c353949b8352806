#ifndef REGION_INDEX_HPP
#define REGION_INDEX_HPP

#include "FSPLIT.hpp"
#include "Feature.hpp"

#include <boost/geometry/index/rtree.hpp>

#include <cstddef>
#include <utility>
#include <vector>

namespace FSPLIT {

/**
 * @brief R*-tree over region bounding boxes
 *
 * Built once from the normalized region set and read-only afterwards, so
 * concurrent queries are safe. Queries return a superset of the regions a
 * geometry can intersect; exact tests are the caller's job.
 */
class RegionIndex {
public:
    RegionIndex() = default;

    /**
     * @brief Bulk-load one box per non-empty region geometry
     * @param regions  normalized region set
     * @param diagnostics receives one entry per region skipped for an empty geometry
     */
    static RegionIndex build(const FeatureSet& regions, Diagnostics& diagnostics);

    /**
     * @brief Indices of regions whose box intersects the query box, ascending
     */
    std::vector<std::size_t> query(const GeoBox& box) const;

    std::size_t size() const { return tree_.size(); }
    bool empty() const { return tree_.empty(); }

private:
    using Entry = std::pair<GeoBox, std::size_t>;
    using Tree = boost::geometry::index::rtree<Entry, boost::geometry::index::rstar<16>>;

    explicit RegionIndex(std::vector<Entry> entries);

    Tree tree_;
};

} // namespace FSPLIT

#endif // REGION_INDEX_HPP
