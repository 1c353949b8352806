#include "RegionIndex.hpp"

#include <algorithm>
#include <iterator>
#include <string>
#include <utility>

namespace FSPLIT {

namespace bgi = boost::geometry::index;

RegionIndex::RegionIndex(std::vector<Entry> entries)
    : tree_(entries.begin(), entries.end()) {
}

RegionIndex RegionIndex::build(const FeatureSet& regions, Diagnostics& diagnostics) {
    std::vector<Entry> entries;
    entries.reserve(regions.size());

    for (std::size_t i = 0; i < regions.size(); ++i) {
        const Geometry& geom = regions.getFeature(i).geometry;
        if (isEmpty(geom)) {
            diagnostics.push_back("Region #" + std::to_string(i) +
                                  " has no usable geometry and cannot receive faults");
            continue;
        }
        entries.emplace_back(envelope(geom), i);
    }

    // Packing constructor does the bulk load
    return RegionIndex(std::move(entries));
}

std::vector<std::size_t> RegionIndex::query(const GeoBox& box) const {
    std::vector<Entry> hits;
    tree_.query(bgi::intersects(box), std::back_inserter(hits));

    std::vector<std::size_t> result;
    result.reserve(hits.size());
    for (const auto& hit : hits) {
        result.push_back(hit.second);
    }
    std::sort(result.begin(), result.end());
    return result;
}

} // namespace FSPLIT
