/**
 * @file TestHelpers.hpp
 * @brief Geometry builders and in-memory collaborators shared by the tests
 */

#ifndef FSPLIT_TEST_HELPERS_HPP
#define FSPLIT_TEST_HELPERS_HPP

#include "FSPLIT.hpp"
#include "CoordinateSystem.hpp"
#include "Feature.hpp"
#include "FeatureIO.hpp"
#include "Geometry.hpp"

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace FSPLIT {
namespace test {

/**
 * @brief Straight fault trace from (x0, y0) to (x1, y1)
 */
inline Geometry makeLine(double x0, double y0, double x1, double y1) {
    Polyline line;
    line.push_back(GeoPoint(x0, y0));
    line.push_back(GeoPoint(x1, y1));
    MultiPolyline ml;
    ml.push_back(line);
    return ml;
}

/**
 * @brief Axis-aligned square region
 */
inline Geometry makeBox(double xmin, double ymin, double xmax, double ymax) {
    Polygon poly;
    auto& ring = poly.outer();
    ring.push_back(GeoPoint(xmin, ymin));
    ring.push_back(GeoPoint(xmin, ymax));
    ring.push_back(GeoPoint(xmax, ymax));
    ring.push_back(GeoPoint(xmax, ymin));
    ring.push_back(GeoPoint(xmin, ymin));
    MultiPolygon mp;
    mp.push_back(poly);
    Geometry geom = mp;
    correct(geom);
    return geom;
}

/**
 * @brief Fault schema with a name, a slip rate and a left-over join artifact
 */
inline FeatureSet makeFaultSet() {
    return FeatureSet({FieldDefinition("name", FieldType::TEXT),
                       FieldDefinition("slip_rate", FieldType::REAL),
                       FieldDefinition("index_right", FieldType::INTEGER)});
}

inline void addFault(FeatureSet& faults, const std::string& name, Geometry geom,
                     double slip_rate = 1.0) {
    Feature f;
    f.geometry = std::move(geom);
    f.values = {AttributeValue(name), AttributeValue(slip_rate),
                AttributeValue(std::int64_t(7))};
    faults.addFeature(std::move(f));
}

inline FeatureSet makeRegionSet(const std::string& name_field = "NAME_EN") {
    return FeatureSet({FieldDefinition("ISO_A3", FieldType::TEXT),
                       FieldDefinition(name_field, FieldType::TEXT)});
}

inline void addRegion(FeatureSet& regions, AttributeValue name, Geometry geom,
                      const std::string& iso = "XXX") {
    Feature f;
    f.geometry = std::move(geom);
    f.values = {AttributeValue(iso), std::move(name)};
    regions.addFeature(std::move(f));
}

/**
 * @brief Text value of a named field
 */
inline std::string textField(const FeatureSet& set, std::size_t feature, const std::string& field) {
    auto idx = set.findField(field);
    if (!idx) return "";
    const auto* s = std::get_if<std::string>(&set.getFeature(feature).values[*idx]);
    return s ? *s : "";
}

inline std::vector<std::string> faultNames(const FeatureSet& set) {
    std::vector<std::string> names;
    for (std::size_t i = 0; i < set.size(); ++i) {
        names.push_back(textField(set, i, "name"));
    }
    return names;
}

/**
 * @brief Reader serving prepared feature sets by path
 */
class MemoryReader : public FeatureSetReader {
public:
    void add(const std::string& path, FeatureSet set) { sets_[path] = std::move(set); }

    SetupResult<FeatureSet> load(const std::string& path) override {
        auto it = sets_.find(path);
        if (it == sets_.end()) {
            return SetupResult<FeatureSet>::fatal("no such dataset");
        }
        return SetupResult<FeatureSet>::success(it->second);
    }

private:
    std::map<std::string, FeatureSet> sets_;
};

/**
 * @brief Writer keeping every written set in memory; chosen paths fail
 */
class MemoryWriter : public FeatureSetWriter {
public:
    void failOn(const std::string& path) { failing_.insert(path); }

    bool write(const std::string& path, const FeatureSet& features) override {
        if (failing_.count(path)) {
            last_error_ = "disk full";
            return false;
        }
        written[path] = features;
        order.push_back(path);
        return true;
    }

    const std::string& getLastError() const override { return last_error_; }

    std::map<std::string, FeatureSet> written;
    std::vector<std::string> order;

private:
    std::set<std::string> failing_;
    std::string last_error_;
};

/**
 * @brief Reprojection that shifts points by a fixed offset
 *
 * Only identifiers listed as known resolve; "EPSG:0" style unknowns fail.
 */
class OffsetReprojection : public ReprojectionService {
public:
    OffsetReprojection(double dx = 0.0, double dy = 0.0) : dx_(dx), dy_(dy) {}

    void addKnown(const std::string& id) { known_.insert(id); }

    bool initialize(const std::string& source_id, const std::string& target_id) override {
        ++initialize_calls;
        last_source = source_id;
        last_target = target_id;
        if (!known_.count(source_id) || !known_.count(target_id)) {
            last_error_ = "unknown reference";
            return false;
        }
        return true;
    }

    bool transform(double* x, double* y, size_t n) const override {
        for (size_t i = 0; i < n; ++i) {
            x[i] += dx_;
            y[i] += dy_;
        }
        return true;
    }

    const std::string& getLastError() const override { return last_error_; }

    int initialize_calls = 0;
    std::string last_source;
    std::string last_target;

private:
    double dx_;
    double dy_;
    std::set<std::string> known_;
    std::string last_error_;
};

} // namespace test
} // namespace FSPLIT

#endif // FSPLIT_TEST_HELPERS_HPP
