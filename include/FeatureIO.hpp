#ifndef FEATURE_IO_HPP
#define FEATURE_IO_HPP

#include "FSPLIT.hpp"
#include "Feature.hpp"

#include <string>

namespace FSPLIT {

/**
 * @brief Source of feature sets (one dataset per path)
 */
class FeatureSetReader {
public:
    virtual ~FeatureSetReader() = default;

    /**
     * @brief Load every feature of the dataset at path
     * @return the feature set, or a fatal error naming the path
     */
    virtual SetupResult<FeatureSet> load(const std::string& path) = 0;
};

/**
 * @brief Sink for per-region feature sets
 */
class FeatureSetWriter {
public:
    virtual ~FeatureSetWriter() = default;

    /**
     * @brief Write the feature set to path, replacing any existing file
     * @return false on failure (see getLastError)
     */
    virtual bool write(const std::string& path, const FeatureSet& features) = 0;

    virtual const std::string& getLastError() const = 0;
};

/**
 * @brief Reads the first layer of any OGR vector dataset (GeoJSON, Shapefile, ...)
 *
 * LineString/MultiLineString become MultiPolyline, Polygon/MultiPolygon become
 * MultiPolygon (orientation corrected). Curved types are linearized; other
 * geometry types load as empty geometries. The layer CRS is reported as
 * "AUTH:CODE" when identifiable, WKT otherwise, and empty when undeclared.
 */
class OGRFeatureSetReader : public FeatureSetReader {
public:
    explicit OGRFeatureSetReader(bool restore_shx = true);

    SetupResult<FeatureSet> load(const std::string& path) override;

private:
    bool restore_shx_;
};

/**
 * @brief Writes a feature set as a single-layer OGR dataset
 */
class OGRFeatureSetWriter : public FeatureSetWriter {
public:
    explicit OGRFeatureSetWriter(std::string driver_name = "GeoJSON");

    bool write(const std::string& path, const FeatureSet& features) override;

    const std::string& getLastError() const override { return last_error_; }

private:
    std::string driver_name_;
    std::string last_error_;
};

} // namespace FSPLIT

#endif // FEATURE_IO_HPP
