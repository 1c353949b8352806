#ifndef FSPLIT_HPP
#define FSPLIT_HPP

#include <petsc.h>

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace FSPLIT {

// Forward declarations
class FeatureSet;
class RegionIndex;
class SpatialJoinEngine;
class RegionGrouper;
class FaultPartitioner;

constexpr const char* FSPLIT_VERSION = "1.0.0";

/**
 * @brief Per-record problems collected while a stage keeps running
 */
using Diagnostics = std::vector<std::string>;

/**
 * @brief Run configuration for a partitioning pass
 *
 * Passed by value into FaultPartitioner; nothing here is process-wide.
 */
struct PartitionConfig {
    // Inputs
    std::string faults_path;
    std::string regions_path;
    bool restore_shx = true;            ///< Let GDAL rebuild a missing shapefile .shx

    // Regions
    std::string region_name_field = "NAME_EN";
    std::string default_crs = "EPSG:4326";  ///< Assigned when a dataset carries no CRS

    // Output
    std::string output_dir;
    std::string file_prefix = "faults_";
    std::string output_driver = "GeoJSON";
    std::string file_extension = ".geojson";

    // Run control
    int progress_interval = 10;         ///< Join progress report step in percent (0 = off)
};

/**
 * @brief Outcome of a setup stage: either a value or a fatal error message
 *
 * Setup stages (loading, CRS normalization, field validation) cannot be
 * retried; a fatal result aborts the run and carries enough context to fix
 * the configuration.
 */
template <typename T>
class SetupResult {
public:
    static SetupResult success(T value) {
        SetupResult result;
        result.value_ = std::move(value);
        return result;
    }

    static SetupResult fatal(std::string message) {
        SetupResult result;
        result.error_ = std::move(message);
        return result;
    }

    bool ok() const { return value_.has_value(); }
    explicit operator bool() const { return ok(); }

    const T& value() const {
        if (!value_) throw std::logic_error("SetupResult has no value: " + error_);
        return *value_;
    }

    T& value() {
        if (!value_) throw std::logic_error("SetupResult has no value: " + error_);
        return *value_;
    }

    const std::string& error() const { return error_; }

private:
    SetupResult() = default;

    std::optional<T> value_;
    std::string error_;
};

} // namespace FSPLIT

#endif // FSPLIT_HPP
