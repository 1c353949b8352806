#ifndef COORDINATE_SYSTEM_HPP
#define COORDINATE_SYSTEM_HPP

#include <cstddef>
#include <string>
#include <vector>

// Forward declaration for PROJ types (avoid including proj.h in header)
struct PJconsts;
typedef struct PJconsts PJ;
struct pj_ctx;
typedef struct pj_ctx PJ_CONTEXT;

namespace FSPLIT {

/**
 * @brief 2D point with optional elevation
 */
struct GeoPoint {
    double x;       ///< X coordinate (easting/longitude)
    double y;       ///< Y coordinate (northing/latitude)
    double z;       ///< Z coordinate (elevation/depth)

    GeoPoint() : x(0), y(0), z(0) {}
    GeoPoint(double xx, double yy, double zz = 0) : x(xx), y(yy), z(zz) {}
};

/**
 * @brief Coordinate Reference System definition
 *
 * A dataset declares its CRS through one opaque identifier string. Depending
 * on its form it is kept as an authority code, a PROJ string or WKT.
 */
struct CRSDefinition {
    std::string epsg_code;      ///< Authority code (e.g., "EPSG:4326")
    std::string proj_string;    ///< PROJ string (alternative to EPSG)
    std::string wkt;            ///< WKT definition (alternative)

    bool empty() const { return epsg_code.empty() && proj_string.empty() && wkt.empty(); }

    /**
     * @brief Identifier handed to PROJ
     */
    const std::string& identifier() const;

    /**
     * @brief Classify an identifier string into one of the three forms
     */
    static CRSDefinition fromIdentifier(const std::string& id);
};

/**
 * @brief Canonical form of a reference identifier
 *
 * Trims whitespace, upper-cases the authority of "auth:code" identifiers and
 * prefixes bare numeric codes with "EPSG:". PROJ strings and WKT are returned
 * trimmed but otherwise untouched. Two datasets share a reference frame iff
 * their normalized identifiers compare equal.
 */
std::string normalizeReferenceId(const std::string& id);

/**
 * @brief Point reprojection between two reference systems
 *
 * Used by the reference normalizer once per region geometry.
 */
class ReprojectionService {
public:
    virtual ~ReprojectionService() = default;

    /**
     * @brief Resolve both identifiers into a usable transformation
     * @return false if either identifier cannot be resolved (see getLastError)
     */
    virtual bool initialize(const std::string& source_id, const std::string& target_id) = 0;

    /**
     * @brief Transform coordinate arrays in place
     * @return false if any point failed to transform
     */
    virtual bool transform(double* x, double* y, size_t n) const = 0;

    virtual const std::string& getLastError() const = 0;
};

/**
 * @brief Coordinate transformation between CRS using PROJ library
 *
 * Supports EPSG codes, PROJ strings and WKT definitions. Output axis order is
 * always easting/longitude first, matching the order GDAL hands out.
 *
 * Usage:
 * @code
 * CoordinateTransformer transformer;
 * if (transformer.initialize("EPSG:4326", "EPSG:3857")) {
 *     double x[] = {-122.4194};   // San Francisco
 *     double y[] = {37.7749};
 *     transformer.transform(x, y, 1);
 * }
 * @endcode
 */
class CoordinateTransformer : public ReprojectionService {
public:
    CoordinateTransformer();
    ~CoordinateTransformer() override;

    // Disable copy (PROJ handles are not copyable)
    CoordinateTransformer(const CoordinateTransformer&) = delete;
    CoordinateTransformer& operator=(const CoordinateTransformer&) = delete;

    // Move semantics
    CoordinateTransformer(CoordinateTransformer&& other) noexcept;
    CoordinateTransformer& operator=(CoordinateTransformer&& other) noexcept;

    // =========================================================================
    // CRS Configuration
    // =========================================================================

    /**
     * @brief Set source CRS from any supported identifier form
     */
    void setSourceCRS(const std::string& id);

    /**
     * @brief Set target CRS from any supported identifier form
     */
    void setTargetCRS(const std::string& id);

    // =========================================================================
    // Transformation Methods
    // =========================================================================

    /**
     * @brief Build the transformation pipeline for the configured CRS pair
     * @return true if transformation is ready
     */
    bool initialize();

    bool initialize(const std::string& source_id, const std::string& target_id) override;

    bool transform(double* x, double* y, size_t n) const override;

    // =========================================================================
    // Query Methods
    // =========================================================================

    const std::string& getLastError() const override { return last_error_; }

    /**
     * @brief Get PROJ library version
     */
    static std::string getProjVersion();

private:
    CRSDefinition source_crs_;
    CRSDefinition target_crs_;

    // PROJ handles (opaque pointers)
    PJ_CONTEXT* ctx_;
    PJ* transform_;

    bool is_valid_;
    mutable std::string last_error_;

    void cleanup();
};

/**
 * @brief Common CRS definitions
 */
namespace CRS {
    const std::string WGS84 = "EPSG:4326";           ///< WGS 84 (GPS standard)
}

} // namespace FSPLIT

#endif // COORDINATE_SYSTEM_HPP
