#ifndef GEOMETRY_HPP
#define GEOMETRY_HPP

#include "CoordinateSystem.hpp"

#include <boost/geometry.hpp>
#include <boost/geometry/geometries/register/point.hpp>

#include <cstddef>
#include <functional>
#include <variant>

// GeoPoint doubles as the Boost.Geometry point type (planar x/y, z ignored)
BOOST_GEOMETRY_REGISTER_POINT_2D(FSPLIT::GeoPoint, double, boost::geometry::cs::cartesian, x, y)

namespace FSPLIT {

namespace bg = boost::geometry;

using GeoBox = bg::model::box<GeoPoint>;
using Polyline = bg::model::linestring<GeoPoint>;
using MultiPolyline = bg::model::multi_linestring<Polyline>;
using Polygon = bg::model::polygon<GeoPoint>;           ///< clockwise outer ring, closed
using MultiPolygon = bg::model::multi_polygon<Polygon>;

/**
 * @brief Feature geometry: nothing, a (multi)polyline or a (multi)polygon
 *
 * Single linestrings and polygons are stored as one-part multi geometries.
 */
using Geometry = std::variant<std::monostate, MultiPolyline, MultiPolygon>;

enum class GeometryKind {
    EMPTY,
    LINEAR,
    AREAL
};

/**
 * @brief Kind of the stored geometry; a multi geometry without points is EMPTY
 */
GeometryKind geometryKind(const Geometry& geom);

inline bool isEmpty(const Geometry& geom) {
    return geometryKind(geom) == GeometryKind::EMPTY;
}

/**
 * @brief Axis-aligned bounding box. Precondition: geometry is not empty.
 */
GeoBox envelope(const Geometry& geom);

/**
 * @brief True iff the geometries share at least one point
 *
 * Boundary contact and full containment both count. Empty geometries never
 * intersect anything.
 */
bool intersects(const Geometry& a, const Geometry& b);

/**
 * @brief Visit every vertex of the geometry
 */
void forEachPoint(Geometry& geom, const std::function<void(GeoPoint&)>& fn);

/**
 * @brief Fix ring orientation and closure so polygons follow the model's convention
 */
void correct(Geometry& geom);

} // namespace FSPLIT

#endif // GEOMETRY_HPP
