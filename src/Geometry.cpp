#include "Geometry.hpp"

#include <type_traits>

namespace FSPLIT {

GeometryKind geometryKind(const Geometry& geom) {
    if (std::holds_alternative<MultiPolyline>(geom)) {
        return bg::num_points(std::get<MultiPolyline>(geom)) > 0 ? GeometryKind::LINEAR
                                                                 : GeometryKind::EMPTY;
    }
    if (std::holds_alternative<MultiPolygon>(geom)) {
        return bg::num_points(std::get<MultiPolygon>(geom)) > 0 ? GeometryKind::AREAL
                                                                : GeometryKind::EMPTY;
    }
    return GeometryKind::EMPTY;
}

GeoBox envelope(const Geometry& geom) {
    GeoBox box;
    bg::assign_inverse(box);
    std::visit([&box](const auto& g) {
        using T = std::decay_t<decltype(g)>;
        if constexpr (!std::is_same_v<T, std::monostate>) {
            // Parts without points would poison the envelope; skip them
            for (const auto& part : g) {
                if (bg::num_points(part) == 0) continue;
                bg::expand(box, bg::return_envelope<GeoBox>(part));
            }
        }
    }, geom);
    return box;
}

bool intersects(const Geometry& a, const Geometry& b) {
    if (isEmpty(a) || isEmpty(b)) return false;

    return std::visit([](const auto& ga, const auto& gb) -> bool {
        using A = std::decay_t<decltype(ga)>;
        using B = std::decay_t<decltype(gb)>;
        if constexpr (std::is_same_v<A, std::monostate> || std::is_same_v<B, std::monostate>) {
            return false;
        } else {
            return bg::intersects(ga, gb);
        }
    }, a, b);
}

void forEachPoint(Geometry& geom, const std::function<void(GeoPoint&)>& fn) {
    std::visit([&fn](auto& g) {
        using T = std::decay_t<decltype(g)>;
        if constexpr (!std::is_same_v<T, std::monostate>) {
            bg::for_each_point(g, [&fn](GeoPoint& p) { fn(p); });
        }
    }, geom);
}

void correct(Geometry& geom) {
    if (auto* polys = std::get_if<MultiPolygon>(&geom)) {
        bg::correct(*polys);
    }
}

} // namespace FSPLIT
