#pragma once
#ifndef _BOOST_GEOMETRY_H_
#define _BOOST_GEOMETRY_H_
#include <boost/geometry.hpp>
#include <boost/geometry/geometries/geometries.hpp>
#include <vector>
using bg_point = boost::geometry::model::d2::point_xy<double>;
using bg_polygon = boost::geometry::model::polygon<bg_point, false, false>;
using bg_box = boost::geometry::model::box<bg_point>;
using Polys = std::vector<bg_polygon>;

inline bg_polygon rectPoly(const std::vector<bg_point>& corners) {
    bg_polygon poly;
    poly.outer().assign(corners.begin(), corners.end());
    if (!boost::geometry::is_valid(poly)) {
        boost::geometry::correct(poly);
    }
    return poly;
}

inline bg_polygon boxPoly(double x0, double y0, double x1, double y1) {
    return rectPoly({bg_point{x0, y0}, bg_point{x1, y0}, bg_point{x1, y1}, bg_point{x0, y1}});
}

inline double polysArea(const Polys& polys) {
    auto area{0.0};
    for (auto& p : polys) {
        area += std::abs(boost::geometry::area(p));
    }
    return area;
}

inline bool intersectArea(const bg_polygon& poly1, const bg_polygon& poly2, double& area) {
    Polys out;
    if (boost::geometry::intersection(poly1, poly2, out) && !out.empty()) {
        area += polysArea(out);
        return true;
    }
    return false;
}

inline double intersectArea(const bg_polygon& poly, const Polys& polys) {
    auto area{0.0};
    for (auto& p : polys) {
        intersectArea(poly, p, area);
    }
    return area;
}

// covered up to a small tolerance, edges touching the outline count as inside
inline bool coveredBy(const bg_polygon& poly, const bg_polygon& outline, double tol) {
    auto area{std::abs(boost::geometry::area(poly))};
    auto inside{0.0};
    intersectArea(poly, outline, inside);
    return area - inside <= tol;
}
#endif
