#pragma once
#ifndef _EIGEN_
#define _EIGEN_
#define EIGEN_NO_DEBUG
#include <Eigen/Dense>
#include <Eigen/Geometry>
#include <array>
#include <cmath>
#include <limits>
#include <vector>
#include "const_.h"
using ep3 = Eigen::Vector3d;
using epts = std::vector<ep3>;
using ep2 = Eigen::Vector2d;
using e_rmat = Eigen::Matrix3d;
using e_iso = Eigen::Isometry3d;
using e_box = Eigen::AlignedBox3d;

inline double deg2rad(double deg) {
    static constexpr auto c_d2r{c_pi / 180.0};
    return deg * c_d2r;
}

inline double rad2deg(double rad) {
    static constexpr auto c_r2d{180.0 / c_pi};
    return rad * c_r2d;
}

inline double div_s(double x, double y) {
    return (y > -c_1e_8 && y < c_1e_8) ? 0.0 : x / y;
}

inline bool e_p_equal(const auto& p1, const auto& p2, int axis = 3, double prec = 1e-6) {
    for (int i = 0; i < axis; ++i) {
        if (std::abs(p1(i) - p2(i)) > prec) return false;
    }
    return true;
}

// three.js order: R = Rx * Ry * Rz
inline e_rmat e_euler(const ep3& xyz) {
    e_rmat r{Eigen::AngleAxisd(xyz(0), ep3::UnitX())
        * Eigen::AngleAxisd(xyz(1), ep3::UnitY())
        * Eigen::AngleAxisd(xyz(2), ep3::UnitZ())};
    return r;
}

inline ep3 e_euler_of(const e_rmat& m) {
    ep3 xyz;
    auto m13{std::max(-1.0, std::min(1.0, m(0, 2)))};
    xyz(1) = std::asin(m13);
    if (std::abs(m13) < 1.0 - c_1e_8) {
        xyz(0) = std::atan2(-m(1, 2), m(2, 2));
        xyz(2) = std::atan2(-m(0, 1), m(0, 0));
    } else {
        xyz(0) = std::atan2(m(2, 1), m(1, 1));
        xyz(2) = 0.0;
    }
    return xyz;
}

inline e_iso e_transform(const ep3& pos, const e_rmat& rot) {
    e_iso t{e_iso::Identity()};
    t.translate(pos);
    t.rotate(rot);
    return t;
}

// slab test against an axis aligned box centred at the origin
inline bool e_ray_box(const ep3& o, const ep3& d, const ep3& half, double& tmin, double& tmax) {
    tmin = -std::numeric_limits<double>::infinity();
    tmax = std::numeric_limits<double>::infinity();
    for (int i = 0; i < 3; ++i) {
        if (std::abs(d(i)) < c_1e_8) {
            if (o(i) < -half(i) || o(i) > half(i)) return false;
            continue;
        }
        auto t1{(-half(i) - o(i)) / d(i)};
        auto t2{(half(i) - o(i)) / d(i)};
        if (t1 > t2) std::swap(t1, t2);
        tmin = std::max(tmin, t1);
        tmax = std::min(tmax, t2);
        if (tmin > tmax) return false;
    }
    return tmax >= 0.0;
}
#endif
