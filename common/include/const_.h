#pragma once
#ifndef _CONSTANTS_
#define _CONSTANTS_
#include <cstddef>
static constexpr auto c_1e_8{1e-8};
static constexpr auto c_1e_6{1e-6};
static constexpr auto c_pi{3.14159265358979323846};
static constexpr auto c_declination{2.0 * c_pi / 365.0};

static constexpr auto c_sun_distance{1000.0};  // m, rays effectively parallel
static constexpr auto c_ray_epsilon{0.1};      // m, self intersection noise
static constexpr auto c_ray_range{50.0};       // m
static constexpr auto c_min_blocker{0.2};      // m, in at least one dimension
static constexpr int c_samples{5};             // centre + 4 corners

static constexpr auto c_cell_thickness{0.005};
static constexpr auto c_cell_lift{0.002};
static constexpr auto c_cell_fill{0.95};
static constexpr auto c_connector_width{0.08};
static constexpr auto c_default_mount_offset{0.05};
static constexpr auto c_footprint_tol{1e-3};   // m2

enum enOrientation : int {
    c_landscape,
    c_portrait
};

enum enOccluderKind : int {
    c_occ_house,
    c_occ_roof,
    c_occ_parapet,
    c_occ_object,
    c_occ_platform,
    c_occ_panel,
    c_occ_connector,
    c_occ_cell
};
#endif
