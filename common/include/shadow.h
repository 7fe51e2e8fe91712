#pragma once
#ifndef _SHADOW_
#define _SHADOW_
#include "scene.h"
#include "solar.h"
#include <string_view>

struct ShadowBucket {
    int level{};
    std::string_view color{};
    double opacity{};
};

struct StringShade {
    int panel{};
    int string{};
    int cells{};
    double mean{};
    double max{};
};
using StringShades = std::vector<StringShade>;

class Shadow {
public:
    Shadow() = default;

    // centre, then the two near and the two far corners of the top face
    std::array<ep3, c_samples> samplePoints(const SolarCell& cell) const;

    bool blocker(const Hit& hit, int self) const;

    // blocked samples / c_samples, 0 when the sun is down
    double sampleOcclusion(const SolarCell& cell, const SunVector& sun, const OccluderQuery& query) const;

    ShadowBucket classify(double intensity, std::string_view stringColor) const;

    StringShades strings(const Cells& cells, const std::vector<double>& intensities) const;
};
static const Shadow g_shadow;

// last intensity per cell, cell k is sampled on ticks where (tick + k) % interval == 0
class ShadowTracker {
public:
    explicit ShadowTracker(size_t cells, int interval = 1);

    bool due(long long tick, size_t cell) const;

    // returns the number of cells sampled on this tick
    size_t tick(long long tick, const SunVector& sun, const Cells& cells, const OccluderQuery& query, bool mt = false);

    const std::vector<double>& intensities() const { return _intensities; }
    double intensity(size_t cell) const { return _intensities.at(cell); }
    int interval() const { return _interval; }
    size_t unavailable() const { return _unavailable; }
private:
    std::vector<double> _intensities;
    int _interval{1};
    size_t _unavailable{};
};
#endif
