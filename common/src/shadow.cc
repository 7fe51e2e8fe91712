#include "shadow.h"
#include "error.h"
#include "log.h"
#include "tp.h"
#include <map>

struct BucketStep {
    double upto{};
    std::string_view color{};
    double opacity{};
};

static constexpr std::array<BucketStep, 5> c_buckets{{
    {0.2, "#FFFF00", 0.7},
    {0.4, "#FFC000", 0.6},
    {0.6, "#FF8000", 0.5},
    {0.8, "#FF4000", 0.4},
    {1.0, "#FF0000", 0.3}
}};
static constexpr auto c_lit_opacity{0.8};

std::array<ep3, c_samples> Shadow::samplePoints(const SolarCell& cell) const {
    auto hw{cell.size.width / 2};
    auto hd{cell.size.depth / 2};
    auto top{cell.size.height / 2};
    // near corners at -z, far corners at +z along the tilt axis
    return {
        cell.world * ep3{0.0, top, 0.0},
        cell.world * ep3{-hw, top, -hd},
        cell.world * ep3{hw, top, -hd},
        cell.world * ep3{-hw, top, hd},
        cell.world * ep3{hw, top, hd}
    };
}

bool Shadow::blocker(const Hit& hit, int self) const {
    if (hit.id == self) return false;
    if (hit.distance <= c_ray_epsilon || hit.distance >= c_ray_range) return false;
    return hit.extent.width > c_min_blocker || hit.extent.height > c_min_blocker
        || hit.extent.depth > c_min_blocker;
}

double Shadow::sampleOcclusion(const SolarCell& cell, const SunVector& sun, const OccluderQuery& query) const {
    if (!sun.daylight) return 0.0;
    // sun behind the panel plane
    if (cell.world.linear().col(1).dot(sunDirection(sun)) <= 0.0) return 1.0;
    auto target{sunWorldPosition(sun)};
    auto blocked{0};
    for (const auto& p : samplePoints(cell)) {
        auto hits{query.castRay(p, target - p)};
        if (std::any_of(hits.begin(), hits.end(), [&](const Hit& h) { return blocker(h, cell.occluder); })) {
            ++blocked;
        }
    }
    return static_cast<double>(blocked) / c_samples;
}

ShadowBucket Shadow::classify(double intensity, std::string_view stringColor) const {
    if (intensity <= c_1e_8) {
        return ShadowBucket{0, stringColor, c_lit_opacity};
    }
    for (int i = 0; i < static_cast<int>(c_buckets.size()); ++i) {
        if (intensity <= c_buckets[i].upto + c_1e_8) {
            return ShadowBucket{i + 1, c_buckets[i].color, c_buckets[i].opacity};
        }
    }
    const auto& last = c_buckets.back();
    return ShadowBucket{static_cast<int>(c_buckets.size()), last.color, last.opacity};
}

StringShades Shadow::strings(const Cells& cells, const std::vector<double>& intensities) const {
    std::map<std::pair<int, int>, StringShade> groups;
    auto size{std::min(cells.size(), intensities.size())};
    for (size_t k = 0; k < size; ++k) {
        const auto& c = cells[k];
        auto& g = groups[{c.panel, c.string}];
        g.panel = c.panel;
        g.string = c.string;
        ++g.cells;
        g.mean += intensities[k];
        g.max = std::max(g.max, intensities[k]);
    }
    StringShades res;
    res.reserve(groups.size());
    for (auto& [_, g] : groups) {
        g.mean /= g.cells;
        res.emplace_back(g);
    }
    return res;
}

ShadowTracker::ShadowTracker(size_t cells, int interval)
    : _intensities(cells, 0.0), _interval(std::max(1, interval)) {}

bool ShadowTracker::due(long long tick, size_t cell) const {
    if (_interval <= 1) return true;
    auto r{(tick + static_cast<long long>(cell)) % _interval};
    return r == 0;
}

size_t ShadowTracker::tick(long long tick, const SunVector& sun, const Cells& cells,
    const OccluderQuery& query, bool mt) {
    if (_intensities.size() != cells.size()) {
        _intensities.assign(cells.size(), 0.0);
    }
    if (!sun.daylight) {
        std::fill(_intensities.begin(), _intensities.end(), 0.0);
        return cells.size();
    }
    std::vector<size_t> sampled(_ghc, 0);
    std::vector<size_t> failed(_ghc, 0);
    auto f = [&](int th, int begin, int end) {
        for (int k = begin; k < end; ++k) {
            if (!due(tick, k)) continue;
            try {
                _intensities[k] = g_shadow.sampleOcclusion(cells[k], sun, query);
                ++sampled[th];
            } catch (const OcclusionQueryUnavailable& e) {
                ++failed[th];
                glog.dbg("tick {} cell {}: {}", tick, k, e.what());
            }
        }
    };
    if (mt) {
        asyncF(f, cells.size());
    } else {
        f(0, 0, static_cast<int>(cells.size()));
    }
    size_t n{};
    for (auto s : sampled) n += s;
    for (auto s : failed) _unavailable += s;
    return n;
}
