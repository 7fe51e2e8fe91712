#include "scene.h"
#include "error.h"
#include "log.h"
#include <format>

e_iso HouseSpec::frame() const {
    return e_transform(centerToEdge(ep3::Zero(), Dimensions{width, 0.0, depth}), e_euler(ep3{0.0, deg2rad(rotationFromNorth), 0.0}));
}

bg_polygon HouseSpec::roofOutline() const {
    return boxPoly(0.0, 0.0, roofWidth, roofDepth);
}

int BoxScene::add(int kind, const std::string& name, const e_iso& pose, const Dimensions& size) {
    if (_sealed) {
        throw std::logic_error(std::format("scene sealed, cannot add {}", name));
    }
    Occluder o;
    o.id = static_cast<int>(_occs.size());
    o.kind = kind;
    o.name = name;
    o.size = size;
    o.pose = pose;
    o.inv = pose.inverse(Eigen::Isometry);
    ep3 half{size.vec() * 0.5};
    for (int i = 0; i < 8; ++i) {
        ep3 c{(i & 1) ? half.x() : -half.x(), (i & 2) ? half.y() : -half.y(), (i & 4) ? half.z() : -half.z()};
        o.bounds.extend(pose * c);
    }
    _occs.emplace_back(std::move(o));
    return _occs.back().id;
}

void BoxScene::seal() {
    _sealed = true;
    glog.dbg("scene sealed with {} occluders", _occs.size());
}

Hits BoxScene::castRay(const ep3& origin, const ep3& direction) const {
    if (!_sealed) {
        throw OcclusionQueryUnavailable("scene is not initialized");
    }
    Hits hits;
    auto n{direction.norm()};
    if (n < c_1e_8) return hits;
    ep3 d{direction / n};
    for (const auto& o : _occs) {
        auto tmin{0.0};
        auto tmax{0.0};
        ep3 half{o.bounds.sizes() * 0.5};
        if (!e_ray_box(origin - o.bounds.center(), d, half, tmin, tmax)) continue;
        if (!e_ray_box(o.inv * origin, o.inv.linear() * d, o.size.vec() * 0.5, tmin, tmax)) continue;
        // an origin inside the box, or one touching the face it enters, reports the exit
        hits.emplace_back(Hit{o.id, tmin >= c_ray_epsilon ? tmin : tmax, o.size});
    }
    std::sort(hits.begin(), hits.end(), [](const Hit& a, const Hit& b) {
        return a.distance < b.distance;
    });
    return hits;
}

void BoxScene::addHouse(const HouseSpec& house) {
    auto frame{house.frame()};
    auto box = [&](int kind, const std::string& name, const ep3& edge, const Dimensions& dim) {
        if (dim.width <= 0.0 || dim.height <= 0.0 || dim.depth <= 0.0) return;
        add(kind, name, frame * e_transform(edgeToCenter(edge, dim), e_rmat::Identity()), dim);
    };
    box(c_occ_house, "house", ep3::Zero(), Dimensions{house.width, house.height, house.depth});
    box(c_occ_roof, "roof", ep3{0.0, house.height, 0.0},
        Dimensions{house.roofWidth, house.roofThickness, house.roofDepth});

    auto top{house.roofTop()};
    auto pw{house.parapetWidth};
    auto ph{house.parapetHeight};
    auto west{house.parapet("west") ? pw : 0.0};
    auto east{house.parapet("east") ? pw : 0.0};
    auto along{house.roofWidth - west - east};
    if (house.parapet("north")) {
        box(c_occ_parapet, "parapet-north", ep3{west, top, 0.0}, Dimensions{along, ph, pw});
    }
    if (house.parapet("south")) {
        box(c_occ_parapet, "parapet-south", ep3{west, top, house.roofDepth - pw}, Dimensions{along, ph, pw});
    }
    if (west > 0.0) {
        box(c_occ_parapet, "parapet-west", ep3{0.0, top, 0.0}, Dimensions{pw, ph, house.roofDepth});
    }
    if (east > 0.0) {
        box(c_occ_parapet, "parapet-east", ep3{house.roofWidth - pw, top, 0.0}, Dimensions{pw, ph, house.roofDepth});
    }

    for (const auto& obj : house.objects) {
        ep3 edge{obj.position.x(), top + obj.position.y(), obj.position.z()};
        box(c_occ_object, obj.id, edge, obj.size);
        if (obj.pipe) {
            ep3 pedge{edge + obj.pipeOffset + ep3{0.0, obj.size.height, 0.0}};
            box(c_occ_object, obj.id + "-pipe", pedge, Dimensions{obj.pipeDiameter, obj.pipeHeight, obj.pipeDiameter});
        }
    }
}

void BoxScene::addLayout(const LayoutResult& res) {
    for (const auto& p : res.panels) {
        auto prefix{std::format("{}-r{}-c{}", p.installation, p.row, p.column)};
        add(c_occ_platform, prefix + "/platform", p.platform.world, p.platform.size);
        add(c_occ_panel, prefix + "/panel", p.panel.world, p.panel.size);
    }
    for (const auto& c : res.connectors) {
        add(c_occ_connector, std::format("{}-r{}/connector-{}", c.installation, c.row, c.left ? "left" : "right"),
            c.box.world, c.box.size);
    }
}

void BoxScene::addCells(Cells& cells, const LayoutResult& res) {
    for (auto& c : cells) {
        c.occluder = add(c_occ_cell, g_cells.name(res, c), c.world, c.size);
    }
}
