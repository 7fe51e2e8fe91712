#include "layout.h"
#include "error.h"
#include "log.h"
#include <format>

static constexpr std::array<std::string_view, 2> c_orientation_names{"landscape", "portrait"};

int orientationOf(std::string_view name) {
    for (int i = 0; i < static_cast<int>(c_orientation_names.size()); ++i) {
        if (c_orientation_names[i] == name) return i;
    }
    return -1;
}

std::string_view orientationName(int orientation) {
    return c_orientation_names.at(orientation == c_portrait ? c_portrait : c_landscape);
}

void LayoutResult::append(LayoutResult&& other) {
    panels.insert(panels.end(), std::make_move_iterator(other.panels.begin()),
        std::make_move_iterator(other.panels.end()));
    connectors.insert(connectors.end(), std::make_move_iterator(other.connectors.begin()),
        std::make_move_iterator(other.connectors.end()));
    spacings.insert(spacings.end(), other.spacings.begin(), other.spacings.end());
}

Spacing calculateSpacing(const PanelSpec& panel, const PlatformSpec& platform, double connector) {
    auto beta{deg2rad(platform.tilt)};
    auto portrait{platform.orientation == c_portrait};
    Spacing s;
    s.tiltAxis = portrait ? panel.length : panel.width;
    s.projectedDepth = s.tiltAxis * std::cos(beta);
    s.rearElevation = s.tiltAxis * std::sin(beta);
    s.airGap = connector - s.projectedDepth;
    s.rowSpacing = connector;
    s.singleColWidth = portrait ? panel.width : panel.length;
    s.platformLength = platform.length;
    s.platformThickness = platform.thickness;
    s.mountOffset = platform.mountOffset;
    return s;
}

SpacingInfo spacingInfo(const PanelSpec& panel, const PlatformSpec& platform, double connector) {
    auto mm = [](double m) {
        return static_cast<int>(std::lround(m * 1000.0));
    };
    auto s{calculateSpacing(panel, platform, connector)};
    SpacingInfo info;
    info.projectedDepthMm = mm(s.projectedDepth);
    info.airGapMm = mm(s.airGap);
    info.rowSpacingMm = mm(s.rowSpacing);
    info.tiltAxisMm = mm(s.tiltAxis);
    info.orientation = platform.orientation;
    info.description = std::format("{} mode: Panel projected depth {}mm, Air gap {}mm",
        platform.orientation == c_portrait ? "Portrait" : "Landscape", info.projectedDepthMm, info.airGapMm);
    return info;
}

e_iso installationFrame(const Installation& inst) {
    return e_transform(inst.position, e_euler(inst.rotation));
}

namespace {
void setPose(BoxPlacement& box, const e_iso& frame) {
    box.pose = frame * e_transform(box.center, e_euler(box.rotation));
    box.world = box.pose;
}

void checkInstallation(const Installation& inst, const PanelSpec& panel) {
    const auto& pf = inst.platform;
    if (inst.rows.empty()) {
        throw LayoutError(inst.id, -1, "no rows");
    }
    if (!(pf.tilt > 0.0 && pf.tilt < 90.0)) {
        throw LayoutError(inst.id, -1, std::format("tilt {} deg outside (0, 90)", pf.tilt));
    }
    if (!(panel.length > 0.0 && panel.width > 0.0 && panel.thickness > 0.0)) {
        throw LayoutError(inst.id, -1, "panel dimensions must be positive");
    }
    if (!(pf.thickness > 0.0)) {
        throw LayoutError(inst.id, -1, std::format("platform thickness {}", pf.thickness));
    }
}
}

LayoutResult layoutInstallation(const Installation& inst, const PanelSpec& panel) {
    checkInstallation(inst, panel);
    const auto& pf = inst.platform;
    auto frame{installationFrame(inst)};
    auto pdim{panel.oriented(pf.orientation)};
    auto beta{deg2rad(pf.tilt)};
    LayoutResult res;
    res.spacings.reserve(inst.rows.size());
    auto z{0.0};
    for (int r = 0; r < static_cast<int>(inst.rows.size()); ++r) {
        const auto& row = inst.rows[r];
        if (row.columns <= 0) {
            throw LayoutError(inst.id, r, std::format("{} columns", row.columns));
        }
        auto sp{calculateSpacing(panel, pf, 0.0)};
        if (row.connector) {
            sp = calculateSpacing(panel, pf, *row.connector);
            if (sp.airGap < -c_1e_8) {
                throw LayoutError(inst.id, r, std::format("connector {:.3f} m is shorter than the projected panel depth {:.3f} m (air gap {:.0f} mm)",
                    *row.connector, sp.projectedDepth, sp.airGap * 1000.0));
            }
        } else {
            sp.rowSpacing = sp.projectedDepth;
            sp.airGap = 0.0;
        }

        Dimensions pd{sp.singleColWidth, sp.platformThickness, sp.projectedDepth};
        // panel box on the platform top, raised to the tilt pivot, its far
        // edge at the platform's far edge plus the mount offset
        ep3 mount{0.0, pd.height + sp.rearElevation / 2, pd.depth - pdim.depth + sp.mountOffset};
        for (int col = 0; col < row.columns; ++col) {
            PanelPlacement pp;
            pp.installation = inst.id;
            pp.row = r;
            pp.column = col;
            pp.orientation = pf.orientation;
            pp.platform.edge = ep3{col * sp.singleColWidth, 0.0, z};
            pp.platform.size = pd;
            pp.platform.center = edgeToCenter(pp.platform.edge, pd);
            setPose(pp.platform, frame);

            pp.panel.size = pdim;
            pp.panel.edge = pp.platform.edge + mount;
            pp.panel.center = edgeToCenter(pp.panel.edge, pdim);
            pp.panel.rotation = ep3{-beta, 0.0, 0.0};
            setPose(pp.panel, frame);
            res.panels.emplace_back(std::move(pp));
        }

        // zero gap leaves no room for a connector
        if (row.connector && sp.airGap > c_1e_8) {
            Dimensions cd{c_connector_width, sp.platformThickness, sp.airGap};
            for (auto left : {true, false}) {
                ConnectorPlacement cp;
                cp.installation = inst.id;
                cp.row = r;
                cp.left = left;
                cp.box.edge = ep3{left ? 0.0 : sp.singleColWidth * row.columns - cd.width, 0.0, z + sp.projectedDepth};
                cp.box.size = cd;
                cp.box.center = edgeToCenter(cp.box.edge, cd);
                setPose(cp.box, frame);
                res.connectors.emplace_back(std::move(cp));
            }
        }
        z += row.connector ? sp.rowSpacing : sp.projectedDepth;
        res.spacings.emplace_back(sp);
    }
    glog.dbg("installation {}: {} panels, {} connectors, depth {:.3f} m",
        inst.id, res.panels.size(), res.connectors.size(), z);
    return res;
}

void placeInWorld(LayoutResult& res, const e_iso& house) {
    for (auto& p : res.panels) {
        p.platform.world = house * p.platform.pose;
        p.panel.world = house * p.panel.pose;
    }
    for (auto& c : res.connectors) {
        c.box.world = house * c.box.pose;
    }
}

namespace {
bg_polygon boxFootprint(const BoxPlacement& box) {
    ep3 half{box.size.vec() * 0.5};
    std::vector<bg_point> corners;
    corners.reserve(4);
    static constexpr std::array<std::array<int, 2>, 4> c_corners{{{-1, -1}, {1, -1}, {1, 1}, {-1, 1}}};
    for (const auto& [sx, sz] : c_corners) {
        ep3 p{box.pose * ep3{sx * half.x(), -half.y(), sz * half.z()}};
        corners.emplace_back(bg_point{p.x(), p.z()});
    }
    return rectPoly(corners);
}
}

Polys footprint(const LayoutResult& res, std::string_view installation) {
    Polys polys;
    for (const auto& p : res.panels) {
        if (p.installation == installation) {
            polys.emplace_back(boxFootprint(p.platform));
        }
    }
    for (const auto& c : res.connectors) {
        if (c.installation == installation) {
            polys.emplace_back(boxFootprint(c.box));
        }
    }
    return polys;
}
