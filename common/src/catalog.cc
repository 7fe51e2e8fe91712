#include "catalog.h"
#include "error.h"
#include "log.h"
#include <format>
#include <set>

LayoutCatalog::LayoutCatalog(std::vector<Layout> layouts, std::string defaultId,
    const PanelSpec& panel, const HouseSpec& house)
    : _layouts(std::move(layouts)), _default(std::move(defaultId)), _panel(panel), _house(house) {}

const Layout* LayoutCatalog::find(std::string_view id) const {
    for (const auto& l : _layouts) {
        if (l.id == id) return &l;
    }
    return nullptr;
}

const Layout& LayoutCatalog::defaultLayout() const {
    auto l{find(_default)};
    if (l == nullptr) {
        throw LayoutError(std::format("default layout '{}' not found", _default));
    }
    return *l;
}

std::vector<std::string> LayoutCatalog::ids() const {
    std::vector<std::string> res;
    res.reserve(_layouts.size());
    for (const auto& l : _layouts) {
        res.emplace_back(l.id);
    }
    return res;
}

LayoutResult LayoutCatalog::select(std::string_view id) const {
    auto layout{find(id)};
    if (layout == nullptr) {
        throw LayoutError(std::format("unknown layout '{}'", id));
    }
    if (layout->installations.empty()) {
        throw LayoutError(std::format("layout '{}' has no installations", id));
    }
    std::set<std::string> seen;
    LayoutResult res;
    for (const auto& inst : layout->installations) {
        if (!seen.insert(inst.id).second) {
            throw LayoutError(inst.id, -1, std::format("duplicate installation in layout '{}'", id));
        }
        res.append(layoutInstallation(inst, _panel));
    }
    checkFootprints(*layout, res);
    placeInWorld(res, _house.frame());
    glog.info("layout {} selected: {} panels, {} connectors", layout->id, res.panels.size(), res.connectors.size());
    return res;
}

void LayoutCatalog::checkFootprints(const Layout& layout, const LayoutResult& res) const {
    const auto& insts = layout.installations;
    std::vector<Polys> prints;
    prints.reserve(insts.size());
    for (const auto& inst : insts) {
        prints.emplace_back(footprint(res, inst.id));
    }
    for (int i = 0; i < static_cast<int>(insts.size()); ++i) {
        for (int j = i + 1; j < static_cast<int>(insts.size()); ++j) {
            auto area{0.0};
            for (const auto& poly : prints[j]) {
                area += intersectArea(poly, prints[i]);
            }
            if (area > c_footprint_tol) {
                throw LayoutError(insts[j].id, -1, std::format("footprint overlaps installation '{}' by {:.3f} m2",
                    insts[i].id, area));
            }
        }
    }
    auto outline{_house.roofOutline()};
    for (int i = 0; i < static_cast<int>(insts.size()); ++i) {
        auto outside{0.0};
        for (const auto& poly : prints[i]) {
            if (coveredBy(poly, outline, c_footprint_tol)) continue;
            auto inside{0.0};
            intersectArea(poly, outline, inside);
            outside += std::abs(boost::geometry::area(poly)) - inside;
        }
        if (outside > c_footprint_tol) {
            glog.warn("layout {} installation {}: {:.3f} m2 of the footprint is off the roof",
                layout.id, insts[i].id, outside);
        }
    }
}

LayoutSummary LayoutCatalog::summary(std::string_view id) const {
    auto layout{find(id)};
    if (layout == nullptr) {
        throw LayoutError(std::format("unknown layout '{}'", id));
    }
    LayoutSummary s;
    s.id = layout->id;
    s.name = layout->name;
    s.description = layout->description;
    for (const auto& inst : layout->installations) {
        InstallationSummary is;
        is.id = inst.id;
        is.panels = inst.panelCount();
        is.orientation = inst.platform.orientation;
        is.connector = inst.firstConnector();
        if (is.connector) {
            is.line = std::format("{}: {} panels, {}, Connector {:.0f}mm", is.id, is.panels,
                orientationName(is.orientation), *is.connector * 1000.0);
        } else {
            is.line = std::format("{}: {} panels, {}", is.id, is.panels, orientationName(is.orientation));
        }
        s.totalPanels += is.panels;
        s.installations.emplace_back(std::move(is));
    }
    return s;
}
