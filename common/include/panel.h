#pragma once
#ifndef _PANEL_H_
#define _PANEL_H_
#include "layout.h"
#include <string>
#include <vector>

struct SolarCell {
    int panel{};          // index into LayoutResult::panels
    int row{};
    int column{};
    int string{};
    int occluder{-1};     // scene id when the cell itself is in the scene
    ep3 local{ep3::Zero()};
    Dimensions size{};    // drawn extent
    e_iso world{e_iso::Identity()};

    inline ep3 worldCenter() const {
        return world.translation();
    }
};
using Cells = std::vector<SolarCell>;

struct CellGrid {
    int columns{};
    int rows{};
    double width{};   // pitch along x
    double depth{};   // pitch along the tilt axis
};

class PanelCells {
public:
    CellGrid grid(const PanelSpec& spec, int orientation) const;
    int stringOf(const PanelSpec& spec, int orientation, int row, int column) const;

    // panel local cells of one panel
    Cells cells(const PanelSpec& spec, int orientation) const;

    // cells of every placed panel, world transforms from the panel placement
    Cells build(const LayoutResult& res, const PanelSpec& spec) const;

    std::string name(const LayoutResult& res, const SolarCell& cell) const;
};
static const PanelCells g_cells;
#endif
