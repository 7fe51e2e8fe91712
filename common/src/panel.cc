#include "panel.h"
#include <format>

CellGrid PanelCells::grid(const PanelSpec& spec, int orientation) const {
    CellGrid g;
    if (orientation == c_portrait) {
        g.columns = spec.cellRows;
        g.rows = spec.cellColumns;
    } else {
        g.columns = spec.cellColumns;
        g.rows = spec.cellRows;
    }
    auto dim{spec.oriented(orientation)};
    g.width = div_s(dim.width, g.columns);
    g.depth = div_s(dim.depth, g.rows);
    return g;
}

// landscape strings run across rows, portrait across columns
int PanelCells::stringOf(const PanelSpec& spec, int orientation, int row, int column) const {
    auto g{grid(spec, orientation)};
    auto strings{std::max(1, spec.stringCount)};
    auto idx{orientation == c_portrait ? column : row};
    auto count{orientation == c_portrait ? g.columns : g.rows};
    if (count <= 0) return 0;
    return std::min(strings - 1, idx * strings / count);
}

Cells PanelCells::cells(const PanelSpec& spec, int orientation) const {
    auto g{grid(spec, orientation)};
    auto dim{spec.oriented(orientation)};
    Cells cs;
    if (g.columns <= 0 || g.rows <= 0) return cs;
    cs.reserve(static_cast<size_t>(g.columns) * g.rows);
    // cell edges from the panel's minimum corner, in panel local coordinates
    ep3 origin{centerToEdge(ep3::Zero(), dim)};
    Dimensions pitch{g.width, c_cell_thickness, g.depth};
    for (int row = 0; row < g.rows; ++row) {
        for (int col = 0; col < g.columns; ++col) {
            SolarCell c;
            c.row = row;
            c.column = col;
            c.string = stringOf(spec, orientation, row, col);
            ep3 edge{origin + ep3{col * g.width, dim.height + c_cell_lift, row * g.depth}};
            c.local = edgeToCenter(edge, pitch);
            c.size = Dimensions{g.width * c_cell_fill, c_cell_thickness, g.depth * c_cell_fill};
            cs.emplace_back(c);
        }
    }
    return cs;
}

Cells PanelCells::build(const LayoutResult& res, const PanelSpec& spec) const {
    Cells all;
    std::array<Cells, 2> proto{cells(spec, c_landscape), cells(spec, c_portrait)};
    all.reserve(res.panels.size() * proto[0].size());
    for (int i = 0; i < static_cast<int>(res.panels.size()); ++i) {
        const auto& p = res.panels[i];
        for (auto c : proto[p.orientation == c_portrait ? 1 : 0]) {
            c.panel = i;
            c.world = p.panel.world * e_transform(c.local, e_rmat::Identity());
            all.emplace_back(c);
        }
    }
    return all;
}

std::string PanelCells::name(const LayoutResult& res, const SolarCell& cell) const {
    const auto& p = res.panels.at(cell.panel);
    return std::format("{}-r{}-c{}/cell-{}-{}", p.installation, p.row, p.column, cell.row, cell.column);
}
