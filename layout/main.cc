#include "catalog.h"
#include "config.h"
#include "error.h"

void spacingReport(const Layout& layout, const PanelSpec& panel) {
    for (const auto& inst : layout.installations) {
        for (int r = 0; r < static_cast<int>(inst.rows.size()); ++r) {
            const auto& row = inst.rows[r];
            if (!row.connector) continue;
            auto info{spacingInfo(panel, inst.platform, *row.connector)};
            std::cout << std::format("  {} row {}: {}, row pitch {}mm, tilt axis {}mm\n",
                inst.id, r, info.description, info.rowSpacingMm, info.tiltAxisMm);
        }
    }
}

int main(int argc, char** argv) {
    Elapsed rt;
    auto err = [](std::string_view msg) {
        std::cout << msg << std::endl;
        return 1;
    };

    if (argc < 2) return err("usage: roofshade-layout <config.json> [layout]");
    RunConfig rc;
    if (!g_config.read(argv[1], rc)) {
        return err("config err");
    }
    glog.level(rc.sim.logLevel);
    auto folder{rc.sim.output};
    std::error_code ec;
    std::filesystem::create_directories(folder, ec);
    if (ec) {
        return err(std::format("output folder {}: {}", folder.string(), ec.message()));
    }

    LayoutCatalog catalog(rc.layouts, rc.defaultLayout, rc.panel, rc.house);
    std::vector<std::string> ids;
    if (argc > 2) {
        ids.emplace_back(argv[2]);
    } else {
        ids = catalog.ids();
    }
    auto rejected{0};
    for (const auto& id : ids) {
        try {
            auto res{catalog.select(id)};
            auto s{catalog.summary(id)};
            auto dflt{id == rc.defaultLayout ? " [default]" : ""};
            std::cout << std::format("{} ({}){}: {} panels\n  {}\n", s.name, s.id, dflt, s.totalPanels, s.description);
            for (const auto& is : s.installations) {
                std::cout << std::format("  {}\n", is.line);
            }
            spacingReport(*catalog.find(id), rc.panel);
            g_config.writePlacements(res, folder / std::format("{}_placements.csv", id));
        } catch (const LayoutError& e) {
            ++rejected;
            std::cout << std::format("{} rejected: {}\n", id, e.what());
        }
    }
    rt.view("layout time: ");
    return rejected > 0 ? 1 : 0;
}
