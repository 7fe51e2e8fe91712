#undef NDEBUG
#include "catalog.h"
#include "config.h"
#include "error.h"
#include "shadow.h"
#include <algorithm>
#include <cassert>
#include <cmath>
#include <iostream>

#ifndef ROOFSHADE_DATA
#define ROOFSHADE_DATA "data"
#endif

RunConfig load() {
    RunConfig rc;
    auto ok{g_config.read(std::filesystem::path(ROOFSHADE_DATA) / "culemborg.json", rc)};
    assert(ok);
    return rc;
}

void test_read_sample() {
    auto rc{load()};
    assert(std::abs(rc.location.latitude - 51.9554) < 1e-9);
    assert(rc.location.timezone == "Europe/Amsterdam");
    assert(rc.panel.cellColumns == 16 && rc.panel.cellRows == 6 && rc.panel.stringCount == 3);
    assert(rc.platforms.size() == 2);
    assert(rc.platforms.at("portrait").orientation == c_portrait);
    assert(rc.layouts.size() == 5);
    assert(rc.defaultLayout == "current");
    assert(rc.sim.layout == "current");
    assert(!rc.sim.now && !rc.sim.sweep);
    assert(rc.sim.moment.year == 2024 && rc.sim.moment.month == 8 && rc.sim.moment.day == 11);
    assert(std::abs(rc.sim.moment.hour - 16.9) < 1e-9);
    assert(rc.sim.interval == 30);
    assert(rc.house.objects.size() == 1 && rc.house.objects[0].pipe);
    assert(std::abs(rc.house.rotationFromNorth - 30.0) < 1e-12);

    const auto& sw1 = rc.layouts[0].installations[1];
    assert(sw1.id == "sw1");
    assert(std::abs(sw1.rotation.y() - deg2rad(90.0)) < 1e-12);
    assert(sw1.rows.size() == 2 && sw1.rows[0].connector && !sw1.rows[1].connector);
    assert(rc.stringColor(1) == "#74b9ff");
    assert(rc.stringColor(7) == rc.cellColor);
    std::cout << "[PASS] Sample configuration read.\n";
}

void test_every_layout_selects() {
    auto rc{load()};
    LayoutCatalog catalog(rc.layouts, rc.defaultLayout, rc.panel, rc.house);
    assert(catalog.defaultLayout().id == "current");
    for (const auto& id : catalog.ids()) {
        auto res{catalog.select(id)};
        auto s{catalog.summary(id)};
        assert(static_cast<int>(res.panels.size()) == s.totalPanels);
        assert(s.installations.size() == 3);
    }
    auto s{catalog.summary("current")};
    assert(s.totalPanels == 12);
    assert(s.installations[0].line == "se: 6 panels, landscape, Connector 1320mm");
    assert(catalog.summary("sw-portrait").installations[1].line == "sw1: 3 panels, portrait");
    std::cout << "[PASS] All sample layouts select.\n";
}

void test_bad_selections() {
    auto rc{load()};
    auto layouts{rc.layouts};
    auto broken{layouts[0]};
    broken.id = "broken";
    broken.installations[2].position = broken.installations[1].position;
    layouts.emplace_back(broken);
    auto dup{layouts[0]};
    dup.id = "dup";
    dup.installations[2].id = "sw1";
    layouts.emplace_back(dup);
    auto bare{layouts[0]};
    bare.id = "bare";
    bare.installations.clear();
    layouts.emplace_back(bare);

    LayoutCatalog catalog(layouts, "missing", rc.panel, rc.house);
    auto rejected = [&](std::string_view id) {
        try {
            catalog.select(id);
        } catch (const LayoutError& e) {
            return std::string(e.installation().empty() ? "-" : e.installation());
        }
        return std::string();
    };
    assert(rejected("broken") == "sw2");
    assert(rejected("dup") == "sw1");
    assert(rejected("bare") == "-");
    assert(rejected("nowhere") == "-");
    assert(rejected("current").empty());
    bool thrown{};
    try {
        catalog.defaultLayout();
    } catch (const LayoutError&) {
        thrown = true;
    }
    assert(thrown);
    std::cout << "[PASS] Overlapping, duplicate, empty and unknown layouts rejected.\n";
}

void test_placements_file() {
    auto rc{load()};
    LayoutCatalog catalog(rc.layouts, rc.defaultLayout, rc.panel, rc.house);
    auto res{catalog.select("current")};
    auto file{std::filesystem::temp_directory_path() / "roofshade_placements_test.csv"};
    g_config.writePlacements(res, file);
    std::ifstream ifs(file);
    std::string line;
    auto n{0};
    while (std::getline(ifs, line)) ++n;
    assert(n == 1 + 2 * static_cast<int>(res.panels.size()) + static_cast<int>(res.connectors.size()));
    std::filesystem::remove(file);
    std::cout << "[PASS] Placements written.\n";
}

void test_sample_moment_shading() {
    auto rc{load()};
    GeoLocation loc(rc.location.latitude, rc.location.longitude, rc.location.timezone);
    LayoutCatalog catalog(rc.layouts, rc.defaultLayout, rc.panel, rc.house);
    auto res{catalog.select(rc.defaultLayout)};
    auto cells{g_cells.build(res, rc.panel)};
    assert(cells.size() == res.panels.size() * 96);

    BoxScene scene;
    scene.addHouse(rc.house);
    scene.addLayout(res);
    scene.seal();
    auto sun{computeSunPosition(rc.sim.moment, loc)};
    ShadowTracker tracker(cells.size(), rc.sim.interval);
    size_t sampled{};
    for (long long t = 0; t < rc.sim.interval; ++t) {
        sampled += tracker.tick(t, sun, cells, scene, true);
    }
    assert(sampled == cells.size());
    for (auto v : tracker.intensities()) {
        assert(v >= 0.0 && v <= 1.0);
    }
    assert(tracker.unavailable() == 0);
    std::cout << "[PASS] One interval over the sample roof.\n";
}

void test_winter_noon_rows() {
    auto rc{load()};
    GeoLocation loc(rc.location.latitude, rc.location.longitude, rc.location.timezone);
    LayoutCatalog catalog(rc.layouts, rc.defaultLayout, rc.panel, rc.house);
    auto res{catalog.select("current")};
    auto cells{g_cells.build(res, rc.panel)};
    BoxScene scene;
    scene.addHouse(rc.house);
    scene.addLayout(res);
    scene.seal();

    SimulatedMoment noon{2024, 12, 21, 12.0};
    assert(toUtc(noon, loc) == ptime(gdate(2024, 12, 21), boost::posix_time::hours(11)));
    auto sun{computeSunPosition(noon, loc)};
    assert(sun.daylight && sun.elevation > 10.0 && sun.elevation < 18.0);
    ShadowTracker tracker(cells.size(), 1);
    tracker.tick(0, sun, cells, scene);

    std::vector<double> mean(res.panels.size(), 0.0);
    std::vector<double> peak(res.panels.size(), 0.0);
    std::vector<int> count(res.panels.size(), 0);
    for (size_t k = 0; k < cells.size(); ++k) {
        auto p{cells[k].panel};
        mean[p] += tracker.intensity(k);
        peak[p] = std::max(peak[p], tracker.intensity(k));
        ++count[p];
    }
    auto trailing{0};
    for (size_t i = 0; i < res.panels.size(); ++i) {
        mean[i] /= count[i];
        const auto& p = res.panels[i];
        if (p.row == 0) {
            // nothing in front of the lead rows
            assert(mean[i] < 0.05);
        } else if (p.installation == "se") {
            // low winter sun, the row in front casts a shadow
            assert(mean[i] > 0.2 && peak[i] == 1.0);
            ++trailing;
        } else {
            assert(peak[i] > 0.0);
        }
    }
    assert(trailing == 5);
    std::cout << "[PASS] Winter noon: trailing rows shaded by the row in front.\n";
}

void test_historic_moment() {
    auto rc{load()};
    GeoLocation loc(rc.location.latitude, rc.location.longitude, rc.location.timezone);
    // summer time ended on the last Sunday of September until 1996
    auto utc{toUtc(SimulatedMoment{1995, 10, 1, 12.0}, loc)};
    assert(utc == ptime(gdate(1995, 10, 1), boost::posix_time::hours(11)));
    std::cout << "[PASS] Historic moment uses the zone history.\n";
}

void test_hour_sweep() {
    SimulationSettings ss;
    ss.sweep = true;
    ss.begin = 6.0;
    ss.end = 20.0;
    ss.step = 0.5;
    auto ms{ss.moments()};
    assert(ms.size() == 29);
    assert(ms.front().hour == 6.0 && ms.back().hour == 20.0);
    ss.sweep = false;
    assert(ss.moments().size() == 1);
    std::cout << "[PASS] Hour sweep moments.\n";
}

void test_rejects_bad_file() {
    RunConfig rc;
    assert(!g_config.read(std::filesystem::path(ROOFSHADE_DATA) / "missing.json", rc));
    auto file{std::filesystem::temp_directory_path() / "roofshade_bad_config.json"};
    {
        std::ofstream ofs(file);
        ofs << R"({"location": {"latitude": 52.0}})";
    }
    assert(!g_config.read(file, rc));
    std::filesystem::remove(file);
    std::cout << "[PASS] Missing and incomplete configurations rejected.\n";
}

// sample configuration with its simulation block patched
std::filesystem::path patched(std::string_view key, const json& value) {
    std::ifstream ifs(std::filesystem::path(ROOFSHADE_DATA) / "culemborg.json");
    auto j{json::parse(ifs)};
    j["simulation"][std::string(key)] = value;
    auto file{std::filesystem::temp_directory_path() / "roofshade_patched.json"};
    std::ofstream ofs(file);
    ofs << j.dump(2);
    return file;
}

void test_ticks_cover_interval() {
    RunConfig rc;
    auto few{patched("ticks-per-moment", 5)};
    assert(!g_config.read(few, rc));
    RunConfig full;
    auto enough{patched("ticks-per-moment", 30)};
    assert(g_config.read(enough, full));
    assert(full.sim.ticks == 30 && full.sim.interval == 30);
    std::filesystem::remove(enough);
    std::cout << "[PASS] Ticks per moment must cover the tick interval.\n";
}

void test_log_clock() {
    auto tm{log_now()};
    assert(tm.year >= 2024);
    assert(tm.mon >= 1 && tm.mon <= 12 && tm.mday >= 1 && tm.mday <= 31);
    assert(tm.hour >= 0 && tm.hour < 24 && tm.min >= 0 && tm.min < 60 && tm.sec >= 0 && tm.sec <= 60);
    std::cout << "[PASS] Log clock reads the local calendar.\n";
}

int main() {
    std::cout << "Running config tests...\n";
    test_read_sample();
    test_every_layout_selects();
    test_bad_selections();
    test_placements_file();
    test_sample_moment_shading();
    test_winter_noon_rows();
    test_historic_moment();
    test_hour_sweep();
    test_rejects_bad_file();
    test_ticks_cover_interval();
    test_log_clock();
    std::cout << "All config tests passed.\n";
    return 0;
}
