#undef NDEBUG
#include "error.h"
#include "shadow.h"
#include <cassert>
#include <cmath>
#include <iostream>

static const SunVector c_overhead{180.0, 90.0, 90.0, true};

SolarCell cellAt(const ep3& p) {
    SolarCell c;
    c.size = Dimensions{0.1, c_cell_thickness, 0.1};
    c.world = e_transform(p, e_rmat::Identity());
    return c;
}

e_iso at(const ep3& p) {
    return e_transform(p, e_rmat::Identity());
}

void test_open_sky() {
    BoxScene scene;
    scene.seal();
    auto cell{cellAt(ep3::Zero())};
    assert(g_shadow.sampleOcclusion(cell, c_overhead, scene) == 0.0);
    std::cout << "[PASS] Nothing in the scene, nothing shaded.\n";
}

void test_enclosing_box() {
    BoxScene scene;
    scene.add(c_occ_object, "shed", at(ep3::Zero()), Dimensions{10.0, 10.0, 10.0});
    scene.seal();
    auto hits{scene.castRay(ep3::Zero(), ep3{0.0, 1.0, 0.0})};
    assert(hits.size() == 1);
    assert(std::abs(hits[0].distance - 5.0) < 1e-9);
    auto cell{cellAt(ep3::Zero())};
    assert(g_shadow.sampleOcclusion(cell, c_overhead, scene) == 1.0);
    std::cout << "[PASS] A cell inside a box is fully shaded.\n";
}

void test_small_and_far_boxes() {
    BoxScene scene;
    scene.add(c_occ_object, "bird", at(ep3{0.0, 2.0, 0.0}), Dimensions{0.15, 0.15, 0.15});
    scene.add(c_occ_object, "cloud", at(ep3{0.0, 80.0, 0.0}), Dimensions{20.0, 1.0, 20.0});
    scene.add(c_occ_object, "sticker", at(ep3{0.0, 0.05, 0.0}), Dimensions{1.0, 0.01, 1.0});
    scene.seal();
    auto cell{cellAt(ep3::Zero())};
    assert(scene.castRay(ep3{0.0, 0.0025, 0.0}, ep3{0.0, 1.0, 0.0}).size() == 3);
    assert(g_shadow.sampleOcclusion(cell, c_overhead, scene) == 0.0);
    std::cout << "[PASS] Tiny, too close and out of range hits ignored.\n";
}

void test_partial_shade() {
    BoxScene scene;
    // covers only the samples on the +x side of the cell
    scene.add(c_occ_object, "chimney", at(ep3{1.01, 3.0, 0.0}), Dimensions{2.0, 0.5, 2.0});
    scene.seal();
    auto cell{cellAt(ep3::Zero())};
    auto v{g_shadow.sampleOcclusion(cell, c_overhead, scene)};
    assert(std::abs(v - 0.4) < 1e-12);
    auto b{g_shadow.classify(v, "#74b9ff")};
    assert(b.level == 2);
    assert(b.color == "#FFC000");
    std::cout << "[PASS] Two of five samples blocked.\n";
}

void test_own_cell_ignored() {
    BoxScene scene;
    auto cell{cellAt(ep3::Zero())};
    cell.size = Dimensions{0.3, 0.3, 0.3};
    cell.occluder = scene.add(c_occ_cell, "cell", cell.world, cell.size);
    scene.seal();
    assert(g_shadow.sampleOcclusion(cell, c_overhead, scene) == 0.0);
    std::cout << "[PASS] A cell does not shade itself.\n";
}

void test_night() {
    BoxScene scene;
    scene.add(c_occ_object, "shed", at(ep3::Zero()), Dimensions{10.0, 10.0, 10.0});
    scene.seal();
    SunVector night{0.0, 0.0, -20.0, false};
    Cells cells{cellAt(ep3::Zero())};
    assert(g_shadow.sampleOcclusion(cells[0], night, scene) == 0.0);
    ShadowTracker tracker(cells.size(), 5);
    tracker.tick(0, c_overhead, cells, scene);
    assert(tracker.intensity(0) == 1.0);
    tracker.tick(1, night, cells, scene);
    assert(tracker.intensity(0) == 0.0);
    std::cout << "[PASS] No shade at night.\n";
}

void test_buckets() {
    auto lit{g_shadow.classify(0.0, "#ff7675")};
    assert(lit.level == 0 && lit.color == "#ff7675" && std::abs(lit.opacity - 0.8) < 1e-12);
    assert(g_shadow.classify(0.2, "").level == 1);
    assert(g_shadow.classify(0.21, "").level == 2);
    assert(g_shadow.classify(0.6, "").color == "#FF8000");
    auto full{g_shadow.classify(1.0, "")};
    assert(full.level == 5 && full.color == "#FF0000" && std::abs(full.opacity - 0.3) < 1e-12);
    auto last{0};
    for (int i = 0; i <= 100; ++i) {
        auto b{g_shadow.classify(i / 100.0, "#ffffff")};
        assert(b.level >= last);
        last = b.level;
    }
    std::cout << "[PASS] Shade buckets grow with intensity.\n";
}

void test_throttling() {
    BoxScene scene;
    scene.seal();
    Cells cells(4, cellAt(ep3::Zero()));
    ShadowTracker tracker(cells.size(), 3);
    assert(tracker.due(0, 0) && tracker.due(0, 3));
    assert(!tracker.due(0, 1) && tracker.due(1, 2));
    assert(tracker.tick(0, c_overhead, cells, scene) == 2);
    assert(tracker.tick(1, c_overhead, cells, scene) == 1);
    // every cell is sampled once per interval
    std::vector<int> count(cells.size(), 0);
    for (long long t = 0; t < 3; ++t) {
        for (size_t k = 0; k < cells.size(); ++k) {
            if (tracker.due(t, k)) ++count[k];
        }
    }
    for (auto n : count) assert(n == 1);
    ShadowTracker every(cells.size(), 1);
    assert(every.tick(7, c_overhead, cells, scene, true) == cells.size());
    std::cout << "[PASS] Cells sampled in staggered ticks.\n";
}

void test_unavailable_keeps_last() {
    BoxScene ready;
    ready.add(c_occ_object, "shed", at(ep3::Zero()), Dimensions{10.0, 10.0, 10.0});
    ready.seal();
    Cells cells(3, cellAt(ep3::Zero()));
    ShadowTracker tracker(cells.size(), 1);
    tracker.tick(0, c_overhead, cells, ready);
    assert(tracker.intensity(2) == 1.0);

    BoxScene loading;
    bool thrown{};
    try {
        loading.castRay(ep3::Zero(), ep3::UnitY());
    } catch (const OcclusionQueryUnavailable&) {
        thrown = true;
    }
    assert(thrown);
    assert(tracker.tick(1, c_overhead, cells, loading) == 0);
    for (auto v : tracker.intensities()) assert(v == 1.0);
    assert(tracker.unavailable() == cells.size());

    ready.seal();
    bool sealed{};
    try {
        ready.add(c_occ_object, "late", at(ep3::Zero()), Dimensions{1.0, 1.0, 1.0});
    } catch (const std::logic_error&) {
        sealed = true;
    }
    assert(sealed);
    std::cout << "[PASS] Unavailable scene keeps the previous shade.\n";
}

void test_string_summary() {
    Cells cells;
    for (int s = 0; s < 2; ++s) {
        for (int i = 0; i < 2; ++i) {
            auto c{cellAt(ep3::Zero())};
            c.panel = 0;
            c.string = s;
            cells.emplace_back(c);
        }
    }
    auto shades{g_shadow.strings(cells, {0.0, 0.4, 1.0, 1.0})};
    assert(shades.size() == 2);
    assert(shades[0].string == 0 && shades[0].cells == 2);
    assert(std::abs(shades[0].mean - 0.2) < 1e-12 && std::abs(shades[0].max - 0.4) < 1e-12);
    assert(std::abs(shades[1].mean - 1.0) < 1e-12);
    std::cout << "[PASS] Per string shade summary.\n";
}

void test_crossed_box_reports_exit() {
    BoxScene scene;
    scene.add(c_occ_panel, "slab", at(ep3::Zero()), Dimensions{2.0, 2.0, 2.0});
    scene.seal();
    // starts 1 cm above the top face and runs through the box
    auto hits{scene.castRay(ep3{0.0, 1.01, 0.0}, ep3{0.0, -1.0, 0.0})};
    assert(hits.size() == 1);
    assert(std::abs(hits[0].distance - 2.01) < 1e-9);
    // far enough away the entry is reported
    hits = scene.castRay(ep3{0.0, 1.5, 0.0}, ep3{0.0, -1.0, 0.0});
    assert(std::abs(hits[0].distance - 0.5) < 1e-9);
    std::cout << "[PASS] A ray crossing the box it starts on reports the far side.\n";
}

void test_sun_behind_panel() {
    PanelSpec panel;
    Installation inst;
    inst.id = "one";
    inst.rows = {RowConfiguration{1, std::nullopt}};
    auto res{layoutInstallation(inst, panel)};
    auto cells{g_cells.build(res, panel)};
    assert(cells.size() == 96);
    BoxScene scene;
    scene.addLayout(res);
    scene.seal();

    auto shaded = [&](double azimuth, double elevation) {
        SunVector sun{azimuth, elevation, elevation, true};
        auto n{0};
        for (const auto& c : cells) {
            if (g_shadow.sampleOcclusion(c, sun, scene) == 1.0) ++n;
        }
        return n;
    };
    // low sun on the back of the module
    assert(shaded(180.0, 2.0) == 96);
    assert(shaded(180.0, 5.0) == 96);
    assert(shaded(180.0, 8.0) == 96);
    // facing sun, nothing else on the roof
    assert(shaded(0.0, 30.0) == 0);
    assert(shaded(180.0, 60.0) == 0);
    std::cout << "[PASS] Sun behind the panel plane shades every cell.\n";
}

void test_house_scene() {
    HouseSpec house;
    RoofObject chimney;
    chimney.id = "chimney";
    chimney.position = ep3{2.8, 0.0, 4.355};
    chimney.size = Dimensions{0.5, 0.4, 0.5};
    chimney.pipe = true;
    chimney.pipeDiameter = 0.1;
    chimney.pipeHeight = 0.3;
    chimney.pipeOffset = ep3{0.1, 0.0, 0.2};
    house.objects.emplace_back(chimney);

    BoxScene scene;
    scene.addHouse(house);
    scene.seal();
    // body, roof, three parapets, chimney and its pipe
    assert(scene.size() == 7);
    assert(scene.at(1).name == "roof");

    // straight down onto the roof centre
    ep3 top{house.frame() * ep3{house.roofWidth / 2, house.roofTop() + 1.0, 1.0}};
    auto hits{scene.castRay(top, ep3{0.0, -1.0, 0.0})};
    assert(!hits.empty());
    assert(scene.at(hits[0].id).kind == c_occ_roof);
    assert(std::abs(hits[0].distance - 1.0) < 1e-9);
    std::cout << "[PASS] House, parapets and roof objects in the scene.\n";
}

int main() {
    std::cout << "Running shadow tests...\n";
    test_open_sky();
    test_enclosing_box();
    test_small_and_far_boxes();
    test_partial_shade();
    test_own_cell_ignored();
    test_night();
    test_buckets();
    test_throttling();
    test_unavailable_keeps_last();
    test_string_summary();
    test_crossed_box_reports_exit();
    test_sun_behind_panel();
    test_house_scene();
    std::cout << "All shadow tests passed.\n";
    return 0;
}
