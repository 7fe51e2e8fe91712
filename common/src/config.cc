#include "config.h"
#include "str_func.h"
#include <cmath>

static constexpr std::array c_log_levels{"dbg", "info", "warn", "err"};
static constexpr std::string_view P_title{"kind,installation,row,column,x,y,z,rx,ry,rz,width,height,depth\n"};
static constexpr std::string_view P_row{"{},{},{},{},{:.4f},{:.4f},{:.4f},{:.5f},{:.5f},{:.5f},{:.4f},{:.4f},{:.4f}\n"};

namespace {
// [x, y, z]
ep3 jvec(const json& j) {
    auto a{j.get<std::array<double, 3>>()};
    return ep3{a[0], a[1], a[2]};
}

Dimensions jdim(const json& j) {
    auto v{jvec(j)};
    return Dimensions{v.x(), v.y(), v.z()};
}
}

std::vector<SimulatedMoment> SimulationSettings::moments() const {
    std::vector<SimulatedMoment> ms;
    if (!sweep) {
        ms.emplace_back(moment);
        return ms;
    }
    auto n{static_cast<int>(std::floor((end - begin) / step + 1e-9)) + 1};
    ms.reserve(std::max(0, n));
    for (int i = 0; i < n; ++i) {
        auto m{moment};
        m.hour = begin + i * step;
        if (m.hour >= 24.0) break;
        ms.emplace_back(m);
    }
    return ms;
}

bool Config::readLocation(const json& j, LocationConf& lo) const {
    lo.latitude = j.at("latitude");
    lo.longitude = j.at("longitude");
    lo.timezone = j.at("timezone");
    lo.city = jval(j, "city", std::string());
    return true;
}

bool Config::readPanel(const json& j, PanelSpec& ps, std::vector<std::string>& colors) const {
    ps.length = j.at("length");
    ps.width = j.at("width");
    ps.thickness = j.at("thickness");
    ps.cellColumns = jval(j, "cell-columns", ps.cellColumns);
    ps.cellRows = jval(j, "cell-rows", ps.cellRows);
    ps.stringCount = jval(j, "string-count", ps.stringCount);
    if (ps.cellColumns <= 0 || ps.cellRows <= 0 || ps.stringCount <= 0) {
        glog.err("panel cell grid {}x{} with {} strings", ps.cellColumns, ps.cellRows, ps.stringCount);
        return false;
    }
    if (j.contains("string-colors")) {
        colors = j["string-colors"].get<std::vector<std::string>>();
    }
    return true;
}

bool Config::readPlatform(const json& j, PlatformSpec& pf) const {
    pf.tilt = j.at("tilt");
    pf.length = j.at("length");
    pf.thickness = j.at("thickness");
    pf.mountOffset = jval(j, "mount-offset", c_default_mount_offset);
    auto name{jval(j, "orientation", std::string("landscape"))};
    pf.orientation = orientationOf(name);
    if (pf.orientation < 0) {
        glog.err("unknown orientation '{}'", name);
        return false;
    }
    return true;
}

bool Config::readHouse(const json& j, HouseSpec& hs) const {
    hs.width = j.at("width");
    hs.depth = j.at("depth");
    hs.height = j.at("height");
    hs.rotationFromNorth = jval(j, "rotation-from-north", 0.0);
    hs.roofWidth = hs.width;
    hs.roofDepth = hs.depth;
    if (j.contains("roof")) {
        const json& jr = j["roof"];
        hs.roofWidth = jval(jr, "width", hs.width);
        hs.roofDepth = jval(jr, "depth", hs.depth);
        hs.roofThickness = jval(jr, "thickness", hs.roofThickness);
    }
    hs.parapetSides.clear();
    if (j.contains("parapet")) {
        const json& jp = j["parapet"];
        hs.parapetHeight = jp.at("height");
        hs.parapetWidth = jp.at("width");
        for (const auto& side : jp.at("sides")) {
            std::string s = side;
            if (s != "north" && s != "south" && s != "east" && s != "west") {
                glog.err("unknown parapet side '{}'", s);
                return false;
            }
            hs.parapetSides.emplace_back(std::move(s));
        }
    }
    hs.objects.clear();
    if (j.contains("objects")) {
        for (const auto& jo : j["objects"]) {
            RoofObject obj;
            obj.id = jo.at("id");
            obj.type = jval(jo, "type", obj.type);
            obj.position = jvec(jo.at("position"));
            obj.size = jdim(jo.at("size"));
            if (jo.contains("pipe")) {
                const json& jp = jo["pipe"];
                obj.pipe = true;
                obj.pipeDiameter = jp.at("diameter");
                obj.pipeHeight = jp.at("height");
                obj.pipeOffset = jvec(jp.at("offset"));
            }
            hs.objects.emplace_back(std::move(obj));
        }
    }
    return true;
}

bool Config::readLayouts(const json& j, const std::map<std::string, PlatformSpec>& platforms,
    std::vector<Layout>& layouts) const {
    for (const auto& jl : j) {
        Layout layout;
        layout.id = jl.at("id");
        layout.name = jval(jl, "name", layout.id);
        layout.description = jval(jl, "description", std::string());
        for (const auto& ji : jl.at("installations")) {
            Installation inst;
            inst.id = ji.at("id");
            auto orientation{jval(ji, "orientation", std::string("landscape"))};
            auto pname{jval(ji, "platform", orientation)};
            auto it = platforms.find(pname);
            if (it == platforms.end()) {
                glog.err("layout {} installation {}: unknown platform '{}'", layout.id, inst.id, pname);
                return false;
            }
            inst.platform = it->second;
            if (ji.contains("orientation")) {
                inst.platform.orientation = orientationOf(orientation);
                if (inst.platform.orientation < 0) {
                    glog.err("layout {} installation {}: unknown orientation '{}'", layout.id, inst.id, orientation);
                    return false;
                }
            }
            inst.position = jvec(ji.at("position"));
            if (ji.contains("rotation")) {
                ep3 deg{jvec(ji["rotation"])};
                inst.rotation = ep3{deg2rad(deg.x()), deg2rad(deg.y()), deg2rad(deg.z())};
            }
            for (const auto& jr : ji.at("rows")) {
                RowConfiguration row;
                row.columns = jr.at("columns");
                if (jr.contains("connector")) {
                    row.connector = jr["connector"].get<double>();
                }
                inst.rows.emplace_back(row);
            }
            layout.installations.emplace_back(std::move(inst));
        }
        layouts.emplace_back(std::move(layout));
    }
    return !layouts.empty();
}

bool Config::readSimulation(const json& j, const std::filesystem::path& folder, SimulationSettings& ss) const {
    ss.layout = jval(j, "layout", ss.layout);
    auto date{jval(j, "date", std::string("now"))};
    ss.now = date == "now";
    if (!ss.now && !sfunc::parseDate(date, ss.moment.year, ss.moment.month, ss.moment.day)) {
        glog.err("bad date '{}', expected YYYY-MM-DD", date);
        return false;
    }
    if (j.contains("time")) {
        std::string t = j["time"];
        if (!sfunc::parseClock(t, ss.moment.hour)) {
            glog.err("bad time '{}', expected HH:MM", t);
            return false;
        }
    } else {
        ss.moment.hour = jval(j, "hour", ss.moment.hour);
    }
    if (j.contains("hours")) {
        const json& jh = j["hours"];
        ss.sweep = true;
        ss.begin = jh.at("begin");
        ss.end = jh.at("end");
        ss.step = jh.at("step");
        if (!(ss.step > 0.0) || ss.begin < 0.0 || ss.end < ss.begin || ss.end >= 24.0) {
            glog.err("bad hour sweep {} -> {} step {}", ss.begin, ss.end, ss.step);
            return false;
        }
    }
    if (!ss.now && !ss.moment.valid()) {
        glog.err("invalid moment {}", ss.moment.str());
        return false;
    }
    ss.interval = jval(j, "tick-interval", ss.interval);
    ss.ticks = jval(j, "ticks-per-moment", ss.ticks);
    if (ss.interval < 1 || ss.ticks < 0) {
        glog.err("tick interval {} / ticks {}", ss.interval, ss.ticks);
        return false;
    }
    // fewer ticks than the interval leaves cells never sampled
    if (ss.ticks > 0 && ss.ticks < ss.interval) {
        glog.err("ticks per moment {} below tick interval {}", ss.ticks, ss.interval);
        return false;
    }
    ss.mt = jval(j, "multiprocessing", ss.mt);
    ss.cellsInScene = jval(j, "cells-in-scene", ss.cellsInScene);
    std::filesystem::path out{jval(j, "output", std::string("."))};
    ss.output = out.is_absolute() ? out : folder / out;
    auto level{jval(j, "log-level", std::string("info"))};
    auto it = std::find(c_log_levels.begin(), c_log_levels.end(), level);
    if (it == c_log_levels.end()) {
        glog.err("unknown log level '{}'", level);
        return false;
    }
    ss.logLevel = static_cast<int>(it - c_log_levels.begin());
    ss.logFile = jval(j, "log-file", ss.logFile);
    return true;
}

bool Config::read(const std::filesystem::path& file, RunConfig& rc) const {
    if (!std::filesystem::exists(file)) {
        glog.err("config {} not found", file.string());
        return false;
    }
    try {
        std::ifstream ifs(file);
        json jconf = json::parse(ifs);
        if (!readLocation(jconf.at("location"), rc.location)) return false;
        if (!readPanel(jconf.at("panel"), rc.panel, rc.stringColors)) return false;
        for (const auto& el : jconf.at("platforms").items()) {
            PlatformSpec pf;
            if (!readPlatform(el.value(), pf)) return false;
            rc.platforms[el.key()] = pf;
        }
        if (!readHouse(jconf.at("house"), rc.house)) return false;
        if (!readLayouts(jconf.at("layouts"), rc.platforms, rc.layouts)) {
            glog.err("config {}: no usable layouts", file.string());
            return false;
        }
        rc.defaultLayout = jval(jconf, "default-layout", rc.layouts.front().id);
        json jsim = jval(jconf, "simulation", json::object());
        if (!readSimulation(jsim, file.parent_path(), rc.sim)) return false;
        if (rc.sim.layout.empty()) {
            rc.sim.layout = rc.defaultLayout;
        }
    } catch (const json::exception& e) {
        glog.err("config {}: {}", file.string(), e.what());
        return false;
    }
    return true;
}

void Config::writePlacements(const LayoutResult& res, const std::filesystem::path& file) const {
    std::ofstream ofs(file);
    ofs << P_title;
    auto line = [&](std::string_view kind, const std::string& inst, int row, int col, const BoxPlacement& b) {
        auto c{b.worldCenter()};
        auto r{b.worldRotation()};
        ofs << std::format(P_row, kind, inst, row, col, c.x(), c.y(), c.z(), r.x(), r.y(), r.z(),
            b.size.width, b.size.height, b.size.depth);
    };
    for (const auto& p : res.panels) {
        line("platform", p.installation, p.row, p.column, p.platform);
        line("panel", p.installation, p.row, p.column, p.panel);
    }
    for (const auto& c : res.connectors) {
        line(c.left ? "connector-left" : "connector-right", c.installation, c.row, -1, c.box);
    }
    glog.info("wrote {} ({} panels, {} connectors)", file.string(), res.panels.size(), res.connectors.size());
}
