#include "tp.h"
#include "arrow_env.h"
#include "catalog.h"
#include "config.h"
#include "error.h"
#include "shadow.h"
static constexpr std::string_view S_title{"moment,utc,azimuth_deg,elevation_deg,altitude_deg,daylight\n"};
static constexpr std::string_view S_row{"{},{},{:.3f},{:.3f},{:.3f},{}\n"};
static constexpr std::string_view C_title{"moment,cell,string,x,y,z,intensity,bucket,color,opacity\n"};
static constexpr std::string_view C_row{"{},{},{},{:.4f},{:.4f},{:.4f},{:.2f},{},{},{:.2f}\n"};
static constexpr std::string_view G_title{"moment,installation,row,column,string,cells,mean_intensity,max_intensity\n"};
static constexpr std::string_view G_row{"{},{},{},{},{},{},{:.3f},{:.2f}\n"};

struct MomentShade {
    SimulatedMoment moment;
    ptime utc;
    SunVector sun;
    std::vector<double> intensities;
    size_t unavailable{};
};
using MomentShades = std::vector<MomentShade>;

void writeSun(const std::filesystem::path& file, const MomentShades& ms) {
    std::ofstream ofs(file);
    ofs << S_title;
    for (const auto& m : ms) {
        ofs << std::format(S_row, m.moment.str(), boost::posix_time::to_iso_extended_string(m.utc),
            m.sun.azimuth, m.sun.elevation, m.sun.altitude, m.sun.daylight ? 1 : 0);
    }
}

void writeShadow(const std::filesystem::path& file, const MomentShades& ms, const Cells& cells,
    const std::vector<std::string>& names, const RunConfig& rc) {
    std::ofstream ofs(file);
    ofs << C_title;
    for (const auto& m : ms) {
        auto moment{m.moment.str()};
        for (size_t k = 0; k < cells.size(); ++k) {
            const auto& c = cells[k];
            auto v{m.intensities[k]};
            auto b{g_shadow.classify(v, rc.stringColor(c.string))};
            auto p{c.worldCenter()};
            ofs << std::format(C_row, moment, names[k], c.string, p.x(), p.y(), p.z(), v, b.level, b.color, b.opacity);
        }
    }
}

void writeStrings(const std::filesystem::path& file, const MomentShades& ms, const Cells& cells, const LayoutResult& res) {
    std::ofstream ofs(file);
    ofs << G_title;
    for (const auto& m : ms) {
        auto moment{m.moment.str()};
        for (const auto& s : g_shadow.strings(cells, m.intensities)) {
            const auto& p = res.panels.at(s.panel);
            ofs << std::format(G_row, moment, p.installation, p.row, p.column, s.string, s.cells, s.mean, s.max);
        }
    }
}

arrow::Status writeFeather(const std::filesystem::path& file, const MomentShades& ms,
    const std::vector<std::string>& names) {
    arrow::FloatBuilder hours;
    std::vector<arrow::FloatBuilder> builders(names.size());
    for (const auto& m : ms) {
        ARROW_RETURN_NOT_OK(hours.Append(static_cast<float>(m.moment.hour)));
        for (size_t k = 0; k < builders.size(); ++k) {
            ARROW_RETURN_NOT_OK(builders[k].Append(static_cast<float>(m.intensities[k])));
        }
    }
    std::vector<std::shared_ptr<arrow::Array>> arrays(builders.size() + 1);
    std::vector<std::shared_ptr<arrow::Field>> fields;
    fields.reserve(arrays.size());
    ARROW_RETURN_NOT_OK(hours.Finish(&arrays[0]));
    fields.emplace_back(arrow::field("hour", arrow::float32()));
    for (size_t k = 0; k < builders.size(); ++k) {
        ARROW_RETURN_NOT_OK(builders[k].Finish(&arrays[k + 1]));
        fields.emplace_back(arrow::field(names[k], arrow::float32()));
    }
    auto schema = arrow::schema(fields);
    auto table = arrow::Table::Make(schema, arrays);
    std::shared_ptr<arrow::io::FileOutputStream> cfs;
    ARROW_ASSIGN_OR_RAISE(cfs, arrow::io::FileOutputStream::Open(file.string(), false));
    auto prop{arrow::ipc::feather::WriteProperties::Defaults()};
    prop.compression = arrow::Compression::ZSTD;
    ARROW_RETURN_NOT_OK(arrow::ipc::feather::WriteTable(*table, cfs.get(), prop));
    ARROW_RETURN_NOT_OK(cfs->Close());
    return arrow::Status::OK();
}

int main(int argc, char** argv) {
    Elapsed rt;
    auto err = [](std::string_view msg) {
        std::cout << msg << std::endl;
        return 1;
    };

    if (argc < 2) return err("usage: roofshade <config.json> [layout]");
    RunConfig rc;
    if (!g_config.read(argv[1], rc)) {
        return err("config err");
    }
    if (argc > 2) {
        rc.sim.layout = argv[2];
    }
    auto& sim = rc.sim;
    glog.level(sim.logLevel);
    std::error_code ec;
    std::filesystem::create_directories(sim.output, ec);
    if (ec) {
        return err(std::format("output folder {}: {}", sim.output.string(), ec.message()));
    }
    if (sim.logFile) {
        glog.write_file(true, sim.output);
    }

    MomentShades ms;
    Cells cells;
    LayoutResult res;
    std::vector<std::string> names;
    try {
        GeoLocation loc(rc.location.latitude, rc.location.longitude, rc.location.timezone);
        LayoutCatalog catalog(rc.layouts, rc.defaultLayout, rc.panel, rc.house);
        res = catalog.select(sim.layout);
        auto summary{catalog.summary(sim.layout)};
        glog.info("{}: {} panels, {}", summary.name, summary.totalPanels, summary.description);
        for (const auto& is : summary.installations) {
            glog.info("  {}", is.line);
        }

        cells = g_cells.build(res, rc.panel);
        names.reserve(cells.size());
        for (const auto& c : cells) {
            names.emplace_back(g_cells.name(res, c));
        }
        BoxScene scene;
        scene.addHouse(rc.house);
        scene.addLayout(res);
        if (sim.cellsInScene) {
            scene.addCells(cells, res);
        }
        scene.seal();
        rt.view("scene setup time: ");

        if (sim.now) {
            sim.moment = nowIn(loc);
        }
        for (const auto& m : sim.moments()) {
            MomentShade s;
            s.moment = m;
            s.utc = toUtc(m, loc);
            s.sun = computeSunPosition(m, loc);
            ms.emplace_back(std::move(s));
        }
        auto ticks{sim.ticks > 0 ? sim.ticks : sim.interval};
        auto calculate = [&](MomentShade& s, bool mt) {
            ShadowTracker tracker(cells.size(), sim.interval);
            for (long long t = 0; t < ticks; ++t) {
                tracker.tick(t, s.sun, cells, scene, mt);
            }
            s.intensities = tracker.intensities();
            s.unavailable = tracker.unavailable();
        };
        if (sim.mt && ms.size() > 1) {
            auto fun = [&](int, int begin, int end) {
                for (int i = begin; i < end; ++i) {
                    calculate(ms[i], false);
                }
            };
            asyncF(fun, ms.size());
        } else {
            for (auto& s : ms) {
                calculate(s, sim.mt);
            }
        }
        for (const auto& s : ms) {
            glog.info("{} sun azimuth {:.1f} elevation {:.1f}{}", s.moment.str(), s.sun.azimuth, s.sun.elevation,
                s.sun.daylight ? "" : " (night)");
            if (s.unavailable > 0) {
                glog.warn("{}: {} cell samples had no occlusion data", s.moment.str(), s.unavailable);
            }
        }
        rt.view("model running time: ");
    } catch (const InvalidLocation& e) {
        return err(e.what());
    } catch (const LayoutError& e) {
        return err(e.what());
    }

    auto folder{sim.output};
    writeSun(folder / "sun.csv", ms);
    writeShadow(folder / std::format("{}_shadow.csv", sim.layout), ms, cells, names, rc);
    writeStrings(folder / std::format("{}_strings.csv", sim.layout), ms, cells, res);
    if (sim.sweep) {
        auto st{writeFeather(folder / std::format("{}_intensity.feather", sim.layout), ms, names)};
        if (!st.ok()) {
            glog.err("feather: {}", st.ToString());
        }
    }
    rt.view("file writing time: ");
    return 0;
}
