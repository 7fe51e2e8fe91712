#pragma once
#ifndef _CONFIG_H_
#define _CONFIG_H_
#include "env_.h"
#include "scene.h"
#include "solar.h"
#include "log.h"
#include <filesystem>
#include <map>

inline auto jval(const json& j, std::string_view key, auto&& def) {
    auto val{def};
    std::string k{key};
    if (j.contains(k)) {
        val = j.at(k).template get<decltype(val)>();
    }
    return val;
}

struct LocationConf {
    double latitude{};
    double longitude{};
    std::string timezone{};
    std::string city{};
};

struct SimulationSettings {
    std::string layout{};
    SimulatedMoment moment;
    bool now{};
    bool sweep{};
    double begin{};
    double end{};
    double step{1.0};
    int interval{30};
    int ticks{};          // per moment, 0 -> one full interval, else >= interval
    bool mt{};
    bool cellsInScene{};
    std::filesystem::path output{"."};
    int logLevel{c_log_info};
    bool logFile{};

    std::vector<SimulatedMoment> moments() const;
};

struct RunConfig {
    LocationConf location;
    PanelSpec panel;
    std::vector<std::string> stringColors{"#ff7675", "#74b9ff", "#00b894"};
    std::string cellColor{"#0f0f1a"};
    std::map<std::string, PlatformSpec> platforms;
    HouseSpec house;
    std::vector<Layout> layouts;
    std::string defaultLayout{"current"};
    SimulationSettings sim;

    std::string_view stringColor(int string) const {
        if (string >= 0 && string < static_cast<int>(stringColors.size())) return stringColors[string];
        return cellColor;
    }
};

class Config {
public:
    bool read(const std::filesystem::path& file, RunConfig& rc) const;

    bool readLocation(const json& j, LocationConf& lo) const;
    bool readPanel(const json& j, PanelSpec& ps, std::vector<std::string>& colors) const;
    bool readPlatform(const json& j, PlatformSpec& pf) const;
    bool readHouse(const json& j, HouseSpec& hs) const;
    bool readLayouts(const json& j, const std::map<std::string, PlatformSpec>& platforms, std::vector<Layout>& layouts) const;
    bool readSimulation(const json& j, const std::filesystem::path& folder, SimulationSettings& ss) const;

    void writePlacements(const LayoutResult& res, const std::filesystem::path& file) const;
};
static const Config g_config;
#endif
