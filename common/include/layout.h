#pragma once
#ifndef _LAYOUT_H_
#define _LAYOUT_H_
#include "coord.h"
#include "bg_.h"
#include <optional>
#include <string>
#include <vector>

struct PanelSpec {
    double length{1.762};    // long side
    double width{1.134};     // short side
    double thickness{0.04};
    int cellColumns{16};
    int cellRows{6};
    int stringCount{3};

    // x along the row, z along the tilt axis
    Dimensions oriented(int orientation) const {
        if (orientation == c_portrait) return Dimensions{width, thickness, length};
        return Dimensions{length, thickness, width};
    }
};

struct PlatformSpec {
    double tilt{13.0};       // deg
    double length{1.145};
    double thickness{0.082};
    double mountOffset{c_default_mount_offset};
    int orientation{c_landscape};
};

struct RowConfiguration {
    int columns{1};
    std::optional<double> connector; // pitch to the next row
};

struct Installation {
    std::string id{};
    std::vector<RowConfiguration> rows;
    PlatformSpec platform;
    ep3 position{ep3::Zero()}; // house local edge coordinates
    ep3 rotation{ep3::Zero()}; // euler xyz, rad

    int panelCount() const {
        auto n{0};
        for (const auto& r : rows) n += r.columns;
        return n;
    }

    std::optional<double> firstConnector() const {
        for (const auto& r : rows) {
            if (r.connector) return r.connector;
        }
        return std::nullopt;
    }
};

struct Layout {
    std::string id{};
    std::string name{};
    std::string description{};
    std::vector<Installation> installations;
};

struct Spacing {
    double projectedDepth{};  // D
    double rearElevation{};   // H
    double airGap{};          // G
    double rowSpacing{};      // P
    double tiltAxis{};        // W
    double singleColWidth{};
    double platformLength{};
    double platformThickness{};
    double mountOffset{};
};

struct SpacingInfo {
    int projectedDepthMm{};
    int airGapMm{};
    int rowSpacingMm{};
    int tiltAxisMm{};
    int orientation{};
    std::string description{};
};

// box with its pose inside the installation, on the house and in the world
struct BoxPlacement {
    ep3 edge{ep3::Zero()};
    Dimensions size{};
    ep3 center{ep3::Zero()};
    ep3 rotation{ep3::Zero()};
    e_iso pose{e_iso::Identity()};
    e_iso world{e_iso::Identity()};

    inline ep3 worldCenter() const {
        return world.translation();
    }

    inline ep3 worldRotation() const {
        return e_euler_of(world.linear());
    }
};

struct PanelPlacement {
    std::string installation{};
    int row{};
    int column{};
    int orientation{};
    BoxPlacement platform;
    BoxPlacement panel;
};

struct ConnectorPlacement {
    std::string installation{};
    int row{};
    bool left{};
    BoxPlacement box;
};

struct LayoutResult {
    std::vector<PanelPlacement> panels;
    std::vector<ConnectorPlacement> connectors;
    std::vector<Spacing> spacings; // per row

    void append(LayoutResult&& other);
};

int orientationOf(std::string_view name);
std::string_view orientationName(int orientation);

Spacing calculateSpacing(const PanelSpec& panel, const PlatformSpec& platform, double connector);
SpacingInfo spacingInfo(const PanelSpec& panel, const PlatformSpec& platform, double connector);

e_iso installationFrame(const Installation& inst);

// installation geometry on the house; throws LayoutError
LayoutResult layoutInstallation(const Installation& inst, const PanelSpec& panel);

// house -> world for every box
void placeInWorld(LayoutResult& res, const e_iso& house);

// platforms and connectors projected on the roof plane (house x, z)
Polys footprint(const LayoutResult& res, std::string_view installation);
#endif
