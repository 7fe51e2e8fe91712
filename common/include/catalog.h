#pragma once
#ifndef _CATALOG_H_
#define _CATALOG_H_
#include "scene.h"
#include <optional>
#include <string>
#include <vector>

struct InstallationSummary {
    std::string id{};
    int panels{};
    int orientation{};
    std::optional<double> connector;
    std::string line{};
};

struct LayoutSummary {
    std::string id{};
    std::string name{};
    std::string description{};
    int totalPanels{};
    std::vector<InstallationSummary> installations;
};

class LayoutCatalog {
public:
    LayoutCatalog(std::vector<Layout> layouts, std::string defaultId, const PanelSpec& panel, const HouseSpec& house);

    const Layout* find(std::string_view id) const;
    const Layout& defaultLayout() const;
    std::vector<std::string> ids() const;

    // every installation laid out on the house and placed in the world;
    // throws LayoutError for unknown ids, bad rows and overlapping installations
    LayoutResult select(std::string_view id) const;

    LayoutSummary summary(std::string_view id) const;

    void checkFootprints(const Layout& layout, const LayoutResult& res) const;
private:
    std::vector<Layout> _layouts;
    std::string _default{};
    PanelSpec _panel;
    HouseSpec _house;
};
#endif
