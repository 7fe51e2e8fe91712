#pragma once
#ifndef _SCENE_H_
#define _SCENE_H_
#include "panel.h"
#include <algorithm>
#include <string>
#include <vector>

struct RoofObject {
    std::string id{};
    std::string type{"chimney"};
    ep3 position{ep3::Zero()}; // x from west wall, y above roof, z from north wall
    Dimensions size{};
    bool pipe{};
    double pipeDiameter{};
    double pipeHeight{};
    ep3 pipeOffset{ep3::Zero()}; // from the object's edge, y from its top
};

// house local frame: origin at the north-west ground corner, x east, z south
struct HouseSpec {
    double width{5.6};     // east-west
    double depth{8.71};    // north-south
    double height{3.0};
    double rotationFromNorth{30.0}; // deg about y
    double roofWidth{5.6};
    double roofDepth{9.21};
    double roofThickness{0.2};
    double parapetHeight{0.16};
    double parapetWidth{0.15};
    std::vector<std::string> parapetSides{"north", "west", "south"};
    std::vector<RoofObject> objects;

    bool parapet(std::string_view side) const {
        return std::find(parapetSides.begin(), parapetSides.end(), side) != parapetSides.end();
    }

    double roofTop() const {
        return height + roofThickness;
    }

    e_iso frame() const;
    bg_polygon roofOutline() const;
};

struct Occluder {
    int id{};
    int kind{};
    std::string name{};
    Dimensions size{};
    e_iso pose{e_iso::Identity()};
    e_iso inv{e_iso::Identity()};
    e_box bounds;
};

struct Hit {
    int id{};
    double distance{};
    Dimensions extent{};
};
using Hits = std::vector<Hit>;

// ray queries against scene geometry, hits ordered by distance
class OccluderQuery {
public:
    virtual ~OccluderQuery() = default;
    virtual Hits castRay(const ep3& origin, const ep3& direction) const = 0;
};

class BoxScene : public OccluderQuery {
public:
    int add(int kind, const std::string& name, const e_iso& pose, const Dimensions& size);

    // no more geometry after this, queries before it throw OcclusionQueryUnavailable
    void seal();
    bool sealed() const { return _sealed; }

    size_t size() const { return _occs.size(); }
    const Occluder& at(int id) const { return _occs.at(id); }

    Hits castRay(const ep3& origin, const ep3& direction) const override;

    void addHouse(const HouseSpec& house);
    void addLayout(const LayoutResult& res);
    void addCells(Cells& cells, const LayoutResult& res);
private:
    std::vector<Occluder> _occs;
    bool _sealed{};
};
#endif
