#pragma once
#ifndef _COORD_H_
#define _COORD_H_
#include "eigen_.h"

// full extents along x (width), y (height), z (depth)
struct Dimensions {
    double width{};
    double height{};
    double depth{};

    inline ep3 vec() const {
        return ep3{width, height, depth};
    }
};

// Edge coordinates give the minimum corner of a box measured from a fixed
// reference edge, center coordinates its middle. Every placement goes through
// these two.
inline ep3 edgeToCenter(const ep3& edge, const Dimensions& dim) {
    return edge + dim.vec() * 0.5;
}

inline ep3 centerToEdge(const ep3& center, const Dimensions& dim) {
    return center - dim.vec() * 0.5;
}
#endif
