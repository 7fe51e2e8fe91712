#pragma once
#ifndef _SOLAR_H_
#define _SOLAR_H_
#include "eigen_.h"
#include "tz.h"
#include <string>

// immutable, throws InvalidLocation
class GeoLocation {
public:
    GeoLocation(double latitude, double longitude, const std::string& timezone);

    double latitude() const { return _latitude; }
    double longitude() const { return _longitude; }
    const std::string& timezone() const { return _timezone; }
    const tz_ptr& zone() const { return _zone; }
private:
    double _latitude{};
    double _longitude{};
    std::string _timezone{};
    tz_ptr _zone;
};

struct SimulatedMoment {
    int year{2024};
    int month{1};
    int day{1};
    double hour{12.0}; // wall clock, [0, 24)

    bool valid() const;
    std::string str() const;
};

// azimuth is a compass bearing: 0 north, 90 east, 180 south, 270 west
struct SunVector {
    double azimuth{};
    double elevation{}; // clamped >= 0
    double altitude{};  // raw signed
    bool daylight{};
};

// declination / hour angle ephemeris on a UTC instant
struct Solar {
    double h{};       // altitude, rad
    double a{};       // azimuth from south, west positive, rad
    double longitude{};
    double sinlat{};
    double coslat{};
    double e{};
    double sinD{};
    double cosD{};
    int day{-1};

    Solar(double lat, double lon) {
        lat = deg2rad(lat);
        sinlat = std::sin(lat);
        coslat = std::cos(lat);
        longitude = lon - 180.0;
    }

    void sv(const ptime& utc);
};

ptime toUtc(const SimulatedMoment& moment, const GeoLocation& location);
SunVector computeSunPosition(const SimulatedMoment& moment, const GeoLocation& location);
SimulatedMoment nowIn(const GeoLocation& location);

// unit vector toward the sun, y up, x east, -z north
ep3 sunDirection(const SunVector& sun);
ep3 sunWorldPosition(const SunVector& sun);
#endif
