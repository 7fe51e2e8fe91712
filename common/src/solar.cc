#include "solar.h"
#include "error.h"
#include "log.h"
#include <format>

GeoLocation::GeoLocation(double latitude, double longitude, const std::string& timezone)
    : _latitude(latitude), _longitude(longitude), _timezone(timezone) {
    if (!(latitude >= -90.0 && latitude <= 90.0)) {
        throw InvalidLocation(std::format("latitude {} outside [-90, 90]", latitude));
    }
    if (!(longitude >= -180.0 && longitude <= 180.0)) {
        throw InvalidLocation(std::format("longitude {} outside [-180, 180]", longitude));
    }
    _zone = g_zones.load(timezone);
}

bool SimulatedMoment::valid() const {
    if (!(hour >= 0.0 && hour < 24.0)) return false;
    try {
        gdate d(year, month, day);
        return !d.is_special();
    } catch (const std::out_of_range&) {
        return false;
    }
}

std::string SimulatedMoment::str() const {
    auto minutes{static_cast<int>(std::floor(hour * 60.0 + 1e-6))};
    return std::format("{:04}-{:02}-{:02} {:02}:{:02}", year, month, day, minutes / 60, minutes % 60);
}

void Solar::sv(const ptime& utc) {
    auto d{static_cast<int>(utc.date().day_of_year())};
    auto hour{utc.time_of_day().total_microseconds() * 1e-6 / 3600.0};
    if (day != d) {
        day = d;
        auto declination{deg2rad(23.45 * std::sin((284.0 + day) * c_declination))};
        sinD = std::sin(declination);
        cosD = std::cos(declination);
        auto W{day * c_declination};
        // equation of time in hours -> degrees of hour angle
        e = (-0.0002786409 + 0.1227715 * std::cos(W + 1.498311)
            - 0.1654575 * std::cos(2 * W - 1.261546)
            - 0.00535383 * std::cos(3 * W - 1.1571)) * 15.0 + longitude;
    }
    auto w{std::remainder(deg2rad(e + 15.0 * hour), 2.0 * c_pi)};
    auto sinh{sinlat * sinD + coslat * cosD * std::cos(w)};
    h = std::asin(std::max(-1.0, std::min(1.0, sinh)));
    auto cosa{div_s(sinh * sinlat - sinD, std::cos(h) * coslat)};
    a = std::acos(std::max(-1.0, std::min(1.0, cosa)));
    if (w < 0.0) {
        a *= -1.0;
    }
}

ptime toUtc(const SimulatedMoment& moment, const GeoLocation& location) {
    static constexpr long long c_day_us{86400LL * 1000000LL - 1};
    auto us{std::min(c_day_us, std::llround(moment.hour * 3.6e9))};
    gdate d(moment.year, moment.month, moment.day);
    return tz_to_utc(location.zone(), d, boost::posix_time::microseconds(us));
}

SunVector computeSunPosition(const SimulatedMoment& moment, const GeoLocation& location) {
    Solar solar(location.latitude(), location.longitude());
    solar.sv(toUtc(moment, location));
    SunVector sun;
    sun.altitude = rad2deg(solar.h);
    sun.elevation = std::max(0.0, sun.altitude);
    sun.daylight = sun.altitude > 0.0;
    // south based ephemeris azimuth + 180 -> bearing from north
    sun.azimuth = std::fmod(rad2deg(solar.a) + 180.0, 360.0);
    if (sun.azimuth < 0.0) sun.azimuth += 360.0;
    if (sun.azimuth >= 360.0) sun.azimuth = 0.0;
    return sun;
}

SimulatedMoment nowIn(const GeoLocation& location) {
    auto local{tz_to_local(location.zone(), boost::posix_time::microsec_clock::universal_time())};
    SimulatedMoment m;
    auto ymd{local.date().year_month_day()};
    m.year = ymd.year;
    m.month = ymd.month;
    m.day = ymd.day;
    m.hour = local.time_of_day().total_seconds() / 3600.0;
    glog.dbg("now in {}: {}", location.timezone(), m.str());
    return m;
}

ep3 sunDirection(const SunVector& sun) {
    auto az{deg2rad(sun.azimuth)};
    auto el{deg2rad(sun.elevation)};
    return ep3{std::cos(el) * std::sin(az), std::sin(el), -std::cos(el) * std::cos(az)};
}

ep3 sunWorldPosition(const SunVector& sun) {
    return sunDirection(sun) * c_sun_distance;
}
