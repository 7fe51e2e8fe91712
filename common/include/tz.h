#pragma once
#ifndef _TZ_H_
#define _TZ_H_
#include <boost/date_time/local_time/local_time.hpp>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>
using tz_rule = boost::local_time::time_zone_ptr;
using ptime = boost::posix_time::ptime;
using gdate = boost::gregorian::date;

// one local time type of a zone
struct ZoneType {
    int offset{}; // seconds east of UTC
    bool dst{};
};

// transition history of a zone, the POSIX rule continues past its end
struct Zone {
    std::vector<std::int64_t> at;  // unix seconds, ascending
    std::vector<std::uint8_t> type; // type in force from at[i]
    std::vector<ZoneType> types;
    tz_rule rule;

    ZoneType typeAt(std::int64_t utc) const;
};
using tz_ptr = std::shared_ptr<const Zone>;

struct ZoneDb {
    std::filesystem::path dir{"/usr/share/zoneinfo"};

    ZoneDb();

    // IANA id ("Europe/Amsterdam") or POSIX rule ("CET-1CEST,M3.5.0,M10.5.0/3").
    // Throws InvalidLocation when neither resolves.
    tz_ptr load(const std::string& id) const;

    // TZif v1-v4; footer is the v2+ POSIX rule, empty when absent
    bool read(const std::filesystem::path& file, Zone& zone, std::string& footer) const;
};

// POSIX counts offsets west of Greenwich as positive, Boost east.
bool tz_posix_to_boost(std::string_view posix, std::string& out);

// wall clock -> UTC; a spring-forward gap resolves past the gap,
// a fall-back repeat resolves to the first (DST) occurrence
ptime tz_to_utc(const tz_ptr& tz, const gdate& d, const boost::posix_time::time_duration& td);
ptime tz_to_local(const tz_ptr& tz, const ptime& utc);

static const ZoneDb g_zones;
#endif
