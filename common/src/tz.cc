#include "tz.h"
#include "error.h"
#include "log.h"
#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <format>
#include <iterator>

ZoneDb::ZoneDb() {
    if (const char* env = std::getenv("TZDIR")) {
        if (*env) dir = env;
    }
}

namespace {
const ptime c_epoch{gdate(1970, 1, 1)};
constexpr std::int64_t c_day{86400};

// big endian, two's complement
std::int64_t be(const std::string& data, size_t pos, int bytes) {
    std::uint64_t v{};
    for (int i = 0; i < bytes; ++i) {
        v = (v << 8) | static_cast<unsigned char>(data[pos + i]);
    }
    if (bytes == 4) return static_cast<std::int32_t>(static_cast<std::uint32_t>(v));
    return static_cast<std::int64_t>(v);
}

std::int64_t unixSeconds(const ptime& t) {
    return (t - c_epoch).total_seconds();
}
}

ZoneType Zone::typeAt(std::int64_t utc) const {
    if (at.empty() || utc >= at.back()) {
        if (rule) {
            boost::local_time::local_date_time ldt(c_epoch + boost::posix_time::seconds(utc), rule);
            return ZoneType{static_cast<int>((ldt.local_time() - ldt.utc_time()).total_seconds()), ldt.is_dst()};
        }
        if (!at.empty()) return types[type.back()];
        return types.empty() ? ZoneType{} : types.front();
    }
    // before the first transition the first type applies
    if (utc < at.front()) return types.front();
    auto it{std::upper_bound(at.begin(), at.end(), utc)};
    return types[type[it - at.begin() - 1]];
}

bool ZoneDb::read(const std::filesystem::path& file, Zone& zone, std::string& footer) const {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(file, ec)) return false;
    std::ifstream f(file, std::ios::binary);
    if (!f) return false;
    std::string data{std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>()};
    if (data.size() < 44 || data.compare(0, 4, "TZif") != 0) return false;

    // isutcnt, isstdcnt, leapcnt, timecnt, typecnt, charcnt
    std::array<std::int64_t, 6> n{};
    auto header = [&](size_t pos) {
        for (int i = 0; i < 6; ++i) {
            n[i] = be(data, pos + 20 + 4 * i, 4);
            if (n[i] < 0) return false;
        }
        return true;
    };
    auto block = [&](int width) {
        return n[3] * width + n[3] + n[4] * 6 + n[5] + n[2] * (width + 4) + n[1] + n[0];
    };
    auto v1{data[4] == '\0'};
    if (!header(0)) return false;
    size_t pos{44};
    auto width{4};
    if (!v1) {
        // skip the 32 bit block, the second header describes the 64 bit one
        pos += static_cast<size_t>(block(4));
        if (data.size() < pos + 44 || data.compare(pos, 4, "TZif") != 0 || !header(pos)) return false;
        pos += 44;
        width = 8;
    }
    if (n[4] == 0 || data.size() < pos + static_cast<size_t>(block(width))) return false;

    Zone z;
    z.at.reserve(n[3]);
    for (std::int64_t i = 0; i < n[3]; ++i) {
        z.at.emplace_back(be(data, pos, width));
        pos += width;
    }
    for (std::int64_t i = 0; i < n[3]; ++i) {
        auto t{static_cast<std::uint8_t>(data[pos++])};
        if (t >= n[4]) return false;
        z.type.emplace_back(t);
    }
    for (std::int64_t i = 0; i < n[4]; ++i) {
        z.types.emplace_back(ZoneType{static_cast<int>(be(data, pos, 4)), data[pos + 4] != '\0'});
        pos += 6;
    }
    pos += static_cast<size_t>(n[5] + n[2] * (width + 4) + n[1] + n[0]);

    footer.clear();
    if (!v1 && pos < data.size() && data[pos] == '\n') {
        auto end{data.find('\n', pos + 1)};
        if (end != std::string::npos) footer = data.substr(pos + 1, end - pos - 1);
    }
    zone = std::move(z);
    return true;
}

tz_ptr ZoneDb::load(const std::string& id) const {
    if (id.empty()) throw InvalidLocation("empty timezone");
    auto zone{std::make_shared<Zone>()};
    std::string posix{};
    auto history{id.find("..") == std::string::npos && read(dir / id, *zone, posix)};
    if (history) {
        glog.dbg("timezone {}: {} transitions, rule '{}'", id, zone->at.size(), posix);
    } else if (std::any_of(id.begin(), id.end(), [](unsigned char c) { return std::isdigit(c); })) {
        posix = id;
    } else if (id == "UTC" || id == "GMT") {
        posix = "UTC0";
    } else {
        throw InvalidLocation(std::format("unknown timezone '{}' (zoneinfo {})", id, dir.string()));
    }
    if (posix.empty()) return zone;

    std::string rule{};
    if (!tz_posix_to_boost(posix, rule)) {
        if (!history) {
            throw InvalidLocation(std::format("unsupported timezone rule '{}' for '{}'", posix, id));
        }
        // the last transition type stays in force
        glog.warn("timezone {}: rule '{}' unsupported, history only", id, posix);
        return zone;
    }
    try {
        zone->rule = tz_rule(new boost::local_time::posix_time_zone(rule));
    } catch (const std::exception& e) {
        if (!history) {
            throw InvalidLocation(std::format("timezone '{}' rule '{}': {}", id, rule, e.what()));
        }
        glog.warn("timezone {}: rule '{}': {}, history only", id, rule, e.what());
    }
    return zone;
}

namespace {
bool zone_name(std::string_view& sv, std::string& name, std::string_view placeholder) {
    if (sv.empty()) return false;
    if (sv.front() == '<') {
        auto end{sv.find('>')};
        if (end == std::string_view::npos) return false;
        sv.remove_prefix(end + 1);
        name = placeholder;
        return true;
    }
    name.clear();
    while (!sv.empty() && std::isalpha(static_cast<unsigned char>(sv.front()))) {
        name.push_back(sv.front());
        sv.remove_prefix(1);
    }
    return name.size() >= 3;
}

// [+-]hh[:mm[:ss]] in seconds
bool zone_offset(std::string_view& sv, int& seconds) {
    auto sign{1};
    if (!sv.empty() && (sv.front() == '+' || sv.front() == '-')) {
        sign = sv.front() == '-' ? -1 : 1;
        sv.remove_prefix(1);
    }
    std::array<int, 3> parts{};
    auto n{0};
    while (n < 3) {
        if (sv.empty() || !std::isdigit(static_cast<unsigned char>(sv.front()))) return n > 0;
        auto v{0};
        while (!sv.empty() && std::isdigit(static_cast<unsigned char>(sv.front()))) {
            v = v * 10 + (sv.front() - '0');
            sv.remove_prefix(1);
        }
        parts[n++] = v;
        seconds = sign * (parts[0] * 3600 + parts[1] * 60 + parts[2]);
        if (sv.empty() || sv.front() != ':') return true;
        sv.remove_prefix(1);
    }
    return true;
}

std::string hms(int seconds) {
    auto sign{seconds < 0 ? '-' : '+'};
    seconds = std::abs(seconds);
    return std::format("{}{:02}:{:02}:{:02}", sign, seconds / 3600, seconds / 60 % 60, seconds % 60);
}
}

bool tz_posix_to_boost(std::string_view posix, std::string& out) {
    std::string stdName{};
    std::string dstName{};
    auto stdOff{0};
    if (!zone_name(posix, stdName, "STD") || !zone_offset(posix, stdOff)) return false;
    out = stdName + hms(-stdOff);
    if (posix.empty()) return true;
    if (!zone_name(posix, dstName, "DST")) return false;
    out += dstName;
    if (!posix.empty() && posix.front() != ',') {
        auto dstOff{0};
        if (!zone_offset(posix, dstOff)) return false;
        out += hms(stdOff - dstOff);
    }
    // Boost only knows transition times inside [0, 24h)
    for (auto pos{posix.find('/')}; pos != std::string_view::npos; pos = posix.find('/', pos + 1)) {
        auto t{posix.substr(pos + 1)};
        auto secs{0};
        if (!zone_offset(t, secs) || secs < 0 || secs >= 24 * 3600) return false;
    }
    out += posix;
    return true;
}

ptime tz_to_utc(const tz_ptr& tz, const gdate& d, const boost::posix_time::time_duration& td) {
    ptime local(d, td);
    auto l{unixSeconds(local)};
    // no zone changes its offset twice within a day
    auto before{tz->typeAt(l - c_day)};
    auto after{tz->typeAt(l + c_day)};
    auto fits = [&](const ZoneType& t) {
        return tz->typeAt(l - t.offset).offset == t.offset;
    };
    auto early{fits(before)};
    auto late{fits(after)};
    if (early && late) {
        // a repeated label resolves to its first occurrence
        return local - boost::posix_time::seconds(std::max(before.offset, after.offset));
    }
    if (early || late) {
        return local - boost::posix_time::seconds(early ? before.offset : after.offset);
    }
    // a skipped label is read with the offset in force before the gap
    return local - boost::posix_time::seconds(before.offset);
}

ptime tz_to_local(const tz_ptr& tz, const ptime& utc) {
    return utc + boost::posix_time::seconds(tz->typeAt(unixSeconds(utc)).offset);
}
