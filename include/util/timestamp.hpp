#pragma once

#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <locale>
#include <sstream>
#include <stdexcept>
#include <string>

namespace bfs::util {

// Parses an RFC 1123 HTTP date ("Tue, 02 Dec 2014 08:09:01 GMT" or with a
// numeric "+0000" zone) into epoch seconds.
inline std::time_t parseHttpDate(const std::string& header) {
    std::tm tm = {};
    std::istringstream ss(header);
    ss.imbue(std::locale::classic());
    ss >> std::get_time(&tm, "%a, %d %b %Y %H:%M:%S");
    if (ss.fail()) throw std::runtime_error("Failed to parse HTTP date: " + header);

    std::string zone;
    ss >> zone;

    long offset = 0;
    if (zone.empty() || zone == "GMT" || zone == "UTC" || zone == "Z") offset = 0;
    else if ((zone.front() == '+' || zone.front() == '-') && zone.size() == 5) {
        for (size_t i = 1; i < zone.size(); ++i)
            if (zone[i] < '0' || zone[i] > '9') throw std::runtime_error("Invalid zone in HTTP date: " + header);
        const long hours = std::stol(zone.substr(1, 2));
        const long minutes = std::stol(zone.substr(3, 2));
        offset = (hours * 3600 + minutes * 60) * (zone.front() == '-' ? -1 : 1);
    } else throw std::runtime_error("Invalid zone in HTTP date: " + header);

    return timegm(&tm) - offset;
}

inline std::string formatHttpDate(const std::time_t ts) {
    std::tm tm = {};
    gmtime_r(&ts, &tm);
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << std::put_time(&tm, "%a, %d %b %Y %H:%M:%S GMT");
    return oss.str();
}

inline std::time_t toTimeT(const std::filesystem::file_time_type& ft) {
    const auto sys = std::chrono::file_clock::to_sys(ft);
    return std::chrono::system_clock::to_time_t(
        std::chrono::time_point_cast<std::chrono::system_clock::duration>(sys));
}

} // namespace bfs::util
