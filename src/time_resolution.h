#pragma once

#include <chrono>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>

#include "types.h"

namespace logrca {

// Accepts "YYYY-MM-DDTHH:MM:SS[.fffffffff][Z|+00:00]". Only UTC offsets are accepted.
inline auto ParseIsoTime(const std::string& iso) -> std::optional<Timestamp> {
    if (iso.size() < 19) { return std::nullopt; }
    std::string trimmed = iso;
    if (trimmed.back() == 'Z') {
        trimmed.pop_back();
    } else if (trimmed.size() >= 25 &&
               (trimmed.compare(trimmed.size() - 6, 6, "+00:00") == 0 ||
                trimmed.compare(trimmed.size() - 6, 6, "-00:00") == 0)) {
        trimmed.resize(trimmed.size() - 6);
    }

    std::tm tm{};
    std::istringstream ss(trimmed.substr(0, 19));
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        return std::nullopt;
    }

    long long nanos = 0;
    if (trimmed.size() > 19) {
        if (trimmed[19] != '.') { return std::nullopt; }
        std::string frac = trimmed.substr(20);
        if (frac.empty() || frac.size() > 9) { return std::nullopt; }
        for (char c : frac) {
            if (!std::isdigit(static_cast<unsigned char>(c))) { return std::nullopt; }
        }
        frac.append(9 - frac.size(), '0');
        nanos = std::stoll(frac);
    }

#if defined(_WIN32)
    std::time_t tt = _mkgmtime(&tm);
#else
    std::time_t tt = timegm(&tm);
#endif
    auto tp = std::chrono::system_clock::from_time_t(tt);
    return tp + std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::nanoseconds(nanos));
}

// Microsecond precision, always suffixed with Z.
inline auto FormatIsoTime(Timestamp tp) -> std::string {
    using namespace std::chrono;
    auto secs = time_point_cast<seconds>(tp);
    if (secs > tp) { secs -= seconds(1); }
    auto micros = duration_cast<microseconds>(tp - secs).count();
    std::time_t tt = system_clock::to_time_t(secs);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &tt);
#else
    gmtime_r(&tt, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << "." << std::setw(6) << std::setfill('0') << micros << "Z";
    return oss.str();
}

} // namespace logrca
