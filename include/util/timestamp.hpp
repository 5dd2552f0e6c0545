#pragma once

#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace rh::util {

using TimePoint = std::chrono::system_clock::time_point;

// ISO 8601 UTC with millisecond precision, e.g. 2026-10-19T08:15:30.125Z
inline std::string toIso8601(const TimePoint tp) {
    using namespace std::chrono;
    const auto ms = duration_cast<milliseconds>(tp.time_since_epoch());
    auto secs = duration_cast<seconds>(ms);
    auto frac = ms - secs;
    if (frac.count() < 0) {
        secs -= seconds(1);
        frac += seconds(1);
    }

    const std::time_t t = secs.count();
    std::tm tm{};
    gmtime_r(&t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << frac.count() << 'Z';
    return oss.str();
}

// Accepts "YYYY-MM-DDTHH:MM:SS[.fff...]Z". Throws std::runtime_error otherwise.
inline TimePoint parseIso8601(const std::string& iso) {
    using namespace std::chrono;
    std::tm tm{};
    std::istringstream ss(iso);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) throw std::runtime_error("Failed to parse timestamp: " + iso);

    milliseconds frac{0};
    if (ss.peek() == '.') {
        ss.get();
        std::string digits;
        while (std::isdigit(ss.peek())) digits.push_back(static_cast<char>(ss.get()));
        if (digits.empty()) throw std::runtime_error("Failed to parse timestamp fraction: " + iso);
        digits.resize(3, '0');
        frac = milliseconds(std::stoi(digits));
    }

    if (ss.get() != 'Z' || ss.peek() != std::char_traits<char>::eof())
        throw std::runtime_error("Timestamp is not UTC ISO 8601: " + iso);

    return system_clock::from_time_t(timegm(&tm)) + frac;
}

} // namespace rh::util
