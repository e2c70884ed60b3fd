#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace trade_analytics {

using Timestamp = std::chrono::system_clock::time_point;

/**
 * Shared helpers for ingestion, formatting and the HTTP layer.
 */
namespace utils {

inline std::tm ts_to_tm(Timestamp ts) {
    auto t = std::chrono::system_clock::to_time_t(ts);
    std::tm tm{};
    gmtime_r(&t, &tm);
    return tm;
}

/**
 * Format timestamp as ISO 8601 string (e.g., "2024-01-15T10:30:00Z").
 */
inline std::string ts_to_iso(Timestamp ts) {
    std::tm tm = ts_to_tm(ts);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return std::string(buf);
}

/**
 * Format timestamp as date string (e.g., "2024-01-15").
 */
inline std::string ts_to_date(Timestamp ts) {
    std::tm tm = ts_to_tm(ts);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d", &tm);
    return std::string(buf);
}

inline std::optional<Timestamp> parse_with_format(const std::string& s, const char* fmt) {
    std::tm tm{};
    std::istringstream ss(s);
    ss >> std::get_time(&tm, fmt);
    if (ss.fail()) return std::nullopt;
    // Fractional seconds are dropped. Only a UTC designator may follow;
    // offsets and junk are rejected.
    if (ss.peek() == '.' && std::string(fmt).find("%S") != std::string::npos) {
        ss.get();
        while (std::isdigit(ss.peek())) ss.get();
    }
    if (ss.peek() == 'Z') ss.get();
    if (ss.peek() != std::char_traits<char>::eof()) return std::nullopt;
    return Timestamp{} + std::chrono::seconds(timegm(&tm));
}

/**
 * Parse ISO 8601 timestamp string to Timestamp.
 * Supports: "2024-01-15T10:30:00Z", "2024-01-15T10:30:00" and "2024-01-15 10:30:00".
 */
inline std::optional<Timestamp> parse_iso_ts(const std::string& s) {
    if (s.empty()) return std::nullopt;
    if (auto ts = parse_with_format(s, "%Y-%m-%dT%H:%M:%S")) return ts;
    return parse_with_format(s, "%Y-%m-%d %H:%M:%S");
}

inline std::optional<Timestamp> parse_date(const std::string& s) {
    if (s.empty()) return std::nullopt;
    return parse_with_format(s, "%Y-%m-%d");
}

// Epoch count in Unit, or nullopt when it does not fit in a Timestamp.
template <typename Unit>
inline std::optional<Timestamp> epoch_in(int64_t v) {
    const auto limit = std::chrono::duration_cast<Unit>(Timestamp::duration::max()).count();
    if (v < 0 || v > limit) return std::nullopt;
    return Timestamp{} + std::chrono::duration_cast<Timestamp::duration>(Unit(v));
}

/**
 * Parse timestamp from various formats (ISO, date, or numeric epoch).
 * Epoch width picks the unit: 19+ digits ns, 16+ us, 13+ ms, otherwise s.
 */
inline std::optional<Timestamp> parse_ts_any(const std::string& s) {
    if (s.empty()) return std::nullopt;

    bool all_digits = std::all_of(s.begin(), s.end(),
        [](unsigned char c) { return std::isdigit(c); });

    if (all_digits) {
        if (s.size() > 19) return std::nullopt;
        int64_t v = 0;
        try {
            v = std::stoll(s);
        } catch (const std::out_of_range&) {
            return std::nullopt;
        }
        if (s.size() >= 19) {
            return epoch_in<std::chrono::nanoseconds>(v);
        } else if (s.size() >= 16) {
            return epoch_in<std::chrono::microseconds>(v);
        } else if (s.size() >= 13) {
            return epoch_in<std::chrono::milliseconds>(v);
        }
        return epoch_in<std::chrono::seconds>(v);
    }

    if (auto ts = parse_iso_ts(s)) return ts;
    return parse_date(s);
}

/**
 * Strict decimal parse: the whole field must be consumed and the value finite.
 */
inline std::optional<double> parse_double(const std::string& s) {
    if (s.empty()) return std::nullopt;
    char* end = nullptr;
    double v = std::strtod(s.c_str(), &end);
    if (end != s.c_str() + s.size() || !std::isfinite(v)) return std::nullopt;
    return v;
}

inline std::string trim(const std::string& s) {
    auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

inline std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

/**
 * Split one CSV record. Double-quoted fields may contain commas and "" escapes.
 */
inline std::vector<std::string> split_csv_line(const std::string& line) {
    std::vector<std::string> out;
    std::string field;
    bool quoted = false;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quoted) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    field.push_back('"');
                    ++i;
                } else {
                    quoted = false;
                }
            } else {
                field.push_back(c);
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == ',') {
            out.push_back(trim(field));
            field.clear();
        } else if (c != '\r') {
            field.push_back(c);
        }
    }
    out.push_back(trim(field));
    return out;
}

inline const char* weekday_name(int wday) {
    static const char* names[] = {"Sunday", "Monday", "Tuesday", "Wednesday",
                                  "Thursday", "Friday", "Saturday"};
    return (wday >= 0 && wday < 7) ? names[wday] : "";
}

inline const char* month_name(int month_index) {
    static const char* names[] = {"January", "February", "March", "April", "May", "June", "July",
                                  "August", "September", "October", "November", "December"};
    return (month_index >= 0 && month_index < 12) ? names[month_index] : "";
}

} // namespace utils
} // namespace trade_analytics
