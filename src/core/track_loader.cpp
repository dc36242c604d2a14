/// @file src/core/track_loader.cpp
/// @brief CSV TrackLoader.

#include "trka/track_loader.hpp"

#include <chrono>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace trka::core {

namespace {

[[nodiscard]] std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

/// Whole-token decimal parse; nullopt on garbage.
[[nodiscard]] std::optional<double> parse_number(const std::string& token) noexcept {
    try {
        std::size_t pos = 0;
        const double val = std::stod(token, &pos);
        if (pos != token.size()) {
            return std::nullopt;  // trailing garbage
        }
        return val;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

}  // namespace

// ─── TrackLoader::parse_timestamp ─────────────────────────────────────────────

std::optional<double> TrackLoader::parse_timestamp(std::string_view text) noexcept {
    const std::string token = trim(std::string(text));
    if (token.empty()) return std::nullopt;

    if (token.find('-', 1) == std::string::npos) {
        return parse_number(token);
    }

    int y = 0, mo = 0, d = 0, h = 0, mi = 0;
    double sec = 0.0;
    int consumed = 0;
    if (std::sscanf(token.c_str(), "%4d-%2d-%2dT%2d:%2d:%lf%n",
                    &y, &mo, &d, &h, &mi, &sec, &consumed) != 6) {
        return std::nullopt;
    }
    const std::string rest = token.substr(static_cast<std::size_t>(consumed));
    if (!rest.empty() && rest != "Z" && rest != "+00:00") {
        return std::nullopt;
    }

    using namespace std::chrono;
    const year_month_day ymd{year{y}, month{static_cast<unsigned>(mo)},
                             day{static_cast<unsigned>(d)}};
    if (!ymd.ok() || h < 0 || h > 23 || mi < 0 || mi > 59 || sec < 0.0 || sec >= 61.0) {
        return std::nullopt;
    }
    const auto days = sys_days{ymd}.time_since_epoch();
    return static_cast<double>(duration_cast<seconds>(days).count())
         + h * 3600.0 + mi * 60.0 + sec;
}

// ─── TrackLoader::parse_row ───────────────────────────────────────────────────

std::optional<TrackPoint> TrackLoader::parse_row(const std::string& line) noexcept {
    std::istringstream ss(line);
    std::string token;
    std::vector<std::string> fields;
    while (std::getline(ss, token, ',')) {
        fields.push_back(trim(token));
    }
    // getline drops a trailing empty field.
    if (!line.empty() && line.back() == ',') {
        fields.emplace_back();
    }
    if (fields.size() < 2 || fields.size() > 4) {
        return std::nullopt;
    }

    const auto lat = parse_number(fields[0]);
    const auto lon = parse_number(fields[1]);
    if (!lat || !lon) {
        return std::nullopt;
    }

    TrackPoint p{
        .latitude  = *lat,
        .longitude = *lon,
        .elevation = std::nullopt,
        .timestamp = std::nullopt,
    };

    if (fields.size() >= 3 && !fields[2].empty()) {
        p.elevation = parse_number(fields[2]);
        if (!p.elevation) return std::nullopt;
    }
    if (fields.size() == 4 && !fields[3].empty()) {
        p.timestamp = parse_timestamp(fields[3]);
        if (!p.timestamp) return std::nullopt;
    }
    return p;
}

// ─── TrackLoader::parse_csv_string ────────────────────────────────────────────

LoadedTrack TrackLoader::parse_csv_string(const std::string& csv_content) noexcept {
    LoadedTrack out;
    std::istringstream stream(csv_content);
    std::string line;
    bool header_skipped = false;

    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        const std::string body = trim(line);
        if (body.empty() || body[0] == '#') {
            continue;
        }
        if (!header_skipped) {
            header_skipped = true;
            continue;
        }

        auto point = parse_row(body);
        if (point) {
            out.points.push_back(*point);
        } else {
            ++out.skipped_rows;
        }
    }
    return out;
}

// ─── TrackLoader::load_csv ────────────────────────────────────────────────────

std::optional<LoadedTrack> TrackLoader::load_csv(const std::string& filepath) noexcept {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::string contents;
    std::string line;
    while (std::getline(file, line)) {
        contents += line;
        contents += '\n';
    }
    return parse_csv_string(contents);
}

}  // namespace trka::core
