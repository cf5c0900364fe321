/// @file src/core/data_loader.cpp
/// @brief CSV DataLoader for binary evolution tracks.

#include "gwbkit/data_loader.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <charconv>
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace gwbkit::core {

namespace {

constexpr std::size_t NCOLS_BASE = 8;
constexpr std::size_t NCOLS_TIME = 9;

[[nodiscard]] std::string trim(const std::string& token) {
    const auto first = token.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = token.find_last_not_of(" \t\r\n");
    return token.substr(first, last - first + 1);
}

/// Number of columns in the header, or 0 if it is not a tracks header.
[[nodiscard]] std::size_t header_columns(const std::string& header) {
    std::istringstream ss(header);
    std::string token;
    std::vector<std::string> names;
    while (std::getline(ss, token, ',')) {
        names.push_back(trim(token));
    }
    static const char* const expected[NCOLS_TIME] = {
        "binary", "sepa", "eccen", "redz", "mass1", "mass2", "dadt", "dedt", "time"};
    if (names.size() != NCOLS_BASE && names.size() != NCOLS_TIME) {
        return 0;
    }
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (names[i] != expected[i]) {
            return 0;
        }
    }
    return names.size();
}

}  // namespace

// ─── DataLoader::validate_row ─────────────────────────────────────────────────

bool DataLoader::validate_row(const TrackRow& row) noexcept {
    if (!std::isfinite(row.sepa)  || !std::isfinite(row.eccen) ||
        !std::isfinite(row.redz)  || !std::isfinite(row.mass1) ||
        !std::isfinite(row.mass2) || !std::isfinite(row.dadt)  ||
        !std::isfinite(row.dedt)  || !std::isfinite(row.time)) {
        return false;
    }
    if (row.sepa <= 0.0)  return false;
    if (row.mass1 <= 0.0 || row.mass2 <= 0.0) return false;
    if (row.redz <= -1.0) return false;
    if (row.eccen < 0.0 || row.eccen >= 1.0) return false;
    return true;
}

// ─── DataLoader::parse_row ────────────────────────────────────────────────────

std::optional<TrackRow>
DataLoader::parse_row(const std::string& line, std::size_t ncols) noexcept {
    if (line.empty() || line[0] == '#') {
        return std::nullopt;
    }

    std::istringstream ss(line);
    std::string token;
    double fields[NCOLS_TIME] = {};
    std::size_t count = 0;

    while (std::getline(ss, token, ',')) {
        if (count == ncols) {
            return std::nullopt;  // too many columns
        }
        token = trim(token);
        if (token.empty()) {
            return std::nullopt;
        }
        const char* begin = token.data();
        const char* end   = token.data() + token.size();
        double val = 0.0;
        const auto [ptr, ec] = std::from_chars(begin, end, val);
        if (ec != std::errc{} || ptr != end || !std::isfinite(val)) {
            return std::nullopt;
        }
        fields[count++] = val;
    }

    if (count != ncols) {
        return std::nullopt;
    }
    // Binary ids are non-negative integers that fit in a long long.
    if (fields[0] < 0.0 || fields[0] >= 9.0e18 || fields[0] != std::floor(fields[0])) {
        return std::nullopt;
    }

    TrackRow row{
        .binary = static_cast<long long>(fields[0]),
        .sepa   = fields[1],
        .eccen  = fields[2],
        .redz   = fields[3],
        .mass1  = fields[4],
        .mass2  = fields[5],
        .dadt   = fields[6],
        .dedt   = fields[7],
        .time   = (ncols == NCOLS_TIME) ? fields[8] : 0.0,
    };

    if (!validate_row(row)) {
        return std::nullopt;
    }
    return row;
}

// ─── DataLoader::parse_csv_string ─────────────────────────────────────────────

BinaryTracks DataLoader::parse_csv_string(const std::string& csv_content) noexcept {
    BinaryTracks tracks;
    std::istringstream stream(csv_content);
    std::string line;
    std::size_t ncols = 0;
    bool header_seen = false;
    long long current = -1;

    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        if (!header_seen) {
            // First non-empty, non-comment line is the header.
            if (!line.empty() && line[0] != '#') {
                header_seen = true;
                ncols = header_columns(line);
                if (ncols == 0) {
                    return tracks;
                }
            }
            continue;
        }

        auto row = parse_row(line, ncols);
        if (!row) {
            continue;
        }

        if (tracks.first_index.empty() || row->binary != current) {
            current = row->binary;
            tracks.first_index.push_back(tracks.sepa.size());
            tracks.last_index.push_back(tracks.sepa.size());
        } else {
            tracks.last_index.back() = tracks.sepa.size();
        }

        tracks.sepa.push_back(row->sepa);
        tracks.eccen.push_back(row->eccen);
        tracks.redz.push_back(row->redz);
        tracks.mass1.push_back(row->mass1);
        tracks.mass2.push_back(row->mass2);
        tracks.dadt.push_back(row->dadt);
        tracks.dedt.push_back(row->dedt);
        if (ncols == NCOLS_TIME) {
            tracks.time.push_back(row->time);
        }
    }

    return tracks;
}

// ─── DataLoader::load_csv ─────────────────────────────────────────────────────

std::optional<BinaryTracks> DataLoader::load_csv(const std::string& filepath) noexcept {
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

// ─── Event export ─────────────────────────────────────────────────────────────

std::string DataLoader::format_events_csv(const resample::EventTable& table) {
    std::string out = "binary,freq_index,harmonic_index,sepa,mass1,mass2,redz,eccen,dadt,dedt\n";
    for (const auto& ev : table.events) {
        out += fmt::format("{},{},{},{:.10e},{:.10e},{:.10e},{:.10e},{:.10e},{:.10e},{:.10e}\n",
                           ev.binary, ev.freq_index, ev.harmonic_index, ev.sepa,
                           ev.mass1, ev.mass2, ev.redz, ev.eccen, ev.dadt, ev.dedt);
    }
    return out;
}

void DataLoader::write_events_csv(const resample::EventTable& table,
                                  const std::string& filepath) {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error(fmt::format("cannot open '{}' for writing", filepath));
    }
    file << format_events_csv(table);
    if (!file) {
        throw std::runtime_error(fmt::format("failed writing events to '{}'", filepath));
    }
}

} // namespace gwbkit::core
