#pragma once

/// @file include/gwbkit/data_loader.hpp
/// @brief CSV I/O for binary evolution tracks and event tables.
///
/// # Module: DataLoader
///
/// ## Responsibility
/// Parse CSV files of evolution tracks into `BinaryTracks`, and export
/// interpolation event tables. Malformed or non-finite rows are skipped; the
/// loader never crashes on bad input.
///
/// ## Expected CSV Format
/// ```
/// binary,sepa,eccen,redz,mass1,mass2,dadt,dedt,time
/// 0,3.1e17,0.10,0.50,1.9e41,9.9e40,-2.0e2,-1.0e-12,0.0
/// 0,2.9e17,0.09,0.49,1.9e41,9.9e40,-2.4e2,-1.1e-12,3.2e14
/// ```
/// The first line is the header; the `time` column is optional. Rows of one
/// binary must be contiguous and in time order; a new binary starts whenever
/// the `binary` column changes.
///
/// ## Guarantees
/// - Loading never throws; returns `nullopt` if the file cannot be opened.
/// - Skips individual bad rows rather than failing the entire load.

#include "gwbkit/resampler.hpp"
#include "gwbkit/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace gwbkit::core {

/// One parsed data row of a tracks CSV.
struct TrackRow {
    long long binary;
    double sepa;
    double eccen;
    double redz;
    double mass1;
    double mass2;
    double dadt;
    double dedt;
    double time;  ///< 0 when the file has no time column
};

/// Loads evolution tracks from CSV files and writes event tables.
class DataLoader {
public:
    /// Load tracks from a CSV file on disk.
    ///
    /// # Returns
    /// - `nullopt` if the file cannot be opened
    /// - Empty tracks if the header is unrecognised or no row is valid
    [[nodiscard]] static std::optional<BinaryTracks>
    load_csv(const std::string& filepath) noexcept;

    /// Parse tracks from a CSV-formatted string (useful for testing).
    [[nodiscard]] static BinaryTracks
    parse_csv_string(const std::string& csv_content) noexcept;

    /// Render an event table as CSV with header
    /// `binary,freq_index,harmonic_index,sepa,mass1,mass2,redz,eccen,dadt,dedt`.
    [[nodiscard]] static std::string format_events_csv(const resample::EventTable& table);

    /// Write `format_events_csv(table)` to `filepath`.
    ///
    /// # Throws
    /// `std::runtime_error` if the file cannot be opened or written.
    static void write_events_csv(const resample::EventTable& table, const std::string& filepath);

    /// A row is valid if all fields are finite, separation, masses and
    /// redshift + 1 are positive, and 0 <= eccen < 1.
    [[nodiscard]] static bool validate_row(const TrackRow& row) noexcept;

private:
    /// Parse a single CSV data row with `ncols` (8 or 9) columns.
    /// Returns `nullopt` if the row is malformed or values are non-finite.
    [[nodiscard]] static std::optional<TrackRow>
    parse_row(const std::string& line, std::size_t ncols) noexcept;
};

} // namespace gwbkit::core
