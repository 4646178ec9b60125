#ifndef DISCONTINUITY_IO_HPP
#define DISCONTINUITY_IO_HPP

/**
 * @file DiscontinuityIO.hpp
 * @brief Field-sheet CSV import and flat result-table export
 *
 * Input columns are matched case-insensitively, with the aliases used
 * by common field sheets:
 *
 *   station, distance (distance_m), type, dip_direction (dip_direction_degrees),
 *   dip (dip_degrees), spacing (spacing_mm), persistence, aperture (aperture_mm),
 *   roughness, infill (infilling_type), weathering, groundwater
 *
 * Extra columns are ignored. Output tables are one header line plus one
 * row per station, family, unclustered discontinuity or error.
 */

#include "RMRS.hpp"
#include "Discontinuity.hpp"
#include "FamilyStatistics.hpp"
#include "RatingAggregator.hpp"
#include "RmrErrors.hpp"
#include <iosfwd>
#include <string>
#include <vector>

namespace RMRS {

/**
 * @brief Rows read from a field sheet
 */
struct RecordTable {
    std::vector<DiscontinuityRecord> records;
    std::vector<RecordError> errors;         ///< Rows that could not be split into fields
};

class DiscontinuityIO {
public:
    /**
     * @brief Read a discontinuity CSV file
     * @throws std::runtime_error if the file cannot be opened or a required
     *         column is missing from the header
     */
    static RecordTable readRecords(const std::string& filename);

    static RecordTable readRecords(std::istream& in,
                                   const std::string& source_name = "<stream>");

    /// Split one CSV line; double-quoted fields may contain commas
    static std::vector<std::string> splitLine(const std::string& line);

    /// Quote a field if it contains a comma, quote or newline
    static std::string escapeField(const std::string& field);

    // =========================================================================
    // Result rows
    // =========================================================================

    static std::string stationHeader();
    static std::string stationRow(const RmrScore& score);

    static std::string familyHeader();
    static std::string familyRow(const FamilySummary& summary);

    static std::string unclusteredHeader();
    static std::string unclusteredRow(const Discontinuity& d);

    static std::string errorHeader();
    static std::string errorRow(const RecordError& error);
    static std::string errorRow(const UnitFailure& failure);

    /**
     * @brief Write a header and pre-formatted rows
     * @throws std::runtime_error if the file cannot be opened
     */
    static void writeTable(const std::string& filename, const std::string& header,
                           const std::vector<std::string>& rows);
};

} // namespace RMRS

#endif // DISCONTINUITY_IO_HPP
