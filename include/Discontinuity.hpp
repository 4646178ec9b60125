#ifndef DISCONTINUITY_HPP
#define DISCONTINUITY_HPP

/**
 * @file Discontinuity.hpp
 * @brief Field record model, orientation geometry and record validation
 *
 * A raw record holds one CSV row as text. Validation turns it into an
 * immutable Discontinuity: angles normalised, codes checked against the
 * code dictionary, structure type parsed. Failures are collected per
 * record so that one bad row never aborts the rest of the batch.
 */

#include "RMRS.hpp"
#include <array>
#include <optional>
#include <string>
#include <vector>

namespace RMRS {

/**
 * @brief Plane orientation as dip direction / dip (degrees)
 */
struct Orientation {
    double dip_direction;    ///< Azimuth of dip (0-360°, circular)
    double dip;              ///< Inclination (0-90°, linear)

    Orientation(double dd = 0.0, double d = 0.0)
        : dip_direction(dd), dip(d) {}

    /// Upward unit normal of the plane (east, north, up)
    std::array<double, 3> pole() const;
};

// ============================================================================
// Orientation geometry
// ============================================================================

/**
 * @brief Wrap an azimuth into [0,360)
 */
double normalizeDipDirection(double dip_direction);

/**
 * @brief Circular distance between two azimuths: min(|d1-d2|, 360-|d1-d2|)
 */
double circularDistance(double d1, double d2);

/**
 * @brief Angle (degrees) between the poles of two planes, in [0,90]
 */
double greatCircleDistance(const Orientation& a, const Orientation& b);

/**
 * @brief Mean orientation: unit-vector mean of dip directions, arithmetic mean of dips
 *
 * Falls back to the first dip direction when the resultant vanishes
 * (directions cancelling exactly). Empty input yields (0,0).
 */
Orientation meanOrientation(const std::vector<Orientation>& orientations);

// ============================================================================
// Records
// ============================================================================

/**
 * @brief One input row, still as text
 */
struct DiscontinuityRecord {
    int source_row;                      ///< 1-based data row in the input file
    std::string station;
    std::string distance;
    std::string type;
    std::string dip_direction;
    std::string dip;
    std::string spacing;
    std::string persistence;
    std::string aperture;
    std::string roughness;
    std::string infill;
    std::string weathering;
    std::string groundwater;

    DiscontinuityRecord() : source_row(-1) {}
};

/**
 * @brief Validated structural discontinuity
 *
 * Codes are stored in the dictionary's canonical form (trimmed, upper-case,
 * "3.0" stored as "3") and are known to exist in the dictionary that
 * validated them.
 */
struct Discontinuity {
    int source_row;                      ///< Row in the input file (-1 if synthetic)
    std::string station;                 ///< Station identifier
    double distance;                     ///< Distance along traverse (m)
    StructureType type;                  ///< Structural type
    Orientation orientation;             ///< Normalised orientation

    std::string spacing_code;
    std::string persistence_code;
    std::string aperture_code;
    std::string roughness_code;
    std::string infill_code;
    std::string weathering_code;
    std::string groundwater_code;

    Discontinuity();

    /// Code recorded for a condition/spacing/groundwater parameter
    const std::string& code(RatingParameter param) const;

    /// "row N" or "station/index" style label for messages
    std::string label() const;
};

/**
 * @brief Validation failure of one record
 */
struct RecordError {
    int source_row;
    std::string station;
    std::string kind;                    ///< Error kind (UnknownCode, InvalidRange, ...)
    std::string message;
};

/**
 * @brief Outcome of validating a batch of records
 */
struct ValidationReport {
    std::vector<Discontinuity> valid;
    std::vector<RecordError> errors;

    size_t totalRecords() const { return valid.size() + errors.size(); }
};

/**
 * @brief Parse a structure type code or name ("J", "Joint", "F", "Fault", ...)
 * @throws UnknownTypeError if not recognised
 */
StructureType parseStructureType(const std::string& code, int source_row = -1);

/**
 * @brief Validates raw records against a code dictionary
 */
class DiscontinuityValidator {
public:
    explicit DiscontinuityValidator(const CodeDictionary& dictionary);

    /**
     * @brief Validate a single record
     * @throws UnknownCodeError, UnknownTypeError or InvalidRangeError
     */
    Discontinuity validate(const DiscontinuityRecord& record) const;

    /**
     * @brief Validate many records, collecting failures instead of stopping
     */
    ValidationReport validateAll(const std::vector<DiscontinuityRecord>& records) const;

private:
    double parseNumber(const std::string& text, const std::string& field,
                       int source_row) const;
    std::string checkedCode(RatingParameter param, const std::string& text,
                            int source_row) const;

    const CodeDictionary& dictionary_;
};

/**
 * @brief Discontinuities of one survey station
 */
struct Station {
    std::string id;
    std::vector<Discontinuity> discontinuities;  ///< In input order
    std::string ucs_class;                       ///< Strength code (e.g. "R4")
    std::optional<double> rqd;                   ///< Measured RQD (%), if any
    std::optional<double> traverse_length;       ///< Scanline length (m), if known

    /// Configured traverse length, else the largest recorded distance
    double effectiveTraverseLength() const;
};

/**
 * @brief Group validated discontinuities by station, preserving first-seen order
 */
std::vector<Station> groupByStation(const std::vector<Discontinuity>& discontinuities,
                                    const std::string& default_ucs_class);

} // namespace RMRS

#endif // DISCONTINUITY_HPP
