#ifndef RMRS_HPP
#define RMRS_HPP

#include <string>
#include <vector>
#include <map>
#include <utility>

namespace RMRS {

// Forward declarations
class CodeDictionary;
class RQDEstimator;
class RatingAggregator;
class OrientationClustering;
class FamilyStatistics;
class ConfigReader;

// Enumerations

/**
 * @brief Field parameters that carry a code in the code dictionary
 *
 * SPACING entries hold a spacing in millimetres; every other parameter
 * holds the rating contribution of the code directly.
 */
enum class RatingParameter {
    STRENGTH,                ///< UCS class (R0..R6)
    SPACING,                 ///< Discontinuity spacing (mm)
    PERSISTENCE,             ///< Trace length class
    APERTURE,                ///< Opening class
    ROUGHNESS,               ///< Surface roughness class
    INFILL,                  ///< Infilling type
    WEATHERING,              ///< Wall weathering grade
    GROUNDWATER              ///< Groundwater condition
};

/**
 * @brief Structural type of a measured discontinuity
 */
enum class StructureType {
    JOINT,
    FAULT,
    SPALLING,                ///< Spalling / sheeting joints
    BEDDING,
    FOLIATION,
    VEIN,
    CONTACT,
    OTHER
};

/**
 * @brief RMR rock-mass classes
 */
enum class RockMassClass {
    CLASS_I,                 ///< [81,100] Very Good
    CLASS_II,                ///< [61,81)  Good
    CLASS_III,               ///< [41,61)  Fair
    CLASS_IV,                ///< [21,41)  Poor
    CLASS_V                  ///< [0,21)   Very Poor
};

/**
 * @brief Admission rule used by the orientation clustering
 */
enum class ClusterMetric {
    TWO_THRESHOLD,           ///< Dip-direction and dip distances each within tolerance
    GREAT_CIRCLE             ///< Angle between plane poles within tolerance
};

// Default analysis constants
constexpr double DEFAULT_ORIENTATION_ADJUSTMENT = -5.0;
constexpr double DEFAULT_CLUSTER_TOLERANCE = 15.0;   // degrees
constexpr int DEFAULT_MIN_FAMILY_MEMBERS = 3;
constexpr double DIP_CLAMP_SLACK = 1.0;              // degrees
constexpr double RMR_MIN_TOTAL = 0.0;
constexpr double RMR_MAX_TOTAL = 100.0;

// Enum <-> string helpers
std::string toString(RatingParameter param);
std::string toString(StructureType type);
std::string toString(ClusterMetric metric);

/**
 * @brief Parse a parameter name ("strength", "spacing", ...), case-insensitive
 * @return false if the name is not a known parameter
 */
bool parseRatingParameter(const std::string& name, RatingParameter& param);

/**
 * @brief Parse a metric name ("TWO_THRESHOLD" or "GREAT_CIRCLE")
 */
bool parseClusterMetric(const std::string& name, ClusterMetric& metric);

/**
 * @brief All parameters, in dictionary order
 */
const std::vector<RatingParameter>& allRatingParameters();

// Text helpers shared by the readers
std::string trimCopy(const std::string& str);
std::string toLowerCopy(const std::string& str);
std::string toUpperCopy(const std::string& str);

/// Split one CSV line into trimmed fields; double-quoted fields may contain
/// commas, and "" inside quotes is a literal quote
std::vector<std::string> splitCsvLine(const std::string& line);

} // namespace RMRS

#endif // RMRS_HPP
