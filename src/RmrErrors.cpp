#include "RmrErrors.hpp"
#include <sstream>

namespace RMRS {

namespace {

std::string locationSuffix(int source_row, const std::string& unit) {
    std::ostringstream oss;
    if (source_row >= 0) {
        oss << " (row " << source_row;
        if (!unit.empty()) oss << ", " << unit;
        oss << ")";
    } else if (!unit.empty()) {
        oss << " (" << unit << ")";
    }
    return oss.str();
}

std::string unknownCodeMessage(RatingParameter parameter, const std::string& code,
                               int source_row, const std::string& unit) {
    return "Unknown " + toString(parameter) + " code '" + code + "'" +
           locationSuffix(source_row, unit);
}

std::string invalidRangeMessage(const std::string& field, double value,
                                int source_row, const std::string& unit) {
    std::ostringstream oss;
    oss << "Value out of range for " << field << ": " << value
        << locationSuffix(source_row, unit);
    return oss.str();
}

} // namespace

// ============================================================================
// UnknownCodeError
// ============================================================================

UnknownCodeError::UnknownCodeError(RatingParameter parameter, const std::string& code,
                                   int source_row, const std::string& unit)
    : RmrError(unknownCodeMessage(parameter, code, source_row, unit)),
      parameter_(parameter), code_(code), source_row_(source_row), unit_(unit) {}

UnknownCodeError UnknownCodeError::withContext(int source_row, const std::string& unit) const {
    return UnknownCodeError(parameter_, code_, source_row, unit);
}

// ============================================================================
// UnknownTypeError
// ============================================================================

UnknownTypeError::UnknownTypeError(const std::string& code, int source_row)
    : RmrError("Unknown type code '" + code + "'" + locationSuffix(source_row, "")),
      code_(code), source_row_(source_row) {}

// ============================================================================
// InsufficientDataError
// ============================================================================

InsufficientDataError::InsufficientDataError(const std::string& unit,
                                             const std::string& detail)
    : RmrError("Cannot determine RQD for " + unit +
               (detail.empty() ? std::string() : ": " + detail)),
      unit_(unit) {}

// ============================================================================
// InvalidRangeError
// ============================================================================

InvalidRangeError::InvalidRangeError(const std::string& field, double value,
                                     int source_row, const std::string& unit)
    : RmrError(invalidRangeMessage(field, value, source_row, unit)),
      field_(field), value_(value), source_row_(source_row), unit_(unit) {}

// ============================================================================
// EmptyInputError
// ============================================================================

EmptyInputError::EmptyInputError(const std::string& unit)
    : RmrError("No valid discontinuities in " + unit), unit_(unit) {}

} // namespace RMRS
