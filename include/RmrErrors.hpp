#ifndef RMR_ERRORS_HPP
#define RMR_ERRORS_HPP

/**
 * @file RmrErrors.hpp
 * @brief Exception hierarchy for rating and clustering failures
 *
 * Every error carries enough context (unit, source row, field, code)
 * for the caller to locate the offending record.
 */

#include "RMRS.hpp"
#include <stdexcept>
#include <string>

namespace RMRS {

/**
 * @brief Base class of all engine errors
 */
class RmrError : public std::runtime_error {
public:
    explicit RmrError(const std::string& message)
        : std::runtime_error(message) {}

    /// Short name of the error kind ("UnknownCode", "InvalidRange", ...)
    virtual std::string kind() const = 0;
};

/**
 * @brief A field code has no entry in the code dictionary
 */
class UnknownCodeError : public RmrError {
public:
    UnknownCodeError(RatingParameter parameter, const std::string& code,
                     int source_row = -1, const std::string& unit = "");

    std::string kind() const override { return "UnknownCode"; }

    RatingParameter parameter() const { return parameter_; }
    const std::string& code() const { return code_; }
    int sourceRow() const { return source_row_; }
    const std::string& unit() const { return unit_; }

    /// Same error, re-attributed to a record and unit
    UnknownCodeError withContext(int source_row, const std::string& unit) const;

private:
    RatingParameter parameter_;
    std::string code_;
    int source_row_;
    std::string unit_;
};

/**
 * @brief A structure-type code is not recognised
 *
 * Structure types are not rated, so they live outside the dictionary
 * and are reported under their own field name.
 */
class UnknownTypeError : public RmrError {
public:
    UnknownTypeError(const std::string& code, int source_row = -1);

    std::string kind() const override { return "UnknownCode"; }

    const std::string& code() const { return code_; }
    int sourceRow() const { return source_row_; }

private:
    std::string code_;
    int source_row_;
};

/**
 * @brief RQD cannot be determined for a station or family
 */
class InsufficientDataError : public RmrError {
public:
    explicit InsufficientDataError(const std::string& unit,
                                   const std::string& detail = "");

    std::string kind() const override { return "InsufficientData"; }

    const std::string& unit() const { return unit_; }

private:
    std::string unit_;
};

/**
 * @brief A value lies outside its physical bounds
 *
 * Raised for angles that cannot be normalised, for non-finite inputs
 * and for totals outside [0,100].
 */
class InvalidRangeError : public RmrError {
public:
    InvalidRangeError(const std::string& field, double value,
                      int source_row = -1, const std::string& unit = "");

    std::string kind() const override { return "InvalidRange"; }

    const std::string& field() const { return field_; }
    double value() const { return value_; }
    int sourceRow() const { return source_row_; }
    const std::string& unit() const { return unit_; }

private:
    std::string field_;
    double value_;
    int source_row_;
    std::string unit_;
};

/**
 * @brief A station or family has no valid members
 */
class EmptyInputError : public RmrError {
public:
    explicit EmptyInputError(const std::string& unit);

    std::string kind() const override { return "EmptyInput"; }

    const std::string& unit() const { return unit_; }

private:
    std::string unit_;
};

/**
 * @brief A station or family whose score could not be computed
 */
struct UnitFailure {
    std::string scope;           ///< "station" or "family"
    std::string unit;            ///< Station id or family label
    std::string kind;            ///< Error kind, as RmrError::kind()
    std::string message;
};

} // namespace RMRS

#endif // RMR_ERRORS_HPP
