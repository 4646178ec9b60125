#ifndef ROCK_MASS_CLASSIFICATION_HPP
#define ROCK_MASS_CLASSIFICATION_HPP

#include "RMRS.hpp"
#include <string>

namespace RMRS {

/**
 * @brief Class and quality descriptor of an RMR total
 */
struct Classification {
    RockMassClass rock_class;
    std::string descriptor;      ///< "Very Good", "Good", "Fair", "Poor", "Very Poor"

    /// Roman numeral of the class ("I" .. "V")
    std::string numeral() const;

    /// "Class II - Good"
    std::string label() const;
};

/**
 * @brief Map an RMR total to its class
 *
 * Closed-open bands: [81,100] I, [61,81) II, [41,61) III, [21,41) IV, [0,21) V.
 *
 * @throws InvalidRangeError if total is outside [0,100] or not finite
 */
Classification classifyRockMass(double total);

} // namespace RMRS

#endif // ROCK_MASS_CLASSIFICATION_HPP
