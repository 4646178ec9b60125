#include "RockMassClassification.hpp"
#include "RmrErrors.hpp"
#include <cmath>

namespace RMRS {

std::string Classification::numeral() const {
    switch (rock_class) {
        case RockMassClass::CLASS_I:   return "I";
        case RockMassClass::CLASS_II:  return "II";
        case RockMassClass::CLASS_III: return "III";
        case RockMassClass::CLASS_IV:  return "IV";
        case RockMassClass::CLASS_V:   return "V";
    }
    return "?";
}

std::string Classification::label() const {
    return "Class " + numeral() + " - " + descriptor;
}

Classification classifyRockMass(double total) {
    if (!std::isfinite(total) || total < RMR_MIN_TOTAL || total > RMR_MAX_TOTAL) {
        throw InvalidRangeError("rmr_total", total);
    }

    if (total >= 81.0) return {RockMassClass::CLASS_I, "Very Good"};
    if (total >= 61.0) return {RockMassClass::CLASS_II, "Good"};
    if (total >= 41.0) return {RockMassClass::CLASS_III, "Fair"};
    if (total >= 21.0) return {RockMassClass::CLASS_IV, "Poor"};
    return {RockMassClass::CLASS_V, "Very Poor"};
}

} // namespace RMRS
