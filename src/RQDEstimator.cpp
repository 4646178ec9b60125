#include "RQDEstimator.hpp"
#include "RmrErrors.hpp"
#include <algorithm>
#include <cmath>

namespace RMRS {

namespace {

double clampPercent(double value) {
    return std::max(0.0, std::min(100.0, value));
}

} // namespace

double RQDEstimator::fromFrequency(double lambda) {
    double x = 0.1 * std::max(0.0, lambda);
    return clampPercent(100.0 * std::exp(-x) * (x + 1.0));
}

RQDEstimate RQDEstimator::estimate(const RQDInput& input, const std::string& unit) {
    if (input.rqd) {
        if (!std::isfinite(*input.rqd)) {
            throw InvalidRangeError("rqd", *input.rqd, -1, unit);
        }
        return RQDEstimate(clampPercent(*input.rqd), false, 0.0);
    }

    if (input.frequency) {
        if (!std::isfinite(*input.frequency) || *input.frequency < 0.0) {
            throw InvalidRangeError("frequency", *input.frequency, -1, unit);
        }
        return RQDEstimate(fromFrequency(*input.frequency), true, *input.frequency);
    }

    if (input.traverse_length && *input.traverse_length > 0.0 &&
        input.discontinuity_count > 0) {
        if (!std::isfinite(*input.traverse_length)) {
            throw InvalidRangeError("traverse_length", *input.traverse_length, -1, unit);
        }
        double lambda = static_cast<double>(input.discontinuity_count) / *input.traverse_length;
        return RQDEstimate(fromFrequency(lambda), true, lambda);
    }

    throw InsufficientDataError(unit, "no RQD, frequency or traverse length available");
}

double RQDEstimator::rating(double rqd) {
    if (rqd >= 90.0) return 20.0;
    if (rqd >= 75.0) return 17.0;
    if (rqd >= 50.0) return 13.0;
    if (rqd >= 25.0) return 8.0;
    return 3.0;
}

} // namespace RMRS
