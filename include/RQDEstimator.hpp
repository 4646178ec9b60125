#ifndef RQD_ESTIMATOR_HPP
#define RQD_ESTIMATOR_HPP

/**
 * @file RQDEstimator.hpp
 * @brief Rock Quality Designation from a direct measurement or from
 *        discontinuity frequency (Priest & Hudson relation)
 *
 *   RQD = 100 * exp(-0.1 * lambda) * (0.1 * lambda + 1)
 *
 * with lambda the number of discontinuities per metre of scanline.
 */

#include "RMRS.hpp"
#include <optional>
#include <string>

namespace RMRS {

/**
 * @brief Inputs from which RQD can be obtained, in order of preference
 */
struct RQDInput {
    std::optional<double> rqd;               ///< Measured RQD (%)
    std::optional<double> frequency;         ///< Discontinuities per metre
    std::optional<double> traverse_length;   ///< Scanline length (m)
    size_t discontinuity_count;              ///< Count along the scanline

    RQDInput() : discontinuity_count(0) {}
};

/**
 * @brief Result of an RQD estimation
 */
struct RQDEstimate {
    double rqd;              ///< RQD (%), in [0,100]
    bool derived;            ///< True if estimated from frequency
    double frequency;        ///< Frequency used (1/m), 0 if measured

    RQDEstimate(double r = 0.0, bool d = false, double f = 0.0)
        : rqd(r), derived(d), frequency(f) {}
};

class RQDEstimator {
public:
    /**
     * @brief RQD from discontinuity frequency, clamped to [0,100]
     * @param lambda Discontinuities per metre (negative values are treated as 0)
     */
    static double fromFrequency(double lambda);

    /**
     * @brief Determine RQD for a station or family
     * @param unit Name used in error messages
     * @throws InsufficientDataError if none of the inputs allows an estimate
     * @throws InvalidRangeError for non-finite inputs
     */
    static RQDEstimate estimate(const RQDInput& input, const std::string& unit);

    /**
     * @brief RMR rating of an RQD value
     *
     * >= 90 -> 20, >= 75 -> 17, >= 50 -> 13, >= 25 -> 8, else 3
     */
    static double rating(double rqd);
};

} // namespace RMRS

#endif // RQD_ESTIMATOR_HPP
