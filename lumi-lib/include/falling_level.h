/**
 * @file falling_level.h
 *
 * @brief Search for the height where a vertical profile crosses a threshold,
 * and fill the grid points where no crossing was found.
 *
 * All functions work on 2d matrices (depth 1) of identical horizontal shape,
 * and unresolved grid points carry the missing value of the matrix. The functions
 * do not throw on data content; shape agreement is checked with ASSERT only.
 */

#ifndef FALLING_LEVEL_H
#define FALLING_LEVEL_H

#include "matrix.h"
#include <vector>

namespace lumi
{
namespace falling_level
{
const double kDefaultThreshold = 90.0;
const double kDefaultPrecision = 0.005;

/**
 * @brief Find the lowest height where profile crosses threshold
 *
 * @param profile Profile values, one matrix per height level, lowest level first
 * @param orography Surface height above sea level
 * @param heights Height of each level above ground, strictly ascending
 * @param threshold Value searched for
 * @param precision Profile values closer than this to the threshold are treated as equal to it
 * @return Height above sea level, missing where profile does not cross the threshold
 */

matrix<double> FindFallingLevel(const std::vector<matrix<double>>& profile, const matrix<double>& orography,
                                const std::vector<double>& heights, double threshold, double precision);

/**
 * @brief For unresolved points where even the highest level has a profile value
 * above threshold, set level to the top of the profile
 *
 * @return Number of points filled
 */

size_t FillInHighFallingLevels(matrix<double>& fallingLevel, const matrix<double>& orography,
                               const matrix<double>& highestProfile, double highestHeight, double threshold);

/**
 * @brief Set unresolved sea points with profile value below threshold to zero
 *
 * Sea is where land sea mask equals zero.
 *
 * @return Number of points filled
 */

size_t FillInSeaPoints(matrix<double>& fallingLevel, const matrix<double>& landSea,
                       const matrix<double>& profileValue, double threshold);

/**
 * @brief Fill unresolved interior points with the mean of their valid neighbours
 *
 * Neighbours are read from the input, so points filled during this call do
 * not contribute to others. Edge points are not modified.
 */

matrix<double> FillInByHorizontalInterpolation(const matrix<double>& fallingLevel);

}  // namespace falling_level
}  // namespace lumi

#endif /* FALLING_LEVEL_H */
