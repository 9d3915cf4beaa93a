/**
 * @file util.h
 *
 * @brief String parsing helpers for configuration values
 */

#ifndef UTIL_H
#define UTIL_H

#include "forecast_type.h"
#include <string>
#include <vector>

namespace lumi
{
namespace util
{
/**
 * @brief Split a string at any of the delimiter characters
 *
 * Elements are trimmed before they are converted to T.
 *
 * @throws std::invalid_argument if an element does not convert to T
 */

template <typename T>
std::vector<T> Split(const std::string& s, const std::string& delims);

std::vector<std::string> Split(const std::string& s, const std::string& delims);

/**
 * @brief Expand a list of integers with ranges
 *
 * 1,5,10-12 --> 1,5,10,11,12
 * 1,5,10-16-2 --> 1,5,10,12,14,16
 * 6-0-3 --> 6,3,0
 */

std::vector<int> ExpandString(const std::string& identifier);

/**
 * @brief Create a list of forecast types from a string
 *
 * Accepted tokens are "det"/"deterministic", "an"/"analysis", "cfN" (control,
 * default N=0) and "pfN" or "pfN-M" (perturbations), comma separated.
 */

std::vector<forecast_type> ForecastTypesFromString(const std::string& types);

}  // namespace util
}  // namespace lumi

#endif /* UTIL_H */
