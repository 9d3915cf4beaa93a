/**
 * @file lumi_common.h
 *
 * Definitions common to all classes: the missing value and enums.
 *
 */

#ifndef LUMI_COMMON_H
#define LUMI_COMMON_H

#include "debug.h"
#include <boost/assign/list_of.hpp>
#include <boost/unordered_map.hpp>
#include <cmath>
#include <cstdint>
#include <limits>
#include <memory>
#include <ostream>
#include <string>

namespace ba = boost::assign;

namespace lumi
{
/*
 * Missing value written by lumi is a nan with a fixed payload. When reading,
 * any nan is missing: input data may mark missing values with a plain nan.
 */

inline double MissingDouble()
{
	return std::nan("0x7fffffff");
}

inline bool IsMissing(double value)
{
	return std::isnan(value);
}

inline bool IsValid(double value)
{
	return !IsMissing(value);
}

// MissingValue<T>() for template code

template <typename T>
T MissingValue()
{
	return std::numeric_limits<T>::max();
}

template <>
inline double MissingValue()
{
	return MissingDouble();
}

template <typename T>
inline bool IsMissing(T value)
{
	return value == MissingValue<T>();
}
template <typename T>
inline bool IsValid(T value)
{
	return !IsMissing(value);
}

// Metadata value for "not set", not a data value

const double kLPMissingValue = -999.;

enum LPPluginClass
{
	kUnknownPlugin = 0,
	kCompiled,
	kAuxiliary
};

// clang-format off

enum LPDebugState
{
	kTraceMsg = 0,
	kDebugMsg,
	kInfoMsg,
	kWarningMsg,
	kErrorMsg,
	kFatalMsg
};

const boost::unordered_map<std::string, LPDebugState> LPStringToDebugState =
	ba::map_list_of
	("trace", kTraceMsg)
	("debug", kDebugMsg)
	("info", kInfoMsg)
	("warning", kWarningMsg)
	("error", kErrorMsg)
	("fatal", kFatalMsg);

enum LPParameterUnit
{
	kUnknownUnit = 0,
	kM,   // meters
	kKm,  // kelvin meters, unit of vertically integrated temperature
	kUnitless
};

const boost::unordered_map<LPParameterUnit, std::string> LPParameterUnitToString =
	ba::map_list_of
	(kUnknownUnit, "unknown")
	(kM, "m")
	(kKm, "K m")
	(kUnitless, "1");

enum LPTimeResolution
{
	kUnknownTimeResolution = 0,
	kHourResolution,
	kMinuteResolution,
	kDayResolution
};

const boost::unordered_map<LPTimeResolution, std::string> LPTimeResolutionToString =
	ba::map_list_of
	(kUnknownTimeResolution, "unknown")
	(kHourResolution, "hour")
	(kMinuteResolution, "minute")
	(kDayResolution, "day");

enum LPModifierType
{
	kUnknownModifierType = 0,
	kMaximumModifier,
	kFindHeightModifier
};

// clang-format on

}  // namespace lumi

#endif /* LUMI_COMMON_H */
