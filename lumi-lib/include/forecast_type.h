/**
 * @file   forecast_type.h
 *
 * @brief Forecast type and realization.
 *
 * Ensemble members are told apart by type and value: the control forecast is
 * kEpsControl/0, perturbed members are kEpsPerturbation/1..N. Deterministic
 * and analysis fields carry no value.
 *
 */

#ifndef FORECAST_TYPE_H
#define FORECAST_TYPE_H

#include "lumi_common.h"
#include <fmt/format.h>

namespace lumi
{
enum LPForecastType
{
	kUnknownType = 0,
	kDeterministic,
	kAnalysis,
	kEpsPerturbation = 3,
	kEpsControl = 4
};

const boost::unordered_map<LPForecastType, std::string> LPForecastTypeToString =
    ba::map_list_of(kUnknownType, "unknown")(kDeterministic, "deterministic")(kAnalysis, "analysis")(
        kEpsControl, "eps control")(kEpsPerturbation, "eps perturbation");

const boost::unordered_map<std::string, LPForecastType> LPStringToForecastType =
    ba::map_list_of("unknown", kUnknownType)("deterministic", kDeterministic)("analysis", kAnalysis)(
        "eps control", kEpsControl)("eps perturbation", kEpsPerturbation);

class forecast_type
{
   public:
	forecast_type() = default;
	explicit forecast_type(LPForecastType theType, double theValue = kLPMissingValue)
	    : itsType(theType), itsValue(theValue)
	{
	}

	std::string ClassName() const
	{
		return "lumi::forecast_type";
	}

	LPForecastType Type() const
	{
		return itsType;
	}

	/// @brief Realization number for ensemble members
	double Value() const
	{
		return itsValue;
	}

	bool operator==(const forecast_type& other) const
	{
		return itsType == other.itsType && itsValue == other.itsValue;
	}
	bool operator!=(const forecast_type& other) const
	{
		return !(*this == other);
	}

	operator std::string() const
	{
		return fmt::format("{}/{}", LPForecastTypeToString.at(itsType), itsValue);
	}

	std::ostream& Write(std::ostream& file) const
	{
		return file << "<" << ClassName() << "> " << static_cast<std::string>(*this) << std::endl;
	}

   private:
	LPForecastType itsType = kUnknownType;
	double itsValue = kLPMissingValue;
};

inline std::ostream& operator<<(std::ostream& file, const forecast_type& ob)
{
	return ob.Write(file);
}
}  // namespace lumi

template <>
struct fmt::formatter<lumi::forecast_type> : fmt::formatter<std::string>
{
	template <typename FormatContext>
	auto format(const lumi::forecast_type& ft, FormatContext& ctx) const -> decltype(ctx.out())
	{
		return fmt::formatter<std::string>::format(static_cast<std::string>(ft), ctx);
	}
};

#endif /* FORECAST_TYPE_H */
