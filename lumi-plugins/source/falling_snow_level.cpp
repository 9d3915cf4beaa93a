/**
 * @file falling_snow_level.cpp
 *
 */

#include "falling_snow_level.h"
#include "falling_level.h"
#include "logger.h"
#include "modifier.h"
#include "util.h"
#include <stdexcept>

using namespace std;
using namespace lumi;
using namespace lumi::plugin;

namespace
{
const level kGroundLevel(kGround, 0);

// Options given as a list in the configuration file are rejected, a single
// value may still be a comma separated list

const string& SingleOptionValue(const plugin_configuration& conf, const string& key)
{
	const auto& values = conf.GetValueList(key);

	if (values.size() != 1)
	{
		throw invalid_argument(fmt::format("Option '{}' must be given once, got {} values", key, values.size()));
	}

	return values[0];
}

double ReadDoubleOption(const plugin_configuration& conf, const string& key, double defaultValue)
{
	if (!conf.Exists(key))
	{
		return defaultValue;
	}

	const string& value = SingleOptionValue(conf, key);
	const auto values = util::Split<double>(value, ",");

	if (values.size() != 1)
	{
		throw invalid_argument(fmt::format("Option '{}' must have exactly one value, got '{}'", key, value));
	}

	return values[0];
}

string ReadStringOption(const plugin_configuration& conf, const string& key, const string& defaultValue)
{
	if (!conf.Exists(key))
	{
		return defaultValue;
	}

	const string& value = SingleOptionValue(conf, key);

	return value.empty() ? defaultValue : value;
}

// Shortest form that still shows a decimal point: 90 -> "90.0", 0.005 -> "0.005"

string FormatReal(double value)
{
	string str = fmt::format("{}", value);

	if (str.find_first_of(".eEn") == string::npos)
	{
		str += ".0";
	}

	return str;
}

matrix<double> ColumnMaximum(const vector<matrix<double>>& profile, const vector<double>& heights)
{
	modifier_max mod;

	for (size_t k = 0; k < profile.size(); k++)
	{
		mod.Process(profile[k].Values(), vector<double>(profile[k].Size(), heights[k]));
	}

	return matrix<double>(profile[0].SizeX(), profile[0].SizeY(), 1, MissingDouble(), mod.Result());
}
}  // namespace

falling_snow_level::falling_snow_level()
    : itsThreshold(falling_level::kDefaultThreshold),
      itsPrecision(falling_level::kDefaultPrecision),
      itsSeaPointProfileValue(SeaPointProfileValue::kTop),
      itsProfileParam("WETBULBINT-KM", kKm),
      itsOrographyParam("Z-M", kM),
      itsLandSeaParam("LC-0TO1", kUnitless)
{
	itsLogger = logger("falling_snow_level");
}

void falling_snow_level::Provider(shared_ptr<const profile_provider> theProvider)
{
	itsProvider = theProvider;
}

const vector<shared_ptr<info<double>>>& falling_snow_level::Results() const
{
	return compiled_plugin_base::Results();
}

double falling_snow_level::Threshold() const
{
	return itsThreshold;
}

double falling_snow_level::Precision() const
{
	return itsPrecision;
}

void falling_snow_level::ReadOptions()
{
	itsThreshold = ReadDoubleOption(*itsConfiguration, "falling_level_threshold", falling_level::kDefaultThreshold);
	itsPrecision = ReadDoubleOption(*itsConfiguration, "precision", falling_level::kDefaultPrecision);

	if (itsPrecision < 0)
	{
		throw invalid_argument(fmt::format("{}: precision must not be negative, got {}", ClassName(), itsPrecision));
	}

	const string seaPointValue = ReadStringOption(*itsConfiguration, "sea_point_profile_value", "top");

	if (seaPointValue == "top")
	{
		itsSeaPointProfileValue = SeaPointProfileValue::kTop;
	}
	else if (seaPointValue == "max")
	{
		itsSeaPointProfileValue = SeaPointProfileValue::kMax;
	}
	else
	{
		throw invalid_argument(
		    fmt::format("{}: invalid value for sea_point_profile_value: '{}'", ClassName(), seaPointValue));
	}

	itsProfileParam = param(ReadStringOption(*itsConfiguration, "profile_param", "WETBULBINT-KM"), kKm);
	itsOrographyParam = param(ReadStringOption(*itsConfiguration, "orography_param", "Z-M"), kM);
	itsLandSeaParam = param(ReadStringOption(*itsConfiguration, "land_sea_param", "LC-0TO1"), kUnitless);

	itsLogger.Trace(fmt::format("Threshold: {} precision: {} sea point profile value: {}", itsThreshold,
	                            itsPrecision, seaPointValue));
}

void falling_snow_level::Process(shared_ptr<const plugin_configuration> conf)
{
	Init(conf);

	if (!itsProvider)
	{
		throw runtime_error(fmt::format("{}: profile provider not set", ClassName()));
	}

	ReadOptions();

	/*
	 * Profile is read from the configured height levels, lowest first
	 */

	itsProfileLevels = itsConfiguration->Levels();

	if (itsProfileLevels.size() < 2)
	{
		throw invalid_argument(fmt::format("{}: at least two height levels are needed, got {}", ClassName(),
		                                   itsProfileLevels.size()));
	}

	for (size_t k = 0; k < itsProfileLevels.size(); k++)
	{
		if (itsProfileLevels[k].Type() != kHeight)
		{
			throw invalid_argument(fmt::format("{}: level {} is not a height level", ClassName(),
			                                   static_cast<string>(itsProfileLevels[k])));
		}

		if (k > 0 && itsProfileLevels[k].Value() <= itsProfileLevels[k - 1].Value())
		{
			throw invalid_argument(fmt::format("{}: height levels must be strictly ascending ({} after {})",
			                                   ClassName(), itsProfileLevels[k].Value(),
			                                   itsProfileLevels[k - 1].Value()));
		}
	}

	if (itsConfiguration->Times().empty())
	{
		itsLogger.Warning("No forecast times configured");
	}

	SetParams(param("falling snow level above sea level", kM), level(kHeight, 0));

	Start();
}

/*
 * Calculate()
 *
 * This function does the actual calculation.
 */

void falling_snow_level::Calculate(shared_ptr<info<double>> myTargetInfo, unsigned short threadIndex)
{
	auto myThreadedLogger = logger("falling_snow_levelThread #" + to_string(threadIndex));

	const forecast_time forecastTime = myTargetInfo->Time();
	const forecast_type forecastType = myTargetInfo->ForecastType();

	myThreadedLogger.Info(
	    fmt::format("Calculating time {} forecast type {}", forecastTime.ValidDateTime(), forecastType));

	info_t<double> orographyInfo = itsProvider->Fetch(forecastTime, kGroundLevel, itsOrographyParam, forecastType);
	info_t<double> landSeaInfo = itsProvider->Fetch(forecastTime, kGroundLevel, itsLandSeaParam, forecastType);

	vector<info_t<double>> profileInfos;
	vector<double> heights;

	for (const auto& lev : itsProfileLevels)
	{
		profileInfos.push_back(itsProvider->Fetch(forecastTime, lev, itsProfileParam, forecastType));
		heights.push_back(lev.Value());
	}

	vector<info_t<double>> inputs = profileInfos;
	inputs.push_back(orographyInfo);
	inputs.push_back(landSeaInfo);

	info_t<double> reference;
	bool inputMissing = false;

	for (const auto& input : inputs)
	{
		if (!input)
		{
			inputMissing = true;
			continue;
		}

		if (!reference)
		{
			reference = input;
		}
		else if (!input->Data().SameShape(reference->Data()))
		{
			throw runtime_error(fmt::format("{}: shape of {} at {} ({}x{}) does not match shape of {} ({}x{})",
			                                ClassName(), input->Param(), input->Level(), input->SizeX(),
			                                input->SizeY(), reference->Param(), reference->SizeX(),
			                                reference->SizeY()));
		}
	}

	if (inputMissing)
	{
		myThreadedLogger.Warning(
		    fmt::format("Skipping step {}, forecast type {}: input data not found", forecastTime.Step(), forecastType));

		if (reference)
		{
			myTargetInfo->Create(reference->SizeX(), reference->SizeY());
		}

		return;
	}

	// result carries the time and forecast type of the profile it was calculated from

	myTargetInfo->Time(profileInfos.front()->Time());
	myTargetInfo->ForecastType(profileInfos.front()->ForecastType());

	vector<matrix<double>> profile;
	profile.reserve(profileInfos.size());

	for (const auto& p : profileInfos)
	{
		profile.push_back(p->Data());
	}

	const matrix<double>& orography = orographyInfo->Data();
	const matrix<double>& landSea = landSeaInfo->Data();
	const size_t gridSize = orography.Size();

	auto fallingLevel = falling_level::FindFallingLevel(profile, orography, heights, itsThreshold, itsPrecision);

	myThreadedLogger.Debug(
	    fmt::format("Threshold crossing found for {}/{} points", gridSize - fallingLevel.MissingCount(), gridSize));

	const size_t highFilled =
	    falling_level::FillInHighFallingLevels(fallingLevel, orography, profile.back(), heights.back(), itsThreshold);

	myThreadedLogger.Debug(fmt::format("High profile points filled: {}", highFilled));

	const matrix<double> seaPointValue = (itsSeaPointProfileValue == SeaPointProfileValue::kMax)
	                                         ? ColumnMaximum(profile, heights)
	                                         : profile.back();

	const size_t seaFilled = falling_level::FillInSeaPoints(fallingLevel, landSea, seaPointValue, itsThreshold);

	myThreadedLogger.Debug(fmt::format("Sea points filled: {}", seaFilled));

	const size_t missingBefore = fallingLevel.MissingCount();

	myTargetInfo->Data(falling_level::FillInByHorizontalInterpolation(fallingLevel));

	const size_t missing = myTargetInfo->Data().MissingCount();

	myThreadedLogger.Debug(fmt::format("Points filled from neighbours: {}", missingBefore - missing));
	myThreadedLogger.Info(fmt::format("[{}] Missing values: {}/{}", forecastType, missing, gridSize));
}

ostream& falling_snow_level::Write(ostream& file) const
{
	file << fmt::format("<falling_snow_level: precision:{}, falling_level_threshold:{}>", FormatReal(itsPrecision),
	                    FormatReal(itsThreshold));

	return file;
}
