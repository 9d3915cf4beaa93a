/**
 * @file configuration.h
 *
 * @brief Settings shared by every plugin of a run: what to process and how many threads to use.
 *
 */

#ifndef CONFIGURATION_H
#define CONFIGURATION_H

#include "forecast_time.h"
#include "forecast_type.h"
#include "level.h"
#include <vector>

namespace lumi
{
class configuration
{
   public:
	configuration() : itsForecastTypes({forecast_type(kDeterministic)})
	{
	}
	virtual ~configuration() = default;

	configuration(const configuration&) = default;
	configuration& operator=(const configuration&) = default;

	std::string ClassName() const
	{
		return "lumi::configuration";
	}

	std::ostream& Write(std::ostream& file) const;

	/**
	 * @brief Number of threads used when processing, -1 means automatic
	 */

	short ThreadCount() const
	{
		return itsThreadCount;
	}
	void ThreadCount(short theThreadCount)
	{
		itsThreadCount = theThreadCount;
	}

	const std::string& ConfigurationFileName() const
	{
		return itsConfigurationFileName;
	}
	void ConfigurationFileName(const std::string& theName)
	{
		itsConfigurationFileName = theName;
	}

	/**
	 * @brief JSON text of the configuration, json_parser reads this instead of the file
	 */

	const std::string& ConfigurationFileContent() const
	{
		return itsConfigurationFileContent;
	}
	void ConfigurationFileContent(const std::string& theContent)
	{
		itsConfigurationFileContent = theContent;
	}

	const std::vector<forecast_time>& Times() const
	{
		return itsTimes;
	}
	void Times(const std::vector<forecast_time>& theTimes)
	{
		itsTimes = theTimes;
	}

	/**
	 * @brief Analysis times, forecast steps are counted from these
	 */

	const std::vector<raw_time>& OriginDateTimes() const
	{
		return itsOriginDateTimes;
	}
	void OriginDateTimes(const std::vector<raw_time>& theOriginDateTimes)
	{
		itsOriginDateTimes = theOriginDateTimes;
	}

	const std::vector<level>& Levels() const
	{
		return itsLevels;
	}
	void Levels(const std::vector<level>& theLevels)
	{
		itsLevels = theLevels;
	}

	/**
	 * @brief Forecast types (deterministic, control, perturbations) to process
	 *
	 * By default contains one deterministic forecast type.
	 */

	const std::vector<forecast_type>& ForecastTypes() const
	{
		return itsForecastTypes;
	}
	void ForecastTypes(const std::vector<forecast_type>& theForecastTypes)
	{
		itsForecastTypes = theForecastTypes;
	}

	/// @brief Step length when times were given as start_time..stop_time, empty otherwise
	const time_duration& ForecastStep() const
	{
		return itsForecastStep;
	}
	void ForecastStep(const time_duration& theForecastStep)
	{
		itsForecastStep = theForecastStep;
	}

   protected:
	std::string itsConfigurationFileName;
	std::string itsConfigurationFileContent;

	short itsThreadCount = -1;

	std::vector<raw_time> itsOriginDateTimes;
	std::vector<forecast_time> itsTimes;
	std::vector<level> itsLevels;
	std::vector<forecast_type> itsForecastTypes;

	time_duration itsForecastStep;
};

inline std::ostream& operator<<(std::ostream& file, const configuration& ob)
{
	return ob.Write(file);
}
}  // namespace lumi

#endif /* CONFIGURATION_H */
