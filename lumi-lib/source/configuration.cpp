/**
 * @file configuration.cpp
 *
 */

#include "configuration.h"
#include <fmt/format.h>
#include <fmt/ranges.h>

using namespace lumi;

std::ostream& configuration::Write(std::ostream& file) const
{
	file << "<" << ClassName() << ">" << std::endl;

	file << "__itsThreadCount__ " << itsThreadCount << std::endl;
	file << "__itsConfigurationFile__ " << itsConfigurationFileName << std::endl;
	file << "__itsForecastStep__ " << itsForecastStep << std::endl;
	file << fmt::format("__itsTimes__ {}", fmt::join(itsTimes, ", ")) << std::endl;
	file << fmt::format("__itsLevels__ {}", fmt::join(itsLevels, ", ")) << std::endl;
	file << fmt::format("__itsForecastTypes__ {}", fmt::join(itsForecastTypes, ", ")) << std::endl;

	return file;
}
