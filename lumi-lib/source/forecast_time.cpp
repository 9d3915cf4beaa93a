/**
 * @file forecast_time.cpp
 *
 */

#include "forecast_time.h"
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <fmt/chrono.h>
#include <stdexcept>

using namespace lumi;

namespace
{
// Compact form "YYYYMMDDHHMM"

boost::posix_time::ptime FromCompactTime(const std::string& theTime)
{
	if (theTime.size() != 12 || !boost::algorithm::all(theTime, boost::algorithm::is_digit()))
	{
		throw std::invalid_argument("expected 12 digits");
	}

	const auto field = [&](size_t start, size_t len) { return std::stoi(theTime.substr(start, len)); };

	const boost::gregorian::date day(static_cast<unsigned short>(field(0, 4)), static_cast<unsigned short>(field(4, 2)),
	                                 static_cast<unsigned short>(field(6, 2)));

	return boost::posix_time::ptime(day, boost::posix_time::hours(field(8, 2)) + boost::posix_time::minutes(field(10, 2)));
}
}  // namespace

time_duration::time_duration(LPTimeResolution theResolution, long theValue)
{
	switch (theResolution)
	{
		case kMinuteResolution:
			itsDuration = boost::posix_time::minutes(theValue);
			break;
		case kHourResolution:
			itsDuration = boost::posix_time::hours(theValue);
			break;
		case kDayResolution:
			itsDuration = boost::posix_time::hours(24 * theValue);
			break;
		default:
			throw std::runtime_error(
			    fmt::format("{}: unsupported time resolution '{}'", ClassName(), LPTimeResolutionToString.at(theResolution)));
	}
}

time_duration::time_duration(const std::string& theDuration)
    : itsDuration(boost::posix_time::duration_from_string(theDuration))
{
}

time_duration::operator std::string() const
{
	return boost::posix_time::to_simple_string(itsDuration);
}

std::ostream& time_duration::Write(std::ostream& file) const
{
	return file << static_cast<std::string>(*this);
}

raw_time::raw_time(const std::string& theTime, const std::string& theTimeMask)
    : itsDateTime(boost::posix_time::not_a_date_time)
{
	try
	{
		if (theTimeMask == "%Y-%m-%d %H:%M:%S")
		{
			itsDateTime = boost::posix_time::time_from_string(theTime);
		}
		else if (theTimeMask == "%Y%m%d%H%M")
		{
			itsDateTime = FromCompactTime(theTime);
		}
		else
		{
			throw std::invalid_argument("unsupported time mask");
		}
	}
	catch (const std::exception& e)
	{
		throw std::runtime_error(fmt::format("{}: Unable to create time from '{}' with mask '{}': {}", ClassName(),
		                                     theTime, theTimeMask, e.what()));
	}

	if (Empty())
	{
		throw std::runtime_error(
		    fmt::format("{}: Unable to create time from '{}' with mask '{}'", ClassName(), theTime, theTimeMask));
	}
}

std::string raw_time::String(const std::string& theTimeMask) const
{
	if (Empty())
	{
		return "not_a_date_time";
	}

	return fmt::format(fmt::runtime("{:" + theTimeMask + "}"), boost::posix_time::to_tm(itsDateTime));
}

std::ostream& raw_time::Write(std::ostream& file) const
{
	file << "<" << ClassName() << ">" << std::endl;
	file << "__itsDateTime__ " << String() << std::endl;

	return file;
}

time_duration forecast_time::Step() const
{
	if (itsOriginDateTime.Empty() || itsValidDateTime.Empty())
	{
		return time_duration();
	}

	return itsValidDateTime - itsOriginDateTime;
}

std::ostream& forecast_time::Write(std::ostream& file) const
{
	file << "<" << ClassName() << ">" << std::endl;
	file << "__itsOriginDateTime__ " << itsOriginDateTime.String() << std::endl;
	file << "__itsValidDateTime__ " << itsValidDateTime.String() << std::endl;

	return file;
}
