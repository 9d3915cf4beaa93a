/**
 * @file forecast_time.h
 *
 * @brief Time metadata of a forecast: durations, absolute times and the
 * origin time + step pair that identifies one forecast time.
 *
 * All three are thin wrappers over boost::posix_time.
 */

#ifndef FORECAST_TIME_H
#define FORECAST_TIME_H

#include "lumi_common.h"
#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <fmt/format.h>

namespace lumi
{
/**
 * @class time_duration
 *
 * @brief Signed length of time, minute resolution is enough for forecast steps
 */

class time_duration
{
   public:
	time_duration() : itsDuration(boost::posix_time::not_a_date_time)
	{
	}
	time_duration(const boost::posix_time::time_duration& theDuration) : itsDuration(theDuration)
	{
	}
	time_duration(LPTimeResolution theResolution, long theValue);

	/// @brief Parse "HH:MM[:SS]"
	explicit time_duration(const std::string& theDuration);

	std::string ClassName() const
	{
		return "lumi::time_duration";
	}

	operator std::string() const;
	std::ostream& Write(std::ostream& file) const;

	bool operator==(const time_duration& other) const
	{
		return itsDuration == other.itsDuration;
	}
	bool operator!=(const time_duration& other) const
	{
		return itsDuration != other.itsDuration;
	}
	bool operator<(const time_duration& other) const
	{
		return itsDuration < other.itsDuration;
	}
	bool operator>(const time_duration& other) const
	{
		return other < *this;
	}
	bool operator<=(const time_duration& other) const
	{
		return !(other < *this);
	}
	bool operator>=(const time_duration& other) const
	{
		return !(*this < other);
	}

	time_duration operator+(const time_duration& other) const
	{
		return time_duration(itsDuration + other.itsDuration);
	}
	time_duration operator-(const time_duration& other) const
	{
		return time_duration(itsDuration - other.itsDuration);
	}
	time_duration operator*(int theMultiplier) const
	{
		return time_duration(itsDuration * theMultiplier);
	}
	time_duration& operator+=(const time_duration& other)
	{
		itsDuration += other.itsDuration;
		return *this;
	}
	time_duration& operator-=(const time_duration& other)
	{
		itsDuration -= other.itsDuration;
		return *this;
	}

	bool Empty() const
	{
		return itsDuration.is_not_a_date_time();
	}

	long Hours() const
	{
		return Seconds() / 3600;
	}
	long Minutes() const
	{
		return Seconds() / 60;
	}
	long Seconds() const
	{
		return static_cast<long>(itsDuration.total_seconds());
	}

	const boost::posix_time::time_duration& Raw() const
	{
		return itsDuration;
	}

   private:
	boost::posix_time::time_duration itsDuration;
};

const time_duration ONE_HOUR(kHourResolution, 1);

/**
 * @class raw_time
 *
 * @brief Absolute UTC time
 *
 * Two text forms are understood: "%Y-%m-%d %H:%M:%S" (the default) and the
 * compact "%Y%m%d%H%M" used when a time is converted to a string.
 */

class raw_time
{
   public:
	raw_time() : itsDateTime(boost::posix_time::not_a_date_time)
	{
	}
	raw_time(const boost::posix_time::ptime& theDateTime) : itsDateTime(theDateTime)
	{
	}
	raw_time(const std::string& theTime, const std::string& theTimeMask = "%Y-%m-%d %H:%M:%S");

	std::string ClassName() const
	{
		return "lumi::raw_time";
	}

	operator std::string() const
	{
		return String("%Y%m%d%H%M");
	}

	std::string String(const std::string& theTimeMask = "%Y-%m-%d %H:%M:%S") const;
	std::ostream& Write(std::ostream& file) const;

	bool operator==(const raw_time& other) const
	{
		return itsDateTime == other.itsDateTime;
	}
	bool operator!=(const raw_time& other) const
	{
		return itsDateTime != other.itsDateTime;
	}
	bool operator<(const raw_time& other) const
	{
		return itsDateTime < other.itsDateTime;
	}
	bool operator>(const raw_time& other) const
	{
		return other < *this;
	}

	raw_time operator+(const time_duration& theDuration) const
	{
		return raw_time(itsDateTime + theDuration.Raw());
	}
	raw_time operator-(const time_duration& theDuration) const
	{
		return raw_time(itsDateTime - theDuration.Raw());
	}
	time_duration operator-(const raw_time& other) const
	{
		return time_duration(itsDateTime - other.itsDateTime);
	}

	bool Empty() const
	{
		return itsDateTime.is_not_a_date_time();
	}

   private:
	boost::posix_time::ptime itsDateTime;
};

/**
 * @class forecast_time
 *
 * @brief Origin (analysis) time and the valid time of a forecast
 */

class forecast_time
{
   public:
	forecast_time() = default;
	forecast_time(const raw_time& theOriginDateTime, const raw_time& theValidDateTime)
	    : itsOriginDateTime(theOriginDateTime), itsValidDateTime(theValidDateTime)
	{
	}
	forecast_time(const raw_time& theOriginDateTime, const time_duration& theStep)
	    : itsOriginDateTime(theOriginDateTime), itsValidDateTime(theOriginDateTime + theStep)
	{
	}

	std::string ClassName() const
	{
		return "lumi::forecast_time";
	}
	std::ostream& Write(std::ostream& file) const;

	bool operator==(const forecast_time& other) const
	{
		return itsOriginDateTime == other.itsOriginDateTime && itsValidDateTime == other.itsValidDateTime;
	}
	bool operator!=(const forecast_time& other) const
	{
		return !(*this == other);
	}

	const raw_time& OriginDateTime() const
	{
		return itsOriginDateTime;
	}
	void OriginDateTime(const raw_time& theOriginDateTime)
	{
		itsOriginDateTime = theOriginDateTime;
	}

	const raw_time& ValidDateTime() const
	{
		return itsValidDateTime;
	}
	void ValidDateTime(const raw_time& theValidDateTime)
	{
		itsValidDateTime = theValidDateTime;
	}

	/// @brief Valid time minus origin time, empty if either is unset
	time_duration Step() const;

   private:
	raw_time itsOriginDateTime;
	raw_time itsValidDateTime;
};

inline std::ostream& operator<<(std::ostream& file, const time_duration& ob)
{
	return ob.Write(file);
}
inline std::ostream& operator<<(std::ostream& file, const raw_time& ob)
{
	return ob.Write(file);
}
inline std::ostream& operator<<(std::ostream& file, const forecast_time& ob)
{
	return ob.Write(file);
}
}  // namespace lumi

template <>
struct fmt::formatter<lumi::time_duration> : fmt::formatter<std::string>
{
	template <typename FormatContext>
	auto format(const lumi::time_duration& d, FormatContext& ctx) const -> decltype(ctx.out())
	{
		return fmt::formatter<std::string>::format(static_cast<std::string>(d), ctx);
	}
};

template <>
struct fmt::formatter<lumi::raw_time> : fmt::formatter<std::string>
{
	template <typename FormatContext>
	auto format(const lumi::raw_time& t, FormatContext& ctx) const -> decltype(ctx.out())
	{
		return fmt::formatter<std::string>::format(static_cast<std::string>(t), ctx);
	}
};

template <>
struct fmt::formatter<lumi::forecast_time>
{
	template <typename ParseContext>
	constexpr auto parse(ParseContext& ctx)
	{
		return ctx.begin();
	}

	template <typename FormatContext>
	auto format(const lumi::forecast_time& ft, FormatContext& ctx) const -> decltype(ctx.out())
	{
		return fmt::format_to(ctx.out(), "{} step: {}", ft.OriginDateTime(), ft.Step());
	}
};

#endif /* FORECAST_TIME_H */
