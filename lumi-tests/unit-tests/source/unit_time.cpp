#define BOOST_TEST_MODULE time

#include "forecast_time.h"
#include "lumi_unit.h"

using namespace std;
using namespace lumi;

BOOST_AUTO_TEST_CASE(RAW_TIME)
{
	raw_time t("2024-01-31 21:00:00");

	BOOST_REQUIRE(!t.Empty());
	BOOST_REQUIRE(static_cast<string>(t) == "202401312100");
	BOOST_REQUIRE(t.String("%Y-%m-%d %H:%M:%S") == "2024-01-31 21:00:00");
	BOOST_REQUIRE(t.String("%H") == "21");

	raw_time t2("202401312100", "%Y%m%d%H%M");

	BOOST_REQUIRE(t == t2);

	raw_time t3 = t + ONE_HOUR * 6;

	BOOST_REQUIRE(t3.String("%Y-%m-%d %H:%M:%S") == "2024-02-01 03:00:00");
	BOOST_REQUIRE(t3 > t);
	BOOST_REQUIRE(t3 - t == ONE_HOUR * 6);
	BOOST_REQUIRE(t3 - ONE_HOUR * 6 == t);

	BOOST_REQUIRE(raw_time().Empty());
	BOOST_REQUIRE(raw_time().String() == "not_a_date_time");
}

BOOST_AUTO_TEST_CASE(RAW_TIME_INVALID)
{
	BOOST_CHECK_THROW(raw_time("yesterday"), std::runtime_error);
	BOOST_CHECK_THROW(raw_time("2024013121", "%Y%m%d%H%M"), std::runtime_error);
	BOOST_CHECK_THROW(raw_time("2024-01-31", "%Y-%m-%d"), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(TIME_DURATION)
{
	time_duration d("03:30");

	BOOST_REQUIRE(d.Hours() == 3);
	BOOST_REQUIRE(d.Minutes() == 210);
	BOOST_REQUIRE(d.Seconds() == 12600);

	BOOST_REQUIRE(time_duration(kHourResolution, 3) + time_duration(kMinuteResolution, 30) == d);
	BOOST_REQUIRE(time_duration(kDayResolution, 1) == ONE_HOUR * 24);

	time_duration e = d;
	e -= ONE_HOUR;

	BOOST_REQUIRE(e < d);
	BOOST_REQUIRE(e.Minutes() == 150);

	BOOST_REQUIRE(time_duration().Empty());
	BOOST_REQUIRE(!d.Empty());

	BOOST_CHECK_THROW(time_duration(kUnknownTimeResolution, 1), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(FORECAST_TIME)
{
	const raw_time origin("2024-01-31 00:00:00");

	forecast_time ft(origin, ONE_HOUR * 12);

	BOOST_REQUIRE(ft.OriginDateTime() == origin);
	BOOST_REQUIRE(ft.ValidDateTime() == raw_time("2024-01-31 12:00:00"));
	BOOST_REQUIRE(ft.Step() == ONE_HOUR * 12);

	forecast_time ft2(origin, raw_time("2024-01-31 12:00:00"));

	BOOST_REQUIRE(ft == ft2);

	ft2.ValidDateTime(raw_time("2024-02-01 00:00:00"));

	BOOST_REQUIRE(ft != ft2);
	BOOST_REQUIRE(ft2.Step().Hours() == 24);

	BOOST_REQUIRE(forecast_time().Step().Empty());

	BOOST_REQUIRE(fmt::format("{}", ft) == "202401310000 step: 12:00:00");
}
