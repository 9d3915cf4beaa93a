#define BOOST_TEST_MODULE json_parser

#include "json_parser.h"
#include "logger.h"
#include "lumi_unit.h"

using namespace std;
using namespace lumi;

const string kConfiguration = R"({
	"origintime" : "2024-01-31 00:00:00",
	"hours" : "0-6-3",
	"forecast_type" : "cf,pf1-2",
	"thread_count" : 2,
	"processqueue" : [
	{
		"leveltype" : "height",
		"levels" : "5,195,200",
		"plugins" : [
			{ "name" : "falling_snow_level", "falling_level_threshold" : "85", "precision" : "0.01" },
			{ "name" : "falling_snow_level", "hours" : "12", "sea_point_profile_value" : [ "max" ] }
		]
	}
	]
})";

vector<shared_ptr<plugin_configuration>> Parse(const string& content)
{
	auto conf = make_shared<configuration>();
	conf->ConfigurationFileName("test.json");
	conf->ConfigurationFileContent(content);

	json_parser parser;
	return parser.Parse(conf);
}

BOOST_AUTO_TEST_CASE(PARSE)
{
	const auto plugins = Parse(kConfiguration);

	BOOST_REQUIRE(plugins.size() == 2);

	const auto& pc = plugins[0];

	BOOST_REQUIRE(pc->Name() == "falling_snow_level");
	BOOST_REQUIRE(pc->ConfigurationFileName() == "test.json");

	BOOST_REQUIRE(pc->Times().size() == 3);
	BOOST_REQUIRE(pc->Times()[0].OriginDateTime() == raw_time("2024-01-31 00:00:00"));
	BOOST_REQUIRE(pc->Times()[0].Step() == ONE_HOUR * 0);
	BOOST_REQUIRE(pc->Times()[2].Step() == ONE_HOUR * 6);

	BOOST_REQUIRE(pc->ForecastTypes().size() == 3);
	BOOST_REQUIRE(pc->ForecastTypes()[0] == forecast_type(kEpsControl, 0));
	BOOST_REQUIRE(pc->ForecastTypes()[2] == forecast_type(kEpsPerturbation, 2));

	BOOST_REQUIRE(pc->Levels().size() == 3);
	BOOST_REQUIRE(pc->Levels()[1] == level(kHeight, 195));

	BOOST_REQUIRE(pc->ThreadCount() == 2);

	BOOST_REQUIRE(pc->Exists("falling_level_threshold"));
	BOOST_REQUIRE(pc->GetValue("falling_level_threshold") == "85");
	BOOST_REQUIRE(pc->GetValue("precision") == "0.01");
	BOOST_REQUIRE(!pc->Exists("sea_point_profile_value"));
	BOOST_REQUIRE(pc->GetValue("sea_point_profile_value").empty());
}

BOOST_AUTO_TEST_CASE(PLUGIN_SCOPE_OVERRIDES)
{
	const auto plugins = Parse(kConfiguration);

	const auto& pc = plugins[1];

	// steps are redefined, origin time is inherited
	BOOST_REQUIRE(pc->Times().size() == 1);
	BOOST_REQUIRE(pc->Times()[0].OriginDateTime() == raw_time("2024-01-31 00:00:00"));
	BOOST_REQUIRE(pc->Times()[0].Step() == ONE_HOUR * 12);

	BOOST_REQUIRE(pc->Levels().size() == 3);
	BOOST_REQUIRE(pc->GetValueList("sea_point_profile_value").size() == 1);
	BOOST_REQUIRE(pc->GetValue("sea_point_profile_value") == "max");

	// first plugin is not affected
	BOOST_REQUIRE(plugins[0]->Times().size() == 3);
}

BOOST_AUTO_TEST_CASE(TIMES)
{
	const auto plugins = Parse(R"({
		"origintimes" : "2024-01-31 00:00:00,2024-01-31 12:00:00",
		"times" : "00:00,01:30",
		"processqueue" : [ { "plugins" : [ { "name" : "a" } ] } ]
	})");

	const auto& times = plugins[0]->Times();

	BOOST_REQUIRE(times.size() == 4);
	BOOST_REQUIRE(times[1].Step().Minutes() == 90);
	BOOST_REQUIRE(times[2].OriginDateTime() == raw_time("2024-01-31 12:00:00"));

	const auto plugins2 = Parse(R"({
		"origintime" : "2024-01-31 00:00:00",
		"start_time" : "00:00",
		"stop_time" : "12:00",
		"step" : "06:00",
		"processqueue" : [ { "plugins" : [ { "name" : "a" } ] } ]
	})");

	BOOST_REQUIRE(plugins2[0]->Times().size() == 3);
	BOOST_REQUIRE(plugins2[0]->ForecastStep() == ONE_HOUR * 6);

	// new origin time in processqueue keeps the steps
	const auto plugins3 = Parse(R"({
		"origintime" : "2024-01-31 00:00:00",
		"hours" : "3,6",
		"processqueue" : [ { "origintime" : "2024-02-01 00:00:00", "plugins" : [ { "name" : "a" } ] } ]
	})");

	const auto& times3 = plugins3[0]->Times();

	BOOST_REQUIRE(times3.size() == 2);
	BOOST_REQUIRE(times3[0].OriginDateTime() == raw_time("2024-02-01 00:00:00"));
	BOOST_REQUIRE(times3[1].Step() == ONE_HOUR * 6);
}

BOOST_AUTO_TEST_CASE(DEFAULTS)
{
	const auto plugins = Parse(R"({ "processqueue" : [ { "plugins" : [ { "name" : "a" } ] } ] })");

	const auto& pc = plugins[0];

	BOOST_REQUIRE(pc->ThreadCount() == -1);
	BOOST_REQUIRE(pc->Times().empty());
	BOOST_REQUIRE(pc->Levels().empty());
	BOOST_REQUIRE(pc->ForecastTypes().size() == 1);
	BOOST_REQUIRE(pc->ForecastTypes()[0].Type() == kDeterministic);
}

BOOST_AUTO_TEST_CASE(DEBUG_LEVEL)
{
	const auto original = logger::MainDebugState;

	Parse(R"({ "debug_level" : "warning", "processqueue" : [ { "plugins" : [ { "name" : "a" } ] } ] })");

	BOOST_REQUIRE(logger::MainDebugState == kWarningMsg);
	BOOST_REQUIRE(logger("test").DebugState() == kWarningMsg);

	logger::MainDebugState = original;

	BOOST_CHECK_THROW(Parse(R"({ "debug_level" : "loud", "processqueue" : [ { "plugins" : [ { "name" : "a" } ] } ] })"),
	                  std::runtime_error);
}

BOOST_AUTO_TEST_CASE(INVALID)
{
	BOOST_CHECK_THROW(Parse(""), std::runtime_error);
	BOOST_CHECK_THROW(Parse("{ not json"), std::runtime_error);
	BOOST_CHECK_THROW(Parse(R"({ "hours" : "1" })"), std::runtime_error);
	BOOST_CHECK_THROW(Parse(R"({ "processqueue" : [ ] })"), std::runtime_error);
	BOOST_CHECK_THROW(Parse(R"({ "processqueue" : [ { "leveltype" : "height" } ] })"), std::runtime_error);
	BOOST_CHECK_THROW(Parse(R"({ "processqueue" : [ { "plugins" : [ { "precision" : "1" } ] } ] })"),
	                  std::runtime_error);

	// steps without origin time
	BOOST_CHECK_THROW(Parse(R"({ "hours" : "1", "processqueue" : [ { "plugins" : [ { "name" : "a" } ] } ] })"),
	                  std::runtime_error);

	// levels need a type
	BOOST_CHECK_THROW(Parse(R"({ "levels" : "1,2", "processqueue" : [ { "plugins" : [ { "name" : "a" } ] } ] })"),
	                  std::runtime_error);
	BOOST_CHECK_THROW(
	    Parse(R"({ "leveltype" : "sky", "levels" : "1", "processqueue" : [ { "plugins" : [ { "name" : "a" } ] } ] })"),
	    std::runtime_error);

	BOOST_CHECK_THROW(Parse(R"({ "thread_count" : 0, "processqueue" : [ { "plugins" : [ { "name" : "a" } ] } ] })"),
	                  std::runtime_error);

	BOOST_CHECK_THROW(
	    Parse(R"({ "forecast_type" : "ensemble", "processqueue" : [ { "plugins" : [ { "name" : "a" } ] } ] })"),
	    std::invalid_argument);
}
