#define BOOST_TEST_MODULE falling_snow_level

#include "falling_snow_level.h"
#include "json_parser.h"
#include "lumi_unit.h"
#include "memory_provider.h"
#include <sstream>

using namespace std;
using namespace lumi;
using namespace lumi::plugin;

const double kEpsilon = 1e-3;
const double kMissing = MissingDouble();

const size_t kSizeX = 3;
const size_t kSizeY = 3;
const size_t kCenter = 4;
const vector<double> heights = {5., 195., 200.};

const param profileParam("WETBULBINT-KM", kKm);
const param orographyParam("Z-M", kM);
const param landSeaParam("LC-0TO1", kUnitless);

const raw_time origin("2024-01-01 00:00:00");

vector<forecast_type> ForecastTypes()
{
	return {forecast_type(kEpsControl, 0), forecast_type(kEpsPerturbation, 1)};
}

vector<forecast_time> Times()
{
	return {forecast_time(origin, ONE_HOUR * 0), forecast_time(origin, ONE_HOUR * 3)};
}

vector<level> Levels()
{
	vector<level> levels;

	for (double h : heights)
	{
		levels.push_back(level(kHeight, h));
	}

	return levels;
}

// Profile of one level: uniform value, except corner (0,0) that never crosses
// the threshold and is warm, and the center that never crosses and is cold

vector<double> ProfileLevel(double value, double corner, double center)
{
	vector<double> values(kSizeX * kSizeY, value);
	values[0] = corner;
	values[kCenter] = center;

	return values;
}

// Control member crosses at half way between 5 and 195 meters, perturbed
// member at one quarter

shared_ptr<memory_provider> Provider(double orography, double landSea, double centerTop = 70.)
{
	auto prov = make_shared<memory_provider>();

	for (const auto& ftype : ForecastTypes())
	{
		const double second = (ftype.Type() == kEpsControl) ? 100. : 120.;

		for (const auto& ftime : Times())
		{
			prov->Add(ftype, ftime, level(kHeight, 5), profileParam, kSizeX, kSizeY, ProfileLevel(80., 95., 50.));
			prov->Add(ftype, ftime, level(kHeight, 195), profileParam, kSizeX, kSizeY,
			          ProfileLevel(second, 100., 60.));
			prov->Add(ftype, ftime, level(kHeight, 200), profileParam, kSizeX, kSizeY,
			          ProfileLevel(110., 110., centerTop));
		}
	}

	prov->AddStatic(level(kGround, 0), orographyParam, kSizeX, kSizeY, vector<double>(kSizeX * kSizeY, orography));
	prov->AddStatic(level(kGround, 0), landSeaParam, kSizeX, kSizeY, vector<double>(kSizeX * kSizeY, landSea));

	return prov;
}

shared_ptr<plugin_configuration> Configuration(const map<string, vector<string>>& options = {},
                                               short threadCount = -1)
{
	auto conf = make_shared<plugin_configuration>("falling_snow_level", options);

	conf->Times(Times());
	conf->ForecastTypes(ForecastTypes());
	conf->Levels(Levels());
	conf->ThreadCount(threadCount);

	return conf;
}

double ExpectedCrossing(const forecast_type& ftype)
{
	return (ftype.Type() == kEpsControl) ? 100. : 52.5;
}

BOOST_AUTO_TEST_CASE(PROCESS_LAND)
{
	falling_snow_level fsl;
	fsl.Provider(Provider(1., 1.));
	fsl.Process(Configuration());

	const auto& results = fsl.Results();

	BOOST_REQUIRE(results.size() == 4);

	for (size_t i = 0; i < results.size(); i++)
	{
		const auto& r = results[i];

		// forecast type is the outer dimension
		BOOST_REQUIRE(r->ForecastType() == ForecastTypes()[i / 2]);
		BOOST_REQUIRE(r->Time() == Times()[i % 2]);

		BOOST_REQUIRE(r->Param().Name() == "falling snow level above sea level");
		BOOST_REQUIRE(r->Param().Unit() == kM);
		BOOST_REQUIRE(r->Level() == level(kHeight, 0));

		BOOST_REQUIRE(r->SizeX() == kSizeX);
		BOOST_REQUIRE(r->SizeY() == kSizeY);

		const auto& data = r->Data();
		const double crossing = ExpectedCrossing(r->ForecastType()) + 1.;

		// warm column is set to the top of the profile
		BOOST_CHECK_CLOSE(data.At(0), 201., kEpsilon);

		for (size_t j = 1; j < data.Size(); j++)
		{
			if (j == kCenter)
			{
				continue;
			}

			BOOST_CHECK_CLOSE(data.At(j), crossing, kEpsilon);
		}

		// cold land column is filled from neighbours
		BOOST_CHECK_CLOSE(data.At(kCenter), (201. + 7. * crossing) / 8., kEpsilon);
		BOOST_REQUIRE(data.MissingCount() == 0);
	}
}

BOOST_AUTO_TEST_CASE(PROCESS_SEA)
{
	falling_snow_level fsl;
	fsl.Provider(Provider(0., 0.));
	fsl.Process(Configuration());

	for (const auto& r : fsl.Results())
	{
		const auto& data = r->Data();
		const double crossing = ExpectedCrossing(r->ForecastType());

		BOOST_CHECK_CLOSE(data.At(0), 200., kEpsilon);
		BOOST_CHECK_CLOSE(data.At(1), crossing, kEpsilon);
		BOOST_CHECK_CLOSE(data.At(8), crossing, kEpsilon);

		// cold sea column is forced to sea level
		BOOST_REQUIRE(data.At(kCenter) == 0.);
	}
}

BOOST_AUTO_TEST_CASE(SEA_POINT_PROFILE_VALUE)
{
	// center column has no value at the highest level, given either as
	// MissingDouble() or as a plain nan

	for (double centerTop : {kMissing, numeric_limits<double>::quiet_NaN()})
	{
		falling_snow_level top;
		top.Provider(Provider(0., 0., centerTop));
		top.Process(Configuration());

		falling_snow_level max;
		max.Provider(Provider(0., 0., centerTop));
		max.Process(Configuration({{"sea_point_profile_value", {"max"}}}));

		for (size_t i = 0; i < top.Results().size(); i++)
		{
			const double crossing = ExpectedCrossing(top.Results()[i]->ForecastType());
			const auto& data = top.Results()[i]->Data();

			BOOST_CHECK_CLOSE(data.At(kCenter), (200. + 7. * crossing) / 8., kEpsilon);
			BOOST_REQUIRE(data.MissingCount() == 0);
			BOOST_REQUIRE(max.Results()[i]->Data().At(kCenter) == 0.);
		}
	}
}

BOOST_AUTO_TEST_CASE(IDEMPOTENT)
{
	falling_snow_level fsl;
	fsl.Provider(Provider(1., 1.));

	const auto conf = Configuration();

	fsl.Process(conf);

	vector<matrix<double>> first;

	for (const auto& r : fsl.Results())
	{
		first.push_back(r->Data());
	}

	fsl.Process(conf);

	BOOST_REQUIRE(fsl.Results().size() == first.size());

	for (size_t i = 0; i < first.size(); i++)
	{
		BOOST_REQUIRE(fsl.Results()[i]->Data() == first[i]);
	}
}

BOOST_AUTO_TEST_CASE(THREAD_COUNT)
{
	falling_snow_level single;
	single.Provider(Provider(1., 0.));
	single.Process(Configuration({}, 1));

	falling_snow_level multi;
	multi.Provider(Provider(1., 0.));
	multi.Process(Configuration({}, 4));

	BOOST_REQUIRE(single.Results().size() == multi.Results().size());

	for (size_t i = 0; i < single.Results().size(); i++)
	{
		BOOST_REQUIRE(single.Results()[i]->ForecastType() == multi.Results()[i]->ForecastType());
		BOOST_REQUIRE(single.Results()[i]->Time() == multi.Results()[i]->Time());
		BOOST_REQUIRE(single.Results()[i]->Data() == multi.Results()[i]->Data());
	}
}

BOOST_AUTO_TEST_CASE(MISSING_INPUT)
{
	auto prov = make_shared<memory_provider>();

	const auto ftype = forecast_type(kDeterministic);
	const auto times = Times();

	// first time has full data, second time lacks the highest level

	for (size_t i = 0; i < times.size(); i++)
	{
		prov->Add(ftype, times[i], level(kHeight, 5), profileParam, kSizeX, kSizeY, ProfileLevel(80., 80., 80.));
		prov->Add(ftype, times[i], level(kHeight, 195), profileParam, kSizeX, kSizeY, ProfileLevel(100., 100., 100.));

		if (i == 0)
		{
			prov->Add(ftype, times[i], level(kHeight, 200), profileParam, kSizeX, kSizeY,
			          ProfileLevel(110., 110., 110.));
		}
	}

	prov->AddStatic(level(kGround, 0), orographyParam, kSizeX, kSizeY, vector<double>(kSizeX * kSizeY, 0.));
	prov->AddStatic(level(kGround, 0), landSeaParam, kSizeX, kSizeY, vector<double>(kSizeX * kSizeY, 1.));

	auto conf = Configuration();
	conf->ForecastTypes({ftype});

	falling_snow_level fsl;
	fsl.Provider(prov);
	fsl.Process(conf);

	const auto& results = fsl.Results();

	BOOST_REQUIRE(results.size() == 2);
	BOOST_REQUIRE(results[0]->Data().MissingCount() == 0);
	BOOST_CHECK_CLOSE(results[0]->Data().At(kCenter), 100., kEpsilon);

	BOOST_REQUIRE(results[1]->SizeX() == kSizeX);
	BOOST_REQUIRE(results[1]->SizeY() == kSizeY);
	BOOST_REQUIRE(results[1]->Data().MissingCount() == kSizeX * kSizeY);
}

BOOST_AUTO_TEST_CASE(SHAPE_MISMATCH)
{
	auto prov = Provider(1., 1.);
	prov->AddStatic(level(kGround, 0), orographyParam, 2, 2, vector<double>(4, 1.));

	falling_snow_level fsl;
	fsl.Provider(prov);

	BOOST_CHECK_THROW(fsl.Process(Configuration()), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(INVALID_CONFIGURATION)
{
	falling_snow_level fsl;

	// provider not set
	BOOST_CHECK_THROW(fsl.Process(Configuration()), std::runtime_error);

	fsl.Provider(Provider(1., 1.));

	BOOST_CHECK_THROW(fsl.Process(Configuration({{"precision", {"-0.1"}}})), std::invalid_argument);
	BOOST_CHECK_THROW(fsl.Process(Configuration({{"precision", {"abc"}}})), std::invalid_argument);
	BOOST_CHECK_THROW(fsl.Process(Configuration({{"falling_level_threshold", {"1,2"}}})), std::invalid_argument);
	BOOST_CHECK_THROW(fsl.Process(Configuration({{"precision", {"0.01", "0.02"}}})), std::invalid_argument);
	BOOST_CHECK_THROW(fsl.Process(Configuration({{"sea_point_profile_value", {"top", "max"}}})),
	                  std::invalid_argument);
	BOOST_CHECK_THROW(fsl.Process(Configuration({{"sea_point_profile_value", {"bottom"}}})), std::invalid_argument);

	auto conf = Configuration();
	conf->Levels({level(kHeight, 5)});
	BOOST_CHECK_THROW(fsl.Process(conf), std::invalid_argument);

	conf->Levels({level(kHeight, 195), level(kHeight, 5)});
	BOOST_CHECK_THROW(fsl.Process(conf), std::invalid_argument);

	conf->Levels({level(kGround, 0), level(kHeight, 5)});
	BOOST_CHECK_THROW(fsl.Process(conf), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(OPTIONS)
{
	falling_snow_level fsl;

	stringstream ss;
	ss << fsl;

	BOOST_REQUIRE(ss.str() == "<falling_snow_level: precision:0.005, falling_level_threshold:90.0>");

	fsl.Provider(Provider(1., 1.));
	fsl.Process(Configuration({{"falling_level_threshold", {"105"}}, {"precision", {"0.01"}}}));

	BOOST_CHECK_CLOSE(fsl.Threshold(), 105., kEpsilon);
	BOOST_CHECK_CLOSE(fsl.Precision(), 0.01, kEpsilon);

	ss.str("");
	ss << fsl;

	BOOST_REQUIRE(ss.str() == "<falling_snow_level: precision:0.01, falling_level_threshold:105.0>");

	// control member crosses 105 between 195 (100) and 200 (110) meters
	const auto& data = fsl.Results()[0]->Data();
	BOOST_CHECK_CLOSE(data.At(1), 1. + 197.5, kEpsilon);
}

BOOST_AUTO_TEST_CASE(RESULT_METADATA_FROM_PROFILE)
{
	// provider serves an older run that is valid at the requested time

	const raw_time previousOrigin("2023-12-31 12:00:00");
	const auto ftype = forecast_type(kDeterministic);
	const auto requested = forecast_time(origin, ONE_HOUR * 3);
	const auto served = forecast_time(previousOrigin, ONE_HOUR * 15);

	BOOST_REQUIRE(requested.ValidDateTime() == served.ValidDateTime());

	auto prov = make_shared<memory_provider>();

	const vector<double> values = {80., 100., 110.};

	for (size_t k = 0; k < heights.size(); k++)
	{
		prov->Add(ftype, served, level(kHeight, heights[k]), profileParam, 1, 1, {values[k]});
	}

	prov->AddStatic(level(kGround, 0), orographyParam, 1, 1, {0.});
	prov->AddStatic(level(kGround, 0), landSeaParam, 1, 1, {1.});

	auto conf = Configuration();
	conf->ForecastTypes({ftype});
	conf->Times({requested});

	falling_snow_level fsl;
	fsl.Provider(prov);
	fsl.Process(conf);

	BOOST_REQUIRE(fsl.Results().size() == 1);

	const auto& r = fsl.Results()[0];

	BOOST_REQUIRE(r->Time() == served);
	BOOST_REQUIRE(r->Time().OriginDateTime() == previousOrigin);
	BOOST_REQUIRE(r->ForecastType() == ftype);
	BOOST_CHECK_CLOSE(r->Data().At(0), 100., kEpsilon);
}

BOOST_AUTO_TEST_CASE(INPUT_PARAMETER_NAMES)
{
	auto prov = make_shared<memory_provider>();
	const auto ftype = forecast_type(kDeterministic);
	const auto ftime = Times()[0];

	const vector<double> values = {80., 100., 110.};

	for (size_t k = 0; k < heights.size(); k++)
	{
		prov->Add(ftype, ftime, level(kHeight, heights[k]), param("WBI"), 1, 1, {values[k]});
	}

	prov->AddStatic(level(kGround, 0), param("OROG"), 1, 1, {10.});
	prov->AddStatic(level(kGround, 0), param("LSM"), 1, 1, {1.});

	auto conf = Configuration({{"profile_param", {"WBI"}}, {"orography_param", {"OROG"}}, {"land_sea_param", {"LSM"}}});
	conf->ForecastTypes({ftype});
	conf->Times({ftime});

	falling_snow_level fsl;
	fsl.Provider(prov);
	fsl.Process(conf);

	BOOST_REQUIRE(fsl.Results().size() == 1);
	BOOST_CHECK_CLOSE(fsl.Results()[0]->Data().At(0), 110., kEpsilon);

	// orography, land sea mask and three profile levels
	BOOST_REQUIRE(prov->FetchCount() == 5);
}

BOOST_AUTO_TEST_CASE(CONFIGURATION_FILE)
{
	auto conf = make_shared<configuration>();
	conf->ConfigurationFileContent(R"({
		"origintime" : "2024-01-01 00:00:00",
		"hours" : "0,3",
		"forecast_type" : "cf,pf1",
		"leveltype" : "height",
		"levels" : "5,195,200",
		"processqueue" : [ { "plugins" : [ { "name" : "falling_snow_level", "thread_count" : 2 } ] } ]
	})");

	json_parser parser;
	const auto plugins = parser.Parse(conf);

	BOOST_REQUIRE(plugins.size() == 1);

	falling_snow_level fromFile;
	fromFile.Provider(Provider(1., 1.));
	fromFile.Process(plugins[0]);

	falling_snow_level direct;
	direct.Provider(Provider(1., 1.));
	direct.Process(Configuration());

	BOOST_REQUIRE(fromFile.Results().size() == 4);

	for (size_t i = 0; i < direct.Results().size(); i++)
	{
		BOOST_REQUIRE(fromFile.Results()[i]->ForecastType() == direct.Results()[i]->ForecastType());
		BOOST_REQUIRE(fromFile.Results()[i]->Time() == direct.Results()[i]->Time());
		BOOST_REQUIRE(fromFile.Results()[i]->Data() == direct.Results()[i]->Data());
	}
}
