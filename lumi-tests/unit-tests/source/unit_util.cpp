#define BOOST_TEST_MODULE util

#include "lumi_unit.h"
#include "util.h"

using namespace std;
using namespace lumi;

BOOST_AUTO_TEST_CASE(SPLIT)
{
	const auto strs = util::Split("a, b ,c", ",");

	BOOST_REQUIRE(strs.size() == 3);
	BOOST_REQUIRE(strs[0] == "a");
	BOOST_REQUIRE(strs[1] == "b");
	BOOST_REQUIRE(strs[2] == "c");

	const auto dbls = util::Split<double>("5,195.5, 200", ",");

	BOOST_REQUIRE(dbls.size() == 3);
	BOOST_REQUIRE(dbls[1] == 195.5);

	BOOST_CHECK_THROW(util::Split<double>("5,x", ","), std::invalid_argument);
	BOOST_CHECK_THROW(util::Split<int>("", ","), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(EXPAND_STRING)
{
	BOOST_REQUIRE(util::ExpandString("0-6-3") == vector<int>({0, 3, 6}));
	BOOST_REQUIRE(util::ExpandString("1,2-4") == vector<int>({1, 2, 3, 4}));
	BOOST_REQUIRE(util::ExpandString("4-1-2") == vector<int>({4, 2}));
	BOOST_REQUIRE(util::ExpandString("12") == vector<int>({12}));
	BOOST_REQUIRE(util::ExpandString("6-0-3") == vector<int>({6, 3, 0}));

	BOOST_CHECK_THROW(util::ExpandString("0-6-0"), std::invalid_argument);
	BOOST_CHECK_THROW(util::ExpandString("0-6-3-1"), std::invalid_argument);
	BOOST_CHECK_THROW(util::ExpandString("a-b"), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(FORECAST_TYPES)
{
	const auto types = util::ForecastTypesFromString("deterministic,cf,pf1-3");

	BOOST_REQUIRE(types.size() == 5);
	BOOST_REQUIRE(types[0] == forecast_type(kDeterministic));
	BOOST_REQUIRE(types[1] == forecast_type(kEpsControl, 0));
	BOOST_REQUIRE(types[2] == forecast_type(kEpsPerturbation, 1));
	BOOST_REQUIRE(types[4] == forecast_type(kEpsPerturbation, 3));

	BOOST_REQUIRE(util::ForecastTypesFromString("CF5")[0] == forecast_type(kEpsControl, 5));
	BOOST_REQUIRE(util::ForecastTypesFromString("an")[0].Type() == kAnalysis);

	BOOST_CHECK_THROW(util::ForecastTypesFromString("ensemble"), std::invalid_argument);
	BOOST_CHECK_THROW(util::ForecastTypesFromString("pf1-2-3"), std::invalid_argument);
}
