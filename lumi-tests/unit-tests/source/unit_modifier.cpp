#define BOOST_TEST_MODULE modifier

#include "lumi_unit.h"
#include "modifier.h"

using namespace std;
using namespace lumi;

const double kEpsilon = 1e-3;
const double kMissing = MissingDouble();

const vector<double> heights = {5., 10., 20.};

// Four grid points, three levels, lowest level first
const vector<vector<double>> values = {{80., 80., 70., 50.}, {90., 100., 80., 60.}, {100., 110., 90., 100.}};

vector<double> Repeat(double value, size_t count)
{
	return vector<double>(count, value);
}

BOOST_AUTO_TEST_CASE(MODIFIER_FINDHEIGHT)
{
	modifier_findheight mod;
	mod.FindValue(Repeat(90., 4));

	for (size_t i = 0; i < heights.size(); i++)
	{
		mod.Process(values[i], Repeat(heights[i], 4));
	}

	const auto& result = mod.Result();

	BOOST_CHECK_CLOSE(result[0], 10., kEpsilon);
	BOOST_CHECK_CLOSE(result[1], 7.5, kEpsilon);
	BOOST_CHECK_CLOSE(result[2], 20., kEpsilon);
	BOOST_CHECK_CLOSE(result[3], 17.5, kEpsilon);

	BOOST_REQUIRE(mod.CalculationFinished());
	BOOST_REQUIRE(mod.HeightsCrossed() == 4);
}

BOOST_AUTO_TEST_CASE(MODIFIER_FINDHEIGHT_NOT_FOUND)
{
	modifier_findheight mod;
	mod.FindValue(Repeat(90., 4));

	auto top = values[2];
	top[3] = 70.;

	mod.Process(values[0], Repeat(heights[0], 4));
	mod.Process(values[1], Repeat(heights[1], 4));
	mod.Process(top, Repeat(heights[2], 4));

	const auto& result = mod.Result();

	BOOST_CHECK_CLOSE(result[0], 10., kEpsilon);
	BOOST_REQUIRE(IsMissing(result[3]));
	BOOST_REQUIRE(!mod.CalculationFinished());
}

BOOST_AUTO_TEST_CASE(MODIFIER_FINDHEIGHT_DECREASING_PROFILE)
{
	modifier_findheight mod;
	mod.FindValue({90.});

	mod.Process({100.}, {0.});
	mod.Process({80.}, {100.});

	BOOST_CHECK_CLOSE(mod.Result()[0], 50., kEpsilon);
}

BOOST_AUTO_TEST_CASE(MODIFIER_FINDHEIGHT_FIRST_CROSSING)
{
	modifier_findheight mod;
	mod.FindValue({90.});

	const vector<double> profile = {80., 100., 80., 100.};

	for (size_t i = 0; i < profile.size(); i++)
	{
		mod.Process({profile[i]}, {10. * static_cast<double>(i)});
	}

	BOOST_CHECK_CLOSE(mod.Result()[0], 5., kEpsilon);
}

BOOST_AUTO_TEST_CASE(MODIFIER_FINDHEIGHT_PRECISION)
{
	modifier_findheight mod;
	mod.FindValue({90., 90.});
	mod.Precision(0.005);

	mod.Process({89.996, 89.99}, {0., 0.});
	mod.Process({95., 95.}, {10., 10.});

	const auto& result = mod.Result();

	// first point is snapped to the threshold, so the lower level is the answer
	BOOST_REQUIRE(result[0] == 0.);

	// second point is outside tolerance and is interpolated
	BOOST_REQUIRE(result[1] > 0.);
	BOOST_CHECK_CLOSE(result[1], 10. * 0.01 / 5.01, kEpsilon);
}

BOOST_AUTO_TEST_CASE(MODIFIER_FINDHEIGHT_FLAT_AT_THRESHOLD)
{
	modifier_findheight mod;
	mod.FindValue({90.});

	mod.Process({90.}, {5.});
	mod.Process({90.}, {10.});

	BOOST_REQUIRE(mod.Result()[0] == 5.);
}

BOOST_AUTO_TEST_CASE(MODIFIER_FINDHEIGHT_MISSING_LEVEL)
{
	// a gap in the profile does not break the search

	modifier_findheight mod;
	mod.FindValue({90., 90.});

	mod.Process({80., 80.}, {0., 0.});
	mod.Process({kMissing, 85.}, {10., 10.});
	mod.Process({100., 100.}, {20., 20.});

	const auto& result = mod.Result();

	BOOST_CHECK_CLOSE(result[0], 10., kEpsilon);
	BOOST_CHECK_CLOSE(result[1], 10. + 10. / 3., kEpsilon);
}

BOOST_AUTO_TEST_CASE(MODIFIER_FINDHEIGHT_PLAIN_NAN)
{
	// any nan is skipped like MissingDouble()

	const double nan = numeric_limits<double>::quiet_NaN();

	modifier_findheight mod;
	mod.FindValue({90., 90.});

	mod.Process({80., 80.}, {0., 0.});
	mod.Process({nan, 85.}, {10., nan});
	mod.Process({100., 100.}, {20., 20.});

	const auto& result = mod.Result();

	BOOST_CHECK_CLOSE(result[0], 10., kEpsilon);
	BOOST_CHECK_CLOSE(result[1], 10., kEpsilon);
	BOOST_REQUIRE(mod.CalculationFinished());
}

BOOST_AUTO_TEST_CASE(MODIFIER_FINDHEIGHT_MISSING_FIND_VALUE)
{
	modifier_findheight mod;
	mod.FindValue({kMissing, 90.});

	mod.Process({80., 80.}, {0., 0.});
	mod.Process({100., 100.}, {10., 10.});

	BOOST_REQUIRE(IsMissing(mod.Result()[0]));
	BOOST_CHECK_CLOSE(mod.Result()[1], 5., kEpsilon);
	BOOST_REQUIRE(mod.CalculationFinished());
}

BOOST_AUTO_TEST_CASE(MODIFIER_FINDHEIGHT_SIZE_MISMATCH)
{
	modifier_findheight mod;
	mod.FindValue({90., 90.});

	BOOST_CHECK_THROW(mod.Process({80., 80., 80.}, {0., 0., 0.}), std::invalid_argument);

	modifier_findheight mod2;
	mod2.FindValue({90., 90.});
	mod2.Process({80., 80.}, {0., 0.});

	BOOST_CHECK_THROW(mod2.Process({80.}, {10.}), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(MODIFIER_FINDHEIGHT_CLEAR)
{
	modifier_findheight mod;
	mod.FindValue({90.});

	mod.Process({80.}, {0.});
	mod.Process({100.}, {10.});

	BOOST_REQUIRE(mod.CalculationFinished());

	mod.Clear();

	BOOST_REQUIRE(!mod.CalculationFinished());
	BOOST_REQUIRE(IsMissing(mod.Result()[0]));

	mod.Process({100.}, {0.});
	mod.Process({80.}, {20.});

	BOOST_CHECK_CLOSE(mod.Result()[0], 10., kEpsilon);
}

BOOST_AUTO_TEST_CASE(MODIFIER_MAX)
{
	modifier_max mod;

	for (size_t i = 0; i < heights.size(); i++)
	{
		mod.Process(values[i], Repeat(heights[i], 4));
	}

	mod.Process({kMissing, 120., kMissing, kMissing}, Repeat(30., 4));

	const auto& result = mod.Result();

	BOOST_REQUIRE(result[0] == 100.);
	BOOST_REQUIRE(result[1] == 120.);
	BOOST_REQUIRE(result[2] == 90.);
	BOOST_REQUIRE(result[3] == 100.);
}

BOOST_AUTO_TEST_CASE(MODIFIER_MAX_ALL_MISSING)
{
	modifier_max mod;

	mod.Process({kMissing, 1.}, {0., 0.});
	mod.Process({kMissing, 2.}, {10., 10.});

	BOOST_REQUIRE(IsMissing(mod.Result()[0]));
	BOOST_REQUIRE(mod.Result()[1] == 2.);
}
