#define BOOST_TEST_MODULE falling_level

#include "falling_level.h"
#include "lumi_unit.h"

#include "falling_level_helper.h"

using namespace std;
using namespace lumi;

const double kEpsilon = 1e-3;
const double kMissing = MissingDouble();
const double kNaN = numeric_limits<double>::quiet_NaN();

const double kThreshold = falling_level::kDefaultThreshold;

vector<matrix<double>> Profile()
{
	return {Grid({{80, 80}, {70, 50}}), Grid({{90, 100}, {80, 60}}), Grid({{100, 110}, {90, 100}})};
}

const vector<double> heights = {5, 10, 20};

BOOST_AUTO_TEST_CASE(FIND_FALLING_LEVEL)
{
	const auto orography = Grid({{0, 0}, {5, 3}});

	const auto result =
	    falling_level::FindFallingLevel(Profile(), orography, heights, kThreshold, falling_level::kDefaultPrecision);

	Dump(result);

	BOOST_CHECK_CLOSE(result.At(0, 0, 0), 10., kEpsilon);
	BOOST_CHECK_CLOSE(result.At(1, 0, 0), 7.5, kEpsilon);
	BOOST_CHECK_CLOSE(result.At(0, 1, 0), 25., kEpsilon);
	BOOST_CHECK_CLOSE(result.At(1, 1, 0), 20.5, kEpsilon);
}

BOOST_AUTO_TEST_CASE(FIND_FALLING_LEVEL_NOT_CROSSED)
{
	const auto orography = Grid({{0, 0}, {5, 3}});

	auto profile = Profile();
	profile[2].Set(1, 1, 0, 70.);

	const auto result =
	    falling_level::FindFallingLevel(profile, orography, heights, kThreshold, falling_level::kDefaultPrecision);

	BOOST_CHECK_CLOSE(result.At(0, 0, 0), 10., kEpsilon);
	BOOST_REQUIRE(result.IsMissing(1, 1, 0));
	BOOST_REQUIRE(result.MissingCount() == 1);
}

BOOST_AUTO_TEST_CASE(FIND_FALLING_LEVEL_MISSING_OROGRAPHY)
{
	const auto orography = Grid({{kMissing, 0}, {5, 3}});

	const auto result =
	    falling_level::FindFallingLevel(Profile(), orography, heights, kThreshold, falling_level::kDefaultPrecision);

	BOOST_REQUIRE(result.IsMissing(0, 0, 0));
	BOOST_CHECK_CLOSE(result.At(1, 0, 0), 7.5, kEpsilon);
}

BOOST_AUTO_TEST_CASE(FIND_FALLING_LEVEL_THRESHOLD)
{
	const auto orography = Grid({{0, 0}, {0, 0}});

	const auto result = falling_level::FindFallingLevel(Profile(), orography, heights, 100., 0.);

	BOOST_CHECK_CLOSE(result.At(0, 0, 0), 20., kEpsilon);
	BOOST_CHECK_CLOSE(result.At(1, 0, 0), 10., kEpsilon);
	BOOST_REQUIRE(result.IsMissing(0, 1, 0));
	BOOST_CHECK_CLOSE(result.At(1, 1, 0), 20., kEpsilon);
}

BOOST_AUTO_TEST_CASE(FILL_IN_HIGH_FALLING_LEVELS)
{
	auto fallingLevel = Grid({{1, 1, 2}, {1, kMissing, 2}, {1, 2, 2}});
	const auto orography = Grid({{1, 1, 1}, {1, 1, 1}, {1, 1, 1}});
	const auto highest = Grid({{1, 1, 1}, {1, 100, 1}, {1, 1, 1}});

	const size_t filled = falling_level::FillInHighFallingLevels(fallingLevel, orography, highest, 300., kThreshold);

	BOOST_REQUIRE(filled == 1);
	BOOST_CHECK_CLOSE(fallingLevel.At(1, 1, 0), 301., kEpsilon);

	// resolved points are untouched
	BOOST_REQUIRE(fallingLevel.At(0, 0, 0) == 1.);
	BOOST_REQUIRE(fallingLevel.At(2, 2, 0) == 2.);
}

BOOST_AUTO_TEST_CASE(FILL_IN_HIGH_FALLING_LEVELS_COLD_COLUMN)
{
	auto fallingLevel = Grid({{1, 1, 2}, {1, kMissing, 2}, {1, 2, 2}});
	const auto orography = Grid({{1, 1, 1}, {1, 1, 1}, {1, 1, 1}});

	// strictly above threshold is required
	const auto highest = Grid({{1, 1, 1}, {1, kThreshold, 1}, {1, 1, 1}});

	const size_t filled = falling_level::FillInHighFallingLevels(fallingLevel, orography, highest, 300., kThreshold);

	BOOST_REQUIRE(filled == 0);
	BOOST_REQUIRE(fallingLevel.IsMissing(1, 1, 0));
}

BOOST_AUTO_TEST_CASE(FILL_IN_HIGH_FALLING_LEVELS_RESOLVED_POINT)
{
	auto fallingLevel = Grid({{1, 1, 2}, {1, 1.5, 2}, {1, 2, 2}});
	const auto orography = Grid({{1, 1, 1}, {1, 1, 1}, {1, 1, 1}});
	const auto highest = Grid({{100, 100, 100}, {100, 100, 100}, {100, 100, 100}});

	const size_t filled = falling_level::FillInHighFallingLevels(fallingLevel, orography, highest, 300., kThreshold);

	BOOST_REQUIRE(filled == 0);
	BOOST_REQUIRE(fallingLevel.At(1, 1, 0) == 1.5);
}

BOOST_AUTO_TEST_CASE(FILL_IN_SEA_POINTS)
{
	auto fallingLevel = Grid({{1, 1, 2}, {1, kMissing, 2}, {1, 2, 2}});
	const auto landSea = Grid({{1, 1, 1}, {1, 0, 1}, {1, 1, 1}});
	const auto profileValue = Grid({{100, 100, 100}, {100, 5, 100}, {100, 100, 100}});

	const size_t filled = falling_level::FillInSeaPoints(fallingLevel, landSea, profileValue, kThreshold);

	BOOST_REQUIRE(filled == 1);
	BOOST_REQUIRE(fallingLevel.At(1, 1, 0) == 0.);
	BOOST_REQUIRE(fallingLevel.At(0, 0, 0) == 1.);
}

BOOST_AUTO_TEST_CASE(FILL_IN_SEA_POINTS_LAND)
{
	auto fallingLevel = Grid({{1, 1, 2}, {1, kMissing, 2}, {1, 2, 2}});
	const auto landSea = Grid({{1, 1, 1}, {1, 1, 1}, {1, 1, 1}});
	const auto profileValue = Grid({{100, 100, 100}, {100, 5, 100}, {100, 100, 100}});

	const size_t filled = falling_level::FillInSeaPoints(fallingLevel, landSea, profileValue, kThreshold);

	BOOST_REQUIRE(filled == 0);
	BOOST_REQUIRE(fallingLevel.IsMissing(1, 1, 0));
}

BOOST_AUTO_TEST_CASE(FILL_IN_SEA_POINTS_WARM_OR_RESOLVED)
{
	// warm sea point is not forced to sea level
	auto fallingLevel = Grid({{1, 1, 2}, {1, kMissing, 2}, {1, 2, 2}});
	const auto landSea = Grid({{0, 0, 0}, {0, 0, 0}, {0, 0, 0}});
	const auto warm = Grid({{100, 100, 100}, {100, 100, 100}, {100, 100, 100}});

	BOOST_REQUIRE(falling_level::FillInSeaPoints(fallingLevel, landSea, warm, kThreshold) == 0);
	BOOST_REQUIRE(fallingLevel.IsMissing(1, 1, 0));

	// already resolved sea point is unchanged
	auto resolved = Grid({{1, 1, 2}, {1, 1, 2}, {1, 2, 2}});
	const auto cold = Grid({{5, 5, 5}, {5, 5, 5}, {5, 5, 5}});

	BOOST_REQUIRE(falling_level::FillInSeaPoints(resolved, landSea, cold, kThreshold) == 0);
	BOOST_REQUIRE(resolved.At(1, 1, 0) == 1.);
}

BOOST_AUTO_TEST_CASE(FILL_IN_SEA_POINTS_MISSING_MASK)
{
	auto fallingLevel = Grid({{kMissing, kMissing}, {kMissing, kMissing}});
	const auto landSea = Grid({{kMissing, 0}, {0.5, 0}});
	const auto profileValue = Grid({{5, 5}, {5, kMissing}});

	BOOST_REQUIRE(falling_level::FillInSeaPoints(fallingLevel, landSea, profileValue, kThreshold) == 1);
	BOOST_REQUIRE(fallingLevel.IsMissing(0, 0, 0));
	BOOST_REQUIRE(fallingLevel.At(1, 0, 0) == 0.);
	BOOST_REQUIRE(fallingLevel.IsMissing(0, 1, 0));
	BOOST_REQUIRE(fallingLevel.IsMissing(1, 1, 0));
}

BOOST_AUTO_TEST_CASE(HORIZONTAL_INTERPOLATION_UNIFORM)
{
	const auto fallingLevel = Grid({{1, 1, 1}, {1, kMissing, 1}, {1, 1, 1}});

	const auto result = falling_level::FillInByHorizontalInterpolation(fallingLevel);

	BOOST_CHECK_CLOSE(result.At(1, 1, 0), 1., kEpsilon);
	BOOST_REQUIRE(result.MissingCount() == 0);
}

BOOST_AUTO_TEST_CASE(FIND_FALLING_LEVEL_PLAIN_NAN)
{
	// plain nan in input data is missing, same as MissingDouble()

	const vector<matrix<double>> profile = {Grid({{80, 80, 80}, {80, 80, 80}, {80, 80, 80}}),
	                                        Grid({{85, 85, 85}, {85, 85, 85}, {85, 85, 85}}),
	                                        Grid({{100, 100, 100}, {100, kNaN, 100}, {100, 100, 100}})};

	const auto orography = Grid({{0, 0, 0}, {0, 0, 0}, {0, 0, 0}});

	const auto result =
	    falling_level::FindFallingLevel(profile, orography, heights, kThreshold, falling_level::kDefaultPrecision);

	BOOST_CHECK_CLOSE(result.At(0, 0, 0), 10. + 10. / 3., kEpsilon);
	BOOST_REQUIRE(result.IsMissing(1, 1, 0));
	BOOST_REQUIRE(result.MissingCount() == 1);

	auto highFilled = result;
	BOOST_REQUIRE(falling_level::FillInHighFallingLevels(highFilled, orography, profile.back(), heights.back(),
	                                                     kThreshold) == 0);
	BOOST_REQUIRE(highFilled.IsMissing(1, 1, 0));

	const auto filled = falling_level::FillInByHorizontalInterpolation(result);
	BOOST_CHECK_CLOSE(filled.At(1, 1, 0), 10. + 10. / 3., kEpsilon);
}

BOOST_AUTO_TEST_CASE(HORIZONTAL_INTERPOLATION)
{
	const auto fallingLevel = Grid({{1, 1, 2}, {1, kMissing, 2}, {1, 2, 2}});

	const auto result = falling_level::FillInByHorizontalInterpolation(fallingLevel);

	BOOST_CHECK_CLOSE(result.At(1, 1, 0), 1.5, kEpsilon);

	// input is not modified
	BOOST_REQUIRE(fallingLevel.IsMissing(1, 1, 0));
}

BOOST_AUTO_TEST_CASE(HORIZONTAL_INTERPOLATION_CORNER)
{
	const auto fallingLevel = Grid({{1, 1, 2}, {1, kMissing, 2}, {1, 2, kMissing}});

	const auto result = falling_level::FillInByHorizontalInterpolation(fallingLevel);

	Dump(result);

	// mean of the seven valid neighbours
	BOOST_CHECK_CLOSE(result.At(1, 1, 0), 10. / 7., kEpsilon);

	// corner is not an interior point
	BOOST_REQUIRE(result.IsMissing(2, 2, 0));
}

BOOST_AUTO_TEST_CASE(HORIZONTAL_INTERPOLATION_PLAIN_NAN_NEIGHBOUR)
{
	const auto fallingLevel = Grid({{1, 1, 1, 1}, {1, kMissing, 1, 1}, {1, 1, kNaN, 1}, {1, 1, 1, 1}});

	const auto result = falling_level::FillInByHorizontalInterpolation(fallingLevel);

	// nan neighbour does not contribute, and the nan point is filled too
	BOOST_CHECK_CLOSE(result.At(1, 1, 0), 1., kEpsilon);
	BOOST_CHECK_CLOSE(result.At(2, 2, 0), 1., kEpsilon);
	BOOST_REQUIRE(result.MissingCount() == 0);
}

BOOST_AUTO_TEST_CASE(HORIZONTAL_INTERPOLATION_SINGLE_PASS)
{
	// interior points only see the input values, so a point surrounded by
	// missing values is not filled even if its neighbours are

	const auto fallingLevel = Grid({{1, 1, 1, 1, 1},
	                                {1, kMissing, kMissing, kMissing, 1},
	                                {1, kMissing, kMissing, kMissing, 1},
	                                {1, kMissing, kMissing, kMissing, 1},
	                                {1, 1, 1, 1, 1}});

	const auto result = falling_level::FillInByHorizontalInterpolation(fallingLevel);

	BOOST_REQUIRE(result.IsMissing(2, 2, 0));
	BOOST_CHECK_CLOSE(result.At(1, 1, 0), 1., kEpsilon);
	BOOST_CHECK_CLOSE(result.At(2, 1, 0), 1., kEpsilon);
	BOOST_REQUIRE(result.MissingCount() == 1);
}
