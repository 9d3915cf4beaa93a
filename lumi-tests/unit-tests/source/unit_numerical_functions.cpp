#define BOOST_TEST_MODULE numerical_functions

#include "lumi_unit.h"
#include "numerical_functions.h"

#include "falling_level_helper.h"

#include "timer.h"

using namespace std;
using namespace lumi;

const double kEpsilon = 1e-3;

BOOST_AUTO_TEST_CASE(MEAN2D)
{
	matrix<double> A(5, 4, 1, MissingDouble());

	for (size_t i = 0; i < A.Size(); ++i)
	{
		A.Set(i, static_cast<double>(i));
	}

	matrix<double> B(3, 3, 1, MissingDouble(), 1.);

	const auto C = numerical_functions::Mean2D(A, B);

	Dump(C);

	// interior point is the mean of its 3x3 box, which for a linear field is the point itself
	BOOST_CHECK_CLOSE(C.At(1, 1, 0), 6., kEpsilon);
	BOOST_CHECK_CLOSE(C.At(3, 2, 0), 13., kEpsilon);

	// kernel does not fit at the edges
	for (size_t i = 0; i < A.SizeX(); ++i)
	{
		BOOST_REQUIRE(C.IsMissing(i, 0, 0));
		BOOST_REQUIRE(C.IsMissing(i, A.SizeY() - 1, 0));
	}
	for (size_t j = 0; j < A.SizeY(); ++j)
	{
		BOOST_REQUIRE(C.IsMissing(0, j, 0));
		BOOST_REQUIRE(C.IsMissing(A.SizeX() - 1, j, 0));
	}
}

BOOST_AUTO_TEST_CASE(MEAN2D_MISSING_VALUES)
{
	const double kMissing = MissingDouble();

	auto A = Grid({{1, 1, 2}, {1, kMissing, 2}, {1, 2, kMissing}});

	// center point excluded
	matrix<double> B(3, 3, 1, MissingDouble(), 1.);
	B.Set(1, 1, 0, MissingDouble());

	const auto C = numerical_functions::Mean2D(A, B);

	BOOST_CHECK_CLOSE(C.At(1, 1, 0), 10. / 7., kEpsilon);

	auto allMissing = Grid({{kMissing, kMissing, kMissing}, {kMissing, 5, kMissing}, {kMissing, kMissing, kMissing}});

	BOOST_REQUIRE(numerical_functions::Mean2D(allMissing, B).IsMissing(1, 1, 0));
}

BOOST_AUTO_TEST_CASE(MEAN2D_LARGE)
{
	matrix<double> A(2001, 1000, 1, MissingDouble(), 36.);
	matrix<double> B(3, 3, 1, MissingDouble(), 1.);

	lumi::timer timer;
	timer.Start();

	const auto C = numerical_functions::Mean2D(A, B);

	timer.Stop();

	BOOST_CHECK_CLOSE(C.At(1000, 500, 0), 36., kEpsilon);
	BOOST_REQUIRE(C.MissingCount() == 2 * 2001 + 2 * 998);

	std::cout << "Mean2D took " << timer.GetTime() << " ms " << std::endl;
}

BOOST_AUTO_TEST_CASE(REDUCE2D_SUM)
{
	auto A = Grid({{1, 2, 3, 4}, {5, 6, 7, 8}, {9, 10, 11, 12}});
	matrix<double> B(3, 3, 1, MissingDouble(), 1.);

	const auto C = numerical_functions::Reduce2D(
	    A, B,
	    [](double& val1, double& val2, const double& a, const double& b) {
		    val1 += a * b;
		    val2 += b;
	    },
	    [](const double& val1, const double& val2) { return val1; }, 0., 0.);

	BOOST_CHECK_CLOSE(C.At(1, 1, 0), 54., kEpsilon);
	BOOST_CHECK_CLOSE(C.At(2, 1, 0), 63., kEpsilon);
	BOOST_REQUIRE(C.MissingCount() == 10);
}

BOOST_AUTO_TEST_CASE(LINEAR)
{
	using numerical_functions::interpolation::Linear;

	BOOST_CHECK_CLOSE(Linear<double>(90., 80., 100., 5., 10.), 7.5, kEpsilon);
	BOOST_CHECK_CLOSE(Linear<double>(90., 100., 80., 0., 100.), 50., kEpsilon);
	BOOST_CHECK_CLOSE(Linear<double>(0.25, 0., 4.), 1., kEpsilon);

	// end points are returned exactly
	BOOST_REQUIRE(Linear<double>(90., 90., 100., 10., 20.) == 10.);
	BOOST_REQUIRE(Linear<double>(100., 90., 100., 10., 20.) == 20.);

	// degenerate segment
	BOOST_REQUIRE(Linear<double>(90., 90., 90., 5., 10.) == 5.);
}
