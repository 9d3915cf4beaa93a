/**
 * @file falling_level.cpp
 *
 */

#include "falling_level.h"
#include "modifier.h"
#include "numerical_functions.h"

using namespace lumi;
using namespace lumi::numerical_functions;

matrix<double> falling_level::FindFallingLevel(const std::vector<matrix<double>>& profile,
                                               const matrix<double>& orography, const std::vector<double>& heights,
                                               double threshold, double precision)
{
	ASSERT(profile.size() == heights.size());
	ASSERT(profile.size() > 0);

	matrix<double> result(orography.SizeX(), orography.SizeY(), 1, MissingDouble());

	modifier_findheight mod;
	mod.FindValue(std::vector<double>(orography.Size(), threshold));
	mod.Precision(precision);

	for (size_t k = 0; k < profile.size(); k++)
	{
		ASSERT(profile[k].SameShape(orography));

		mod.Process(profile[k].Values(), std::vector<double>(orography.Size(), heights[k]));

		if (mod.CalculationFinished())
		{
			break;
		}
	}

	const auto& heightAboveGround = mod.Result();
	auto& out = result.Values();

	for (size_t i = 0; i < out.size(); i++)
	{
		const double h = heightAboveGround[i];
		const double orog = orography.At(i);

		if (IsValid(h) && IsValid(orog))
		{
			out[i] = h + orog;
		}
	}

	return result;
}

size_t falling_level::FillInHighFallingLevels(matrix<double>& fallingLevel, const matrix<double>& orography,
                                              const matrix<double>& highestProfile, double highestHeight,
                                              double threshold)
{
	ASSERT(fallingLevel.SameShape(orography));
	ASSERT(fallingLevel.SameShape(highestProfile));

	size_t filled = 0;
	auto& out = fallingLevel.Values();

	for (size_t i = 0; i < out.size(); i++)
	{
		if (IsValid(out[i]))
		{
			continue;
		}

		const double top = highestProfile.At(i);
		const double orog = orography.At(i);

		if (IsValid(top) && IsValid(orog) && top > threshold)
		{
			out[i] = orog + highestHeight;
			filled++;
		}
	}

	return filled;
}

size_t falling_level::FillInSeaPoints(matrix<double>& fallingLevel, const matrix<double>& landSea,
                                      const matrix<double>& profileValue, double threshold)
{
	ASSERT(fallingLevel.SameShape(landSea));
	ASSERT(fallingLevel.SameShape(profileValue));

	size_t filled = 0;
	auto& out = fallingLevel.Values();

	for (size_t i = 0; i < out.size(); i++)
	{
		if (IsValid(out[i]))
		{
			continue;
		}

		const double lsm = landSea.At(i);
		const double val = profileValue.At(i);

		if (IsValid(lsm) && lsm == 0. && IsValid(val) && val < threshold)
		{
			out[i] = 0.;
			filled++;
		}
	}

	return filled;
}

matrix<double> falling_level::FillInByHorizontalInterpolation(const matrix<double>& fallingLevel)
{
	// 3x3 box, center point excluded
	matrix<double> kernel(3, 3, 1, MissingDouble(), 1.);
	kernel.Set(1, 1, 0, MissingDouble());

	const matrix<double> mean = Mean2D<double>(fallingLevel, kernel);

	matrix<double> result(fallingLevel);
	auto& out = result.Values();

	for (size_t i = 0; i < out.size(); i++)
	{
		if (IsMissing(out[i]))
		{
			out[i] = mean.At(i);
		}
	}

	return result;
}
