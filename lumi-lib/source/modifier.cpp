/**
 * @file modifier.cpp
 */

#include "modifier.h"
#include "numerical_functions.h"
#include <algorithm>
#include <cmath>
#include <fmt/format.h>
#include <stdexcept>

using namespace lumi;

void modifier::Init(size_t theSize)
{
	itsResult.assign(theSize, MissingDouble());
	itsPreviousValue.assign(theSize, MissingDouble());
	itsPreviousHeight.assign(theSize, MissingDouble());
	itsFinished.assign(theSize, false);
}

void modifier::Process(const std::vector<double>& theData, const std::vector<double>& theHeights)
{
	if (itsResult.empty())
	{
		Init(theData.size());
	}

	if (theData.size() != itsResult.size() || theHeights.size() != itsResult.size())
	{
		throw std::invalid_argument(fmt::format("{}: level size {} does not match grid size {}", ClassName(),
		                                        theData.size(), itsResult.size()));
	}

	for (size_t i = 0; i < theData.size(); i++)
	{
		const double value = theData[i];
		const double height = theHeights[i];

		if (IsMissing(value) || IsMissing(height))
		{
			continue;
		}

		const double previousValue = itsPreviousValue[i];
		const double previousHeight = itsPreviousHeight[i];

		itsPreviousValue[i] = value;
		itsPreviousHeight[i] = height;

		if (!itsFinished[i])
		{
			Calculate(i, value, height, previousValue, previousHeight);
		}
	}

	itsLevelsProcessed++;
}

const std::vector<double>& modifier::Result() const
{
	return itsResult;
}

size_t modifier::HeightsCrossed() const
{
	return static_cast<size_t>(std::count(itsFinished.begin(), itsFinished.end(), true));
}

bool modifier::CalculationFinished() const
{
	return !itsResult.empty() && HeightsCrossed() == itsResult.size();
}

void modifier::Clear(double fillValue)
{
	std::fill(itsResult.begin(), itsResult.end(), fillValue);
	std::fill(itsPreviousValue.begin(), itsPreviousValue.end(), MissingDouble());
	std::fill(itsPreviousHeight.begin(), itsPreviousHeight.end(), MissingDouble());
	std::fill(itsFinished.begin(), itsFinished.end(), false);
	itsLevelsProcessed = 0;
}

std::ostream& modifier::Write(std::ostream& file) const
{
	file << "<" << ClassName() << ">" << std::endl;
	file << fmt::format("__itsResult__ size {}, {} finished", itsResult.size(), HeightsCrossed()) << std::endl;
	file << "__itsLevelsProcessed__ " << itsLevelsProcessed << std::endl;

	return file;
}

/* ----------------- */

void modifier_max::Calculate(size_t theIndex, double theValue, double, double, double)
{
	double& current = itsResult[theIndex];

	if (IsMissing(current) || theValue > current)
	{
		current = theValue;
	}
}

/* ----------------- */

void modifier_findheight::SkipMissingFindValues()
{
	for (size_t i = 0; i < itsFindValue.size(); i++)
	{
		if (IsMissing(itsFindValue[i]))
		{
			itsFinished[i] = true;
		}
	}
}

void modifier_findheight::Init(size_t theSize)
{
	if (itsFindValue.size() != theSize)
	{
		throw std::invalid_argument(
		    fmt::format("{}: {} find values given for grid of size {}", ClassName(), itsFindValue.size(), theSize));
	}

	modifier::Init(theSize);
	SkipMissingFindValues();
}

void modifier_findheight::Clear(double fillValue)
{
	modifier::Clear(fillValue);

	if (itsFindValue.size() == itsFinished.size())
	{
		SkipMissingFindValues();
	}
}

void modifier_findheight::Calculate(size_t theIndex, double theValue, double theHeight, double thePreviousValue,
                                    double thePreviousHeight)
{
	// lowest valid level only starts the bracket
	if (IsMissing(thePreviousValue))
	{
		return;
	}

	const double findValue = itsFindValue[theIndex];

	const auto snap = [&](double v) { return std::fabs(v - findValue) <= itsPrecision ? findValue : v; };

	const double lower = snap(thePreviousValue);
	const double upper = snap(theValue);

	if ((lower - findValue) * (upper - findValue) > 0)
	{
		return;
	}

	const double height =
	    numerical_functions::interpolation::Linear(findValue, lower, upper, thePreviousHeight, theHeight);

	if (IsValid(height))
	{
		itsResult[theIndex] = height;
		itsFinished[theIndex] = true;
	}
}
