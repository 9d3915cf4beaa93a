/**
 * @file modifier.h
 *
 */

#ifndef MODIFIER_H
#define MODIFIER_H

#include "lumi_common.h"
#include <vector>

namespace lumi
{
/**
 * @class modifier
 *
 * Reduces a vertical profile to one value per grid point. Data is fed one level
 * at a time, lowest level first; each call to Process() has the values and
 * heights of one level for all grid points.
 *
 * Levels where value or height is missing are skipped, and the previous valid
 * level of the point is carried over them. A point marked finished is not
 * looked at again.
 */

class modifier
{
   public:
	virtual ~modifier() = default;

	virtual std::string ClassName() const
	{
		return "lumi::modifier";
	}

	LPModifierType Type() const
	{
		return itsModifierType;
	}

	/**
	 * @brief Feed one level of data to modifier
	 *
	 * Throws std::invalid_argument if the level size differs from earlier levels.
	 */

	void Process(const std::vector<double>& theData, const std::vector<double>& theHeights);

	const std::vector<double>& Result() const;

	/**
	 * @return True when every grid point is finished
	 */

	bool CalculationFinished() const;

	/**
	 * @return Number of finished grid points
	 */

	size_t HeightsCrossed() const;

	/**
	 * @brief Reset results and profile state so that a new profile can be fed
	 */

	virtual void Clear(double fillValue = MissingDouble());

	std::ostream& Write(std::ostream& file) const;

   protected:
	explicit modifier(LPModifierType theModifierType) : itsModifierType(theModifierType)
	{
	}

	/**
	 * @brief Size the state for a grid, called on the first Process()
	 */

	virtual void Init(size_t theSize);

	virtual void Calculate(size_t theIndex, double theValue, double theHeight, double thePreviousValue,
	                       double thePreviousHeight) = 0;

	std::vector<double> itsResult;
	std::vector<double> itsPreviousValue;
	std::vector<double> itsPreviousHeight;
	std::vector<bool> itsFinished;

   private:
	LPModifierType itsModifierType;
	size_t itsLevelsProcessed = 0;
};

inline std::ostream& operator<<(std::ostream& file, const modifier& ob)
{
	return ob.Write(file);
}

/**
 * @class modifier_max
 *
 * Maximum value of each profile, missing if the profile has no valid values
 */

class modifier_max : public modifier
{
   public:
	modifier_max() : modifier(kMaximumModifier)
	{
	}

	std::string ClassName() const override
	{
		return "lumi::modifier_max";
	}

   protected:
	void Calculate(size_t theIndex, double theValue, double theHeight, double thePreviousValue,
	               double thePreviousHeight) override;
};

/**
 * @class modifier_findheight
 *
 * Height where each profile first reaches its find value, scanning upwards.
 *
 * The height is interpolated linearly between the two consecutive valid levels
 * that bracket the find value. Profile values within Precision() of the find
 * value count as equal to it, and a level equal to the find value is a valid end
 * of a bracket. A point whose find value is missing, or whose profile never
 * reaches the find value, has a missing result.
 */

class modifier_findheight : public modifier
{
   public:
	modifier_findheight() : modifier(kFindHeightModifier)
	{
	}

	std::string ClassName() const override
	{
		return "lumi::modifier_findheight";
	}

	/**
	 * @brief Value to search for, one per grid point. Must be set before Process().
	 */

	void FindValue(const std::vector<double>& theFindValue)
	{
		itsFindValue = theFindValue;
	}
	const std::vector<double>& FindValue() const
	{
		return itsFindValue;
	}

	double Precision() const
	{
		return itsPrecision;
	}
	void Precision(double thePrecision)
	{
		ASSERT(thePrecision >= 0);
		itsPrecision = thePrecision;
	}

	void Clear(double fillValue = MissingDouble()) override;

   protected:
	void Init(size_t theSize) override;

	void Calculate(size_t theIndex, double theValue, double theHeight, double thePreviousValue,
	               double thePreviousHeight) override;

   private:
	void SkipMissingFindValues();

	std::vector<double> itsFindValue;
	double itsPrecision = 0;
};

}  // namespace lumi

#endif /* MODIFIER_H */
