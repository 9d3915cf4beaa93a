/**
 * @file matrix.h
 *
 * @brief Value storage for gridded data. Does not have any mathematical implications of matrices.
 *
 * Values are stored x fastest, then y, then z. A matrix carries its own missing
 * value. Values are compared bitwise so that a nan payload can be used; if the
 * missing value is a nan, any nan counts as missing.
 */

#ifndef MATRIX_H
#define MATRIX_H

#include "lumi_common.h"
#include <algorithm>
#include <cstring>
#include <fmt/format.h>
#include <stdexcept>
#include <vector>

namespace lumi
{
/**
 * @brief Compare two values bitwise, so that nan == nan if payloads match
 */

template <typename T>
inline bool Compare(const T& lhs, const T& rhs)
{
	return std::memcmp(&lhs, &rhs, sizeof(T)) == 0;
}

template <class T>
class matrix
{
   public:
	matrix() : itsWidth(0), itsHeight(0), itsDepth(0), itsMissingValue(lumi::MissingValue<T>())
	{
	}

	/**
	 * @brief Create matrix with all values set to missing value
	 */

	matrix(size_t theWidth, size_t theHeight, size_t theDepth, T theMissingValue)
	    : matrix(theWidth, theHeight, theDepth, theMissingValue, theMissingValue)
	{
	}

	/**
	 * @brief Create matrix with all values set to given fill value
	 */

	matrix(size_t theWidth, size_t theHeight, size_t theDepth, T theMissingValue, T theFillValue)
	    : itsValues(theWidth * theHeight * theDepth, theFillValue),
	      itsWidth(theWidth),
	      itsHeight(theHeight),
	      itsDepth(theDepth),
	      itsMissingValue(theMissingValue)
	{
	}

	/**
	 * @brief Create matrix from existing values
	 *
	 * Throws std::invalid_argument if the number of values does not match the dimensions.
	 */

	matrix(size_t theWidth, size_t theHeight, size_t theDepth, T theMissingValue, const std::vector<T>& theValues)
	    : itsValues(theValues),
	      itsWidth(theWidth),
	      itsHeight(theHeight),
	      itsDepth(theDepth),
	      itsMissingValue(theMissingValue)
	{
		if (itsValues.size() != theWidth * theHeight * theDepth)
		{
			throw std::invalid_argument(fmt::format("{}: got {} values for a {}x{}x{} matrix", ClassName(),
			                                        itsValues.size(), theWidth, theHeight, theDepth));
		}
	}

	bool operator==(const matrix& other) const
	{
		return itsWidth == other.itsWidth && itsHeight == other.itsHeight && itsDepth == other.itsDepth &&
		       Compare(itsMissingValue, other.itsMissingValue) &&
		       std::equal(itsValues.begin(), itsValues.end(), other.itsValues.begin(),
		                  [](const T& a, const T& b) { return Compare(a, b); });
	}

	bool operator!=(const matrix& other) const
	{
		return !(*this == other);
	}

	std::string ClassName() const
	{
		return "lumi::matrix";
	}

	T& operator[](size_t theIndex)
	{
		return itsValues[theIndex];
	}

	T At(size_t theIndex) const
	{
		ASSERT(theIndex < itsValues.size());
		return itsValues[theIndex];
	}

	T At(size_t x, size_t y, size_t z = 0) const
	{
		return At(Index(x, y, z));
	}

	size_t Index(size_t x, size_t y, size_t z) const
	{
		ASSERT(x < itsWidth && y < itsHeight);
		return (z * itsHeight + y) * itsWidth + x;
	}

	size_t Size() const
	{
		return itsValues.size();
	}
	size_t SizeX() const
	{
		return itsWidth;
	}
	size_t SizeY() const
	{
		return itsHeight;
	}
	size_t SizeZ() const
	{
		return itsDepth;
	}

	/**
	 * @brief True if horizontal dimensions of this and other matrix agree
	 */

	bool SameShape(const matrix& other) const
	{
		return itsWidth == other.itsWidth && itsHeight == other.itsHeight;
	}

	std::vector<T>& Values()
	{
		return itsValues;
	}

	const std::vector<T>& Values() const
	{
		return itsValues;
	}

	/**
	 * @brief Replace all values. Size of the new data must be equal to the old one.
	 */

	void Set(const std::vector<T>& theValues)
	{
		ASSERT(theValues.size() == itsValues.size());
		itsValues = theValues;
	}

	void Set(size_t theIndex, T theValue)
	{
		ASSERT(theIndex < itsValues.size());
		itsValues[theIndex] = theValue;
	}

	void Set(size_t x, size_t y, size_t z, T theValue)
	{
		Set(Index(x, y, z), theValue);
	}

	void Fill(T theValue)
	{
		std::fill(itsValues.begin(), itsValues.end(), theValue);
	}

	T MissingValue() const
	{
		return itsMissingValue;
	}

	bool IsMissing(size_t theIndex) const
	{
		return IsMissingValue(At(theIndex));
	}

	bool IsMissing(size_t x, size_t y, size_t z) const
	{
		return IsMissing(Index(x, y, z));
	}

	/**
	 * @return Number of missing values
	 */

	size_t MissingCount() const
	{
		return static_cast<size_t>(std::count_if(itsValues.begin(), itsValues.end(),
		                                         [this](const T& v) { return IsMissingValue(v); }));
	}

	std::ostream& Write(std::ostream& file) const
	{
		file << "<" << ClassName() << ">" << std::endl;
		file << fmt::format("__itsSize__ {}x{}x{} ({} values, {} missing)", itsWidth, itsHeight, itsDepth,
		                    itsValues.size(), MissingCount())
		     << std::endl;

		return file;
	}

	friend std::ostream& operator<<(std::ostream& file, const matrix<T>& ob)
	{
		return ob.Write(file);
	}

   private:
	bool IsMissingValue(const T& v) const
	{
		// nan != nan
		return Compare(v, itsMissingValue) || (v != v && itsMissingValue != itsMissingValue);
	}

	std::vector<T> itsValues;

	size_t itsWidth;
	size_t itsHeight;
	size_t itsDepth;

	T itsMissingValue;
};

}  // namespace lumi

#endif /* MATRIX_H */
